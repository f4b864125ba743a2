#if defined(__linux__)

#include "platform/ProcessImpl.hpp"
#include <errno.h>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <glog/logging.h>

namespace setupcore::process::detail {

	//---Платформенно-специфичная реализация запуска процесса для Linux.
	//   Ошибка execv передаётся родителю через pipe с O_CLOEXEC:
	//   успешный exec закрывает pipe, и read() возвращает 0
    bool runPlatform(const fs::path& exe, const std::vector<std::string>& args,
        ExecutionResult& out, const RunOptions& opt)
    {
        out = {};

        int errPipe[2] = { -1, -1 };
        if (pipe2(errPipe, O_CLOEXEC) != 0)
        {
            out.sysError = (std::uint32_t)errno;
            LOG(ERROR) << "pipe2 failed for process " << exe << " with error " << out.sysError;
            return false;
        }

        //---Подготовка argv до fork (в дочернем процессе только async-signal-safe вызовы)
        std::vector<std::string> argvStorage;
        argvStorage.reserve(args.size() + 1);
        argvStorage.push_back(exe.string());
        argvStorage.insert(argvStorage.end(), args.begin(), args.end());

        std::vector<char*> argv;
        argv.reserve(argvStorage.size() + 1);
        for (auto& s : argvStorage) argv.push_back(s.data());
        argv.push_back(nullptr);

        const std::string cwd = opt.workingDir.string();

        pid_t pid = fork();
        if (pid < 0)
        {
            out.sysError = (std::uint32_t)errno;
            ::close(errPipe[0]);
            ::close(errPipe[1]);
            LOG(ERROR) << "fork failed for process " << exe << " with error " << out.sysError;
            return false;
        }

        if (pid == 0)
        {
            ::close(errPipe[0]);

            int childErr = 0;
            if (!cwd.empty() && chdir(cwd.c_str()) != 0)
            {
                childErr = errno;
            }
            else
            {
                execv(argv[0], argv.data());
                childErr = errno;
            }
            (void)!::write(errPipe[1], &childErr, sizeof(childErr));
            _exit(127);
        }

        ::close(errPipe[1]);

        //---Ждём: либо EOF (exec прошёл), либо код ошибки
        int childErr = 0;
        ssize_t n = 0;
        do
        {
            n = ::read(errPipe[0], &childErr, sizeof(childErr));
        } while (n < 0 && errno == EINTR);
        ::close(errPipe[0]);

        int status = 0;
        pid_t waited = 0;
        do
        {
            waited = waitpid(pid, &status, 0);
        } while (waited < 0 && errno == EINTR);

        if (n == (ssize_t)sizeof(childErr))
        {
            out.launched = false;
            out.sysError = (std::uint32_t)childErr;
            LOG(ERROR) << "Failed to start process " << exe << " with error: " << out.sysError;
            return false;
        }

        if (waited < 0)
        {
            out.launched = false;
            out.sysError = (std::uint32_t)errno;
            LOG(ERROR) << "waitpid failed for process " << exe << " with error " << out.sysError;
            return false;
        }

        out.launched = true;
        if (WIFEXITED(status))
            out.exitCode = WEXITSTATUS(status);
        else if (WIFSIGNALED(status))
            out.exitCode = 128 + WTERMSIG(status);
        else
            out.exitCode = 1;

        return true;
    }

} // namespace setupcore::process::detail
#endif
