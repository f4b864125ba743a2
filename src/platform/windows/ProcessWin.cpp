#ifdef _WIN32

#include "platform/ProcessImpl.hpp"
#include <windows.h>
#include <string_view>
#include <vector>
#include <glog/logging.h>

namespace setupcore::process::detail {

    namespace {

    //---Дескриптор, закрываемый при выходе из области видимости
    struct ScopedHandle final {
        explicit ScopedHandle(HANDLE h) : h(h) {}
        ~ScopedHandle() { if (h) CloseHandle(h); }
        ScopedHandle(const ScopedHandle&) = delete;
        ScopedHandle& operator=(const ScopedHandle&) = delete;

        HANDLE h = nullptr;
    };

    //---UTF-8 → UTF-16. Некорректный UTF-8 → пустая строка
    static std::wstring toWide(const std::string& s)
    {
        if (s.empty()) return {};

        const int n = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, s.data(), (int)s.size(), nullptr, 0);
        if (n <= 0)
        {
            LOG(ERROR) << "Invalid UTF-8 in command argument, error " << GetLastError();
            return {};
        }
        std::wstring w((size_t)n, L'\0');
        MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, s.data(), (int)s.size(), w.data(), n);
        return w;
    }

    //---Аргумент в формате CommandLineToArgvW:
    //   N слешей перед кавычкой → 2N+1, N слешей в конце → 2N
    static void appendQuoted(std::wstring& cmd, std::wstring_view arg)
    {
        if (!arg.empty() && arg.find_first_of(L" \t\n\v\"") == std::wstring_view::npos)
        {
            cmd.append(arg);
            return;
        }

        cmd.push_back(L'"');
        for (std::size_t i = 0; ; i++)
        {
            std::size_t slashes = 0;
            while (i < arg.size() && arg[i] == L'\\') { slashes++; i++; }

            if (i == arg.size())
            {
                cmd.append(slashes * 2, L'\\');
                break;
            }
            if (arg[i] == L'"')
            {
                cmd.append(slashes * 2 + 1, L'\\');
                cmd.push_back(L'"');
            }
            else
            {
                cmd.append(slashes, L'\\');
                cmd.push_back(arg[i]);
            }
        }
        cmd.push_back(L'"');
    }

    //---Ожидание завершения без таймаута и чтение кода
    static bool waitExitCode(HANDLE process, DWORD& code, std::uint32_t& sysError)
    {
        if (WaitForSingleObject(process, INFINITE) == WAIT_FAILED)
        {
            sysError = GetLastError();
            LOG(ERROR) << "WaitForSingleObject failed with error " << sysError;
            return false;
        }
        if (!GetExitCodeProcess(process, &code))
        {
            sysError = GetLastError();
            LOG(ERROR) << "GetExitCodeProcess failed with error " << sysError;
            return false;
        }
        return true;
    }

    } // namespace

	//---Запуск через CreateProcessW. Код завершения, который не удалось получить,
	//   считается ошибкой запуска
    bool runPlatform(const fs::path& exe, const std::vector<std::string>& args, ExecutionResult& out, const RunOptions& opt)
    {
        out = {};

        const std::wstring exeW = exe.wstring();

        std::wstring cmd;
        appendQuoted(cmd, exeW);
        for (const auto& a : args)
        {
            cmd.push_back(L' ');
            appendQuoted(cmd, toWide(a));
        }
        //---CreateProcessW может изменять буфер командной строки
        std::vector<wchar_t> cmdBuf(cmd.c_str(), cmd.c_str() + cmd.size() + 1);

        const std::wstring cwd = opt.workingDir.wstring();

        STARTUPINFOW si{};
        si.cb = sizeof(si);
        PROCESS_INFORMATION pi{};

        if (!CreateProcessW(exeW.c_str(), cmdBuf.data(), nullptr, nullptr, FALSE,
            opt.hideWindow ? CREATE_NO_WINDOW : 0, nullptr,
            cwd.empty() ? nullptr : cwd.c_str(), &si, &pi))
        {
            out.sysError = GetLastError();
            LOG(ERROR) << "CreateProcessW failed for " << exe << " with error " << out.sysError;
            return false;
        }

        ScopedHandle thread(pi.hThread);
        ScopedHandle process(pi.hProcess);

        DWORD code = 0;
        if (!waitExitCode(process.h, code, out.sysError)) return false;

        out.launched = true;
        out.exitCode = (int)code;
        return true;
    }

} // namespace setupcore::process::detail
#endif
