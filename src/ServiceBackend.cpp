#include "setup_core/ServiceBackend.hpp"
#include "setup_core/CommandRunner.hpp"
#include "setup_core/Config.hpp"
#include "setup_core/Paths.hpp"

#include <memory>
#include <glog/logging.h>

namespace setupcore {

    namespace {

    //---Реализация бэкенда установки службы для Windows:
    //   sc.exe - запрос/запуск/остановка/удаление, обёртка служб (nssm.exe) - регистрация и свойства
    class BackendScNssm final : public IServiceBackend {
    public:
        BackendScNssm(CommandRunner& runner, const ToolPaths& tools)
            : runner_(runner), tools_(tools)
        {
        }
		//---Проверка существования службы (sc query): 0 - есть, остальное - нет
        bool exists(const std::string& name, bool& exists, Error* error) override
        {
            if (name.empty()) return fail(error, ErrorKind::InvalidArgument, "sc query: empty service name");

            const process::ExecutionResult rr = runner_.run(tools_.sc, { "query", name });
            if (!rr.launched)
            {
                return fail(error, ErrorKind::LaunchFailure,
                    "sc query: failed to start sc.exe. sysError=" + std::to_string(rr.sysError));
            }

            exists = (rr.exitCode == 0);
            if (rr.exitCode != 0 && rr.exitCode != kScServiceDoesNotExist)
            {
                LOG(WARNING) << "sc query " << name << ": unexpected exitCode=" << rr.exitCode
                    << ", treating service as absent";
            }
            LOG(INFO) << "Service " << name << (exists ? " exists" : " does not exist");
            return true;
        }
		//---Регистрация службы: путь и аргументы одной командой
        bool install(const std::string& name, const fs::path& exe, const std::string& args, Error* error) override
        {
            if (name.empty()) return fail(error, ErrorKind::InvalidArgument, "install: empty service name");
            if (exe.empty()) return fail(error, ErrorKind::InvalidArgument, "install: empty executable path");

            // nssm install "<name>" "<exe>" [args]
            std::vector<std::string> a{ "install", name, pathToUtf8(exe) };
            if (!args.empty()) a.push_back(args);

            return runner_.runChecked(tools_.serviceWrapper, a, {}, "nssm install", error);
        }
		//---Установка свойства: nssm set "<name>" <property> <values...>
        bool setProperty(const std::string& name, const std::string& property,
            const std::vector<std::string>& values, Error* error) override
        {
            std::vector<std::string> a{ "set", name, property };
            a.insert(a.end(), values.begin(), values.end());

            return runner_.runChecked(tools_.serviceWrapper, a, {}, "nssm set " + property, error);
        }
		//---Запуск службы
        bool start(const std::string& name, Error* error) override
        {
            // 1056 = already running => ok
            return runner_.runTolerant(tools_.sc, { "start", name }, {}, "sc start",
                { kScServiceAlreadyRunning }, nullptr, error);
        }
		//---Остановка службы
        bool stop(const std::string& name, Error* error) override
        {
            // 1062 = уже остановлена, 1060 = службы нет: это ок
            return runner_.runTolerant(tools_.sc, { "stop", name }, {}, "sc stop",
                { kScServiceNotActive, kScServiceDoesNotExist }, nullptr, error);
        }
		//---Остановка без проверки кода
        bool stopBestEffort(const std::string& name, int* exitCode, Error* error) override
        {
            return runner_.runBestEffort(tools_.sc, { "stop", name }, {}, "sc stop (best effort)", exitCode, error);
        }
		//---Удаление службы
        bool remove(const std::string& name, Error* error) override
        {
            if (name.empty()) return fail(error, ErrorKind::InvalidArgument, "remove: empty service name");

            // 1060 = службы нет, 1072 = помечена на удаление: тоже ок
            return runner_.runTolerant(tools_.sc, { "delete", name }, {}, "sc delete",
                { kScServiceDoesNotExist, kScServiceMarkedForDelete }, nullptr, error);
        }

    private:
        CommandRunner& runner_;
        ToolPaths tools_;
    };

    } // namespace

    //---Cоздание бэкенда
    std::unique_ptr<IServiceBackend> makeServiceBackend(CommandRunner& runner, const ToolPaths& tools)
    {
        return std::make_unique<BackendScNssm>(runner, tools);
    }

} // namespace setupcore
