#include "setup_core/Installer.hpp"
#include "setup_core/CommandRunner.hpp"
#include "setup_core/InstallDecision.hpp"
#include "setup_core/KeyValueStore.hpp"
#include "setup_core/Paths.hpp"
#include "setup_core/Platform.hpp"
#include "setup_core/Preflight.hpp"
#include "setup_core/Prompt.hpp"
#include "setup_core/RuntimeDependency.hpp"
#include "setup_core/ServiceBackend.hpp"
#include "setup_core/ServiceLifecycle.hpp"
#include "setup_core/SystemCommands.hpp"
#include "setup_core/Version.hpp"

#include <filesystem>
#include <memory>
#include <system_error>
#include <glog/logging.h>

namespace setupcore {

	namespace {

		//---Всё, что нужно шагам одного прогона
		struct Steps final {
			Steps(const CliOptions& opt, const ProductConfig& cfg, SetupEnvironment& env)
				: opt(opt), cfg(cfg), env(env),
				ui(env.prompt, opt.unattended),
				runner(env.runner),
				backend(makeServiceBackend(runner, cfg.tools)),
				sys(runner, cfg.tools),
				decision(env.store, cfg.versionKey, ui)
			{
			}

			const CliOptions& opt;
			const ProductConfig& cfg;
			SetupEnvironment& env;

			Interaction ui;
			CommandRunner runner;
			std::unique_ptr<IServiceBackend> backend;
			SystemCommands sys;
			InstallDecisionEngine decision;
		};

		//------------------------------------------------------------
		//	Шлюз решения об установке
		//------------------------------------------------------------
		static bool checkStep(Steps& s, Error* error)
		{
			InstallDecision d = InstallDecision::Fresh;
			if (!s.decision.evaluate(s.opt.packageVersion, d, error)) return false;

			LOG(INFO) << "Install decision: " << toString(d) << ", proceeding";
			return true;
		}
		//------------------------------------------------------------
		//	Остановка службы и трея перед копированием файлов
		//------------------------------------------------------------
		static bool preflightStep(Steps& s, Error* error)
		{
			PreflightCleanup preflight(*s.backend, s.sys);
			return preflight.run(s.cfg.serviceName, s.cfg.uiExe, nullptr, error);
		}
		//------------------------------------------------------------
		//	Настройка службы после копирования файлов + запись версии
		//------------------------------------------------------------
		static bool configureStep(Steps& s, Error* error)
		{
			//---Версия записывается в реестр - мусор туда попадать не должен
			PackedVersion v;
			if (!parseVersion(s.opt.packageVersion, v, error)) return false;
			LOG(INFO) << "Package version " << s.opt.packageVersion << " (" << toString(v) << ")";

			const ServiceSpec spec = makeServiceSpec(s.cfg, s.opt.enabled);

			//---Исполняемый файл службы должен быть уже скопирован
			std::error_code ec;
			if (!fs::exists(spec.exeAbs, ec))
			{
				return fail(error, ErrorKind::InvalidArgument,
					"Service executable does not exist: " + pathToUtf8(spec.exeAbs));
			}

			ServiceLifecycleManager lifecycle(*s.backend, s.sys, s.env.store,
				AutostartEntry{ s.cfg.trayAutostartKey, trayAutostartValue(s.cfg) });

			if (!lifecycle.apply(spec, s.opt.enabled, error)) return false;

			return s.decision.recordInstalled(s.opt.packageVersion, error);
		}
		//------------------------------------------------------------
		//	Деинсталляция: вопрос о данных → команды → записи реестра →
		//	файлы приложения → данные
		//------------------------------------------------------------
		static bool uninstallStep(Steps& s, Error* error)
		{
			UninstallOrchestrator orchestrator(*s.backend, s.sys, s.ui, s.env.removeDataRoot);

			//---Выбор живёт только в этом прогоне; до ответа - Keep
			const UninstallContext ctx = orchestrator.begin(s.cfg.productName, s.cfg.dataRoot, s.opt.deleteData);

			if (!orchestrator.runCommands(s.cfg.serviceName, s.cfg.uiExe, error)) return false;

			if (!s.env.store.remove(s.cfg.trayAutostartKey, error)) return false;
			if (!s.decision.clearInstalled(error)) return false;

			//---Файлы приложения (при запуске из Inno Setup их удаляет Inno)
			if (!s.opt.fromInno && s.env.removeInstallDir)
			{
				std::string delErr;
				if (!s.env.removeInstallDir(s.cfg.appDir, &delErr))
					LOG(WARNING) << "removeInstallDir: " << delErr;
			}

			(void)orchestrator.finish(ctx, s.cfg.dataRoot);
			return true;
		}
	} // namespace

	//------------------------------------------------------------
	//	Логирование ошибки, показ пользователю и код завершения
	//------------------------------------------------------------
	static int fail(Interaction& ui, const Error& err) {
		LOG(ERROR) << "[" << toString(err.kind) << "] " << err.message;
		ui.reportError(err.message);
		return exitCodeFor(err.kind == ErrorKind::None ? ErrorKind::InvalidArgument : err.kind);
	}
	//------------------------------------------------------------
	//	Оркестратор: запуск шагов установщика с заданными опциями
	//------------------------------------------------------------
	int runInstaller(const CliOptions& opt, const ProductConfig& cfg, SetupEnvironment& env) {

		Steps s(opt, cfg, env);
		Error err;

		LOG(INFO) << "Service " << cfg.serviceName << ", app dir " << cfg.appDir << ", data root " << cfg.dataRoot
			<< (s.ui.unattended() ? " (unattended)" : "");

		switch (opt.cmd)
		{
		//---Нужно ли ставить общую среду выполнения
		case Command::CheckRuntime:
		{
			RuntimeDependencyDetector detector(env.store, env.os);
			const bool required = detector.installRequired();
			LOG(INFO) << "Runtime installer " << (required ? "required" : "not required");
			return required ? kExitOk : kExitRuntimeNotNeeded;
		}
		case Command::Check:
			if (!checkStep(s, &err)) return fail(s.ui, err);
			return kExitOk;

		case Command::Preflight:
			if (!preflightStep(s, &err)) return fail(s.ui, err);
			return kExitOk;

		case Command::Configure:
			if (!configureStep(s, &err)) return fail(s.ui, err);
			return kExitOk;

		//---Полная последовательность: решение → очистка → настройка
		case Command::Install:
			if (!checkStep(s, &err)) return fail(s.ui, err);
			if (!preflightStep(s, &err)) return fail(s.ui, err);
			if (!configureStep(s, &err)) return fail(s.ui, err);
			return kExitOk;

		case Command::Uninstall:
			if (!uninstallStep(s, &err)) return fail(s.ui, err);
			return kExitOk;

		case Command::Help:
		case Command::Invalid:
			break;
		}
		return kExitInvalidCli;
	}
	//------------------------------------------------------------
	//	Запуск на реальной машине
	//------------------------------------------------------------
	int runInstaller(const CliOptions& opt, const ProductConfig& cfg) {

		auto prompt = makePrompt();
		Interaction ui(*prompt, opt.unattended);

		//---Проверка прав администратора (кроме проверки среды выполнения)
		if (opt.cmd != Command::CheckRuntime && !requireAdminRoot())
		{
			return fail(ui, Error{ ErrorKind::InvalidArgument, "Administrator/root privileges required." });
		}

		//---Хранилище ключ-значение для текущей платформы
		auto store = makeKeyValueStore();
		if (!store) return fail(ui, Error{ ErrorKind::InvalidArgument, "Registry is not available on this platform." });

		process::SystemProcessRunner runner;

		SetupEnvironment env{
			runner,
			*store,
			*prompt,
			[](const fs::path& dir, std::string* error) { return removeDataRoot(dir, error); },
			[](const fs::path& dir, std::string* error) { return removeInstallDir(dir, error); },
			osVersion()
		};
		return runInstaller(opt, cfg, env);
	}
}; //---namespace setupcore
