#pragma once
#include "Cli.hpp"
#include "Config.hpp"
#include "Process.hpp"
#include "RuntimeDependency.hpp"
#include "Uninstall.hpp"

namespace setupcore {

	class IKeyValueStore;
	class IUserPrompt;

	//---Коды завершения помощника, кроме exitCodeFor(ErrorKind)
	inline constexpr int kExitOk = 0;
	inline constexpr int kExitInvalidCli = 2;
	inline constexpr int kExitRuntimeNotNeeded = 10;

	//---Внешние зависимости одного прогона
	struct SetupEnvironment final {
		process::IProcessRunner& runner;
		IKeyValueStore& store;
		IUserPrompt& prompt;
		DirectoryRemover removeDataRoot;
		DirectoryRemover removeInstallDir;
		OsVersion os;
	};

	//---Оркестратор: выполняет команду с заданной конфигурацией и окружением.
	//   Единственная точка прерывания: ошибка логируется, показывается пользователю
	//   (кроме автоматического режима) и превращается в код завершения
	int runInstaller(const CliOptions& opt, const ProductConfig& cfg, SetupEnvironment& env);

	//---То же для реальной машины: реестр, sc.exe, MessageBox, проверка прав администратора
	int runInstaller(const CliOptions& opt, const ProductConfig& cfg);

};//---namespace setupcore
