#include <filesystem>
#include <iostream>
#include <system_error>

#include "setup_core/Cli.hpp"
#include "setup_core/Config.hpp"
#include "setup_core/Installer.hpp"
#include "setup_core/Logging.hpp"
#include "setup_core/Paths.hpp"

//------------------------------------------------------------
//	Каталог логов прогона. При деинсталляции каталог данных может
//	удаляться, поэтому лог пишется во временный каталог
//------------------------------------------------------------
static std::filesystem::path runLogDir(const setupcore::CliOptions& opt, const setupcore::ProductConfig& cfg) {

	if (opt.cmd == setupcore::Command::Uninstall)
	{
		std::error_code ec;
		const std::filesystem::path tmp = std::filesystem::temp_directory_path(ec);
		if (!ec) return tmp / "kolibri-setup-logs";
	}
	return setupcore::logDir(cfg.dataRoot);
}

int main(int argc, char** argv) {

	//---Разбор аргументов командной строки
	const setupcore::CliOptions opt = setupcore::parseCli(argc, argv);

	//---Если запрошена справка или команда некорректна → вывод справки и выход
	if (opt.cmd == setupcore::Command::Help || opt.cmd == setupcore::Command::Invalid)
	{
		setupcore::printHelp(std::cout);
		return (opt.cmd == setupcore::Command::Invalid) ? setupcore::kExitInvalidCli : setupcore::kExitOk;
	}

	//---Конфигурация продукта с учётом опций
	setupcore::ProductConfig cfg = setupcore::defaultProductConfig();
	setupcore::applyCliOptions(cfg, opt);

	setupcore::initLogging(argv[0], runLogDir(opt, cfg));

	//---Запуск установщика с заданными опциями
	const int rc = setupcore::runInstaller(opt, cfg);

	setupcore::shutdownLogging();
	return rc;
}
