#pragma once
#include <filesystem>
#include <string>

#include "KeyValueStore.hpp"
#include "ServiceSpec.hpp"

namespace setupcore {

	namespace fs = std::filesystem;

	struct CliOptions;

	//---Пути к внешним утилитам
	struct ToolPaths final {
		fs::path sc;				//	%SystemRoot%\System32\sc.exe
		fs::path serviceWrapper;	//	nssm.exe из каталога приложения
		fs::path taskkill;			//	%SystemRoot%\System32\taskkill.exe
		fs::path icacls;			//	%SystemRoot%\System32\icacls.exe
	};

	//---Статическое описание продукта
	struct ProductConfig final {

		//---Продукт
		std::string productName = "Kolibri";

		//---Служба
		std::string serviceName = "Kolibri";
		std::string serviceDescription = "Kolibri Learning Platform server";
		std::string serviceExe = "kolibri-server.exe";		//	Относительно appDir или абсолютный
		std::string serviceArgs;
		std::string account = "NT AUTHORITY\\LocalService";

		//---Права на каталог данных: SID LocalService и BUILTIN\Users
		//   (SID не зависят от языка системы)
		std::string serviceGrantee = "*S-1-5-19";
		std::string usersGrantee = "*S-1-5-32-545";

		//---Приложение в трее
		std::string uiExe = "Kolibri.exe";

		//---Обёртка служб
		std::string serviceWrapperExe = "nssm.exe";

		//---Реестр
		StoreKey versionKey{ Scope::Machine, "SOFTWARE\\Kolibri", "InstalledVersion" };
		StoreKey trayAutostartKey{ Scope::Machine, "SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Run", "KolibriTray" };

		//---Каталоги
		fs::path appDir;		//	Каталог установки приложения
		fs::path dataRoot;		//	Каталог данных (KOLIBRI_HOME)

		//---Утилиты
		ToolPaths tools;
	};

	//---Конфигурация по умолчанию для текущей машины:
	//   appDir = selfDir(), dataRoot = defaultDataRoot(), утилиты из системного каталога
	ProductConfig defaultProductConfig();

	//---Применение опций командной строки поверх конфигурации
	void applyCliOptions(ProductConfig& cfg, const CliOptions& opt);

	//---Полный путь к исполняемому файлу службы
	fs::path serviceExePath(const ProductConfig& cfg);

	//---Значение автозапуска приложения в трее: "\"<appDir>\Kolibri.exe\""
	std::string trayAutostartValue(const ProductConfig& cfg);

	//---Спецификация службы из конфигурации
	ServiceSpec makeServiceSpec(const ProductConfig& cfg, bool enabled);

};//---namespace setupcore
