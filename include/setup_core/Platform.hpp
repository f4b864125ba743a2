#pragma once
#include <filesystem>
#include <memory>
#include <string>

#include "RuntimeDependency.hpp"

namespace setupcore {

	namespace fs = std::filesystem;

	class IKeyValueStore;
	class IUserPrompt;

	//---Запуск с правами администратора
	bool requireAdminRoot();

	//---Хранилище ключ-значение текущей платформы (nullptr, если платформа не поддерживается)
	std::unique_ptr<IKeyValueStore> makeKeyValueStore();

	//---Диалоги текущей платформы
	std::unique_ptr<IUserPrompt> makePrompt();

	//---Версия ОС
	OsVersion osVersion();

	//---Полный путь к системной утилите (sc.exe, taskkill.exe, icacls.exe)
	fs::path systemToolPath(const std::string& exeName);

	//---Удаление каталога данных (с отложенным удалением, если сразу не получилось)
	bool removeDataRoot(const fs::path& dataRoot, std::string* error);

	//---Удаление каталога установки. При --from-inno не вызывается: {app} удаляет Inno Setup
	bool removeInstallDir(const fs::path& installDir, std::string* error);

};//---namespace setupcore
