#pragma once
#include <filesystem>
#include <memory>
#include <string>

#include "setup_core/RuntimeDependency.hpp"

namespace setupcore {

	class IKeyValueStore;
	class IUserPrompt;

	//---Платформенно-зависимые реализации
	namespace platform {
		namespace fs = std::filesystem;

		//---Получение пути к собственному исполняемому файлу
		fs::path selfExePath();
		//---Проверка, что процесс запущен с правами администратора / root
		bool isElevated();
		//---Системный каталог утилит (System32 / /usr/bin)
		fs::path systemDir();
		//---Каталог данных по умолчанию (ProgramData\kolibri / /var/lib/kolibri)
		fs::path defaultDataRoot();
		//---Версия ОС
		OsVersion osVersion();
		//---Хранилище ключ-значение (реестр; nullptr, если нет)
		std::unique_ptr<IKeyValueStore> makeKeyValueStore();
		//---Диалоги
		std::unique_ptr<IUserPrompt> makePrompt();
		//---Удалить папку установки
		bool removeInstallDir(const fs::path& installDir, std::string* error);
		//---Удалить DataRoot (данные/кэш/логи)
		bool removeDataRoot(const fs::path& dataRoot, std::string* error);
	}

} // namespace setupcore
