#include "setup_core/Platform.hpp"
#include "setup_core/KeyValueStore.hpp"
#include "setup_core/Prompt.hpp"
#include "platform/PlatformImpl.hpp"

namespace setupcore {
	//------------------------------------------------------------
	//	Проверка прав администратора
	//------------------------------------------------------------
	bool requireAdminRoot() {
		return platform::isElevated();
	}
	//------------------------------------------------------------
	//	Хранилище ключ-значение для текущей платформы
	//------------------------------------------------------------
	std::unique_ptr<IKeyValueStore> makeKeyValueStore() {
		return platform::makeKeyValueStore();
	}
	//------------------------------------------------------------
	//	Диалоги для текущей платформы
	//------------------------------------------------------------
	std::unique_ptr<IUserPrompt> makePrompt() {
		return platform::makePrompt();
	}
	//------------------------------------------------------------
	OsVersion osVersion() {
		return platform::osVersion();
	}
	//------------------------------------------------------------
	//	Полный путь к системной утилите
	//------------------------------------------------------------
	fs::path systemToolPath(const std::string& exeName) {
		const fs::path dir = platform::systemDir();
		if (dir.empty()) return fs::path(exeName);
		return dir / exeName;
	}
	//------------------------------------------------------------
	bool removeDataRoot(const fs::path& dataRoot, std::string* error) {
		return platform::removeDataRoot(dataRoot, error);
	}
	//------------------------------------------------------------
	bool removeInstallDir(const fs::path& installDir, std::string* error) {
		return platform::removeInstallDir(installDir, error);
	}
}; //---namespace setupcore
