#pragma once
#include <filesystem>
#include <string>

#include "Config.hpp"
#include "Error.hpp"

namespace setupcore {

	namespace fs = std::filesystem;

	class CommandRunner;

	//---taskkill: "процесс с таким именем не найден"
	inline constexpr int kTaskkillNotFound = 128;

	//---Итог принудительного завершения процесса по имени образа
	enum class KillResult {
		Killed,			//	Код 0 - процесс найден и завершён
		NotRunning,		//	kTaskkillNotFound
		Unexpected		//	Любой другой код
	};

	//---Файловые права и процессы через системные утилиты
	class SystemCommands final {
	public:
		SystemCommands(CommandRunner& runner, ToolPaths tools);

		//---Рекурсивно выдать право изменения (M) на каталог
		bool grantModify(const fs::path& dir, const std::string& grantee, Error* error);

		//---taskkill /F /IM <image>. Любой код - не ошибка, false только при ошибке запуска
		bool killImage(const std::string& image, KillResult& result, Error* error);

	private:
		CommandRunner& runner_;
		ToolPaths tools_;
	};

};//---namespace setupcore
