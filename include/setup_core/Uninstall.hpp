#pragma once
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "Error.hpp"

namespace setupcore {

	namespace fs = std::filesystem;

	class IServiceBackend;
	class Interaction;
	class SystemCommands;

	//---Что делать с данными пользователя
	enum class DataRetentionChoice {
		Keep,
		Delete
	};

	//---Состояние одного прогона деинсталляции. До вопроса пользователю - Keep
	struct UninstallContext final {
		DataRetentionChoice retention = DataRetentionChoice::Keep;
	};

	//---Удаление каталога: true - удалён (или не существовал), иначе error
	using DirectoryRemover = std::function<bool(const fs::path& dir, std::string* error)>;

	//---Деинсталляция: вопрос о данных, команды удаления службы, финальная очистка
	class UninstallOrchestrator final {
	public:
		UninstallOrchestrator(IServiceBackend& backend, SystemCommands& sys,
			Interaction& ui, DirectoryRemover remover);

		//---Единственный вопрос о данных. preset (из командной строки) отвечает без вопроса.
		//   В автоматическом режиме без preset - Keep
		UninstallContext begin(const std::string& productName, const fs::path& dataRoot,
			std::optional<bool> presetDelete);

		//---Остановка службы, удаление службы, завершение приложения в трее
		bool runCommands(const std::string& serviceName, const std::string& uiImage, Error* error);

		//---Финальная очистка после удаления файлов. Ошибка удаления данных -
		//   только предупреждение. Возвращает true, если каталог данных удалён
		bool finish(const UninstallContext& ctx, const fs::path& dataRoot);

	private:
		IServiceBackend& backend_;
		SystemCommands& sys_;
		Interaction& ui_;
		DirectoryRemover remover_;
	};

};//---namespace setupcore
