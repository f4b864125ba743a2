#include "setup_core/Uninstall.hpp"
#include "setup_core/IServiceBackend.hpp"
#include "setup_core/Paths.hpp"
#include "setup_core/Prompt.hpp"
#include "setup_core/SystemCommands.hpp"

#include <utility>
#include <glog/logging.h>

namespace setupcore {

	//------------------------------------------------------------
	UninstallOrchestrator::UninstallOrchestrator(IServiceBackend& backend, SystemCommands& sys,
		Interaction& ui, DirectoryRemover remover)
		: backend_(backend), sys_(sys), ui_(ui), remover_(std::move(remover))
	{
	}
	//------------------------------------------------------------
	//	Единственный вопрос об удалении данных
	//------------------------------------------------------------
	UninstallContext UninstallOrchestrator::begin(const std::string& productName, const fs::path& dataRoot,
		std::optional<bool> presetDelete)
	{
		UninstallContext ctx;

		bool del = false;
		if (presetDelete)
		{
			del = *presetDelete;
			LOG(INFO) << "Data retention preset from command line: " << (del ? "delete" : "keep");
		}
		else
		{
			del = ui_.confirm("Do you also want to delete all " + productName + " data in '"
				+ pathToUtf8(dataRoot) + "'? This cannot be undone.", false);
		}

		ctx.retention = del ? DataRetentionChoice::Delete : DataRetentionChoice::Keep;
		return ctx;
	}
	//------------------------------------------------------------
	//	Остановка службы, удаление службы, завершение трея
	//------------------------------------------------------------
	bool UninstallOrchestrator::runCommands(const std::string& serviceName, const std::string& uiImage, Error* error)
	{
		if (!backend_.stop(serviceName, error)) return false;
		if (!backend_.remove(serviceName, error)) return false;

		KillResult kill = KillResult::NotRunning;
		if (!sys_.killImage(uiImage, kill, error)) return false;
		if (kill == KillResult::Unexpected)
			return fail(error, ErrorKind::CommandFailure, "taskkill " + uiImage + ": failed to terminate process");

		return true;
	}
	//------------------------------------------------------------
	//	Финальная очистка данных
	//------------------------------------------------------------
	bool UninstallOrchestrator::finish(const UninstallContext& ctx, const fs::path& dataRoot)
	{
		if (ctx.retention == DataRetentionChoice::Keep)
		{
			LOG(INFO) << "Keeping data directory " << dataRoot;
			return false;
		}

		std::string err;
		if (!remover_ || !remover_(dataRoot, &err))
		{
			LOG(WARNING) << "Failed to delete data directory " << dataRoot
				<< (err.empty() ? std::string() : ": " + err) << ". Delete it manually.";
			return false;
		}

		LOG(INFO) << "Data directory deleted: " << dataRoot;
		return true;
	}
}; //---namespace setupcore
