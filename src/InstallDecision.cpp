#include "setup_core/InstallDecision.hpp"
#include "setup_core/Prompt.hpp"
#include "setup_core/Version.hpp"

#include <utility>
#include <glog/logging.h>

namespace setupcore {

	//------------------------------------------------------------
	const char* toString(InstallDecision d)
	{
		switch (d)
		{
		case InstallDecision::Fresh:			return "Fresh";
		case InstallDecision::Repair:			return "Repair";
		case InstallDecision::Upgrade:			return "Upgrade";
		case InstallDecision::RejectDowngrade:	return "RejectDowngrade";
		}
		return "Unknown";
	}
	//------------------------------------------------------------
	//	Решение по установленной и устанавливаемой версиям
	//------------------------------------------------------------
	bool decideInstall(const std::optional<std::string>& installed, const std::string& incoming,
		InstallDecision& out, Error* error)
	{
		//---Устанавливаемая версия проверяется всегда, до любых изменений системы
		PackedVersion incomingV;
		if (!parseVersion(incoming, incomingV, error)) return false;

		//---Установленной версии нет → чистая установка
		if (!installed)
		{
			out = InstallDecision::Fresh;
			return true;
		}

		PackedVersion installedV;
		if (!parseVersion(*installed, installedV, error)) return false;

		const int cmp = compareVersions(incomingV, installedV);
		if (cmp < 0) out = InstallDecision::RejectDowngrade;
		else if (cmp == 0) out = InstallDecision::Repair;
		else out = InstallDecision::Upgrade;
		return true;
	}
	//------------------------------------------------------------
	InstallDecisionEngine::InstallDecisionEngine(IKeyValueStore& store, StoreKey versionKey, Interaction& ui)
		: store_(store), versionKey_(std::move(versionKey)), ui_(ui)
	{
	}
	//------------------------------------------------------------
	//	Шлюз: решение + подтверждение
	//------------------------------------------------------------
	bool InstallDecisionEngine::evaluate(const std::string& incoming, InstallDecision& decision, Error* error)
	{
		std::optional<std::string> installed;
		if (!store_.get(versionKey_, installed, error)) return false;

		//---Пустое значение считаем отсутствием записи
		if (installed && installed->empty()) installed.reset();

		if (!decideInstall(installed, incoming, decision, error)) return false;

		LOG(INFO) << "Installed version: " << (installed ? *installed : std::string("<none>"))
			<< ", incoming: " << incoming << " -> " << toString(decision);

		switch (decision)
		{
		case InstallDecision::Fresh:
			return true;

		case InstallDecision::RejectDowngrade:
			return fail(error, ErrorKind::RejectDowngrade,
				"A newer version (" + *installed + ") is already installed. "
				"Uninstall it before installing version " + incoming + ".");

		case InstallDecision::Repair:
			if (!ui_.confirm("Version " + incoming + " is already installed. Repair the installation?", true))
				return fail(error, ErrorKind::Cancelled, "Repair cancelled by the user");
			return true;

		case InstallDecision::Upgrade:
			if (!ui_.confirm("Version " + *installed + " is installed. Upgrade to version " + incoming + "?", true))
				return fail(error, ErrorKind::Cancelled, "Upgrade cancelled by the user");
			return true;
		}
		return true;
	}
	//------------------------------------------------------------
	bool InstallDecisionEngine::recordInstalled(const std::string& version, Error* error)
	{
		LOG(INFO) << "Recording installed version " << version;
		return store_.set(versionKey_, version, error);
	}
	//------------------------------------------------------------
	bool InstallDecisionEngine::clearInstalled(Error* error)
	{
		LOG(INFO) << "Clearing installed version record";
		return store_.remove(versionKey_, error);
	}
}; //---namespace setupcore
