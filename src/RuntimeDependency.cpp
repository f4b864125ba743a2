#include "setup_core/RuntimeDependency.hpp"

#include <optional>
#include <string>
#include <glog/logging.h>

namespace setupcore {

	namespace {
		//---Идентификатор WebView2 Evergreen Runtime в EdgeUpdate
		constexpr const char* kRuntimeClientId = "{F3017226-FE2A-4295-8BDF-00C3A9A7E4C5}";
	} // namespace

	//------------------------------------------------------------
	//	Регистрация для всей машины (32-битное представление реестра)
	//------------------------------------------------------------
	StoreKey runtimeMachineKey()
	{
		return StoreKey{ Scope::Machine,
			std::string("SOFTWARE\\WOW6432Node\\Microsoft\\EdgeUpdate\\Clients\\") + kRuntimeClientId, "pv" };
	}
	//------------------------------------------------------------
	//	Регистрация для текущего пользователя
	//------------------------------------------------------------
	StoreKey runtimeUserKey()
	{
		return StoreKey{ Scope::User,
			std::string("Software\\Microsoft\\EdgeUpdate\\Clients\\") + kRuntimeClientId, "pv" };
	}
	//------------------------------------------------------------
	RuntimeDependencyDetector::RuntimeDependencyDetector(IKeyValueStore& store, OsVersion os)
		: store_(store), os_(os)
	{
	}
	//------------------------------------------------------------
	//	Версия зарегистрирована, не пустая и не "0.0.0.0"
	//------------------------------------------------------------
	bool RuntimeDependencyDetector::presentAt(const StoreKey& key)
	{
		std::optional<std::string> pv;
		Error err;
		if (!store_.get(key, pv, &err))
		{
			LOG(WARNING) << "Runtime check: cannot read " << key.path << ": " << err.message;
			return false;
		}
		return pv && !pv->empty() && *pv != "0.0.0.0";
	}
	//------------------------------------------------------------
	bool RuntimeDependencyDetector::isPresent()
	{
		const bool machine = presentAt(runtimeMachineKey());
		const bool user = !machine && presentAt(runtimeUserKey());

		LOG(INFO) << "Runtime dependency: machine=" << machine << " user=" << user;
		return machine || user;
	}
	//------------------------------------------------------------
	bool RuntimeDependencyDetector::shouldInstall() const
	{
		const bool supported = os_.major >= kRuntimeMinOsMajor;
		if (!supported)
		{
			LOG(INFO) << "Runtime dependency: OS " << os_.major << "." << os_.minor
				<< " is older than " << kRuntimeMinOsMajor << ", installer not supported";
		}
		return supported;
	}
}; //---namespace setupcore
