#include "setup_core/Config.hpp"
#include "setup_core/Cli.hpp"
#include "setup_core/Paths.hpp"
#include "setup_core/Platform.hpp"

namespace setupcore {

	//------------------------------------------------------------
	//	Конфигурация по умолчанию для текущей машины
	//------------------------------------------------------------
	ProductConfig defaultProductConfig()
	{
		ProductConfig cfg;
		cfg.appDir = selfDir();
		cfg.dataRoot = resolveDataRoot({});

		cfg.tools.sc = systemToolPath("sc.exe");
		cfg.tools.taskkill = systemToolPath("taskkill.exe");
		cfg.tools.icacls = systemToolPath("icacls.exe");
		cfg.tools.serviceWrapper = cfg.appDir / cfg.serviceWrapperExe;
		return cfg;
	}
	//------------------------------------------------------------
	//	Переопределения из командной строки
	//------------------------------------------------------------
	void applyCliOptions(ProductConfig& cfg, const CliOptions& opt)
	{
		if (!opt.appDir.empty())
		{
			cfg.appDir = fs::path(opt.appDir);
			cfg.tools.serviceWrapper = cfg.appDir / cfg.serviceWrapperExe;
		}
		if (!opt.dataRoot.empty()) cfg.dataRoot = resolveDataRoot(opt.dataRoot);

		if (!opt.name.empty()) cfg.serviceName = opt.name;
		if (!opt.exe.empty()) cfg.serviceExe = opt.exe;
		if (opt.args) cfg.serviceArgs = *opt.args;
		if (!opt.description.empty()) cfg.serviceDescription = opt.description;
		if (!opt.account.empty()) cfg.account = opt.account;
		if (!opt.uiExe.empty()) cfg.uiExe = opt.uiExe;
	}
	//------------------------------------------------------------
	fs::path serviceExePath(const ProductConfig& cfg)
	{
		return resolveExePath(cfg.serviceExe, cfg.appDir);
	}
	//------------------------------------------------------------
	std::string trayAutostartValue(const ProductConfig& cfg)
	{
		return "\"" + pathToUtf8(cfg.appDir / cfg.uiExe) + "\"";
	}
	//------------------------------------------------------------
	//	Спецификация службы: всегда заново из конфигурации
	//------------------------------------------------------------
	ServiceSpec makeServiceSpec(const ProductConfig& cfg, bool enabled)
	{
		ServiceSpec spec;
		spec.name = cfg.serviceName;
		spec.description = cfg.serviceDescription;
		spec.exeAbs = serviceExePath(cfg);
		spec.args = cfg.serviceArgs;
		spec.workingDir = spec.exeAbs.parent_path();
		spec.account = cfg.account;
		spec.dataDir = cfg.dataRoot;
		spec.serviceGrantee = cfg.serviceGrantee;
		spec.usersGrantee = cfg.usersGrantee;
		spec.startType = enabled ? StartType::Automatic : StartType::Disabled;
		return spec;
	}
}; //---namespace setupcore
