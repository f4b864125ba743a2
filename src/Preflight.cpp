#include "setup_core/Preflight.hpp"
#include "setup_core/IServiceBackend.hpp"

#include <glog/logging.h>

namespace setupcore {

	//------------------------------------------------------------
	PreflightCleanup::PreflightCleanup(IServiceBackend& backend, SystemCommands& sys)
		: backend_(backend), sys_(sys)
	{
	}
	//------------------------------------------------------------
	//	Остановка службы и приложения в трее перед копированием файлов
	//------------------------------------------------------------
	bool PreflightCleanup::run(const std::string& serviceName, const std::string& uiImage,
		PreflightReport* report, Error* error)
	{
		LOG(INFO) << "Preflight: stopping " << serviceName << " and " << uiImage;

		PreflightReport r;

		//---1. Остановка службы: любой код - информационный
		if (!backend_.stopBestEffort(serviceName, &r.serviceStopExitCode, error)) return false;

		//---2. Принудительное завершение трея: 0 и "не найден" ожидаемы, остальное - предупреждение
		if (!sys_.killImage(uiImage, r.uiKill, error)) return false;

		if (report) *report = r;
		return true;
	}
}; //---namespace setupcore
