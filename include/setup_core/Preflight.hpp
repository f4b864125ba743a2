#pragma once
#include <string>

#include "Error.hpp"
#include "SystemCommands.hpp"

namespace setupcore {

	class IServiceBackend;

	//---Итог предварительной очистки
	struct PreflightReport final {
		int serviceStopExitCode = 0;
		KillResult uiKill = KillResult::NotRunning;
	};

	//---Остановка службы и приложения в трее перед копированием файлов.
	//   Оба шага "по возможности": "не запущено" ожидаемо и не отличимо заранее
	//   от "не удалось остановить"
	class PreflightCleanup final {
	public:
		PreflightCleanup(IServiceBackend& backend, SystemCommands& sys);

		//---false только если команда не запустилась (LaunchFailure)
		bool run(const std::string& serviceName, const std::string& uiImage,
			PreflightReport* report, Error* error);

	private:
		IServiceBackend& backend_;
		SystemCommands& sys_;
	};

};//---namespace setupcore
