#pragma once
#include <memory>

#include "IServiceBackend.hpp"

namespace setupcore {

	class CommandRunner;
	struct ToolPaths;

	//---Бэкенд на sc.exe (query/start/stop/delete) и обёртке служб nssm.exe (install/set)
	std::unique_ptr<IServiceBackend> makeServiceBackend(CommandRunner& runner, const ToolPaths& tools);

};//---namespace setupcore
