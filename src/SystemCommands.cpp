#include "setup_core/SystemCommands.hpp"
#include "setup_core/CommandRunner.hpp"
#include "setup_core/Paths.hpp"

#include <utility>
#include <glog/logging.h>

namespace setupcore {

	//------------------------------------------------------------
	SystemCommands::SystemCommands(CommandRunner& runner, ToolPaths tools)
		: runner_(runner), tools_(std::move(tools))
	{
	}
	//------------------------------------------------------------
	//	icacls "<dir>" /grant "<grantee>:(OI)(CI)M" /T
	//------------------------------------------------------------
	bool SystemCommands::grantModify(const fs::path& dir, const std::string& grantee, Error* error)
	{
		if (dir.empty()) return fail(error, ErrorKind::InvalidArgument, "icacls: empty directory");
		if (grantee.empty()) return fail(error, ErrorKind::InvalidArgument, "icacls: empty grantee");

		return runner_.runChecked(tools_.icacls,
			{ pathToUtf8(dir), "/grant", grantee + ":(OI)(CI)M", "/T" },
			{}, "icacls grant " + grantee, error);
	}
	//------------------------------------------------------------
	//	taskkill /F /IM <image>
	//------------------------------------------------------------
	bool SystemCommands::killImage(const std::string& image, KillResult& result, Error* error)
	{
		if (image.empty()) return fail(error, ErrorKind::InvalidArgument, "taskkill: empty image name");

		int code = 0;
		if (!runner_.runBestEffort(tools_.taskkill, { "/F", "/IM", image }, {}, "taskkill " + image, &code, error))
			return false;

		if (code == 0)
		{
			result = KillResult::Killed;
			LOG(INFO) << "taskkill " << image << ": process terminated";
		}
		else if (code == kTaskkillNotFound)
		{
			result = KillResult::NotRunning;
			LOG(INFO) << "taskkill " << image << ": no running process";
		}
		else
		{
			result = KillResult::Unexpected;
			LOG(WARNING) << "taskkill " << image << ": unexpected exitCode=" << code;
		}
		return true;
	}
}; //---namespace setupcore
