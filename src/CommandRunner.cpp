#include "setup_core/CommandRunner.hpp"
#include "setup_core/Paths.hpp"

#include <sstream>
#include <glog/logging.h>

namespace setupcore {

	namespace {
		//------------------------------------------------------------
		//	Аргумент в кавычках, если содержит пробелы
		//------------------------------------------------------------
		static std::string quoteForLog(const std::string& s)
		{
			if (s.empty() || s.find_first_of(" \t\"") != std::string::npos)
			{
				return "\"" + s + "\"";
			}
			return s;
		}
		//------------------------------------------------------------
		//	Есть ли код в списке допустимых
		//------------------------------------------------------------
		static bool isTolerated(int code, std::initializer_list<int> ok)
		{
			for (int v : ok) if (code == v) return true;
			return false;
		}
		//------------------------------------------------------------
		//	Сообщение об ошибке запуска
		//------------------------------------------------------------
		static bool launchFailure(const std::string& what, const fs::path& exe,
			const std::vector<std::string>& args, const process::ExecutionResult& rr, Error* error)
		{
			std::ostringstream os;
			os << what << ": failed to start '" << describeCommand(exe, args)
				<< "'. sysError=" << rr.sysError;
			LOG(ERROR) << os.str();
			return fail(error, ErrorKind::LaunchFailure, os.str());
		}
		//------------------------------------------------------------
		//	Сообщение о недопустимом коде завершения
		//------------------------------------------------------------
		static bool commandFailure(const std::string& what, const fs::path& exe,
			const std::vector<std::string>& args, int exitCode, Error* error)
		{
			std::ostringstream os;
			os << what << ": '" << describeCommand(exe, args) << "' exitCode=" << exitCode;
			LOG(ERROR) << os.str();
			return fail(error, ErrorKind::CommandFailure, os.str());
		}
	} // namespace

	//------------------------------------------------------------
	//	Строка команды для логов
	//------------------------------------------------------------
	std::string describeCommand(const fs::path& exe, const std::vector<std::string>& args)
	{
		std::string s = quoteForLog(pathToUtf8(exe));
		for (const auto& a : args)
		{
			s += " ";
			s += quoteForLog(a);
		}
		return s;
	}
	//------------------------------------------------------------
	//	Классификация результата
	//------------------------------------------------------------
	Outcome classify(const process::ExecutionResult& rr, std::initializer_list<int> toleratedCodes)
	{
		if (!rr.launched) return Outcome::Fatal;
		if (rr.exitCode == 0) return Outcome::Success;
		if (isTolerated(rr.exitCode, toleratedCodes)) return Outcome::Tolerated;
		return Outcome::Fatal;
	}
	//------------------------------------------------------------
	CommandRunner::CommandRunner(process::IProcessRunner& runner)
		: runner_(runner)
	{
	}
	//------------------------------------------------------------
	//	Запуск без проверки кода
	//------------------------------------------------------------
	process::ExecutionResult CommandRunner::run(const fs::path& exe, const std::vector<std::string>& args,
		const fs::path& workingDir)
	{
		LOG(INFO) << "Run: " << describeCommand(exe, args)
			<< (workingDir.empty() ? std::string() : " (cwd: " + pathToUtf8(workingDir) + ")");

		process::RunOptions opt;
		opt.workingDir = workingDir;
		opt.hideWindow = true;

		const process::ExecutionResult rr = runner_.run(exe, args, opt);

		if (!rr.launched)
			LOG(ERROR) << "Not started: " << pathToUtf8(exe) << " sysError=" << rr.sysError;
		else
			LOG(INFO) << "Finished: " << pathToUtf8(exe) << " exitCode=" << rr.exitCode;

		return rr;
	}
	//------------------------------------------------------------
	//	Запуск с проверкой кода
	//------------------------------------------------------------
	bool CommandRunner::runChecked(const fs::path& exe, const std::vector<std::string>& args,
		const fs::path& workingDir, const std::string& what, Error* error)
	{
		return runTolerant(exe, args, workingDir, what, {}, nullptr, error);
	}
	//------------------------------------------------------------
	//	Запуск, терпимый к перечисленным кодам
	//------------------------------------------------------------
	bool CommandRunner::runTolerant(const fs::path& exe, const std::vector<std::string>& args,
		const fs::path& workingDir, const std::string& what,
		std::initializer_list<int> toleratedCodes, int* exitCode, Error* error)
	{
		const process::ExecutionResult rr = run(exe, args, workingDir);
		if (exitCode) *exitCode = rr.exitCode;

		switch (classify(rr, toleratedCodes))
		{
		case Outcome::Success:
			LOG(INFO) << what << ": ok";
			return true;
		case Outcome::Tolerated:
			LOG(INFO) << what << ": exitCode=" << rr.exitCode << " (expected)";
			return true;
		case Outcome::Fatal:
			break;
		}

		if (!rr.launched) return launchFailure(what, exe, args, rr, error);
		return commandFailure(what, exe, args, rr.exitCode, error);
	}
	//------------------------------------------------------------
	//	Запуск "по возможности"
	//------------------------------------------------------------
	bool CommandRunner::runBestEffort(const fs::path& exe, const std::vector<std::string>& args,
		const fs::path& workingDir, const std::string& what, int* exitCode, Error* error)
	{
		const process::ExecutionResult rr = run(exe, args, workingDir);
		if (exitCode) *exitCode = rr.exitCode;

		if (!rr.launched) return launchFailure(what, exe, args, rr, error);

		LOG(INFO) << what << ": exitCode=" << rr.exitCode << " (informational)";
		return true;
	}
}; //---namespace setupcore
