#pragma once
#include <filesystem>
#include <initializer_list>
#include <string>
#include <vector>

#include "Error.hpp"
#include "Process.hpp"

namespace setupcore {

	namespace fs = std::filesystem;

	//---Классификация результата команды для конкретного места вызова
	enum class Outcome {
		Success,		//	exitCode == 0
		Tolerated,		//	ненулевой код, который место вызова считает ожидаемым
		Fatal			//	ошибка запуска или недопустимый код
	};

	//---Классифицирует результат по списку допустимых ненулевых кодов
	Outcome classify(const process::ExecutionResult& rr, std::initializer_list<int> toleratedCodes);

	//---Единая точка запуска внешних команд.
	//   Каждый запуск логируется до (exe, аргументы, рабочий каталог) и после (код / ошибка запуска)
	class CommandRunner final {
	public:
		explicit CommandRunner(process::IProcessRunner& runner);

		//---Запуск без проверки кода. Код интерпретирует вызывающий
		process::ExecutionResult run(const fs::path& exe, const std::vector<std::string>& args,
			const fs::path& workingDir = {});

		//---Запуск с проверкой: ошибка запуска -> LaunchFailure, код != 0 -> CommandFailure
		bool runChecked(const fs::path& exe, const std::vector<std::string>& args,
			const fs::path& workingDir, const std::string& what, Error* error);

		//---Запуск, терпимый к перечисленным кодам.
		//   Ошибка запуска -> LaunchFailure, код вне списка -> CommandFailure.
		//   Фактический код возвращается в exitCode (если не nullptr)
		bool runTolerant(const fs::path& exe, const std::vector<std::string>& args,
			const fs::path& workingDir, const std::string& what,
			std::initializer_list<int> toleratedCodes, int* exitCode, Error* error);

		//---Запуск "по возможности": любой код только логируется.
		//   false - только если процесс не запустился (LaunchFailure)
		bool runBestEffort(const fs::path& exe, const std::vector<std::string>& args,
			const fs::path& workingDir, const std::string& what, int* exitCode, Error* error);

	private:
		process::IProcessRunner& runner_;
	};

	//---Строка команды для логов и сообщений об ошибках
	std::string describeCommand(const fs::path& exe, const std::vector<std::string>& args);

};//---namespace setupcore
