#include "setup_core/Prompt.hpp"

#include <istream>
#include <ostream>
#include <glog/logging.h>

namespace setupcore {

	//------------------------------------------------------------
	ConsolePrompt::ConsolePrompt(std::istream& in, std::ostream& out)
		: in_(in), out_(out)
	{
	}
	//------------------------------------------------------------
	//	Вопрос да/нет в консоли. Конец ввода - "нет"
	//------------------------------------------------------------
	bool ConsolePrompt::askYesNo(const std::string& question)
	{
		std::string line;
		while (true)
		{
			out_ << question << " [y/n]: " << std::flush;
			if (!std::getline(in_, line)) return false;

			if (line == "y" || line == "Y" || line == "yes") return true;
			if (line == "n" || line == "N" || line == "no") return false;
		}
	}
	//------------------------------------------------------------
	void ConsolePrompt::showError(const std::string& message)
	{
		out_ << "ERROR: " << message << std::endl;
	}

	//------------------------------------------------------------
	Interaction::Interaction(IUserPrompt& prompt, bool unattended)
		: prompt_(prompt), unattended_(unattended)
	{
	}
	//------------------------------------------------------------
	//	Подтверждение с учётом автоматического режима
	//------------------------------------------------------------
	bool Interaction::confirm(const std::string& question, bool unattendedAnswer)
	{
		if (unattended_)
		{
			LOG(INFO) << "Unattended: '" << question << "' -> " << (unattendedAnswer ? "yes" : "no");
			return unattendedAnswer;
		}
		const bool answer = prompt_.askYesNo(question);
		LOG(INFO) << "User answered '" << question << "' -> " << (answer ? "yes" : "no");
		return answer;
	}
	//------------------------------------------------------------
	void Interaction::reportError(const std::string& message)
	{
		if (unattended_) return;
		prompt_.showError(message);
	}
}; //---namespace setupcore
