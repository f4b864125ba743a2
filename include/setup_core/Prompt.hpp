#pragma once
#include <iosfwd>
#include <string>

namespace setupcore {

	//---Блокирующие диалоги с пользователем
	class IUserPrompt {
	public:
		virtual ~IUserPrompt() = default;

		virtual bool askYesNo(const std::string& question) = 0;
		virtual void showError(const std::string& message) = 0;
	};

	//---Диалоги через консоль
	class ConsolePrompt final : public IUserPrompt {
	public:
		ConsolePrompt(std::istream& in, std::ostream& out);

		bool askYesNo(const std::string& question) override;
		void showError(const std::string& message) override;

	private:
		std::istream& in_;
		std::ostream& out_;
	};

	//---Взаимодействие с учётом режима: в автоматическом режиме
	//   диалоги подавляются и применяются значения по умолчанию
	class Interaction final {
	public:
		Interaction(IUserPrompt& prompt, bool unattended);

		bool unattended() const { return unattended_; }

		//---Вопрос да/нет; в автоматическом режиме возвращает unattendedAnswer
		bool confirm(const std::string& question, bool unattendedAnswer);
		//---Сообщение об ошибке; в автоматическом режиме не показывается
		void reportError(const std::string& message);

	private:
		IUserPrompt& prompt_;
		bool unattended_ = false;
	};

};//---namespace setupcore
