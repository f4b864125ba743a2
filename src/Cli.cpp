#include "setup_core/Cli.hpp"
#include <iomanip>
#include <optional>
#include <string_view>
#include <vector>

namespace setupcore {

	namespace {

		//---Аргументы командной строки без argv[0]: флаги "--x" и пары "--key=value"
		class ArgList final {
		public:
			ArgList(int argc, char** argv)
			{
				for (int i = 1; i < argc; i++) args_.emplace_back(argv[i]);
			}

			bool flag(std::string_view name) const
			{
				for (const auto& a : args_) if (a == name) return true;
				return false;
			}

			//---Значение первого "--key=value" без обрамляющих кавычек
			std::optional<std::string> value(std::string_view key) const
			{
				for (const auto& a : args_)
				{
					if (a.size() > key.size() && a.compare(0, key.size(), key) == 0 && a[key.size()] == '=')
						return unquote(a.substr(key.size() + 1));
				}
				return std::nullopt;
			}

			std::string valueOr(std::string_view key) const { return value(key).value_or(std::string()); }

		private:
			static std::string unquote(std::string v)
			{
				if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front())
					return v.substr(1, v.size() - 2);
				return v;
			}

			std::vector<std::string> args_;
		};
	} // namespace

	//------------------------------------------------------------
	//	Парсинг ответа да/нет (--delete-data=yes|no)
	//------------------------------------------------------------
	static bool parseYesNo(std::string v, bool& out)
	{
		//---Приводим к нижнему регистру
		for (char& c : v) if (c >= 'A' && c <= 'Z') c = char(c - 'A' + 'a');

		if (v == "yes" || v == "y" || v == "true" || v == "1") { out = true; return true; }
		if (v == "no" || v == "n" || v == "false" || v == "0") { out = false; return true; }

		return false;
	}
	//------------------------------------------------------------
	//---Парсинг опций командной строки
	//------------------------------------------------------------
	CliOptions parseCli(int argc, char** argv) {
	
		//---Результирующие опции
		CliOptions o;
		const ArgList args(argc, argv);

		//---Определение команды
		const bool check = args.flag("--check");
		const bool preflight = args.flag("--preflight");
		const bool configure = args.flag("--configure");
		const bool install = args.flag("--install");
		const bool uninstall = args.flag("--uninstall");
		const bool checkRuntime = args.flag("--check-runtime");
		const bool help = args.flag("--help");

		//---Параметры службы
		o.name = args.valueOr("--name");
		o.exe = args.valueOr("--exe");
		o.args = args.value("--args");
		o.description = args.valueOr("--desc");
		o.account = args.valueOr("--account");
		o.uiExe = args.valueOr("--ui-exe");

		//---Каталоги и версия
		o.appDir = args.valueOr("--app-dir");
		o.dataRoot = args.valueOr("--data-root");
		o.packageVersion = args.valueOr("--package-version");

		//---Флаги
		o.unattended = args.flag("--unattended");
		o.fromInno = args.flag("--from-inno");

		const bool enable = args.flag("--enable");
		const bool disable = args.flag("--disable");
		if (enable && disable)
		{
			o.cmd = Command::Invalid; //	взаимоисключающие флаги
			return o;
		}
		o.enabled = !disable;

		//---Ответ на вопрос об удалении данных
		if (const auto del = args.value("--delete-data"))
		{
			bool v = false;
			if (!parseYesNo(*del, v))
			{
				o.cmd = Command::Invalid; //	неверное значение --delete-data
				return o;
			}
			o.deleteData = v;
		}

		//---Определение команды
		const int cmdCount =
			(check ? 1 : 0) +
			(preflight ? 1 : 0) +
			(configure ? 1 : 0) +
			(install ? 1 : 0) +
			(uninstall ? 1 : 0) +
			(checkRuntime ? 1 : 0);

		//---Если не указана ни одна команда → Help
		if (cmdCount == 0 || help)
		{
			o.cmd = (cmdCount == 0 || cmdCount == 1) ? Command::Help : Command::Invalid;
			return o;
		}
		//---Если некорректно указана команда → Invalid
		if (cmdCount > 1)
		{
			o.cmd = Command::Invalid;
			return o;
		}
		if(check) o.cmd = Command::Check;
		if(preflight) o.cmd = Command::Preflight;
		if(configure) o.cmd = Command::Configure;
		if(install) o.cmd = Command::Install;
		if(uninstall) o.cmd = Command::Uninstall;
		if(checkRuntime) o.cmd = Command::CheckRuntime;

		//---Версия пакета обязательна для шагов установки
		const bool needsVersion = o.cmd == Command::Check || o.cmd == Command::Configure || o.cmd == Command::Install;
		if (needsVersion && o.packageVersion.empty())
		{
			o.cmd = Command::Invalid;
			return o;
		}
		
		//---Возврат опций
		return o;
	}
	//------------------------------------------------------------
	//	Вывод опции с описанием
	//------------------------------------------------------------
	static void printOpt(std::ostream& os, const std::string& opt, const std::string& desc, int w = 24)
	{
		os << "  " << std::left << std::setw(w) << opt << desc << "\n";
	}
	//------------------------------------------------------------
	//	Вывод справки по использованию
	//------------------------------------------------------------
	void printHelp(std::ostream& os)
	{
		os <<
			"setup-helper\n\n"
			"Usage:\n"
			"  setup-helper <command> [options]\n\n"
			"Commands (choose exactly one):\n"
			"  --check           Decide fresh/repair/upgrade; refuse downgrade\n"
			"  --preflight       Stop service and tray app before files are copied\n"
			"  --configure       Create/update and start the service after files are copied\n"
			"  --install         --check + --preflight + --configure\n"
			"  --uninstall       Stop and remove service, optionally delete data\n"
			"  --check-runtime   Exit 0 if the runtime installer must run, 10 otherwise\n\n"
			"Common options:\n";

		printOpt(os, "--package-version=<v>", "Version being installed (required for --check/--configure/--install)");
		printOpt(os, "--app-dir=<path>", "Installation directory (default: helper location)");
		printOpt(os, "--data-root=<path>", "Data directory (default: KOLIBRI_HOME or ProgramData\\kolibri)");
		printOpt(os, "--unattended", "No dialogs: repair/upgrade proceed, data is kept");

		os << "\nService options:\n";
		printOpt(os, "--name=<name>", "Service name");
		printOpt(os, "--exe=<path>", "Service executable; relative paths resolve against --app-dir");
		printOpt(os, "--args=\"...\"", "Arguments passed to the service");
		printOpt(os, "--desc=\"...\"", "Service description");
		printOpt(os, "--account=<account>", "Run-as account");
		printOpt(os, "--ui-exe=<image>", "Tray application image name");
		printOpt(os, "--enable | --disable", "Service enabled (autostart + start now) or disabled (default: enable)");

		os << "\nUninstall options:\n";
		printOpt(os, "--delete-data=yes|no", "Answer the data deletion question in advance");
		printOpt(os, "--from-inno", "Called from Inno Setup (do not delete install dir here)");

		os <<
			"\nExamples:\n"
			"  setup-helper --check --package-version=0.17.2\n"
			"  setup-helper --preflight\n"
			"  setup-helper --configure --package-version=0.17.2 --app-dir=\"C:\\\\Program Files\\\\Kolibri\"\n"
			"  setup-helper --configure --package-version=0.17.2 --disable --unattended\n"
			"  setup-helper --uninstall --from-inno\n"
			"  setup-helper --uninstall --delete-data=yes --unattended\n";
	}
};//---namespace setupcore
