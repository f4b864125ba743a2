#pragma once
#include <optional>
#include <string>
#include <iostream>

namespace setupcore {

	//---Команды CLI (шаги, которые вызывает внешний установщик)
	enum class Command {
	Help,
	Check,			//	Решение об установке (до любых изменений)
	Preflight,		//	Остановка службы и трея перед копированием файлов
	Configure,		//	Настройка службы после копирования файлов
	Install,		//	Check + Preflight + Configure
	Uninstall,		//	Полная деинсталляция
	CheckRuntime,	//	Нужно ли ставить общую среду выполнения
	Invalid
	};

	//---Опции командной строки
	struct CliOptions final {

		//---Команда
		Command cmd = Command::Help;

		//---Версия устанавливаемого пакета (для --check / --install / --configure)
		std::string packageVersion;

		//---Переопределения конфигурации (пустые - значения по умолчанию)
		std::string name;			//	Имя службы
		std::string exe;			//	Путь к EXE службы
		std::optional<std::string> args;	//	Аргументы командной строки для EXE
		std::string description;	//	Описание службы
		std::string account;		//	Учётная запись службы
		std::string uiExe;			//	Имя образа приложения в трее
		std::string appDir;			//	Каталог установки
		std::string dataRoot;       //	Каталог данных

		//---Флаги
		bool enabled = true;		//	Служба включена (автозапуск + запуск сейчас)
		bool unattended = false;	//	Без диалогов, значения по умолчанию
		bool fromInno = false;      //	Каталог установки удаляет сам Inno Setup

		//---Ответ на вопрос об удалении данных (--delete-data=yes|no)
		std::optional<bool> deleteData;
	};

	CliOptions parseCli(int argc, char** argv);
	void printHelp(std::ostream& os);

};//---namespace setupcore
