#pragma once
#include <filesystem>
#include <string>

namespace setupcore {

	namespace fs = std::filesystem;

	//---Тип запуска службы
	enum class StartType {
		Automatic,
		Disabled
	};

	//---Желаемое состояние службы. Пересчитывается из конфигурации при каждом запуске,
	//   из ОС никогда не читается и всегда применяется целиком
	struct ServiceSpec final{

		//---Параметры службы
		std::string name;				//	Обязательное поле
		std::string description;		//	Описание, видимое в оснастке служб

		fs::path exeAbs;				//	Абсолютный путь к исполняемому файлу службы
		std::string args;				//	Аргументы командной строки для exe
		fs::path workingDir;			//	Рабочий каталог службы

		std::string account;			//	Учётная запись, под которой работает служба

		//---Права на каталог данных
		fs::path dataDir;				//	Каталог данных службы
		std::string serviceGrantee;		//	Кому выдать права от имени службы (SID или имя)
		std::string usersGrantee;		//	Кому выдать права для обычных пользователей

		//---Флаги
		StartType startType = StartType::Automatic;
	};

	//---Имя типа запуска для логов
	const char* toString(StartType t);

};//---namespace setupcore
