#pragma once
#include <string>

namespace setupcore {

	//---Классы ошибок установщика
	enum class ErrorKind {
		None,
		InvalidArgument,		//	Некорректные параметры / конфигурация
		LaunchFailure,			//	Внешняя команда не запустилась
		CommandFailure,			//	Команда запустилась, но вернула недопустимый код
		VersionParseError,		//	Строка версии не разбирается
		RejectDowngrade,		//	Установленная версия новее устанавливаемой
		Cancelled,				//	Пользователь отказался продолжать
		StoreFailure,			//	Ошибка хранилища ключ-значение (реестр)
		FilesystemFailure		//	Ошибка файловой системы
	};

	//---Описание ошибки: класс + сообщение с полным контекстом команды
	struct Error final {
		ErrorKind kind = ErrorKind::None;
		std::string message;
	};

	//---Имя класса ошибки для логов
	const char* toString(ErrorKind kind);

	//---Код завершения процесса для класса ошибки
	int exitCodeFor(ErrorKind kind);

	//---Заполняет error (если не nullptr) и возвращает false.
	//   Удобно для "return fail(error, ...)"
	bool fail(Error* error, ErrorKind kind, std::string message);

};//---namespace setupcore
