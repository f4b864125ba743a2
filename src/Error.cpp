#include "setup_core/Error.hpp"

#include <utility>

namespace setupcore {

	//------------------------------------------------------------
	//	Имя класса ошибки
	//------------------------------------------------------------
	const char* toString(ErrorKind kind)
	{
		switch (kind)
		{
		case ErrorKind::None:				return "None";
		case ErrorKind::InvalidArgument:	return "InvalidArgument";
		case ErrorKind::LaunchFailure:		return "LaunchFailure";
		case ErrorKind::CommandFailure:		return "CommandFailure";
		case ErrorKind::VersionParseError:	return "VersionParseError";
		case ErrorKind::RejectDowngrade:	return "RejectDowngrade";
		case ErrorKind::Cancelled:			return "Cancelled";
		case ErrorKind::StoreFailure:		return "StoreFailure";
		case ErrorKind::FilesystemFailure:	return "FilesystemFailure";
		}
		return "Unknown";
	}
	//------------------------------------------------------------
	//	Код завершения процесса для класса ошибки
	//------------------------------------------------------------
	int exitCodeFor(ErrorKind kind)
	{
		switch (kind)
		{
		case ErrorKind::None:				return 0;
		case ErrorKind::InvalidArgument:	return 2;
		case ErrorKind::LaunchFailure:		return 3;
		case ErrorKind::CommandFailure:		return 4;
		case ErrorKind::VersionParseError:	return 5;
		case ErrorKind::RejectDowngrade:	return 6;
		case ErrorKind::Cancelled:			return 7;
		default:							return 1;
		}
	}
	//------------------------------------------------------------
	//	Заполнение ошибки
	//------------------------------------------------------------
	bool fail(Error* error, ErrorKind kind, std::string message)
	{
		if (error)
		{
			error->kind = kind;
			error->message = std::move(message);
		}
		return false;
	}
}; //---namespace setupcore
