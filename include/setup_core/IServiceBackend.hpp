#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "Error.hpp"

namespace setupcore {

	namespace fs = std::filesystem;

	//---Коды завершения sc.exe (совпадают с кодами Win32)
	inline constexpr int kScServiceAlreadyRunning = 1056;	//	ERROR_SERVICE_ALREADY_RUNNING
	inline constexpr int kScServiceDoesNotExist = 1060;		//	ERROR_SERVICE_DOES_NOT_EXIST
	inline constexpr int kScServiceNotActive = 1062;		//	ERROR_SERVICE_NOT_ACTIVE
	inline constexpr int kScServiceMarkedForDelete = 1072;	//	ERROR_SERVICE_MARKED_FOR_DELETE

	//---Интерфейс менеджера служб ОС: операции адресуются по имени службы
	class IServiceBackend {
	public:
		virtual ~IServiceBackend() = default;

		//---Зарегистрирована ли служба
		virtual bool exists(const std::string& name, bool& exists, Error* error) = 0;

		//---Регистрация новой службы: путь + аргументы одной командой
		virtual bool install(const std::string& name, const fs::path& exe, const std::string& args, Error* error) = 0;

		//---Установка одного свойства существующей службы
		virtual bool setProperty(const std::string& name, const std::string& property,
			const std::vector<std::string>& values, Error* error) = 0;

		virtual bool start(const std::string& name, Error* error) = 0;

		//---Остановка; "не запущена" и "не существует" - не ошибка
		virtual bool stop(const std::string& name, Error* error) = 0;

		//---Остановка без проверки кода: код только логируется и возвращается в exitCode.
		//   false - только при ошибке запуска команды
		virtual bool stopBestEffort(const std::string& name, int* exitCode, Error* error) = 0;

		//---Удаление; "не существует" и "помечена на удаление" - не ошибка
		virtual bool remove(const std::string& name, Error* error) = 0;
	};
};//---namespace setupcore
