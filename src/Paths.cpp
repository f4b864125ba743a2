#include "setup_core/Paths.hpp"
#include "platform/PlatformImpl.hpp"

#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#endif

namespace setupcore {

	//---Директория, в которой находится исполняемый файл помощника (зависит от платформы)
	fs::path selfDir() {
		
		//---Получение пути к собственному исполняемому файлу
		const fs::path exe = platform::selfExePath();

		//---Возврат родительской директории или текущей директории, если путь не определён
		if (!exe.empty())
		{
			return exe.parent_path();
		}
		return fs::current_path();
	}
	//---Определение пути к исполняемому файлу
	fs::path resolveExePath(const std::string& exeArg, const fs::path& baseDir) {
		
		if (exeArg.empty())
		{
			return {};
		}
		
		//---Формирование пути
		fs::path p(exeArg);
		
		//---Если путь относительный → формирование абсолютного пути относительно baseDir
		if (p.is_relative())
		{ 
			p = (baseDir / p).lexically_normal();
		}
		return p;
	}
	//---Каталог данных
	fs::path resolveDataRoot(const std::string& cliValue) {

		//---Явно заданный путь
		if (!cliValue.empty()) return fs::path(cliValue);

		//---Переменная окружения KOLIBRI_HOME
		if (const char* home = std::getenv("KOLIBRI_HOME"); home && *home)
		{
			return fs::path(home);
		}
		//---Каталог платформы по умолчанию
		return platform::defaultDataRoot();
	}
	//---Каталог логов
	fs::path logDir(const fs::path& dataRoot) {
		return dataRoot / "logs";
	}
	//---Преобразование fs::path в std::string в кодировке UTF-8
	std::string pathToUtf8(const fs::path& p) {
#ifdef _WIN32
		const std::wstring w = p.wstring();
		if (w.empty()) return {};

		const int n = WideCharToMultiByte(CP_UTF8, 0, w.data(), (int)w.size(), nullptr, 0, nullptr, nullptr);
		if (n <= 0) return {};
		std::string s((size_t)n, '\0');
		WideCharToMultiByte(CP_UTF8, 0, w.data(), (int)w.size(), s.data(), n, nullptr, nullptr);
		return s;
#else
		return p.string();
#endif
	}
} // namespace setupcore
