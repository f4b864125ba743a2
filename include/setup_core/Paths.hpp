#pragma once
#include <filesystem>
#include <string>

namespace setupcore {

	namespace fs = std::filesystem;

	//---Директория, в которой находится исполняемый файл помощника (зависит от платформы)
	fs::path selfDir();

	//--Определение пути к исполняемому файлу:
	//	Если exeArg пустой → возвращается пустой путь
	//	Если exeArg относительный путь → baseDir / exeArg
	//	Если exeArg абсолютный путь → остаётся без изменений
	fs::path resolveExePath(const std::string& exeArg, const fs::path& baseDir);

	//---Каталог данных: cliValue, иначе KOLIBRI_HOME, иначе каталог платформы по умолчанию
	fs::path resolveDataRoot(const std::string& cliValue);

	//---Каталог логов внутри каталога данных
	fs::path logDir(const fs::path& dataRoot);

	//---Путь в UTF-8 для аргументов команд и значений хранилища
	//	(на Windows fs::path::string() отдаёт ANSI-кодировку)
	std::string pathToUtf8(const fs::path& p);

};//---namespace setupcore
