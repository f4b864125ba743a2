#pragma once
#include <filesystem>

namespace setupcore {

	//---Инициализация glog: файлы по уровням в logDir + дублирование в stderr
	void initLogging(const char* programName, const std::filesystem::path& logDir);

	//---Сброс буферов glog перед выходом
	void shutdownLogging();

};//---namespace setupcore
