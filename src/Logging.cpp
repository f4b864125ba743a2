#include "setup_core/Logging.hpp"

#include <system_error>
#include <glog/logging.h>

namespace setupcore {

	//------------------------------------------------------------
	//	Инициализация логгера
	//------------------------------------------------------------
	void initLogging(const char* programName, const std::filesystem::path& logDir) {

		//---Создание директории для логов (без неё glog пишет только в stderr)
		std::error_code ec;
		if (!logDir.empty()) std::filesystem::create_directories(logDir, ec);

		google::SetLogFilenameExtension(".txt");
		google::SetLogDestination(google::GLOG_INFO, (logDir / "info").string().c_str());
		google::SetLogDestination(google::GLOG_WARNING, (logDir / "warning").string().c_str());
		google::SetLogDestination(google::GLOG_ERROR, (logDir / "error").string().c_str());
		google::SetLogDestination(google::GLOG_FATAL, (logDir / "fatal").string().c_str());
		google::InitGoogleLogging(programName);

		//---Настройка вывода в консоль
		FLAGS_alsologtostderr = true;
		FLAGS_colorlogtostderr = true;

		if (ec) LOG(WARNING) << "Cannot create log directory " << logDir << ": " << ec.message();
	}
	//------------------------------------------------------------
	void shutdownLogging() {
		google::ShutdownGoogleLogging();
	}
};//---namespace setupcore
