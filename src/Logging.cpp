#include "tailwind_cli/Logging.hpp"

#include <glog/logging.h>
#include <system_error>

namespace twcli {

	namespace fs = std::filesystem;

	//---Инициализация логгера
	void initLogging(const char* programName, const fs::path& logDir, bool verbose) {

		//---Подробный лог шагов вызова
		FLAGS_v = verbose ? 1 : 0;

		//---Без каталога логов → только stderr
		if (logDir.empty())
		{
			FLAGS_logtostderr = true;
			FLAGS_colorlogtostderr = true;
			google::InitGoogleLogging(programName);
			return;
		}

		//---Создание директории для логов
		std::error_code ec;
		fs::create_directories(logDir, ec);

		google::SetLogFilenameExtension(".txt"); // Расширение
		google::SetLogDestination(google::GLOG_INFO, (logDir / "info").string().c_str()); // Путь и название логов для ошибок, предупреждений и информации
		google::SetLogDestination(google::GLOG_WARNING, (logDir / "warning").string().c_str());
		google::SetLogDestination(google::GLOG_ERROR, (logDir / "error").string().c_str());
		google::SetLogDestination(google::GLOG_FATAL, (logDir / "fatal").string().c_str());
		google::InitGoogleLogging(programName); // Инициализация

		//---Настройка вывода в консоль
		FLAGS_alsologtostderr = true;
		FLAGS_colorlogtostderr = true;

		if (ec) LOG(WARNING) << "Error creating log directory " << logDir << ": " << ec.message();
	}

};//---namespace twcli
