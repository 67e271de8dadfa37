#pragma once
#include <filesystem>

namespace twcli {

	//--Инициализация glog:
	//	logDir пустой → весь лог в stderr
	//	logDir задан → файлы info/warning/error/fatal (.txt) в logDir + дублирование в stderr
	//	verbose → VLOG(1)
	void initLogging(const char* programName, const std::filesystem::path& logDir, bool verbose);

};//---namespace twcli
