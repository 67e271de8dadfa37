#pragma once
#include <string>
#include <vector>
#include <iostream>

#include "Runner.hpp"

namespace twcli {

	//---Команды CLI
	enum class Command {
	Run,
	Help,
	Version,
	Invalid
	};

	//---Опции командной строки
	struct CliOptions final {

		//---Команда
		Command cmd = Command::Run;

		//---Параметры обёртки
		std::string tempDir;		//	Каталог для временного файла
		std::string workDir;		//	Рабочий каталог tailwindcss
		std::string logDir;			//	Каталог для логов (пусто → только stderr)

		//---Флаги
		bool verbose = false;		//	Подробный лог (glog -v=1)

		//---Аргументы для tailwindcss (передаются без изменений)
		std::vector<std::string> toolArgs;

		std::string error;			//	Причина Command::Invalid
	};

	CliOptions parseCli(int argc, char** argv);
	void printHelp(std::ostream& os);

	//---Код возврата tailwind-cli: код инструмента для ToolFailed, иначе sysexits.h
	int exitCodeFor(const InvocationResult& result);

};//---namespace twcli
