#include <iostream>
#include "tailwind_cli/Cli.hpp"
#include "tailwind_cli/Logging.hpp"
#include "tailwind_cli/Runner.hpp"
#include "tailwind_cli/Version.hpp"

namespace {

	void printStream(std::ostream& os, const std::string& text) {
		if (!text.empty()) os << text << "\n";
	}

} // namespace

int main(int argc, char** argv) {

	//---Разбор аргументов командной строки
	const twcli::CliOptions opt = twcli::parseCli(argc, argv);

	//---Если запрошена справка или команда некорректна → вывод справки и выход
	if (opt.cmd == twcli::Command::Help || opt.cmd == twcli::Command::Invalid)
	{
		if (opt.cmd == twcli::Command::Invalid) std::cerr << opt.error << "\n\n";
		twcli::printHelp(opt.cmd == twcli::Command::Invalid ? std::cerr : std::cout);
		return (opt.cmd == twcli::Command::Invalid) ? 2 : 0;
	}
	if (opt.cmd == twcli::Command::Version)
	{
		std::cout << "tailwind-cli " << TWCLI_VERSION << " (tailwindcss v" << TWCLI_TOOL_VERSION << ")\n";
		return 0;
	}

	//---Инициализация логгера
	twcli::initLogging(argv[0], opt.logDir, opt.verbose);

	twcli::Options runOpt;
	runOpt.tempDir = opt.tempDir;
	runOpt.workingDir = opt.workDir;

	//---Запуск tailwindcss
	twcli::InvocationResult result;
	const bool ok = twcli::run(opt.toolArgs, result, runOpt);

	printStream(std::cout, result.stdoutText);
	printStream(std::cerr, result.stderrText);

	//---Ошибки обёртки (вывод инструмента уже напечатан выше)
	if (!ok && result.kind != twcli::ErrorKind::ToolFailed)
	{
		std::cerr << twcli::describe(result) << "\n";
	}
	else if (result.cleanupFailed)
	{
		std::cerr << "warning: couldn't delete temporary file: " << result.cleanupError << "\n";
	}
	return twcli::exitCodeFor(result);
}
