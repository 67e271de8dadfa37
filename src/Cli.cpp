#include "tailwind_cli/Cli.hpp"
#include "tailwind_cli/Version.hpp"
#include <string_view>
#include <iomanip>

namespace twcli {
	//------------------------------------------------------------
	//	Префикс опций обёртки: всё остальное уходит в tailwindcss
	//------------------------------------------------------------
	static constexpr std::string_view kWrapperPrefix = "--twcli-";
	//------------------------------------------------------------
	//	Проверка, что строка начинается с префикса
	//------------------------------------------------------------
	static bool startsWith(std::string_view s, std::string_view p) {
		return s.size() >= p.size() && s.substr(0, p.size()) == p;
	}
	//------------------------------------------------------------
	//	Удаление кавычек в начале и конце строки
	//------------------------------------------------------------
	static std::string trimQuotes(std::string v) {

		//---Если строка слишком короткая → возврат без изменений
		if (v.size() < 2) return v;

		//---Проверка на двойные или одинарные кавычки
		const bool dbl = (v.front() == '"' && v.back() == '"');
		const bool sgl = (v.front() == '\'' && v.back() == '\'');

		//---Если есть кавычки → удаление
		if (dbl || sgl) v = v.substr(1, v.size() - 2);

		return v;
	}
	//------------------------------------------------------------
	//	Значение ключа вида --key=value (false, если аргумент - не этот ключ)
	//------------------------------------------------------------
	static bool getKv(std::string_view arg, std::string_view key, std::string& value) {

		//---Формирование префикса ключа
		const std::string prefix = std::string(key) + "=";
		if (!startsWith(arg, prefix)) return false;

		//---Значение без префикса и с удалёнными кавычками
		value = trimQuotes(std::string(arg.substr(prefix.size())));
		return true;
	}
	//------------------------------------------------------------
	//---Парсинг опций командной строки
	//------------------------------------------------------------
	CliOptions parseCli(int argc, char** argv) {

		//---Результирующие опции
		CliOptions o;

		//---После "--" все аргументы передаются tailwindcss без разбора
		bool passthrough = false;

		for (int i = 1; i < argc; i++)
		{
			const std::string_view a = argv[i];

			if (passthrough || !startsWith(a, kWrapperPrefix))
			{
				if (!passthrough && a == "--")
				{
					passthrough = true;
					continue;
				}
				o.toolArgs.emplace_back(a);
				continue;
			}

			//---Опции обёртки
			if (a == "--twcli-help") { o.cmd = Command::Help; continue; }
			if (a == "--twcli-version") { o.cmd = Command::Version; continue; }
			if (a == "--twcli-verbose") { o.verbose = true; continue; }

			//---Опции с путём: пустое значение - ошибка
			std::string* target = nullptr;
			std::string value;
			if (getKv(a, "--twcli-temp-dir", value)) target = &o.tempDir;
			else if (getKv(a, "--twcli-work-dir", value)) target = &o.workDir;
			else if (getKv(a, "--twcli-log-dir", value)) target = &o.logDir;

			if (target)
			{
				if (value.empty())
				{
					o.cmd = Command::Invalid;
					o.error = "Empty value for option: " + std::string(a);
					return o;
				}
				*target = value;
				continue;
			}

			//---Неизвестная опция обёртки → Invalid
			o.cmd = Command::Invalid;
			o.error = "Unknown option: " + std::string(a);
			return o;
		}

		//---Возврат опций
		return o;
	}
	//------------------------------------------------------------
	//	Вывод опции с описанием
	//------------------------------------------------------------
	static void printOpt(std::ostream& os, const std::string& opt, const std::string& desc, int w = 26)
	{
		os << "  " << std::left << std::setw(w) << opt << desc << "\n";
	}
	//------------------------------------------------------------
	//	Вывод справки по использованию
	//------------------------------------------------------------
	void printHelp(std::ostream& os)
	{
		os <<
			"tailwind-cli " TWCLI_VERSION " (embedded tailwindcss v" TWCLI_TOOL_VERSION ")\n\n"
			"Usage:\n"
			"  tailwind-cli [wrapper options] [--] <tailwindcss arguments...>\n\n"
			"All arguments not starting with --twcli- (and everything after --)\n"
			"are passed to tailwindcss unchanged.\n\n"
			"Wrapper options:\n";

		printOpt(os, "--twcli-temp-dir=<path>", "Directory for the temporary executable (default: system temp dir)");
		printOpt(os, "--twcli-work-dir=<path>", "Working directory for tailwindcss (default: current directory)");
		printOpt(os, "--twcli-log-dir=<path>", "Write info/warning/error logs to this directory");
		printOpt(os, "--twcli-verbose", "Log every step of the invocation");
		printOpt(os, "--twcli-version", "Print wrapper version and exit");
		printOpt(os, "--twcli-help", "Print this help and exit");

		os <<
			"\nExamples:\n"
			"  tailwind-cli --help\n"
			"  tailwind-cli --input src/main.css --output target/built.css\n"
			"  tailwind-cli --twcli-temp-dir=target --twcli-verbose -- -i in.css -o out.css --minify\n";
	}
	//------------------------------------------------------------
	//	Коды возврата обёртки (sysexits.h) для ошибок, не связанных с самим tailwindcss
	//------------------------------------------------------------
	int exitCodeFor(const InvocationResult& result)
	{
		switch (result.kind)
		{
		case ErrorKind::None: return 0;
		case ErrorKind::ToolFailed: return result.exitCode != 0 ? result.exitCode : 1;
		case ErrorKind::UnsupportedPlatform: return 69;	// EX_UNAVAILABLE
		case ErrorKind::SpawnFailed: return 71;			// EX_OSERR
		case ErrorKind::TempFileIo: return 73;			// EX_CANTCREAT
		case ErrorKind::CleanupFailed: return 74;		// EX_IOERR
		}
		return 1;
	}
};//---namespace twcli
