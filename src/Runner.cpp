#include "tailwind_cli/Runner.hpp"
#include "tailwind_cli/Materializer.hpp"
#include "tailwind_cli/Output.hpp"
#include "tailwind_cli/Process.hpp"
#include "tailwind_cli/Version.hpp"

#include <sstream>
#include <glog/logging.h>

namespace twcli {

	namespace {
		//------------------------------------------------------------
		//	Логирование ошибки и заполнение результата
		//------------------------------------------------------------
		static bool fail(InvocationResult& out, ErrorKind kind, const std::string& msg, std::uint32_t sysError = 0) {
			out.kind = kind;
			out.message = msg;
			out.sysError = sysError;
			//---Ненулевой код инструмента - ошибка пользователя, а не обёртки
			if (kind == ErrorKind::ToolFailed) LOG(WARNING) << toString(kind) << ": " << msg;
			else LOG(ERROR) << toString(kind) << ": " << msg;
			return false;
		}
		//------------------------------------------------------------
		//	Аргументы одной строкой (для подробного лога)
		//------------------------------------------------------------
		static std::string joinArgs(const std::vector<std::string>& args) {
			std::ostringstream os;
			for (std::size_t i = 0; i < args.size(); i++)
			{
				if (i) os << ' ';
				os << '"' << args[i] << '"';
			}
			return os.str();
		}
	} // namespace

	const char* toString(ErrorKind kind) {
		switch (kind)
		{
		case ErrorKind::None: return "ok";
		case ErrorKind::UnsupportedPlatform: return "unsupported platform";
		case ErrorKind::TempFileIo: return "temporary file I/O error";
		case ErrorKind::SpawnFailed: return "failed to start tailwindcss";
		case ErrorKind::ToolFailed: return "tailwindcss returned an error";
		case ErrorKind::CleanupFailed: return "failed to delete temporary file";
		}
		return "unknown";
	}
	//------------------------------------------------------------
	//	Оркестратор: байты → временный файл → процесс → классификация → удаление
	//------------------------------------------------------------
	bool runEmbedded(const EmbeddedBinary& binary, PlatformId platform,
		const std::vector<std::string>& args, InvocationResult& out, const Options& opt) {

		out = {};
		out.platform = platform;

		VLOG(2) << "tailwindcss arguments: " << joinArgs(args);
		VLOG(1) << "Embedded tailwindcss for " << platformName(platform) << ": " << binary.size << " bytes";

		//---Временный исполняемый файл. Если дальше что-то бросит исключение, его удалит деструктор
		MaterializedExecutable exe;
		std::string err;
		std::uint32_t sysError = 0;
		if (!materialize(binary, platform, TWCLI_VERSION, opt.tempDir, exe, &err, &sysError))
		{
			//---Удалять нечего
			return fail(out, ErrorKind::TempFileIo, err, sysError);
		}
		out.executablePath = exe.path();

		//---Запуск процесса
		process::RunOptions ropt;
		ropt.workingDir = opt.workingDir;

		process::RunResult raw;
		const bool started = process::run(exe.path(), args, raw, ropt);

		//---Удаление временного файла при любом исходе запуска
		std::string cleanupErr;
		if (!exe.remove(&cleanupErr))
		{
			out.cleanupFailed = true;
			out.cleanupError = cleanupErr;
			LOG(WARNING) << "Couldn't delete temporary file " << out.executablePath.u8string() << ": " << cleanupErr;
		}

		if (!started)
		{
			return fail(out, ErrorKind::SpawnFailed, raw.error, raw.sysError);
		}

		//---Классификация вывода
		ToolOutput tool = classify(raw);
		out.exitCode = tool.exitCode;
		out.stdoutText = std::move(tool.stdoutText);
		out.stderrText = std::move(tool.stderrText);

		if (!tool.success)
		{
			std::ostringstream os;
			os << "tailwindcss exited with code " << out.exitCode;
			if (raw.signaled) os << " (signal " << raw.termSignal << ")";
			return fail(out, ErrorKind::ToolFailed, os.str());
		}

		//---Успешный результат сохраняется, но удаление не удалось - это отдельная ошибка
		if (out.cleanupFailed)
		{
			return fail(out, ErrorKind::CleanupFailed, out.cleanupError);
		}

		VLOG(1) << "tailwindcss finished successfully";
		return true;
	}
	//------------------------------------------------------------
	//	Публичная точка входа: определение платформы и запуск
	//------------------------------------------------------------
	bool run(const std::vector<std::string>& args, InvocationResult& out, const Options& opt) {
		out = {};

		//---Платформа: переопределённая в опциях или текущей машины
		PlatformId platform{};
		std::string err;
		bool resolved = false;
		if (opt.hostOs.empty() && opt.hostArch.empty())
		{
			resolved = detectPlatform(platform, &err);
		}
		else
		{
			const std::string os = opt.hostOs.empty() ? hostOsName() : opt.hostOs;
			const std::string arch = opt.hostArch.empty() ? hostArchName() : opt.hostArch;
			resolved = resolvePlatform(os, arch, platform, &err);
		}

		//---До любых операций с файлами
		if (!resolved) return fail(out, ErrorKind::UnsupportedPlatform, err);

		return runEmbedded(bytesFor(platform), platform, args, out, opt);
	}
	//------------------------------------------------------------
	//	Описание результата
	//------------------------------------------------------------
	std::string describe(const InvocationResult& result) {
		std::ostringstream os;
		switch (result.kind)
		{
		case ErrorKind::None:
			os << "tailwindcss finished successfully";
			break;
		case ErrorKind::ToolFailed:
			os << "Tailwind CLI returned an error (exit code " << result.exitCode << "):\n\n";
			os << "stdout:\n" << result.stdoutText << "\n\n";
			os << "stderr:\n" << result.stderrText << "\n";
			break;
		case ErrorKind::UnsupportedPlatform:
			os << "Unsupported platform: " << result.message;
			break;
		case ErrorKind::TempFileIo:
			os << "Couldn't save Tailwind CLI executable to temporary file: " << result.message;
			break;
		case ErrorKind::SpawnFailed:
			os << "Couldn't invoke Tailwind CLI: " << result.message;
			break;
		case ErrorKind::CleanupFailed:
			os << "Couldn't delete Tailwind CLI executable temporary file: " << result.message;
			break;
		}
		if (result.cleanupFailed && result.kind != ErrorKind::CleanupFailed)
		{
			os << "\nCouldn't delete Tailwind CLI executable temporary file: " << result.cleanupError;
		}
		return os.str();
	}

}; //---namespace twcli
