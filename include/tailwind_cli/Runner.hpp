#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "EmbeddedBinary.hpp"
#include "Platform.hpp"

namespace twcli {

	namespace fs = std::filesystem;

	//---Виды ошибок вызова
	enum class ErrorKind {
		None,						// Успех
		UnsupportedPlatform,		// Для ОС/архитектуры нет встроенного бинарника
		TempFileIo,					// Ошибка создания/записи/прав/сброса временного файла
		SpawnFailed,				// Процесс не удалось запустить или дождаться
		ToolFailed,					// Инструмент запустился и вернул ненулевой код
		CleanupFailed				// Временный файл не удалось удалить
	};

	const char* toString(ErrorKind kind);

	//---Опции вызова
	struct Options final {
		fs::path tempDir;			//	Каталог для временного файла (пусто → системный временный каталог)
		fs::path workingDir;		//	Рабочий каталог инструмента (пусто → текущий)
		std::string hostOs;			//	Переопределение ОС (пусто → определяется автоматически)
		std::string hostArch;		//	Переопределение архитектуры (пусто → определяется автоматически)
	};

	//---Результат вызова
	struct InvocationResult final {
		ErrorKind kind = ErrorKind::None;

		//---Вывод инструмента (UTF-8, обрезан по краям). Заполняется и при ToolFailed
		std::string stdoutText;
		std::string stderrText;
		int exitCode = 0;

		std::uint32_t sysError = 0;	//	errno / GetLastError() для TempFileIo и SpawnFailed
		std::string message;		//	Описание ошибки

		//---Ошибка удаления временного файла не скрывает результат инструмента
		bool cleanupFailed = false;
		std::string cleanupError;

		PlatformId platform = PlatformId::LinuxX64;
		fs::path executablePath;	//	Путь временного файла (только для диагностики)

		bool ok() const { return kind == ErrorKind::None; }
	};

	//--Запуск встроенного инструмента с аргументами:
	//	платформа → байты → временный файл → процесс → классификация → удаление файла
	// Возвращает:
	//   true - инструмент вернул 0 и временный файл удалён (out.kind == ErrorKind::None)
	//   false - любая ошибка, вид в out.kind
	bool run(const std::vector<std::string>& args, InvocationResult& out, const Options& opt = {});

	//---То же, но с явно заданными байтами и платформой (опции hostOs/hostArch игнорируются)
	bool runEmbedded(const EmbeddedBinary& binary, PlatformId platform,
		const std::vector<std::string>& args, InvocationResult& out, const Options& opt = {});

	//---Человекочитаемое описание результата
	std::string describe(const InvocationResult& result);

};//---namespace twcli
