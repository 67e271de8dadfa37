#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

#include "tailwind_cli/EmbeddedBinary.hpp"

namespace twcli {

	//---Платформенно-зависимые реализации
	namespace platform {
		namespace fs = std::filesystem;

		//---Имя ОС текущей машины ("linux", "macos", "windows", либо как сообщает система)
		std::string osName();
		//---Архитектура текущей машины ("x86_64", "aarch64", "armv7l", ...)
		std::string archName();
		//---Создание нового файла (только если его нет), запись байтов, сброс на диск,
		//	права 0755 (POSIX). При ошибке недописанный файл удаляется
		bool writeExecutable(const fs::path& path, const EmbeddedBinary& binary,
			std::string* error, std::uint32_t* sysError);
		//---Удаление файла
		bool removeFile(const fs::path& path, std::string* error);
	}

} // namespace twcli
