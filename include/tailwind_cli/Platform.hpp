#pragma once
#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace twcli {

	//---Поддерживаемые пары (ОС, архитектура), для каждой встроен свой бинарник
	enum class PlatformId {
		MacOsArm64,
		MacOsX64,
		LinuxArm64,
		LinuxArmv7,
		LinuxX64,
		WindowsArm64,
		WindowsX64
	};

	//---Количество платформ (должно совпадать с числом элементов PlatformId)
	inline constexpr std::size_t kPlatformCount = 7;

	//---Все платформы в порядке объявления
	const std::array<PlatformId, kPlatformCount>& allPlatforms();

	//---Имя платформы для имён файлов и сообщений: "linux-x64", "macos-arm64", ...
	const char* platformName(PlatformId platform);

	//---Бинарник платформы требует расширения .exe и не имеет POSIX-прав
	bool isWindowsPlatform(PlatformId platform);

	//--Сопоставление строк ОС/архитектуры с платформой:
	//	Регистр не важен. ОС: macos|darwin|osx, linux, windows|win32
	//	Архитектура: x86_64|amd64|x64, aarch64|arm64, armv7|armv7l|armv7hl (только linux)
	//	Неизвестная комбинация → false и описание в error (если задан)
	bool resolvePlatform(std::string_view os, std::string_view arch,
		PlatformId& out, std::string* error);

	//---Имя ОС и архитектуры текущей машины (читаются при каждом вызове)
	std::string hostOsName();
	std::string hostArchName();

	//---Определение платформы текущей машины
	bool detectPlatform(PlatformId& out, std::string* error);

};//---namespace twcli
