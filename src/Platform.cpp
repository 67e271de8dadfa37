#include "tailwind_cli/Platform.hpp"
#include "platform/PlatformImpl.hpp"

#include <glog/logging.h>

namespace twcli {

	namespace {
		//------------------------------------------------------------
		//	Приведение к нижнему регистру (ASCII)
		//------------------------------------------------------------
		static std::string toLower(std::string_view s) {
			std::string v(s);
			for (char& c : v) if (c >= 'A' && c <= 'Z') c = char(c - 'A' + 'a');
			return v;
		}

		enum class Os { MacOs, Linux, Windows, Unknown };
		enum class Arch { X64, Arm64, Armv7, Unknown };

		static Os parseOs(const std::string& os) {
			if (os == "macos" || os == "darwin" || os == "osx") return Os::MacOs;
			if (os == "linux") return Os::Linux;
			if (os == "windows" || os == "win32") return Os::Windows;
			return Os::Unknown;
		}

		static Arch parseArch(const std::string& arch) {
			if (arch == "x86_64" || arch == "amd64" || arch == "x64") return Arch::X64;
			if (arch == "aarch64" || arch == "arm64") return Arch::Arm64;
			if (arch == "armv7" || arch == "armv7l" || arch == "armv7hl") return Arch::Armv7;
			return Arch::Unknown;
		}
	} // namespace

	//------------------------------------------------------------
	//	Все платформы
	//------------------------------------------------------------
	const std::array<PlatformId, kPlatformCount>& allPlatforms() {
		static const std::array<PlatformId, kPlatformCount> all = {
			PlatformId::MacOsArm64,
			PlatformId::MacOsX64,
			PlatformId::LinuxArm64,
			PlatformId::LinuxArmv7,
			PlatformId::LinuxX64,
			PlatformId::WindowsArm64,
			PlatformId::WindowsX64,
		};
		return all;
	}
	//------------------------------------------------------------
	//	Имя платформы
	//------------------------------------------------------------
	const char* platformName(PlatformId platform) {
		switch (platform)
		{
		case PlatformId::MacOsArm64: return "macos-arm64";
		case PlatformId::MacOsX64: return "macos-x64";
		case PlatformId::LinuxArm64: return "linux-arm64";
		case PlatformId::LinuxArmv7: return "linux-armv7";
		case PlatformId::LinuxX64: return "linux-x64";
		case PlatformId::WindowsArm64: return "windows-arm64";
		case PlatformId::WindowsX64: return "windows-x64";
		}
		return "unknown";
	}

	bool isWindowsPlatform(PlatformId platform) {
		return platform == PlatformId::WindowsArm64 || platform == PlatformId::WindowsX64;
	}
	//------------------------------------------------------------
	//	Сопоставление ОС/архитектуры с платформой
	//------------------------------------------------------------
	bool resolvePlatform(std::string_view os, std::string_view arch,
		PlatformId& out, std::string* error) {

		const std::string osName = toLower(os);
		const std::string archName = toLower(arch);

		const Os o = parseOs(osName);
		if (o == Os::Unknown)
		{
			if (error) *error = "Unsupported OS: " + std::string(os);
			return false;
		}

		const Arch a = parseArch(archName);

		//---Таблица поддерживаемых пар
		if (o == Os::MacOs && a == Arch::Arm64) { out = PlatformId::MacOsArm64; return true; }
		if (o == Os::MacOs && a == Arch::X64) { out = PlatformId::MacOsX64; return true; }
		if (o == Os::Linux && a == Arch::Arm64) { out = PlatformId::LinuxArm64; return true; }
		if (o == Os::Linux && a == Arch::Armv7) { out = PlatformId::LinuxArmv7; return true; }
		if (o == Os::Linux && a == Arch::X64) { out = PlatformId::LinuxX64; return true; }
		if (o == Os::Windows && a == Arch::Arm64) { out = PlatformId::WindowsArm64; return true; }
		if (o == Os::Windows && a == Arch::X64) { out = PlatformId::WindowsX64; return true; }

		if (error) *error = "Unsupported architecture: " + std::string(arch) + " (OS " + osName + ")";
		return false;
	}

	std::string hostOsName() {
		return platform::osName();
	}

	std::string hostArchName() {
		return platform::archName();
	}
	//------------------------------------------------------------
	//	Определение платформы текущей машины
	//------------------------------------------------------------
	bool detectPlatform(PlatformId& out, std::string* error) {
		const std::string os = hostOsName();
		const std::string arch = hostArchName();

		if (os.empty() || arch.empty())
		{
			if (error) *error = "Failed to read OS/architecture of this machine";
			return false;
		}
		if (!resolvePlatform(os, arch, out, error)) return false;

		VLOG(1) << "Detected platform " << platformName(out) << " (" << os << "/" << arch << ")";
		return true;
	}
}; //---namespace twcli
