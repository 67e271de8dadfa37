#if !defined(_WIN32)
#include "platform/PlatformImpl.hpp"
#include <sys/utsname.h>
#include <cctype>

namespace twcli::platform {

	//---Имя ОС по uname: "Linux" → "linux", "Darwin" → "macos"
	std::string osName()
	{
		struct utsname u {};
		if (::uname(&u) != 0) return {};

		std::string name(u.sysname);
		for (char& c : name) c = (char)std::tolower((unsigned char)c);

		if (name == "darwin") return "macos";
		return name;
	}
	//---Архитектура по uname ("x86_64", "aarch64", "arm64", "armv7l", ...)
	std::string archName()
	{
		struct utsname u {};
		if (::uname(&u) != 0) return {};
		return u.machine;
	}

} // namespace twcli::platform
#endif
