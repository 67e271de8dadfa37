#include "tailwind_cli/EmbeddedBinary.hpp"

//---Символы генерируются при сборке утилитой twcli_embed (tools/embed_binary.cpp),
//	по одной единице трансляции на платформу
#define TWCLI_DECLARE_EMBEDDED(ident)                          \
	extern const unsigned char twcli_embedded_##ident[];       \
	extern const std::size_t twcli_embedded_##ident##_size;

TWCLI_DECLARE_EMBEDDED(macos_arm64)
TWCLI_DECLARE_EMBEDDED(macos_x64)
TWCLI_DECLARE_EMBEDDED(linux_arm64)
TWCLI_DECLARE_EMBEDDED(linux_armv7)
TWCLI_DECLARE_EMBEDDED(linux_x64)
TWCLI_DECLARE_EMBEDDED(windows_arm64)
TWCLI_DECLARE_EMBEDDED(windows_x64)

#undef TWCLI_DECLARE_EMBEDDED

namespace twcli {

	static_assert(static_cast<std::size_t>(PlatformId::WindowsX64) + 1 == kPlatformCount,
		"kPlatformCount must match PlatformId");

#define TWCLI_EMBEDDED(ident) EmbeddedBinary{ twcli_embedded_##ident, twcli_embedded_##ident##_size }

	//---switch без default: новая платформа без записи - ошибка сборки (-Werror=switch)
	EmbeddedBinary bytesFor(PlatformId platform) noexcept {
		switch (platform)
		{
		case PlatformId::MacOsArm64: return TWCLI_EMBEDDED(macos_arm64);
		case PlatformId::MacOsX64: return TWCLI_EMBEDDED(macos_x64);
		case PlatformId::LinuxArm64: return TWCLI_EMBEDDED(linux_arm64);
		case PlatformId::LinuxArmv7: return TWCLI_EMBEDDED(linux_armv7);
		case PlatformId::LinuxX64: return TWCLI_EMBEDDED(linux_x64);
		case PlatformId::WindowsArm64: return TWCLI_EMBEDDED(windows_arm64);
		case PlatformId::WindowsX64: return TWCLI_EMBEDDED(windows_x64);
		}
		return {};
	}

#undef TWCLI_EMBEDDED

}; //---namespace twcli
