#ifdef _WIN32
#include "platform/PlatformImpl.hpp"
#include <windows.h>

namespace twcli::platform {

	//---Имя ОС
    std::string osName()
    {
        return "windows";
    }

	//---Архитектура машины (нативная, а не архитектура текущего процесса под эмуляцией)
    std::string archName()
    {
        SYSTEM_INFO info{};
        GetNativeSystemInfo(&info);

        switch (info.wProcessorArchitecture)
        {
        case PROCESSOR_ARCHITECTURE_AMD64: return "x86_64";
        case PROCESSOR_ARCHITECTURE_ARM64: return "aarch64";
        case PROCESSOR_ARCHITECTURE_ARM: return "arm";
        case PROCESSOR_ARCHITECTURE_INTEL: return "x86";
        default: return "unknown";
        }
    }

} // namespace twcli::platform
#endif
