#include "tailwind_cli/Process.hpp"
#include "platform/ProcessImpl.hpp"

#include <glog/logging.h>

namespace twcli::process {

// Реализация публичной функции запуска процесса
// Делегирует выполнение detail::runPlatform() (Windows/POSIX)
    bool run(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt)
    {
        VLOG(1) << "Starting process " << exe.u8string() << " with " << args.size() << " argument(s)";

        const bool ok = detail::runPlatform(exe, args, out, opt);
        if (!ok)
        {
            LOG(ERROR) << "Process " << exe.u8string() << " failed: " << out.error << " (sysError=" << out.sysError << ")";
            return false;
        }

        VLOG(1) << "Process " << exe.u8string() << " exited with code " << out.exitCode
            << ", stdout " << out.stdoutBytes.size() << " bytes, stderr " << out.stderrBytes.size() << " bytes";
        return true;
    }

} // namespace twcli::process
