#if !defined(_WIN32)

#include "platform/PlatformImpl.hpp"

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cstring>

namespace twcli::platform {

    //---Права готового файла: rwxr-xr-x
    static constexpr mode_t kExecutableMode = 0755;
    //---Права на время записи: файл ещё нельзя запустить
    static constexpr mode_t kWritingMode = 0600;

    static bool setError(const char* stage, const fs::path& path, int err,
        std::string* error, std::uint32_t* sysError)
    {
        if (error) *error = std::string(stage) + " failed for '" + path.string() + "': " + std::strerror(err);
        if (sysError) *sysError = (std::uint32_t)err;
        return false;
    }

    //---Закрыть и удалить недописанный файл, сохранив исходный errno
    static void discardPartial(int fd, const fs::path& path)
    {
        const int saved = errno;
        if (fd >= 0) ::close(fd);
        ::unlink(path.c_str());
        errno = saved;
    }

    bool writeExecutable(const fs::path& path, const EmbeddedBinary& binary,
        std::string* error, std::uint32_t* sysError)
    {
        //---O_EXCL: чужой файл с тем же именем не перезаписывается
        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, kWritingMode);
        if (fd < 0) return setError("create", path, errno, error, sysError);

        //---Запись всех байтов (write может записать часть)
        std::size_t done = 0;
        while (done < binary.size)
        {
            const ssize_t n = ::write(fd, binary.data + done, binary.size - done);
            if (n < 0)
            {
                if (errno == EINTR) continue;
                const int err = errno;
                discardPartial(fd, path);
                return setError("write", path, err, error, sysError);
            }
            done += (std::size_t)n;
        }

        //---Сброс на диск
        if (::fsync(fd) != 0)
        {
            const int err = errno;
            discardPartial(fd, path);
            return setError("fsync", path, err, error, sysError);
        }

        //---Файл исполняемый только после полной записи
        if (::fchmod(fd, kExecutableMode) != 0)
        {
            const int err = errno;
            discardPartial(fd, path);
            return setError("chmod", path, err, error, sysError);
        }

        if (::close(fd) != 0)
        {
            const int err = errno;
            discardPartial(-1, path);
            return setError("close", path, err, error, sysError);
        }
        return true;
    }

    bool removeFile(const fs::path& path, std::string* error)
    {
        if (::unlink(path.c_str()) == 0) return true;

        if (error) *error = "unlink failed for '" + path.string() + "': " + std::strerror(errno);
        return false;
    }

} // namespace twcli::platform

#endif
