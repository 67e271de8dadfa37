#ifdef _WIN32

#include "platform/PlatformImpl.hpp"
#include <windows.h>
#include <glog/logging.h>

namespace twcli::platform {

    static bool setError(const char* stage, const fs::path& path, DWORD err,
        std::string* error, std::uint32_t* sysError)
    {
        if (error) *error = std::string(stage) + " failed for '" + path.u8string() + "' with error " + std::to_string(err);
        if (sysError) *sysError = err;
        return false;
    }

    //---Закрыть и удалить недописанный файл
    static void discardPartial(HANDLE h, const fs::path& path)
    {
        if (h != INVALID_HANDLE_VALUE) CloseHandle(h);
        if (!DeleteFileW(path.wstring().c_str()))
        {
            LOG(WARNING) << "Failed to delete partial file " << path.u8string() << " with error " << GetLastError();
        }
    }

	//---Запись бинарника. Права не выставляются: исполняемость определяется расширением .exe
    bool writeExecutable(const fs::path& path, const EmbeddedBinary& binary,
        std::string* error, std::uint32_t* sysError)
    {
        //---CREATE_NEW: чужой файл с тем же именем не перезаписывается
        HANDLE h = CreateFileW(path.wstring().c_str(), GENERIC_WRITE, 0, nullptr,
            CREATE_NEW, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (h == INVALID_HANDLE_VALUE) return setError("CreateFileW", path, GetLastError(), error, sysError);

        std::size_t done = 0;
        while (done < binary.size)
        {
            const std::size_t left = binary.size - done;
            const DWORD chunk = left > 0x40000000u ? 0x40000000u : (DWORD)left;
            DWORD written = 0;
            if (!WriteFile(h, binary.data + done, chunk, &written, nullptr))
            {
                const DWORD err = GetLastError();
                discardPartial(h, path);
                return setError("WriteFile", path, err, error, sysError);
            }
            done += written;
        }

        if (!FlushFileBuffers(h))
        {
            const DWORD err = GetLastError();
            discardPartial(h, path);
            return setError("FlushFileBuffers", path, err, error, sysError);
        }

        if (!CloseHandle(h))
        {
            const DWORD err = GetLastError();
            discardPartial(INVALID_HANDLE_VALUE, path);
            return setError("CloseHandle", path, err, error, sysError);
        }
        return true;
    }

    bool removeFile(const fs::path& path, std::string* error)
    {
        if (DeleteFileW(path.wstring().c_str())) return true;

        if (error) *error = "DeleteFileW failed for '" + path.u8string() + "' with error " + std::to_string(GetLastError());
        return false;
    }

} // namespace twcli::platform

#endif
