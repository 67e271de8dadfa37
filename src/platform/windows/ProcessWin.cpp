#ifdef _WIN32

#include "platform/ProcessImpl.hpp"
#include <windows.h>
#include <string_view>
#include <thread>
#include <vector>
#include <glog/logging.h>

namespace twcli::process::detail {

    namespace {

        //---Дескриптор, закрывается в деструкторе
        struct UniqueHandle final {
            HANDLE h = nullptr;

            UniqueHandle() = default;
            explicit UniqueHandle(HANDLE v) : h(v) {}
            ~UniqueHandle() { reset(); }

            UniqueHandle(const UniqueHandle&) = delete;
            UniqueHandle& operator=(const UniqueHandle&) = delete;

            void reset()
            {
                if (h != nullptr && h != INVALID_HANDLE_VALUE) CloseHandle(h);
                h = nullptr;
            }
        };

        //---Атрибуты процесса, освобождаются в деструкторе
        struct AttributeList final {
            LPPROC_THREAD_ATTRIBUTE_LIST list = nullptr;
            std::vector<unsigned char> storage;

            ~AttributeList()
            {
                if (list) DeleteProcThreadAttributeList(list);
            }
        };

    } // namespace

	//--- Преобразование строки UTF-8 в широкую строку (UTF-16) для Windows API
    static std::wstring utf8ToWide(const std::string& s)
    {
        //---Проверка на пустую строку
        if (s.empty()) return {};
        //---Выходной буфер пустой. получаем требуемое число wide-символов
        int n = MultiByteToWideChar(CP_UTF8, 0, s.c_str(), (int)s.size(), nullptr, 0);
        if (n <= 0)
        {
            LOG(ERROR) << "Failed to get required buffer size for UTF-8 to wide conversion";
            return {};
        }
        std::wstring w((size_t)n, L'\0');
        //---Пишем широкие символы (некорректные последовательности → U+FFFD)
        MultiByteToWideChar(CP_UTF8, 0, s.c_str(), (int)s.size(), w.data(), n);
        return w;
    }

    //---Корректное quoting аргументов под CreateProcess (правило backslashes+quotes)
    static std::wstring quoteWindowsArg(std::wstring_view arg)
    {
        //---Кавычки нужны если пустой аргумент, есть пробелы, табуляции, переводы строк или кавычки
        const bool needQuotes =
            arg.empty() || (arg.find_first_of(L" \t\n\v\"") != std::wstring_view::npos);

        if (!needQuotes) return std::wstring(arg);

        std::wstring out;
        out.reserve(arg.size() + 2);
        out.push_back(L'"');

        //---Счетчик последовательных обратных слешей
        std::size_t bsCount = 0;
        for (wchar_t ch : arg)
        {
            if (ch == L'\\')
            {
                ++bsCount;
                out.push_back(L'\\');
                continue;
            }
            if (ch == L'"')
            {
                //--удвоить backslash'и перед кавычкой и экранировать кавычку
                out.append(bsCount, L'\\');
                bsCount = 0;
                out.push_back(L'\\');
                out.push_back(L'"');
                continue;
            }
            bsCount = 0;
            out.push_back(ch);
        }

        //---Удваиваем слеши перед закрывающей кавычкой
        out.append(bsCount, L'\\');
        out.push_back(L'"');
        return out;
    }
	//---Построение командной строки для CreateProcess
    static std::wstring buildCommandLine(const fs::path& exe, const std::vector<std::string>& args)
    {
        std::wstring cmd = quoteWindowsArg(exe.wstring());
        for (const auto& a : args)
        {
            cmd.push_back(L' ');
            cmd += quoteWindowsArg(utf8ToWide(a));
        }
        return cmd;
    }
    //---Чтение канала до EOF (ERROR_BROKEN_PIPE после завершения процесса)
    static DWORD readAll(HANDLE h, std::string& sink)
    {
        char buf[64 * 1024];
        for (;;)
        {
            DWORD got = 0;
            if (!ReadFile(h, buf, sizeof(buf), &got, nullptr))
            {
                const DWORD err = GetLastError();
                return err == ERROR_BROKEN_PIPE ? 0 : err;
            }
            if (got == 0) return 0;
            sink.append(buf, got);
        }
    }
    //---Ошибка WinAPI в результат
    static bool fail(RunResult& out, const char* what)
    {
        out.sysError = GetLastError();
        out.exitCode = (int)out.sysError;
        out.error = std::string(what) + " failed with error " + std::to_string(out.sysError);
        return false;
    }

	//---Платформенно-специфичная реализация запуска процесса для Windows
    bool runPlatform(const fs::path& exe, const std::vector<std::string>& args, RunResult& out, const RunOptions& opt)
    {
        out = {};

        //---Каналы: дочерний процесс наследует только концы записи
        SECURITY_ATTRIBUTES sa{};
        sa.nLength = sizeof(sa);
        sa.bInheritHandle = TRUE;

        UniqueHandle outRead, outWrite, errRead, errWrite;
        if (!CreatePipe(&outRead.h, &outWrite.h, &sa, 0)) return fail(out, "CreatePipe(stdout)");
        if (!CreatePipe(&errRead.h, &errWrite.h, &sa, 0)) return fail(out, "CreatePipe(stderr)");
        if (!SetHandleInformation(outRead.h, HANDLE_FLAG_INHERIT, 0)) return fail(out, "SetHandleInformation(stdout)");
        if (!SetHandleInformation(errRead.h, HANDLE_FLAG_INHERIT, 0)) return fail(out, "SetHandleInformation(stderr)");

        //---stdin дочернего процесса - устройство NUL
        UniqueHandle nulIn(CreateFileW(L"NUL", GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE,
            &sa, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr));
        if (nulIn.h == INVALID_HANDLE_VALUE) return fail(out, "CreateFileW(NUL)");

        //---Явный список наследуемых дескрипторов: параллельные вызовы не получат чужие каналы
        HANDLE inherit[3] = { nulIn.h, outWrite.h, errWrite.h };
        AttributeList attrs;
        SIZE_T attrSize = 0;
        InitializeProcThreadAttributeList(nullptr, 1, 0, &attrSize);
        attrs.storage.resize(attrSize);
        attrs.list = reinterpret_cast<LPPROC_THREAD_ATTRIBUTE_LIST>(attrs.storage.data());
        if (!InitializeProcThreadAttributeList(attrs.list, 1, 0, &attrSize))
        {
            attrs.list = nullptr;
            return fail(out, "InitializeProcThreadAttributeList");
        }
        if (!UpdateProcThreadAttribute(attrs.list, 0, PROC_THREAD_ATTRIBUTE_HANDLE_LIST,
            inherit, sizeof(inherit), nullptr, nullptr))
            return fail(out, "UpdateProcThreadAttribute");

        STARTUPINFOEXW si{};
        si.StartupInfo.cb = sizeof(si);
        si.StartupInfo.dwFlags = STARTF_USESTDHANDLES;
        si.StartupInfo.hStdInput = nulIn.h;
        si.StartupInfo.hStdOutput = outWrite.h;
        si.StartupInfo.hStdError = errWrite.h;
        si.lpAttributeList = attrs.list;

        //---Собираем командную строку из пути к исполняемому файлу и аргументов
        const std::wstring cmdLine = buildCommandLine(exe, args);
        std::vector<wchar_t> buf(cmdLine.begin(), cmdLine.end());
        buf.push_back(L'\0');

        const DWORD flags = EXTENDED_STARTUPINFO_PRESENT | (opt.hideWindow ? CREATE_NO_WINDOW : 0);
        const std::wstring cwdW = opt.workingDir.empty() ? L"" : opt.workingDir.wstring();
        const wchar_t* cwdPtr = opt.workingDir.empty() ? nullptr : cwdW.c_str();

        PROCESS_INFORMATION pi{};
        BOOL ok = CreateProcessW(
            exe.wstring().c_str(), // Имя исполняемого файла
            buf.data(),            // Командная строка (mutable)
            nullptr, nullptr,      // Атрибуты безопасности
            TRUE,                  // Наследование дескрипторов из списка
            flags,
            nullptr,               // Переменные окружения(наследовать от родителя)
            cwdPtr,                // Рабочая директория(nullptr = текущая директория)
            &si.StartupInfo,
            &pi
        );

        //---Обработка ошибки создания процесса
        if (!ok)
        {
            out.started = false;
            return fail(out, "CreateProcessW");
        }

        out.started = true;
        CloseHandle(pi.hThread);
        UniqueHandle process(pi.hProcess);

        //---Концы записи закрываем у себя, иначе ReadFile не увидит EOF
        outWrite.reset();
        errWrite.reset();
        nulIn.reset();

        //---stderr читается во втором потоке, stdout - в текущем
        DWORD errReadError = 0;
        std::thread errReader([&]() { errReadError = readAll(errRead.h, out.stderrBytes); });
        const DWORD outReadError = readAll(outRead.h, out.stdoutBytes);
        errReader.join();

        if (WaitForSingleObject(process.h, INFINITE) == WAIT_FAILED)
            return fail(out, "WaitForSingleObject");

        if (outReadError != 0 || errReadError != 0)
        {
            out.sysError = outReadError != 0 ? outReadError : errReadError;
            out.error = "ReadFile failed with error " + std::to_string(out.sysError);
            return false;
        }

        DWORD code = 0;
        if (!GetExitCodeProcess(process.h, &code))
            return fail(out, "GetExitCodeProcess");

        out.exitCode = (int)code;
        return true;
    }

} // namespace twcli::process::detail
#endif
