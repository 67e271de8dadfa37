#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace twcli::process {

    namespace fs = std::filesystem;

    struct RunOptions final {
        fs::path workingDir;          // Рабочий каталог для запускаемого процесса (опционально)
        bool hideWindow = true;       // Скрыть окно консоли (Windows: CREATE_NO_WINDOW, POSIX: игнорируется)
    };

    struct RunResult final {
        bool started = false;         // Успешно ли запущен процесс (true - да, false - ошибка запуска)
        int exitCode = 0;             // Код завершения процесса (128 + номер сигнала, если убит сигналом)
        bool signaled = false;        // Процесс завершён сигналом (только POSIX)
        int termSignal = 0;           // Номер сигнала, если signaled
        std::uint32_t sysError = 0;   // Код системной ошибки (GetLastError() на Windows или errno на POSIX)
        std::string stdoutBytes;      // Полный вывод stdout (сырые байты)
        std::string stderrBytes;      // Полный вывод stderr (сырые байты)
        std::string error;            // Описание ошибки запуска/ожидания
    };
    //---Запускает внешний процесс и захватывает stdout и stderr целиком
    //
    // Параметры:
    //   exe - путь к исполняемому файлу
    //   args - аргументы командной строки, передаются без изменений
    //   out - структура для записи результатов выполнения (передается по ссылке)
    //   opt - опции запуска процесса (по умолчанию пустые)
    // Возвращает:
    //   true - если процесс успешно запущен и завершился (независимо от exitCode)
    //   false - если процесс не удалось запустить (started == false) или дождаться
    // Примечание:
    //   Функция блокирующая, таймаута нет. stdin дочернего процесса - пустое устройство.
    //   Потоки читаются одновременно, поэтому заполненный канал не приводит к взаимоблокировке
    bool run(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt = {});

} // namespace twcli::process
