#pragma once
#include "tailwind_cli/Process.hpp"

namespace twcli::process::detail {

// Платформенно-специфичная реализация запуска процесса
// Определяется в соответствующих файлах реализации:
//   - ProcessWin.cpp для Windows
//   - ProcessPosix.cpp для Linux и macOS
// Параметры:
//   exe - путь к исполняемому файлу
//   args - аргументы командной строки для передачи процессу
//   out - структура для записи результатов выполнения (передается по ссылке)
//   opt - опции запуска процесса
// Возвращает:
//   true - если процесс успешно запущен и завершился (независимо от exitCode)
//   false - если произошла ошибка при запуске процесса
    bool runPlatform(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt);

} // namespace twcli::process::detail
