#pragma once
#include "uni_service/Process.hpp"

namespace unisvc::process::detail {

// Платформенно-специфичная реализация запуска процесса
// Определяется в ProcessLinux.cpp
// Параметры:
//   exe - путь к исполняемому файлу или имя для поиска в PATH
//   args - аргументы командной строки для передачи процессу
//   out - структура для записи результатов выполнения (передается по ссылке)
//   opt - опции запуска процесса
// Возвращает:
//   true - если процесс успешно запущен и завершился (независимо от exitCode)
//   false - если произошла ошибка при запуске процесса
    bool runPlatform(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt);

} // namespace unisvc::process::detail
