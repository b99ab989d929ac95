#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "Errors.hpp"

namespace unisvc::process {

    namespace fs = std::filesystem;

    struct RunOptions final {
        fs::path workingDir;          // Рабочий каталог для запускаемого процесса (опционально)
        bool captureStdout = false;   // Сохранять stdout в RunResult::out (иначе stdout -> /dev/null)
    };

    struct RunResult final {
        bool started = false;         // Успешно ли запущен процесс (exec выполнен)
        bool signaled = false;        // Процесс завершён сигналом
        int termSignal = 0;           // Номер сигнала, если signaled
        int exitCode = 0;             // Код завершения (128 + сигнал, если signaled)
        std::uint32_t sysError = 0;   // errno при ошибке запуска / ожидания
        std::string out;              // stdout (если captureStdout)
        std::string err;              // stderr (всегда)
    };
    //---Запускает внешний процесс и ждёт его завершения
    // 
    // Параметры:
    //   exe - путь к исполняемому файлу или имя для поиска в PATH
    //   args - аргументы командной строки для передачи процессу
    //   out - структура для записи результатов выполнения (передается по ссылке)
    //   opt - опции запуска процесса (по умолчанию пустые)
    // Возвращает:
    //   true - если процесс успешно запущен и завершился (независимо от exitCode)
    //   false - если процесс не удалось запустить (fork/exec) или дождаться
    // Примечание:
    //   Функция блокирующая. Запуск и ожидание разделены, поэтому ошибка exec
    //   (нет файла, нет прав) отличима от ненулевого кода завершения
    bool run(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt = {});

} // namespace unisvc::process

namespace unisvc {

    //---Запуск команды init-системы. Ненулевой код -> ErrorKind::Command
    bool runCommand(const std::string& command, const std::vector<std::string>& args, Error* error);

    //---То же, но с кодом завершения и stdout. exitCode заполняется и при ошибке
    bool runCommandWithOutput(const std::string& command, const std::vector<std::string>& args,
        int& exitCode, std::string& out, Error* error);

} // namespace unisvc
