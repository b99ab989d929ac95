#include "uni_service/Process.hpp"
#include "platform/ProcessImpl.hpp"

#include <cstring>
#include <sstream>
#include <glog/logging.h>

namespace unisvc::process {

// Реализация публичной функции запуска процесса
// Делегирует выполнение detail::runPlatform()
    bool run(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt)
    {
        return detail::runPlatform(exe, args, out, opt);
    }

} // namespace unisvc::process

namespace unisvc {

    namespace {

        //---"cmd arg1 arg2" для сообщений об ошибках
        std::string describe(const std::string& command, const std::vector<std::string>& args)
        {
            std::ostringstream os;
            os << '"' << command;
            for (const auto& a : args) os << ' ' << a;
            os << '"';
            return os.str();
        }

        static bool endsWith(const std::string& s, const std::string& suffix)
        {
            return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        //---Общая часть run / runWithOutput
        static bool runImpl(const std::string& command, const std::vector<std::string>& args,
            bool readStdout, int& exitCode, std::string& out, Error* error)
        {
            exitCode = 0;
            out.clear();

            VLOG(1) << "exec " << describe(command, args);

            process::RunOptions opt;
            opt.captureStdout = readStdout;

            process::RunResult rr;
            const bool ok = process::run(command, args, rr, opt);

            //---Процесс не запустился (нет файла, нет прав, fork не удался)
            if (!ok || !rr.started)
            {
                std::ostringstream os;
                os << describe(command, args) << " failed: " << std::strerror((int)rr.sysError);
                return fail(error, ErrorKind::Command, os.str());
            }

            out = rr.out;

            //---Ненулевой код завершения или завершение сигналом
            if (rr.exitCode != 0)
            {
                exitCode = rr.exitCode;
                std::ostringstream os;
                os << describe(command, args);
                if (rr.signaled) os << " killed by signal " << rr.termSignal;
                else os << " exit status " << rr.exitCode;
                if (!rr.err.empty()) os << ": " << rr.err;
                return fail(error, ErrorKind::Command, os.str());
            }

            //---launchctl может вернуть 0 при ошибке, поэтому проверяем stderr
            if (command == "launchctl")
            {
                if (!rr.err.empty() && !endsWith(rr.err, "Operation now in progress\n"))
                {
                    out.clear();
                    return fail(error, ErrorKind::Command, describe(command, args) + " failed with stderr: " + rr.err);
                }
            }

            return true;
        }

    } // namespace

    bool runCommand(const std::string& command, const std::vector<std::string>& args, Error* error)
    {
        int exitCode = 0;
        std::string out;
        return runImpl(command, args, false, exitCode, out, error);
    }

    bool runCommandWithOutput(const std::string& command, const std::vector<std::string>& args,
        int& exitCode, std::string& out, Error* error)
    {
        return runImpl(command, args, true, exitCode, out, error);
    }

} // namespace unisvc
