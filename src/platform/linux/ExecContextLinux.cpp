#if defined(__linux__)

#include "uni_service/ExecContext.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace unisvc {

    namespace {
        //---Максимум строк cgroup-файла для проверки
        constexpr int kMaxCgroupLines = 5;
    }

    //---Проверка, что процесс 1 находится в docker / lxc контейнере
    bool isInContainer(const fs::path& cgroupFile, std::error_code& ec)
    {
        ec.clear();

        std::ifstream f(cgroupFile);
        if (!f)
        {
            ec = std::make_error_code(std::errc::no_such_file_or_directory);
            return false;
        }

        std::string line;
        for (int lines = 0; lines < kMaxCgroupLines && std::getline(f, line); lines++)
        {
            if (line.find("docker") != std::string::npos || line.find("lxc") != std::string::npos)
                return true;
        }

        if (f.bad())
        {
            ec = std::make_error_code(std::errc::io_error);
        }
        return false;
    }

    bool parseStatBinaryName(const std::string& stat, std::string& out)
    {
        const auto open = stat.find('(');
        if (open == std::string::npos) return false;

        const auto close = stat.find(')', open + 1);
        if (close == std::string::npos) return false;

        out = stat.substr(open + 1, close - open - 1);
        return true;
    }

    bool binaryName(pid_t pid, const fs::path& procRoot, std::string& out)
    {
        std::ifstream f(procRoot / std::to_string(pid) / "stat");
        if (!f) return false;

        std::ostringstream ss;
        ss << f.rdbuf();
        return parseStatBinaryName(ss.str(), out);
    }

    bool isInteractive(const ContextProbe& probe)
    {
        //---В контейнере считаем запуск интерактивным: цепочка предков ненадёжна
        //   Ошибка чтения = "не в контейнере"
        std::error_code ec;
        if (isInContainer(probe.cgroupFile, ec) && !ec)
            return true;

        //---Родитель pid 1: нас запустила init-система
        const pid_t ppid = probe.parentPid != 0 ? probe.parentPid : ::getppid();
        if (ppid == 1)
            return false;

        std::string binary;
        if (!binaryName(ppid, probe.procRoot, binary))
            return true;
        return binary != "systemd";
    }

    bool isInteractive()
    {
        return isInteractive(ContextProbe{});
    }

} // namespace unisvc
#endif
