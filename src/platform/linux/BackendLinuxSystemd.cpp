#if defined(__linux__)

#include "platform/linux/LinuxBackends.hpp"
#include "uni_service/Paths.hpp"
#include "uni_service/Process.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <glog/logging.h>

namespace unisvc::backend {

    namespace {

        //---Шаблон unit-файла по умолчанию
        const char* const kSystemdScript =
            "[Unit]\n"
            "Description={{.Description}}\n"
            "ConditionFileIsExecutable={{.Path|cmdEscape}}\n"
            "{{range .Dependencies}}{{.}}\n{{end}}"
            "\n"
            "[Service]\n"
            "StartLimitInterval=5\n"
            "StartLimitBurst=10\n"
            "ExecStart={{.Path|cmdEscape}}{{range .Arguments}} {{.|unitQuote}}{{end}}\n"
            "{{if .ChRoot}}RootDirectory={{.ChRoot|cmd}}\n{{end}}"
            "{{if .WorkingDirectory}}WorkingDirectory={{.WorkingDirectory|cmdEscape}}\n{{end}}"
            "{{if .UserName}}User={{.UserName}}\n{{end}}"
            "{{if .ReloadSignal}}ExecReload=/bin/kill -{{.ReloadSignal}} \"$MAINPID\"\n{{end}}"
            "{{if .PIDFile}}PIDFile={{.PIDFile|cmd}}\n{{end}}"
            "{{if .LogOutput}}StandardOutput=file:/var/log/{{.Name}}.out\n"
            "StandardError=file:/var/log/{{.Name}}.err\n{{end}}"
            "{{if .LimitNOFILE}}LimitNOFILE={{.LimitNOFILE}}\n{{end}}"
            "{{if .Restart}}Restart={{.Restart}}\n{{end}}"
            "{{if .SuccessExitStatus}}SuccessExitStatus={{.SuccessExitStatus}}\n{{end}}"
            "RestartSec=120\n"
            "EnvironmentFile=-/etc/sysconfig/{{.Name}}\n"
            "\n"
            "[Install]\n"
            "WantedBy={{.WantedBy}}\n";

        //---Чтение первой строки файла без пробелов по краям
        static std::string readTrimmed(const fs::path& p)
        {
            std::ifstream f(p);
            if (!f) return {};
            std::ostringstream ss;
            ss << f.rdbuf();
            std::string s = ss.str();
            const auto b = s.find_first_not_of(" \r\n");
            if (b == std::string::npos) return {};
            const auto e = s.find_last_not_of(" \r\n");
            return s.substr(b, e - b + 1);
        }

    } // namespace

    bool isSystemd(const fs::path& root)
    {
        if (pathExists(rooted(root, "/run/systemd/system")))
            return true;
        return readTrimmed(rooted(root, "/proc/1/comm")) == "systemd";
    }

    bool listsUnit(const std::string& out, const std::string& unit)
    {
        std::istringstream lines(out);
        std::string line;
        while (std::getline(lines, line))
        {
            //---"<unit> <state> [<preset>]"
            if (line.rfind(unit, 0) == 0 && line.size() > unit.size() &&
                (line[unit.size()] == ' ' || line[unit.size()] == '\t'))
                return true;
        }
        return false;
    }

    ActiveState parseIsActive(const std::string& out)
    {
        auto starts = [&out](const char* p) { return out.rfind(p, 0) == 0; };

        if (starts("activating")) return ActiveState::Activating;
        if (starts("active")) return ActiveState::Active;
        if (starts("inactive")) return ActiveState::Inactive;
        if (starts("failed")) return ActiveState::Failed;
        return ActiveState::Other;
    }

    //---BackendLinuxSystemd - управление службой через systemd
    class BackendLinuxSystemd final : public BackendBase {
    public:
        using BackendBase::BackendBase;

        //---Установка: unit-файл, enable, daemon-reload
        bool install(Error* error) override
        {
            const fs::path p = unitPath();

            //---Для пользовательских служб каталог может отсутствовать
            if (isUser())
            {
                std::error_code ec;
                fs::create_directories(p.parent_path(), ec);
                if (ec)
                    return fail(error, ErrorKind::Io, "create " + p.parent_path().string() + ": " + ec.message());
            }

            tmpl::Data data;
            if (!templateData(data, error)) return false;

            const KeyValue& opt = config().option;
            const int nofile = opt.getInt(option::kLimitNOFILE, -1);
            data.set("Restart", opt.getString(option::kRestart, "always"));
            data.set("SuccessExitStatus", opt.getString(option::kSuccessExitStatus, ""));
            data.set("ReloadSignal", opt.getString(option::kReloadSignal, ""));
            data.set("LimitNOFILE", nofile > -1 ? std::to_string(nofile) : std::string{});
            data.set("WantedBy", isUser() ? "default.target" : "multi-user.target");

            if (!writeDescriptor(p, scriptTemplate(option::kSystemdScript, kSystemdScript), data,
                fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read | fs::perms::others_read,
                error))
                return false;

            if (!systemctl({ "enable", unitName() }, error)) return false;
            return systemctl({ "daemon-reload" }, error);
        }

        //---Удаление: disable, unit-файл, daemon-reload
        bool uninstall(Error* error) override
        {
            if (!systemctl({ "disable", unitName() }, error)) return false;
            if (!removeFile(unitPath(), error)) return false;
            return systemctl({ "daemon-reload" }, error);
        }

        bool start(Error* error) override
        {
            return systemctl({ "start", unitName() }, error);
        }

        bool stop(Error* error) override
        {
            return systemctl({ "stop", unitName() }, error);
        }

        //---systemd перезапускает надёжнее, чем stop + start
        bool restart(Error* error) override
        {
            return systemctl({ "restart", unitName() }, error);
        }

        Status status(Error* error) override
        {
            int exitCode = 0;
            std::string out;
            Error cmdErr;

            //---exitCode 0 + ошибка = systemctl не запустился
            if (!runCommandWithOutput("systemctl", args({ "is-active", unitName() }), exitCode, out, &cmdErr) && exitCode == 0)
            {
                if (error) *error = cmdErr;
                return Status::Unknown;
            }

            switch (parseIsActive(out))
            {
            case ActiveState::Active:
            case ActiveState::Activating:
                return Status::Running;

            case ActiveState::Inactive:
            {
                //---inactive бывает и у неустановленной службы: проверяем unit-файлы
                Error listErr;
                if (!runCommandWithOutput("systemctl", args({ "list-unit-files", "-t", "service", unitName() }), exitCode, out, &listErr) && exitCode == 0)
                {
                    if (error) *error = listErr;
                    return Status::Unknown;
                }
                if (listsUnit(out, unitName()))
                    return Status::Stopped;
                fail(error, ErrorKind::NotInstalled, "");
                return Status::Unknown;
            }

            case ActiveState::Failed:
                fail(error, ErrorKind::Command, "service in failed state");
                return Status::Unknown;

            default:
                fail(error, ErrorKind::NotInstalled, "");
                return Status::Unknown;
            }
        }

    private:
        bool isUser() const
        {
            return config().option.getBool(option::kUserService, false);
        }

        //---Полное имя unit с расширением .service
        std::string unitName() const
        {
            return config().name + ".service";
        }

        //---Путь к unit-файлу: системный или пользовательский
        fs::path unitPath() const
        {
            if (isUser())
                return homeDir() / ".config/systemd/user" / unitName();
            return rooted("/etc/systemd/system") / unitName();
        }

        //---Аргументы systemctl (с --user для пользовательских служб)
        std::vector<std::string> args(std::initializer_list<std::string> a) const
        {
            std::vector<std::string> out;
            if (isUser()) out.push_back("--user");
            out.insert(out.end(), a.begin(), a.end());
            return out;
        }

        //---Запуск systemctl с проверкой кода возврата
        bool systemctl(std::initializer_list<std::string> a, Error* error) const
        {
            return runCommand("systemctl", args(a), error);
        }
    };

    //---Фабричная функция для создания экземпляра бэкенда systemd
    std::unique_ptr<IServiceBackend> newSystemdService(IProgram& program, const std::string& platform,
        const Config& config, Error* /*error*/, const fs::path& root)
    {
        return std::make_unique<BackendLinuxSystemd>(program, platform, config, root);
    }

} // namespace unisvc::backend

#endif // __linux__
