#if defined(__linux__)

#include "platform/linux/LinuxBackends.hpp"
#include "uni_service/Process.hpp"

#include <string>

namespace unisvc::backend {

    namespace {

        //---Шаблон upstart job по умолчанию
        const char* const kUpstartScript =
            "# {{.Description}}\n"
            "\n"
            "{{if .DisplayName}}description    {{.DisplayName|cmd}}\n{{end}}"
            "\n"
            "kill signal INT\n"
            "{{if .ChRoot}}chroot {{.ChRoot}}\n{{end}}"
            "{{if .WorkingDirectory}}chdir {{.WorkingDirectory}}\n{{end}}"
            "start on filesystem or runlevel [2345]\n"
            "stop on runlevel [!2345]\n"
            "\n"
            "{{if .UserName}}setuid {{.UserName}}\n{{end}}"
            "\n"
            "respawn\n"
            "respawn limit 10 5\n"
            "umask 022\n"
            "\n"
            "console none\n"
            "\n"
            "pre-start script\n"
            "    test -x {{.Path|cmd}} || { stop; exit 0; }\n"
            "end script\n"
            "\n"
            "# Start\n"
            "script\n"
            "{{if .LogOutput}}"
            "    stdout_log=\"/var/log/{{.Name}}.out\"\n"
            "    stderr_log=\"/var/log/{{.Name}}.err\"\n"
            "{{end}}"
            "\n"
            "    if [ -f \"/etc/sysconfig/{{.Name}}\" ]; then\n"
            "        set -a\n"
            "        . \"/etc/sysconfig/{{.Name}}\"\n"
            "        set +a\n"
            "    fi\n"
            "\n"
            "    exec {{.Path|cmd}}{{range .Arguments}} {{.|cmd}}{{end}}"
            "{{if .LogOutput}} >> \"$stdout_log\" 2>> \"$stderr_log\"{{end}}\n"
            "end script\n";

    } // namespace

    bool isUpstart(const fs::path& root)
    {
        if (pathExists(rooted(root, "/sbin/upstart-udev-bridge")))
            return true;

        const fs::path initctl = rooted(root, "/sbin/initctl");
        if (!pathExists(initctl))
            return false;

        int exitCode = 0;
        std::string out;
        if (!runCommandWithOutput(initctl.string(), { "--version" }, exitCode, out, nullptr))
            return false;
        return out.find("initctl (upstart") != std::string::npos;
    }

    Status parseUpstartStatus(const std::string& name, const std::string& out, Error* error)
    {
        if (out.rfind(name + " start/running", 0) == 0) return Status::Running;
        if (out.rfind(name + " stop/waiting", 0) == 0) return Status::Stopped;

        fail(error, ErrorKind::NotInstalled, "");
        return Status::Unknown;
    }

    //---BackendLinuxUpstart - job-файл в /etc/init, управление через initctl
    class BackendLinuxUpstart final : public BackendBase {
    public:
        using BackendBase::BackendBase;

        bool install(Error* error) override
        {
            tmpl::Data data;
            if (!templateData(data, error)) return false;

            return writeDescriptor(confPath(), scriptTemplate(option::kUpstartScript, kUpstartScript), data,
                fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read | fs::perms::others_read,
                error);
        }

        bool uninstall(Error* error) override
        {
            return removeFile(confPath(), error);
        }

        bool start(Error* error) override
        {
            return runCommand("initctl", { "start", config().name }, error);
        }

        bool stop(Error* error) override
        {
            return runCommand("initctl", { "stop", config().name }, error);
        }

        Status status(Error* error) override
        {
            int exitCode = 0;
            std::string out;
            Error cmdErr;
            if (!runCommandWithOutput("initctl", { "status", config().name }, exitCode, out, &cmdErr) && exitCode == 0)
            {
                if (error) *error = cmdErr;
                return Status::Unknown;
            }
            return parseUpstartStatus(config().name, out, error);
        }

    private:
        fs::path confPath() const
        {
            return rooted("/etc/init") / (config().name + ".conf");
        }
    };

    std::unique_ptr<IServiceBackend> newUpstartService(IProgram& program, const std::string& platform,
        const Config& config, Error* error, const fs::path& root)
    {
        if (config.option.getBool(option::kUserService, false))
        {
            fail(error, ErrorKind::UserServiceUnsupported, "user services are not supported on " + platform);
            return nullptr;
        }
        return std::make_unique<BackendLinuxUpstart>(program, platform, config, root);
    }

} // namespace unisvc::backend

#endif // __linux__
