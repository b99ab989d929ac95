#if defined(__linux__)

#include "platform/linux/LinuxBackends.hpp"
#include "uni_service/Process.hpp"

#include <string>

namespace unisvc::backend {

    namespace {

        //---Шаблон openrc-run скрипта по умолчанию
        const char* const kOpenRCScript =
            "#!/sbin/openrc-run\n"
            "supervisor=supervise-daemon\n"
            "name={{.DisplayName|cmd}}\n"
            "description={{.Description|cmd}}\n"
            "command={{.Path|cmd}}\n"
            "{{if .Arguments}}command_args=\"{{range .Arguments}}{{.|cmd|shEscape}} {{end}}\"\n{{end}}"
            "{{if .WorkingDirectory}}directory={{.WorkingDirectory|cmd}}\n{{end}}"
            "{{if .UserName}}command_user={{.UserName|cmd}}\n{{end}}"
            "supervise_daemon_args=\"--stdout {{.LogDirectory}}/{{.Name}}.log --stderr {{.LogDirectory}}/{{.Name}}.err\"\n"
            "{{if .Dependencies}}\n"
            "depend() {\n"
            "{{range .Dependencies}}\t{{.}}\n{{end}}"
            "}\n"
            "{{end}}";

        //---rc-service использует коды errno
        constexpr int kEPERM = 1;
        constexpr int kENOENT = 2;
        constexpr int kESRCH = 3;

    } // namespace

    bool isOpenRC(const fs::path& root)
    {
        if (!findTool(root, "openrc-init").empty())
            return true;
        return inittabMatches(root, "::sysinit:.*openrc.*sysinit");
    }

    Status decodeOpenRCStatus(int exitCode, const Error& cmdError, Error* error)
    {
        switch (exitCode)
        {
        case 0:
            if (!cmdError.ok())
            {
                //---rc-service не запустился
                if (error) *error = cmdError;
                return Status::Unknown;
            }
            return Status::Running;
        case kEPERM:
            if (error) *error = cmdError;
            return Status::Unknown;
        case kENOENT:
            fail(error, ErrorKind::NotInstalled, "");
            return Status::Unknown;
        case kESRCH:
            return Status::Stopped;
        default:
            fail(error, ErrorKind::Command, "unknown error: " + cmdError.message);
            return Status::Unknown;
        }
    }

    //---BackendLinuxOpenRC - скрипт в /etc/init.d, регистрация через rc-update
    class BackendLinuxOpenRC final : public BackendBase {
    public:
        using BackendBase::BackendBase;

        bool install(Error* error) override
        {
            tmpl::Data data;
            if (!templateData(data, error)) return false;

            if (!writeDescriptor(scriptPath(), scriptTemplate(option::kOpenRCScript, kOpenRCScript), data,
                fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                fs::perms::others_read | fs::perms::others_exec, error))
                return false;

            return runCommand("rc-update", { "add", config().name }, error);
        }

        bool uninstall(Error* error) override
        {
            if (!runCommand("rc-update", { "delete", config().name }, error)) return false;
            return removeFile(scriptPath(), error);
        }

        bool start(Error* error) override
        {
            return runCommand("rc-service", { config().name, "start" }, error);
        }

        bool stop(Error* error) override
        {
            return runCommand("rc-service", { config().name, "stop" }, error);
        }

        bool restart(Error* error) override
        {
            return runCommand("rc-service", { config().name, "restart" }, error);
        }

        Status status(Error* error) override
        {
            int exitCode = 0;
            std::string out;
            Error cmdErr;
            if (runCommandWithOutput("rc-service", { config().name, "status" }, exitCode, out, &cmdErr))
                return Status::Running;
            return decodeOpenRCStatus(exitCode, cmdErr, error);
        }

    private:
        fs::path scriptPath() const
        {
            return rooted("/etc/init.d") / config().name;
        }
    };

    std::unique_ptr<IServiceBackend> newOpenRCService(IProgram& program, const std::string& platform,
        const Config& config, Error* error, const fs::path& root)
    {
        if (config.option.getBool(option::kUserService, false))
        {
            fail(error, ErrorKind::UserServiceUnsupported, "user services are not supported on " + platform);
            return nullptr;
        }
        return std::make_unique<BackendLinuxOpenRC>(program, platform, config, root);
    }

} // namespace unisvc::backend

#endif // __linux__
