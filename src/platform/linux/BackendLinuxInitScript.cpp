#if defined(__linux__)

#include "platform/linux/LinuxBackends.hpp"
#include "uni_service/Process.hpp"

#include <string>
#include <vector>
#include <glog/logging.h>

namespace unisvc::backend {

    namespace {

        //---Заголовок SysV (chkconfig + LSB)
        const char* const kSysvHeader =
            "#!/bin/sh\n"
            "# For RedHat and cousins:\n"
            "# chkconfig: - 99 01\n"
            "# description: {{.Description}}\n"
            "# processname: {{.Path}}\n"
            "\n"
            "### BEGIN INIT INFO\n"
            "# Provides:          {{.Name}}\n"
            "# Required-Start:\n"
            "# Required-Stop:\n"
            "# Default-Start:     2 3 4 5\n"
            "# Default-Stop:      0 1 6\n"
            "# Short-Description: {{.DisplayName}}\n"
            "# Description:       {{.Description}}\n"
            "### END INIT INFO\n"
            "\n";

        //---Заголовок rcS / boxrc
        const char* const kRcHeader =
            "#!/bin/sh\n"
            "# {{.DisplayName}}: {{.Description}}\n"
            "\n";

        const char* const kScriptVars =
            "name={{.Name|cmd}}\n"
            "{{if .PIDFile}}pid_file={{.PIDFile|cmd}}\n{{else}}pid_file=\"/var/run/$name.pid\"\n{{end}}"
            "stdout_log={{.LogDirectory|cmd}}\"/$name.log\"\n"
            "stderr_log={{.LogDirectory|cmd}}\"/$name.err\"\n"
            "\n";

        const char* const kSysconfig =
            "[ -e \"/etc/sysconfig/$name\" ] && . \"/etc/sysconfig/$name\"\n"
            "\n";

        //---start|stop|restart|status: PID-файл (PIDFile или /var/run), логи в LogDirectory
        //   Зомби (состояние Z) не считается работающим процессом
        const char* const kScriptBody =
            "run_cmd() {\n"
            "{{if .WorkingDirectory}}    cd {{.WorkingDirectory|cmd}} || exit 1\n{{end}}"
            "    exec {{.Path|cmd}}{{range .Arguments}} {{.|cmd}}{{end}}\n"
            "}\n"
            "\n"
            "get_pid() {\n"
            "    cat \"$pid_file\"\n"
            "}\n"
            "\n"
            "is_running() {\n"
            "    [ -f \"$pid_file\" ] || return 1\n"
            "    stat=$(cat \"/proc/$(get_pid)/stat\" 2>/dev/null) || return 1\n"
            "    case \"$stat\" in\n"
            "        *\") Z \"*) return 1 ;;\n"
            "    esac\n"
            "    return 0\n"
            "}\n"
            "\n"
            "case \"$1\" in\n"
            "    start)\n"
            "        if is_running; then\n"
            "            echo \"Already started\"\n"
            "        else\n"
            "            echo \"Starting $name\"\n"
            "            run_cmd >> \"$stdout_log\" 2>> \"$stderr_log\" &\n"
            "            echo $! > \"$pid_file\"\n"
            "            if ! is_running; then\n"
            "                echo \"Unable to start, see $stdout_log and $stderr_log\"\n"
            "                exit 1\n"
            "            fi\n"
            "        fi\n"
            "    ;;\n"
            "    stop)\n"
            "        if is_running; then\n"
            "            printf \"Stopping %s..\" \"$name\"\n"
            "            kill \"$(get_pid)\"\n"
            "            for i in 1 2 3 4 5 6 7 8 9 10\n"
            "            do\n"
            "                if ! is_running; then\n"
            "                    break\n"
            "                fi\n"
            "                printf \".\"\n"
            "                sleep 1\n"
            "            done\n"
            "            echo\n"
            "            if is_running; then\n"
            "                echo \"Not stopped; may still be shutting down or shutdown may have failed\"\n"
            "                exit 1\n"
            "            else\n"
            "                echo \"Stopped\"\n"
            "                if [ -f \"$pid_file\" ]; then\n"
            "                    rm \"$pid_file\"\n"
            "                fi\n"
            "            fi\n"
            "        else\n"
            "            echo \"Not running\"\n"
            "        fi\n"
            "    ;;\n"
            "    restart)\n"
            "        \"$0\" stop\n"
            "        if is_running; then\n"
            "            echo \"Unable to stop, will not attempt to start\"\n"
            "            exit 1\n"
            "        fi\n"
            "        \"$0\" start\n"
            "    ;;\n"
            "    status)\n"
            "        if is_running; then\n"
            "            echo \"Running\"\n"
            "        else\n"
            "            echo \"Stopped\"\n"
            "        fi\n"
            "    ;;\n"
            "    *)\n"
            "        echo \"Usage: $0 {start|stop|restart|status}\"\n"
            "        exit 1\n"
            "    ;;\n"
            "esac\n";

        constexpr fs::perms kScriptPerms =
            fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
            fs::perms::others_read | fs::perms::others_exec;

    } // namespace

    //------------------------------------------------------------
    //  Раскладки
    //------------------------------------------------------------
    ScriptLayout sysvLayout()
    {
        ScriptLayout l;
        l.descriptorDir = "/etc/init.d";
        for (const char* i : { "2", "3", "4", "5" })
            l.links.emplace_back(fs::path("/etc/rc" + std::string(i) + ".d"), "S50");
        for (const char* i : { "0", "1", "6" })
            l.links.emplace_back(fs::path("/etc/rc" + std::string(i) + ".d"), "K02");
        l.linksBestEffort = true;
        l.viaServiceTool = true;
        l.defaultScript = std::string(kSysvHeader) + kScriptVars + kSysconfig + kScriptBody;
        return l;
    }

    ScriptLayout rcsLayout()
    {
        ScriptLayout l;
        l.descriptorDir = "/etc/init.d";
        l.links.emplace_back(fs::path("/etc/rc.d"), "S50");
        l.defaultScript = std::string(kRcHeader) + kScriptVars + kScriptBody;
        return l;
    }

    ScriptLayout boxrcLayout()
    {
        ScriptLayout l;
        l.descriptorDir = "/etc/boxinit.d";
        l.prefix = "65";
        l.links.emplace_back(fs::path("/etc/boxrc.d"), "65");
        l.defaultScript = std::string(kRcHeader) + kScriptVars + kScriptBody;
        return l;
    }

    //------------------------------------------------------------
    //  Детекторы
    //------------------------------------------------------------
    bool isSysV(const fs::path& root)
    {
        return pathExists(rooted(root, "/etc/init.d"));
    }

    bool isRCS(const fs::path& root)
    {
        if (!pathExists(rooted(root, "/etc/init.d/rcS")))
            return false;
        //---Есть "service" - это SysV, а не голый rcS
        if (!findTool(root, "service").empty())
            return false;
        return inittabMatches(root, "::sysinit:.*rcS");
    }

    bool isBoxRC(const fs::path& root)
    {
        if (!pathExists(rooted(root, "/etc/boxinit.d")))
            return false;
        return inittabMatches(root, "::sysinit:.*boxrc\\.d");
    }

    //---BackendLinuxInitScript - сгенерированный shell-скрипт + символьные ссылки
    class BackendLinuxInitScript final : public BackendBase {
    public:
        BackendLinuxInitScript(IProgram& program, std::string platform, Config config,
            ScriptLayout layout, fs::path root)
            : BackendBase(program, std::move(platform), std::move(config), std::move(root)),
              layout_(std::move(layout))
        {
        }

        //---Установка: скрипт 0755 + ссылки
        bool install(Error* error) override
        {
            tmpl::Data data;
            if (!templateData(data, error)) return false;

            const fs::path script = scriptPath();
            if (!writeDescriptor(script, scriptTemplate(scriptOption(), layout_.defaultScript), data, kScriptPerms, error))
                return false;

            for (const auto& link : linkPaths())
            {
                std::error_code ec;
                fs::create_symlink(script, link, ec);
                if (!ec) continue;

                if (layout_.linksBestEffort)
                {
                    LOG(WARNING) << "symlink " << link.string() << ": " << ec.message();
                    continue;
                }
                return fail(error, ErrorKind::Io, "symlink " + link.string() + ": " + ec.message());
            }
            return true;
        }

        //---Удаление: скрипт и ссылки, ошибки возвращаются как есть
        bool uninstall(Error* error) override
        {
            if (!removeFile(scriptPath(), error)) return false;

            for (const auto& link : linkPaths())
            {
                if (layout_.linksBestEffort)
                {
                    std::error_code ec;
                    fs::remove(link, ec);
                    if (ec) LOG(WARNING) << "remove " << link.string() << ": " << ec.message();
                    continue;
                }
                if (!removeFile(link, error)) return false;
            }
            return true;
        }

        bool start(Error* error) override
        {
            return control("start", error);
        }

        bool stop(Error* error) override
        {
            return control("stop", error);
        }

        Status status(Error* error) override
        {
            //---Нет скрипта - не установлена (а не ошибка запуска)
            if (!pathExists(scriptPath()))
            {
                fail(error, ErrorKind::NotInstalled, "");
                return Status::Unknown;
            }

            int exitCode = 0;
            std::string out;
            const bool ok = layout_.viaServiceTool
                ? runCommandWithOutput("service", { config().name, "status" }, exitCode, out, error)
                : runCommandWithOutput(scriptPath().string(), { "status" }, exitCode, out, error);
            if (!ok) return Status::Unknown;

            return parseScriptStatus(out, error);
        }

    private:
        const char* scriptOption() const
        {
            return layout_.viaServiceTool ? option::kSysvScript : option::kRCSScript;
        }

        fs::path scriptPath() const
        {
            return rooted(layout_.descriptorDir) / (layout_.prefix + config().name);
        }

        std::vector<fs::path> linkPaths() const
        {
            std::vector<fs::path> out;
            out.reserve(layout_.links.size());
            for (const auto& [dir, prefix] : layout_.links)
                out.push_back(rooted(dir) / (prefix + config().name));
            return out;
        }

        bool control(const char* verb, Error* error) const
        {
            if (layout_.viaServiceTool)
                return runCommand("service", { config().name, verb }, error);
            return runCommand(scriptPath().string(), { verb }, error);
        }

        ScriptLayout layout_;
    };

    std::unique_ptr<IServiceBackend> newInitScriptService(IProgram& program, const std::string& platform,
        const Config& config, ScriptLayout layout, Error* error, const fs::path& root)
    {
        if (config.option.getBool(option::kUserService, false))
        {
            fail(error, ErrorKind::UserServiceUnsupported, "user services are not supported on " + platform);
            return nullptr;
        }
        return std::make_unique<BackendLinuxInitScript>(program, platform, config, std::move(layout), root);
    }

} // namespace unisvc::backend

#endif // __linux__
