#include <gtest/gtest.h>

#include "TestUtils.hpp"
#include "platform/linux/LinuxBackends.hpp"
#include "uni_service/Process.hpp"

using namespace unisvc;
using namespace unisvc::backend;
using unisvc::test::ScopedPath;
using unisvc::test::TempDir;
using unisvc::test::readFile;
using unisvc::test::writeScript;

namespace {

    class NoopProgram final : public IProgram {
    public:
        bool start(IServiceBackend&, Error*) override { return true; }
        bool stop(IServiceBackend&, Error*) override { return true; }
    };

    //---Временный корень + каталог с фальшивыми утилитами init-системы в PATH
    class NativeBackendTest : public ::testing::Test {
    protected:
        NativeBackendTest() : path_(tools_.path())
        {
            config_.name = "demo";
            config_.displayName = "Demo";
            config_.description = "Demo service";
            config_.executable = "/opt/demo app/bin/demo";
            config_.arguments = { "--price=$5", "two words", "it's" };
        }

        //---Утилита, которая записывает свои аргументы в calls.log
        void fakeTool(const std::string& name, const std::string& body = "exit 0\n")
        {
            writeScript(tools_ / name, "echo \"" + name + " $*\" >> \"" + callsLog().string() + "\"\n" + body);
        }

        fs::path callsLog() const { return tools_ / "calls.log"; }

        TempDir root_;
        TempDir tools_;
        ScopedPath path_;
        Config config_;
        NoopProgram program_;
    };

} // namespace

TEST_F(NativeBackendTest, SystemdInstallWritesUnitAndEnables)
{
    fs::create_directories(root_ / "etc/systemd/system");
    fakeTool("systemctl");
    config_.option.set(option::kLimitNOFILE, 4096);

    Error err;
    auto svc = newSystemdService(program_, "linux-systemd", config_, &err, root_.path());
    ASSERT_NE(svc, nullptr);
    ASSERT_TRUE(svc->install(&err)) << err.message;

    const std::string unit = readFile(root_ / "etc/systemd/system/demo.service");
    EXPECT_NE(unit.find("Description=Demo service\n"), std::string::npos) << unit;
    EXPECT_NE(unit.find("ExecStart=/opt/demo\\x20app/bin/demo \"--price=$$5\" \"two words\" \"it's\"\n"), std::string::npos) << unit;
    EXPECT_NE(unit.find("Restart=always\n"), std::string::npos) << unit;
    EXPECT_NE(unit.find("LimitNOFILE=4096\n"), std::string::npos) << unit;
    EXPECT_NE(unit.find("WantedBy=multi-user.target\n"), std::string::npos) << unit;
    EXPECT_EQ(unit.find("PIDFile="), std::string::npos) << unit;

    const auto perms = fs::status(root_ / "etc/systemd/system/demo.service").permissions();
    EXPECT_EQ(perms & fs::perms::all, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read | fs::perms::others_read);

    EXPECT_EQ(readFile(callsLog()), "systemctl enable demo.service\nsystemctl daemon-reload\n");
}

TEST_F(NativeBackendTest, SystemdInactiveUnknownUnitIsNotInstalled)
{
    //---Имя службы совпадает со словом из итоговой строки list-unit-files
    config_.name = "listed";
    fakeTool("systemctl",
        "case \"$1\" in\n"
        "    is-active) echo inactive; exit 3 ;;\n"
        "    list-unit-files) printf 'UNIT FILE STATE PRESET\\n\\n0 unit files listed.\\n'; exit 1 ;;\n"
        "esac\n");

    auto svc = newSystemdService(program_, "linux-systemd", config_, nullptr, root_.path());
    Error err;
    EXPECT_EQ(svc->status(&err), Status::Unknown);
    EXPECT_EQ(err.kind, ErrorKind::NotInstalled);
}

TEST_F(NativeBackendTest, SystemdInactiveListedUnitIsStopped)
{
    config_.name = "listed";
    fakeTool("systemctl",
        "case \"$1\" in\n"
        "    is-active) echo inactive; exit 3 ;;\n"
        "    list-unit-files) printf 'UNIT FILE STATE PRESET\\nlisted.service disabled enabled\\n\\n1 unit files listed.\\n' ;;\n"
        "esac\n");

    auto svc = newSystemdService(program_, "linux-systemd", config_, nullptr, root_.path());
    Error err;
    EXPECT_EQ(svc->status(&err), Status::Stopped) << err.message;
    EXPECT_TRUE(err.ok());
}

TEST_F(NativeBackendTest, UpstartInstallWritesJob)
{
    fs::create_directories(root_ / "etc/init");
    config_.option.set(option::kLogOutput, true);

    Error err;
    auto svc = newUpstartService(program_, "linux-upstart", config_, &err, root_.path());
    ASSERT_NE(svc, nullptr);
    ASSERT_TRUE(svc->install(&err)) << err.message;

    const std::string job = readFile(root_ / "etc/init/demo.conf");
    EXPECT_NE(job.find("description    \"Demo\"\n"), std::string::npos) << job;
    EXPECT_NE(job.find("    exec \"/opt/demo app/bin/demo\" \"--price=\\$5\" \"two words\" \"it's\""
        " >> \"$stdout_log\" 2>> \"$stderr_log\"\n"), std::string::npos) << job;
    EXPECT_NE(job.find("stdout_log=\"/var/log/demo.out\""), std::string::npos) << job;

    ASSERT_TRUE(svc->uninstall(&err)) << err.message;
    EXPECT_FALSE(fs::exists(root_ / "etc/init/demo.conf"));
}

TEST_F(NativeBackendTest, UpstartStatusFromInitctl)
{
    fakeTool("initctl", "echo 'demo start/running, process 812'\n");

    auto svc = newUpstartService(program_, "linux-upstart", config_, nullptr, root_.path());
    Error err;
    EXPECT_EQ(svc->status(&err), Status::Running) << err.message;
}

TEST_F(NativeBackendTest, OpenRCInstallRegistersScript)
{
    fs::create_directories(root_ / "etc/init.d");
    fakeTool("rc-update");

    Error err;
    auto svc = newOpenRCService(program_, "linux-openrc", config_, &err, root_.path());
    ASSERT_NE(svc, nullptr);
    ASSERT_TRUE(svc->install(&err)) << err.message;

    const fs::path script = root_ / "etc/init.d/demo";
    const std::string text = readFile(script);
    EXPECT_NE(text.find("command=\"/opt/demo app/bin/demo\"\n"), std::string::npos) << text;
    EXPECT_NE(text.find("command_args=\""), std::string::npos) << text;
    EXPECT_NE(fs::status(script).permissions() & fs::perms::owner_exec, fs::perms::none);
    EXPECT_EQ(readFile(callsLog()), "rc-update add demo\n");

    ASSERT_TRUE(svc->uninstall(&err)) << err.message;
    EXPECT_FALSE(fs::exists(script));
    EXPECT_EQ(readFile(callsLog()), "rc-update add demo\nrc-update delete demo\n");
}

//---openrc-run раскрывает command_args через eval: аргументы должны дойти без изменений
TEST_F(NativeBackendTest, OpenRCCommandArgsSurviveEval)
{
    fs::create_directories(root_ / "etc/init.d");
    fakeTool("rc-update");

    Error err;
    auto svc = newOpenRCService(program_, "linux-openrc", config_, &err, root_.path());
    ASSERT_TRUE(svc->install(&err)) << err.message;

    const fs::path driver = tools_ / "expand.sh";
    unisvc::test::writeFile(driver,
        ". \"" + (root_ / "etc/init.d/demo").string() + "\"\n"
        "eval \"set -- $command_args\"\n"
        "printf '[%s]\\n' \"$@\"\n");

    int exitCode = 0;
    std::string out;
    ASSERT_TRUE(runCommandWithOutput("/bin/sh", { driver.string() }, exitCode, out, &err)) << err.message;
    EXPECT_EQ(out, "[--price=$5]\n[two words]\n[it's]\n");
}

TEST_F(NativeBackendTest, OpenRCStatusFromExitCode)
{
    fakeTool("rc-service", "exit 3\n");

    auto svc = newOpenRCService(program_, "linux-openrc", config_, nullptr, root_.path());
    Error err;
    EXPECT_EQ(svc->status(&err), Status::Stopped) << err.message;
}

TEST_F(NativeBackendTest, UserServiceOnlyOnSystemd)
{
    config_.option.set(option::kUserService, true);

    Error err;
    EXPECT_EQ(newUpstartService(program_, "linux-upstart", config_, &err, root_.path()), nullptr);
    EXPECT_EQ(err.kind, ErrorKind::UserServiceUnsupported);

    Error rcErr;
    EXPECT_EQ(newOpenRCService(program_, "linux-openrc", config_, &rcErr, root_.path()), nullptr);
    EXPECT_EQ(rcErr.kind, ErrorKind::UserServiceUnsupported);

    Error sdErr;
    EXPECT_NE(newSystemdService(program_, "linux-systemd", config_, &sdErr, root_.path()), nullptr);
}
