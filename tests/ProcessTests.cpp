#include <gtest/gtest.h>

#include <cerrno>
#include <csignal>

#include "TestUtils.hpp"
#include "uni_service/Paths.hpp"
#include "uni_service/Process.hpp"

using namespace unisvc;
using unisvc::test::ScopedPath;
using unisvc::test::TempDir;

namespace {

    //---Фальшивый launchctl: пишет в stderr и завершается с кодом 0
    void fakeLaunchctl(const TempDir& dir, const std::string& stderrText)
    {
        unisvc::test::writeScript(dir / "launchctl", "printf '" + stderrText + "' 1>&2\nexit 0\n");
    }

} // namespace

TEST(Process, CapturesOutputAndExitCode)
{
    process::RunOptions opt;
    opt.captureStdout = true;

    process::RunResult rr;
    ASSERT_TRUE(process::run("/bin/sh", { "-c", "echo out; echo err 1>&2; exit 3" }, rr, opt));
    EXPECT_TRUE(rr.started);
    EXPECT_FALSE(rr.signaled);
    EXPECT_EQ(rr.exitCode, 3);
    EXPECT_EQ(rr.out, "out\n");
    EXPECT_EQ(rr.err, "err\n");
}

TEST(Process, StdoutIsDiscardedUnlessCaptured)
{
    process::RunResult rr;
    ASSERT_TRUE(process::run("/bin/sh", { "-c", "echo out" }, rr));
    EXPECT_EQ(rr.exitCode, 0);
    EXPECT_TRUE(rr.out.empty());
}

TEST(Process, MissingBinaryIsAStartFailure)
{
    process::RunResult rr;
    EXPECT_FALSE(process::run("/nonexistent/uni-service-no-such-binary", {}, rr));
    EXPECT_FALSE(rr.started);
    EXPECT_EQ(rr.sysError, (std::uint32_t)ENOENT);
}

TEST(Process, SignalTerminationIsReported)
{
    process::RunResult rr;
    ASSERT_TRUE(process::run("/bin/sh", { "-c", "kill -TERM $$" }, rr));
    EXPECT_TRUE(rr.started);
    EXPECT_TRUE(rr.signaled);
    EXPECT_EQ(rr.termSignal, SIGTERM);
    EXPECT_EQ(rr.exitCode, 128 + SIGTERM);
}

TEST(Process, RunsInWorkingDirectory)
{
    TempDir dir;
    process::RunOptions opt;
    opt.captureStdout = true;
    opt.workingDir = dir.path();

    process::RunResult rr;
    ASSERT_TRUE(process::run("/bin/sh", { "-c", "pwd -P" }, rr, opt));
    EXPECT_EQ(rr.out, fs::canonical(dir.path()).string() + "\n");
}

TEST(RunCommand, NonZeroExitIsCommandErrorWithArguments)
{
    Error err;
    EXPECT_FALSE(runCommand("/bin/sh", { "-c", "exit 4" }, &err));
    EXPECT_EQ(err.kind, ErrorKind::Command);
    EXPECT_NE(err.message.find("/bin/sh -c exit 4"), std::string::npos) << err.message;
    EXPECT_NE(err.message.find("exit status 4"), std::string::npos) << err.message;
}

TEST(RunCommand, StartFailureKeepsZeroExitCode)
{
    int exitCode = -1;
    std::string out;
    Error err;
    EXPECT_FALSE(runCommandWithOutput("uni-service-no-such-tool", {}, exitCode, out, &err));
    EXPECT_EQ(exitCode, 0);
    EXPECT_EQ(err.kind, ErrorKind::Command);
}

TEST(RunCommand, WithOutputReturnsStdout)
{
    int exitCode = -1;
    std::string out;
    Error err;
    ASSERT_TRUE(runCommandWithOutput("/bin/sh", { "-c", "echo Running" }, exitCode, out, &err));
    EXPECT_EQ(exitCode, 0);
    EXPECT_EQ(out, "Running\n");
}

TEST(RunCommand, OutputIsKeptOnNonZeroExit)
{
    int exitCode = 0;
    std::string out;
    Error err;
    EXPECT_FALSE(runCommandWithOutput("/bin/sh", { "-c", "echo inactive; exit 3" }, exitCode, out, &err));
    EXPECT_EQ(exitCode, 3);
    EXPECT_EQ(out, "inactive\n");
}

TEST(RunCommand, LaunchctlZeroExitWithStderrFails)
{
    TempDir dir;
    fakeLaunchctl(dir, "Could not find service\\n");
    ScopedPath path(dir.path());

    Error err;
    EXPECT_FALSE(runCommand("launchctl", { "load", "x.plist" }, &err));
    EXPECT_EQ(err.kind, ErrorKind::Command);
    EXPECT_NE(err.message.find("Could not find service"), std::string::npos);
}

TEST(RunCommand, LaunchctlInProgressMessageIsBenign)
{
    TempDir dir;
    fakeLaunchctl(dir, "Operation now in progress\\n");
    ScopedPath path(dir.path());

    Error err;
    EXPECT_TRUE(runCommand("launchctl", { "load", "x.plist" }, &err)) << err.message;
}

TEST(RunCommand, OtherToolsIgnoreStderrOnSuccess)
{
    Error err;
    EXPECT_TRUE(runCommand("/bin/sh", { "-c", "echo noise 1>&2" }, &err)) << err.message;
}

TEST(LookPath, FindsExecutablesOnPath)
{
    TempDir dir;
    const auto tool = dir / "uni-service-fake-tool";
    unisvc::test::writeFile(tool, "#!/bin/sh\n");
    unisvc::test::makeExecutable(tool);

    ScopedPath path(dir.path());
    EXPECT_EQ(lookPath("uni-service-fake-tool"), tool);
    EXPECT_TRUE(lookPath("uni-service-missing-tool").empty());
}
