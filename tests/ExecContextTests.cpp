#include <gtest/gtest.h>

#include "TestUtils.hpp"
#include "uni_service/ExecContext.hpp"

using namespace unisvc;
using unisvc::test::TempDir;
using unisvc::test::writeFile;

namespace {

    constexpr pid_t kParent = 4242;

    ContextProbe probeIn(const TempDir& dir, pid_t parent)
    {
        ContextProbe probe;
        probe.cgroupFile = dir / "cgroup";
        probe.procRoot = dir / "proc";
        probe.parentPid = parent;
        return probe;
    }

    void writeStat(const TempDir& dir, pid_t pid, const std::string& comm)
    {
        writeFile(dir / "proc" / std::to_string(pid) / "stat", std::to_string(pid) + " (" + comm + ") S 1 1 1 0 -1");
    }

} // namespace

TEST(ContainerDetect, DockerOnFirstLine)
{
    TempDir dir;
    writeFile(dir / "cgroup", "12:cpuset:/docker/0123abcd\n11:memory:/\n");

    std::error_code ec;
    EXPECT_TRUE(isInContainer(dir / "cgroup", ec));
    EXPECT_FALSE(ec);
}

TEST(ContainerDetect, LxcWithinFirstFiveLines)
{
    TempDir dir;
    writeFile(dir / "cgroup", "5:a:/\n4:b:/\n3:c:/lxc/box\n2:d:/\n");

    std::error_code ec;
    EXPECT_TRUE(isInContainer(dir / "cgroup", ec));
}

TEST(ContainerDetect, MarkerPastFifthLineIsIgnored)
{
    TempDir dir;
    writeFile(dir / "cgroup", "1:a:/\n2:b:/\n3:c:/\n4:d:/\n5:e:/\n6:f:/\n7:g:/docker/x\n");

    std::error_code ec;
    EXPECT_FALSE(isInContainer(dir / "cgroup", ec));
    EXPECT_FALSE(ec);
}

TEST(ContainerDetect, MissingFileSetsError)
{
    TempDir dir;
    std::error_code ec;
    EXPECT_FALSE(isInContainer(dir / "absent", ec));
    EXPECT_TRUE(ec);
}

TEST(Interactive, ContainerIsAlwaysInteractive)
{
    TempDir dir;
    writeFile(dir / "cgroup", "1:name=systemd:/docker/abc\n");
    EXPECT_TRUE(isInteractive(probeIn(dir, 1)));
}

TEST(Interactive, InitParentIsNotInteractive)
{
    TempDir dir;
    writeFile(dir / "cgroup", "0::/init.scope\n");
    EXPECT_FALSE(isInteractive(probeIn(dir, 1)));
}

TEST(Interactive, UnreadableCgroupIsNotAContainer)
{
    TempDir dir;
    EXPECT_FALSE(isInteractive(probeIn(dir, 1)));
}

TEST(Interactive, SystemdParentIsNotInteractive)
{
    TempDir dir;
    writeFile(dir / "cgroup", "0::/user.slice\n");
    writeStat(dir, kParent, "systemd");
    EXPECT_FALSE(isInteractive(probeIn(dir, kParent)));
}

TEST(Interactive, ShellParentIsInteractive)
{
    TempDir dir;
    writeFile(dir / "cgroup", "0::/user.slice\n");
    writeStat(dir, kParent, "bash");
    EXPECT_TRUE(isInteractive(probeIn(dir, kParent)));
}

TEST(Interactive, UnknownParentIsInteractive)
{
    TempDir dir;
    writeFile(dir / "cgroup", "0::/user.slice\n");
    EXPECT_TRUE(isInteractive(probeIn(dir, kParent)));
}

TEST(StatName, TakesTextBetweenParentheses)
{
    std::string name;
    ASSERT_TRUE(parseStatBinaryName("1 (systemd) S 0 1 1", name));
    EXPECT_EQ(name, "systemd");

    ASSERT_TRUE(parseStatBinaryName("77 (my prog) R", name));
    EXPECT_EQ(name, "my prog");

    EXPECT_FALSE(parseStatBinaryName("77 no parens", name));
    EXPECT_FALSE(parseStatBinaryName("77 (unterminated", name));
}

TEST(StatName, ReadsOwnProcessEntry)
{
    std::string name;
    EXPECT_TRUE(binaryName(::getpid(), "/proc", name));
    EXPECT_FALSE(name.empty());
}
