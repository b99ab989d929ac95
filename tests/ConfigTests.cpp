#include <gtest/gtest.h>

#include "uni_service/Config.hpp"
#include "uni_service/Errors.hpp"

using namespace unisvc;

TEST(KeyValue, MissingOptionsUseDefaults)
{
    KeyValue kv;
    EXPECT_FALSE(kv.has(option::kUserService));
    EXPECT_FALSE(kv.getBool(option::kUserService, false));
    EXPECT_EQ(kv.getInt(option::kLimitNOFILE, -1), -1);
    EXPECT_EQ(kv.getString(option::kLogDirectory, kDefaultLogDirectory), "/var/log");
    EXPECT_FALSE(kv.getFunc(option::kRunWait, nullptr));
}

TEST(KeyValue, TypedValues)
{
    KeyValue kv;
    kv.set(option::kUserService, true);
    kv.set(option::kLimitNOFILE, 4096);
    kv.set(option::kRestart, std::string("on-failure"));

    EXPECT_TRUE(kv.has(option::kUserService));
    EXPECT_TRUE(kv.getBool(option::kUserService, false));
    EXPECT_EQ(kv.getInt(option::kLimitNOFILE, -1), 4096);
    EXPECT_EQ(kv.getString(option::kRestart, "always"), "on-failure");
}

TEST(KeyValue, TypeMismatchFallsBackToDefault)
{
    KeyValue kv;
    kv.set(option::kLimitNOFILE, std::string("many"));
    kv.set(option::kUserService, 1);

    EXPECT_EQ(kv.getInt(option::kLimitNOFILE, 1024), 1024);
    EXPECT_FALSE(kv.getBool(option::kUserService, false));
}

TEST(KeyValue, StringLiteralIsStoredAsString)
{
    KeyValue kv;
    kv.set(option::kPIDFile, "/run/demo.pid");

    EXPECT_EQ(kv.getString(option::kPIDFile, ""), "/run/demo.pid");
    EXPECT_TRUE(kv.getBool(option::kPIDFile, true));
}

TEST(KeyValue, FunctionOption)
{
    int calls = 0;
    KeyValue kv;
    kv.set(option::kRunWait, KeyValue::Func([&calls] { calls++; }));

    auto f = kv.getFunc(option::kRunWait, nullptr);
    ASSERT_TRUE(f);
    f();
    EXPECT_EQ(calls, 1);
}

TEST(Config, ExecPathFallsBackToOwnBinary)
{
    Config c;
    EXPECT_FALSE(c.execPath().empty());

    c.executable = "/usr/local/bin/demo";
    EXPECT_EQ(c.execPath(), "/usr/local/bin/demo");
}

TEST(Errors, FailFillsErrorAndReturnsFalse)
{
    Error err;
    EXPECT_TRUE(err.ok());
    EXPECT_FALSE(fail(&err, ErrorKind::AlreadyInstalled, ""));
    EXPECT_TRUE(err.is(ErrorKind::AlreadyInstalled));
    EXPECT_EQ(err.message, toString(ErrorKind::AlreadyInstalled));

    EXPECT_FALSE(fail(&err, ErrorKind::Io, "disk full"));
    EXPECT_EQ(err.message, "disk full");

    EXPECT_FALSE(fail(nullptr, ErrorKind::Io, "ignored"));
}
