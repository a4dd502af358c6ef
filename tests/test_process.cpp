#include <gtest/gtest.h>
#include <pipeline/executor.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <chrono>
#include <thread>
#include <csignal>
#include <unistd.h>

namespace fs = std::filesystem;

#ifndef _WIN32

class ProcessTest : public ::testing::Test {
protected:
    fs::path test_dir;
    ProcessExecutor executor;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "cppforge_process_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    Invocation shell(const std::string& script) {
        Invocation inv;
        inv.program = "/bin/sh";
        inv.args = {"-c", script};
        inv.environment = platform::environment_variables();
        return inv;
    }

    std::string read_file(const fs::path& p) {
        std::ifstream in(p);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(ProcessTest, ZeroExit) {
    auto r = executor.run(shell("exit 0"));
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value, 0);
}

TEST_F(ProcessTest, NonZeroExitIsNotAnError) {
    auto r = executor.run(shell("exit 3"));
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value, 3);
}

TEST_F(ProcessTest, SignalDeathMapsTo128PlusSignal) {
    auto r = executor.run(shell("kill -TERM $$"));
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value, 128 + 15);
}

TEST_F(ProcessTest, MissingProgramIsLaunchFailure) {
    Invocation inv;
    inv.program = "cppforge-no-such-program-xyz";
    inv.environment = platform::environment_variables();

    auto r = executor.run(inv);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::LaunchFailure);
    EXPECT_NE(r.error.message.find("cppforge-no-such-program-xyz"), std::string::npos);
}

TEST_F(ProcessTest, BadWorkingDirectoryIsLaunchFailure) {
    Invocation inv = shell("exit 0");
    inv.working_dir = (test_dir / "missing").string();

    auto r = executor.run(inv);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::LaunchFailure);
}

TEST_F(ProcessTest, WorkingDirectoryAndArguments) {
    Invocation inv = shell("pwd > out.txt; printf '%s|' \"$@\" >> out.txt");
    inv.args.push_back("sh");          // $0
    inv.args.push_back("one");
    inv.args.push_back("two words");
    inv.working_dir = test_dir.string();

    auto r = executor.run(inv);
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value, 0);

    std::string out = read_file(test_dir / "out.txt");
    EXPECT_NE(out.find(fs::canonical(test_dir).string()), std::string::npos);
    EXPECT_NE(out.find("one|two words|"), std::string::npos);
}

TEST_F(ProcessTest, EnvironmentIsExactlyTheGivenMap) {
    Invocation inv;
    inv.program = "/bin/sh";
    inv.args = {"-c", "printf '%s/%s' \"$CPPFORGE_TEST_VAR\" \"${CPPFORGE_ABSENT-unset}\" > env.txt"};
    inv.working_dir = test_dir.string();
    inv.environment = {{"CPPFORGE_TEST_VAR", "hello"}, {"PATH", "/usr/bin:/bin"}};

    auto r = executor.run(inv);
    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(read_file(test_dir / "env.txt"), "hello/unset");
}

TEST_F(ProcessTest, InterruptIsForwardedToTheChild) {
    struct sigaction before;
    sigaction(SIGINT, nullptr, &before);

    // Interrupt ourselves once the child is running; the executor must pass
    // it on instead of dying from it.
    std::thread interrupter([] {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        kill(getpid(), SIGINT);
    });

    auto started = std::chrono::steady_clock::now();
    auto r = executor.run(shell("exec sleep 5"));
    auto elapsed = std::chrono::steady_clock::now() - started;
    interrupter.join();

    ASSERT_TRUE(r.is_ok()) << r.error.describe();
    EXPECT_EQ(r.value, 128 + SIGINT);
    EXPECT_LT(elapsed, std::chrono::seconds(4));

    struct sigaction after;
    sigaction(SIGINT, nullptr, &after);
    EXPECT_EQ(after.sa_handler, before.sa_handler);
}

TEST(Platform, EnvironmentSnapshotSeesSetVariables) {
    setenv("CPPFORGE_SNAPSHOT_VAR", "42", 1);
    auto env = platform::environment_variables();
    ASSERT_EQ(env.count("CPPFORGE_SNAPSHOT_VAR"), 1u);
    EXPECT_EQ(env.at("CPPFORGE_SNAPSHOT_VAR"), "42");
    unsetenv("CPPFORGE_SNAPSHOT_VAR");
}

TEST(Platform, HostDescription) {
    EXPECT_FALSE(platform::host_system_name().empty());
    EXPECT_EQ(platform::path_list_separator(), ":");
}

#endif
