#include "../../src/internal/subprocess/process.hpp"
#include "../../src/internal/supervisor.hpp"
#include "../test_utils.hpp"

#include <acpbridge/errors.hpp>
#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>

using namespace acpbridge::subprocess;
using acpbridge::TerminationOutcome;
using acpbridge::internal::ProcessSupervisor;
using acpbridge::test::wait_until;

// Test basic process spawn
TEST(ProcessTest, SpawnEcho)
{
    Process proc;
    proc.spawn("/bin/echo", {"Hello"});

    EXPECT_TRUE(proc.is_running() || proc.try_wait().has_value());
    int exit_code = proc.wait();
    EXPECT_EQ(exit_code, 0);
}

// Test stdin write
TEST(ProcessTest, WriteStdin)
{
    Process proc;
    proc.spawn("/bin/cat", {});

    proc.stdin_pipe().write("Hello\n");
    proc.stdin_pipe().close(); // EOF

    std::string output = proc.stdout_pipe().read_line();
    EXPECT_EQ(output, "Hello\n");

    proc.wait();
}

TEST(ProcessTest, MissingExecutableThrowsSpawnError)
{
    Process proc;
    EXPECT_THROW(proc.spawn("/nonexistent/acp-agent-binary", {}), acpbridge::ProcessSpawnError);
}

TEST(ProcessTest, ExitCodeIsReported)
{
    Process proc;
    proc.spawn("/bin/sh", {"-c", "exit 3"});
    EXPECT_EQ(proc.wait(), 3);
    EXPECT_EQ(proc.exit_code(), 3);
}

TEST(ProcessTest, SignalledExitCode)
{
    Process proc;
    proc.spawn("/bin/sleep", {"10"});
    EXPECT_TRUE(proc.is_running());

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    proc.terminate();

    EXPECT_EQ(proc.wait(), 128 + 15);
}

TEST(ProcessTest, WaitForTimesOut)
{
    Process proc;
    proc.spawn("/bin/sleep", {"10"});

    EXPECT_FALSE(proc.wait_for(std::chrono::milliseconds(50)).has_value());
    proc.kill();
    EXPECT_TRUE(proc.wait_for(std::chrono::milliseconds(2000)).has_value());
}

// Test find_executable
TEST(ProcessTest, FindExecutable)
{
    auto sh = find_executable("sh");
    EXPECT_TRUE(sh.has_value());

    auto nonexistent = find_executable("this_should_not_exist_12345");
    EXPECT_FALSE(nonexistent.has_value());
}

// Test working directory
TEST(ProcessTest, WorkingDirectory)
{
    Process proc;
    ProcessOptions opts;
    opts.working_directory = "/";
    proc.spawn("/bin/pwd", {}, opts);

    std::string output = proc.stdout_pipe().read_line();
    EXPECT_EQ(output, "/\n");

    proc.wait();
}

// Test environment variables
TEST(ProcessTest, Environment)
{
    Process proc;
    ProcessOptions opts;
    opts.environment["TEST_VAR"] = "test_value";
    proc.spawn("/bin/sh", {"-c", "echo $TEST_VAR"}, opts);

    std::string output = proc.stdout_pipe().read_line();
    EXPECT_NE(output.find("test_value"), std::string::npos);

    proc.wait();
}

// Test reading multiple lines
TEST(ProcessTest, ReadMultipleLines)
{
    Process proc;
    proc.spawn("/bin/sh", {"-c", "echo Line1; echo Line2"});

    std::string line1 = proc.stdout_pipe().read_line();
    std::string line2 = proc.stdout_pipe().read_line();

    EXPECT_NE(line1.find("Line1"), std::string::npos);
    EXPECT_NE(line2.find("Line2"), std::string::npos);

    proc.wait();
}

// ============================================================================
// ProcessSupervisor
// ============================================================================

TEST(SupervisorTest, ReportsUnexpectedExit)
{
    std::atomic<int> exit_code{-100};
    ProcessSupervisor supervisor("test");

    supervisor.start("/bin/sh", {"-c", "exit 7"}, {}, nullptr,
                     [&](int code) { exit_code = code; });

    ASSERT_TRUE(wait_until([&] { return exit_code != -100; }));
    EXPECT_EQ(exit_code.load(), 7);
    EXPECT_FALSE(supervisor.is_running());
}

TEST(SupervisorTest, ForwardsStderr)
{
    std::mutex mutex;
    std::string captured;
    ProcessSupervisor supervisor("test");

    supervisor.start("/bin/sh", {"-c", "echo oops >&2; sleep 5"}, {},
                     [&](const std::string& text)
                     {
                         std::lock_guard<std::mutex> lock(mutex);
                         captured += text;
                     },
                     nullptr);

    ASSERT_TRUE(wait_until(
        [&]
        {
            std::lock_guard<std::mutex> lock(mutex);
            return captured.find("oops") != std::string::npos;
        }));
    supervisor.terminate_gracefully(std::chrono::milliseconds(1000));
}

TEST(SupervisorTest, GracefulTerminationUsesSigterm)
{
    std::atomic<bool> exit_reported{false};
    ProcessSupervisor supervisor("test");
    supervisor.start("/bin/sleep", {"10"}, {}, nullptr, [&](int) { exit_reported = true; });
    ASSERT_TRUE(supervisor.is_running());
    EXPECT_GT(supervisor.pid(), 0);

    EXPECT_EQ(supervisor.terminate_gracefully(std::chrono::milliseconds(2000)),
              TerminationOutcome::Exit);
    EXPECT_FALSE(supervisor.is_running());
    // Requested terminations are not reported as unexpected exits
    EXPECT_FALSE(exit_reported.load());

    EXPECT_EQ(supervisor.terminate_gracefully(std::chrono::milliseconds(100)),
              TerminationOutcome::AlreadyExited);
}

TEST(SupervisorTest, EscalatesToSigkill)
{
    ProcessSupervisor supervisor("test");
    supervisor.start("/bin/sh", {"-c", "trap '' TERM; while true; do sleep 0.1; done"}, {}, nullptr,
                     nullptr);
    // Give the shell time to install the trap
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(supervisor.terminate_gracefully(std::chrono::milliseconds(300)),
              TerminationOutcome::SigKill);
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(250));
    EXPECT_FALSE(supervisor.is_running());
}

TEST(SupervisorTest, WriteAfterExitThrows)
{
    std::atomic<bool> exited{false};
    ProcessSupervisor supervisor("test");
    supervisor.start("/bin/true", {}, {}, nullptr, [&](int) { exited = true; });

    ASSERT_TRUE(wait_until([&] { return exited.load(); }));
    EXPECT_THROW(supervisor.write("data\n"), acpbridge::ConnectionClosedError);
}
