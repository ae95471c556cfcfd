#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include <fcntl.h>
#include <unistd.h>

#include "include/command_runner.hpp"
#include "include/file_descriptor.hpp"
#include "include/interrupts.hpp"
#include "include/shell_pipe.hpp"

using namespace vantage::os;
using namespace std::chrono_literals;

TEST(CommandRunnerTest, CapturesOutputAndExitCode) {
    ShellCommandRunner runner;
    auto result = runner.run({"/bin/sh", "-c", "echo hello; echo oops 1>&2; exit 3"}, 5s);
    ASSERT_TRUE(result) << result.error();
    EXPECT_EQ(result->exit_code, 3);
    EXPECT_FALSE(result->timed_out);
    EXPECT_FALSE(result->ok());
    EXPECT_NE(result->output.find("hello"), std::string::npos);
    EXPECT_NE(result->output.find("oops"), std::string::npos);
}

TEST(CommandRunnerTest, SuccessIsOk) {
    ShellCommandRunner runner;
    auto result = runner.run({"/bin/sh", "-c", "exit 0"}, 5s);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->ok());
}

TEST(CommandRunnerTest, KillsCommandOnTimeout) {
    ShellCommandRunner runner;
    auto start = std::chrono::steady_clock::now();
    auto result = runner.run({"/bin/sh", "-c", "sleep 10"}, 200ms);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->timed_out);
    EXPECT_FALSE(result->ok());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(CommandRunnerTest, EmptyCommandIsAnError) {
    ShellCommandRunner runner;
    EXPECT_FALSE(runner.run({}, 1s));
}

TEST(CommandRunnerTest, FindsProgramsOnPath) {
    ShellCommandRunner runner;
    EXPECT_TRUE(runner.has_program("sh"));
    EXPECT_TRUE(runner.has_program("/bin/sh"));
    EXPECT_FALSE(runner.has_program("definitely-not-a-real-program-name"));
}

TEST(CommandRunnerTest, JoinQuotesArgumentsWithSpaces) {
    EXPECT_EQ(join_command({"nmcli", "connection", "up", "Home WiFi"}), "nmcli connection up \"Home WiFi\"");
}

TEST(ShellPipeTest, WaitReportsSignalExit) {
    ShellPipe pipe({"/bin/sh", "-c", "kill -TERM $$"});
    (void)pipe.read_all(5s);
    EXPECT_EQ(pipe.wait(), 128 + 15);
}

TEST(ShellPipeTest, InterruptFlagKillsChild) {
    g_interrupted = true;
    ShellPipe pipe({"/bin/sh", "-c", "sleep 5"});
    auto started = std::chrono::steady_clock::now();
    (void)pipe.read_all(5s);
    reset_interrupted();

    EXPECT_TRUE(pipe.timed_out());
    EXPECT_FALSE(g_interrupted.load());
    EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
    EXPECT_EQ(pipe.wait(), 128 + SIGTERM);
}

TEST(FileDescriptorTest, PipeEndsAreCloseOnExec) {
    Pipe pipe = make_pipe();
    ASSERT_TRUE(pipe.read_end);
    ASSERT_TRUE(pipe.write_end);
    EXPECT_NE(::fcntl(pipe.read_end.get(), F_GETFD) & FD_CLOEXEC, 0);
    EXPECT_NE(::fcntl(pipe.write_end.get(), F_GETFD) & FD_CLOEXEC, 0);

    ASSERT_EQ(::write(pipe.write_end.get(), "ok", 2), 2);
    pipe.write_end.reset();
    char buf[4] = {};
    EXPECT_EQ(::read(pipe.read_end.get(), buf, sizeof(buf)), 2);
    EXPECT_EQ(::read(pipe.read_end.get(), buf, sizeof(buf)), 0);
}

TEST(ShellPipeTest, ChildDoesNotInheritUnrelatedPipes) {
    Pipe held = make_pipe();
    const auto fd = std::to_string(held.read_end.get());

    ShellCommandRunner runner;
    auto result = runner.run({"/bin/sh", "-c", "test -e /proc/$$/fd/" + fd}, 5s);
    ASSERT_TRUE(result) << result.error();
    EXPECT_EQ(result->exit_code, 1);
}
