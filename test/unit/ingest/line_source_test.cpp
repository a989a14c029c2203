#include <gtest/gtest.h>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <signal.h>
#include <sys/wait.h>

#include "logvec/ingest/line_source.h"

using namespace logvec::ingest;

namespace {

std::vector<std::string> ReadAll(LineSource& source) {
    std::vector<std::string> lines;
    while (auto line = source.read_line()) {
        lines.push_back(*line);
    }
    return lines;
}

} // namespace

TEST(SubprocessLineSourceTest, StreamsChildStdout) {
    SubprocessLineSource source({"printf", "alpha\\nbeta\\r\\ngamma"});
    ASSERT_TRUE(source.start().ok());
    EXPECT_GT(source.pid(), 0);

    auto lines = ReadAll(source);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "alpha");
    EXPECT_EQ(lines[1], "beta");
    EXPECT_EQ(lines[2], "gamma");

    source.stop();
    EXPECT_EQ(source.pid(), -1);
    int status = source.last_exit_status();
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST(SubprocessLineSourceTest, MissingCommandExitsWith127) {
    SubprocessLineSource source({"/nonexistent/logvec-test-binary"});
    ASSERT_TRUE(source.start().ok());
    EXPECT_TRUE(ReadAll(source).empty());
    source.stop();
    int status = source.last_exit_status();
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 127);
}

TEST(SubprocessLineSourceTest, EmptyCommandIsRejected) {
    SubprocessLineSource source(std::vector<std::string>{});
    EXPECT_FALSE(source.start().ok());
}

TEST(SubprocessLineSourceTest, StopTerminatesAndReapsBlockedChild) {
    SubprocessLineSource source({"sleep", "100"}, std::chrono::milliseconds(2000));
    ASSERT_TRUE(source.start().ok());
    pid_t child = source.pid();
    ASSERT_GT(child, 0);

    std::thread reader([&source] { EXPECT_FALSE(source.read_line().has_value()); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto start = std::chrono::steady_clock::now();
    source.stop();
    reader.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));

    int status = source.last_exit_status();
    ASSERT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGTERM);
    // Already reaped: the pid is no longer our child.
    EXPECT_EQ(waitpid(child, nullptr, WNOHANG), -1);
}

TEST(SubprocessLineSourceTest, EscalatesToSigkill) {
    SubprocessLineSource source({"sh", "-c", "trap '' TERM; exec sleep 100"}, std::chrono::milliseconds(200));
    ASSERT_TRUE(source.start().ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    source.stop();

    int status = source.last_exit_status();
    ASSERT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGKILL);
}

TEST(SubprocessLineSourceTest, RestartAfterExit) {
    SubprocessLineSource source({"echo", "hello"});
    EXPECT_TRUE(source.restartable());
    for (int round = 0; round < 2; round++) {
        ASSERT_TRUE(source.start().ok());
        auto lines = ReadAll(source);
        ASSERT_EQ(lines.size(), 1u);
        EXPECT_EQ(lines[0], "hello");
        source.stop();
    }
}

TEST(StreamLineSourceTest, ReadsStream) {
    std::istringstream in("first\nsecond\r\n\nlast");
    StreamLineSource source(in);
    ASSERT_TRUE(source.start().ok());
    EXPECT_FALSE(source.restartable());

    auto lines = ReadAll(source);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[1], "second");
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(lines[3], "last");
}

TEST(StreamLineSourceTest, StopEndsReading) {
    std::istringstream in("a\nb\n");
    StreamLineSource source(in);
    ASSERT_TRUE(source.start().ok());
    source.stop();
    EXPECT_FALSE(source.read_line().has_value());
}

TEST(StreamLineSourceTest, ReadsFile) {
    std::string path = ::testing::TempDir() + "logvec_line_source_test.log";
    {
        std::ofstream out(path);
        out << "Nov 04 23:58:33 host a: one\nNov 04 23:58:34 host a: two\n";
    }
    auto source = CreateLineSource({"journalctl"}, path, std::chrono::milliseconds(100));
    ASSERT_TRUE(source->start().ok());
    EXPECT_EQ(ReadAll(*source).size(), 2u);
    std::remove(path.c_str());
}

TEST(StreamLineSourceTest, MissingFileFailsToStart) {
    StreamLineSource source(std::string("/nonexistent/logvec/replay.log"));
    auto result = source.start();
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code(), logvec::core::Error::Code::INVALID_ARGUMENT);
}

TEST(LineSourceFactoryTest, CommandWhenNoReplayFile) {
    auto source = CreateLineSource({"journalctl", "-f"}, "", std::chrono::milliseconds(100));
    EXPECT_TRUE(source->restartable());
    EXPECT_EQ(source->describe(), "subprocess 'journalctl -f'");
}
