// tests/test_cli.cpp
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>
#include <mutex>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "ctl/ipc.hpp"

using namespace std::chrono_literals;

namespace test_cli
{
std::mutex               g_mu;
std::vector<std::string> g_lines_seen;

static std::string on_line_cb(const std::string &line)
{
    std::lock_guard<std::mutex> lockguard(g_mu);
    g_lines_seen.push_back(line);
    if (line.rfind("SEND ", 0) == 0)
        return "OK AB";
    if (line == "STATUS")
        return "OK queued=0";
    if (line.rfind("SENDFILE ", 0) == 0)
        return "ERR cannot read";
    return "OK";
}

static std::string temp_path(const std::string &suffix)
{
    const char *tmp  = std::getenv("TMPDIR");
    std::string base = (tmp && *tmp) ? tmp : "/tmp";
    return base + "/parcel-link-cli-test-" + std::to_string(::getpid()) + suffix;
}

static int run_cli(const std::string &sock, const std::string &args)
{
    // ctest runs from the build directory; binaries live in ./bin
    std::string cmd = "./bin/parcelctl --sock " + sock + " " + args + " >/dev/null 2>&1";
    int         rc  = std::system(cmd.c_str());
    if (rc == -1)
        return -1;
    return WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
}
}  // namespace test_cli

TEST(CLI, TestCliFunctionality)
{
    test_cli::g_lines_seen.clear();
    const auto sock = test_cli::temp_path(".sock");
    const auto file = test_cli::temp_path(".txt");
    {
        std::ofstream(file) << "file body";
    }

    std::atomic<bool> server_done{false};
    std::thread       th([&] {
        (void)ipc::start_server(sock, test_cli::on_line_cb);
        server_done.store(true);
    });

    // Wait for server to bind the socket
    for (int i = 0; i < 100; ++i)
    {
        if (access(sock.c_str(), F_OK) == 0)
            break;
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_TRUE(access(sock.c_str(), F_OK) == 0) << "socket not created: " << sock;

    // Exercise CLI argument parsing + IPC
    EXPECT_EQ(test_cli::run_cli(sock, "send \"hello world!\""), 0);
    EXPECT_EQ(test_cli::run_cli(sock, "status"), 0);
    EXPECT_EQ(test_cli::run_cli(sock, "send-file " + file), 1);  // daemon answered ERR
    EXPECT_EQ(test_cli::run_cli(sock, "send"), 2);
    EXPECT_EQ(test_cli::run_cli(sock, "bogus"), 2);
    EXPECT_EQ(test_cli::run_cli(sock, "quit"), 0);

    th.join();
    ASSERT_TRUE(server_done.load());

    // Validate the lines the daemon saw
    {
        std::lock_guard<std::mutex> lockguard(test_cli::g_mu);
        ASSERT_EQ(test_cli::g_lines_seen.size(), 4u);
        EXPECT_EQ(test_cli::g_lines_seen[0], "SEND hello world!");
        EXPECT_EQ(test_cli::g_lines_seen[1], "STATUS");
        EXPECT_EQ(test_cli::g_lines_seen[2], "SENDFILE " + file);
        EXPECT_EQ(test_cli::g_lines_seen.back(), "QUIT");
    }

    // start_server should have cleaned up the socket file
    EXPECT_FALSE(access(sock.c_str(), F_OK) == 0);
    // daemon gone
    EXPECT_EQ(test_cli::run_cli(sock, "status"), 3);
    std::remove(file.c_str());
}
