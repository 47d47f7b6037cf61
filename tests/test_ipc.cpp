#include <chrono>
#include <cstdlib>
#include <gtest/gtest.h>
#include <mutex>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include "ctl/ipc.hpp"

using namespace std::chrono_literals;

namespace
{
std::string temp_sock(const char *tag)
{
    return std::string("/tmp/liftrr-ipc-ut-") + tag + "-" + std::to_string(getpid()) + ".sock";
}

bool wait_for_socket(const std::string &sock)
{
    for (int i = 0; i < 100; ++i)
    {
        if (access(sock.c_str(), F_OK) == 0)
            return true;
        std::this_thread::sleep_for(10ms);
    }
    return false;
}
}  // namespace

TEST(IPC, TestExpandUser)
{
    const char *path      = std::getenv("HOME");
    const char *test_home = "/tmp/ut-home";
    setenv("HOME", test_home, 1);

    EXPECT_EQ(ipc::expand_user("~"), test_home);
    EXPECT_EQ(ipc::expand_user("~/x/y"), std::string(test_home) + "/x/y");
    EXPECT_EQ(ipc::expand_user("/abs/path"), "/abs/path");
    EXPECT_EQ(ipc::expand_user("relative/~/path"), "relative/~/path");

    if (path)
        setenv("HOME", path, 1);
}

TEST(IPC, TestExpandUserNoHomeEnv)
{
    const char *path = std::getenv("HOME");
    unsetenv("HOME");
    EXPECT_EQ(ipc::expand_user("~"), "~");
    EXPECT_EQ(ipc::expand_user("~/x"), "~/x");
    if (path)
        setenv("HOME", path, 1);
}

TEST(IPC, TestStartServerAndSendLine)
{
    const std::string sock = temp_sock("quit");

    // run server (blocks until QUIT)
    std::thread th([&] { ipc::start_server(sock, nullptr); });
    ASSERT_TRUE(wait_for_socket(sock));
    ASSERT_TRUE(ipc::send_line(sock, "QUIT"));
    th.join();
    // server should unlink the socket
    EXPECT_FALSE(access(sock.c_str(), F_OK) == 0);
}

TEST(IPC, RequestGetsHandlerReply)
{
    const std::string        sock = temp_sock("reply");
    std::mutex               mu;
    std::vector<std::string> seen;

    ipc::LineHandler handler = [&](const std::string &line) -> std::string {
        std::lock_guard<std::mutex> lk(mu);
        seen.push_back(line);
        if (line == "STATUS")
            return "service=running\n";
        return "";
    };
    std::thread th([&] { ipc::start_server(sock, handler); });
    ASSERT_TRUE(wait_for_socket(sock));

    std::string reply;
    ASSERT_TRUE(ipc::request(sock, "STATUS", reply));
    EXPECT_EQ(reply, "service=running\n");

    // a line without a reply still completes, with an empty answer
    ASSERT_TRUE(ipc::request(sock, "SCAN\r", reply));
    EXPECT_TRUE(reply.empty());

    ASSERT_TRUE(ipc::send_line(sock, "QUIT"));
    th.join();

    std::lock_guard<std::mutex> lk(mu);
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], "STATUS");
    EXPECT_EQ(seen[1], "SCAN");  // trailing '\r' trimmed
    EXPECT_EQ(seen[2], "QUIT");
}

TEST(IPC, NoServerMeansFailure)
{
    std::string reply;
    EXPECT_FALSE(ipc::request(temp_sock("none"), "STATUS", reply));
    EXPECT_FALSE(ipc::send_line(temp_sock("none"), "STATUS"));
    EXPECT_FALSE(ipc::send_line(temp_sock("none"), ""));
}
