#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ctl/ipc.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

static bool is_valid_mac(const std::string &mac)
{
    if (mac.size() != 17)
        return false;
    for (size_t i = 0; i < mac.size(); ++i)
    {
        if ((i % 3) == 2)
        {
            if (mac[i] != ':')
                return false;
        }
        else
        {
            unsigned char c = static_cast<unsigned char>(mac[i]);
            if (!std::isxdigit(c))
                return false;
        }
    }
    return true;
}

static std::string to_upper_mac(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

static bool is_integer(const std::string &s)
{
    if (s.empty())
        return false;
    size_t i = (s[0] == '-') ? 1 : 0;
    if (i == s.size())
        return false;
    for (; i < s.size(); ++i)
    {
        if (!std::isdigit(static_cast<unsigned char>(s[i])))
            return false;
    }
    return true;
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  liftrrctl [--sock <path>] <command> [args]\n"
                         "\n"
                         "Service:\n"
                         "  up | down | status | quit\n"
                         "Discovery:\n"
                         "  scan | stop | devices\n"
                         "Connection:\n"
                         "  connect AA:BB:CC:DD:EE:FF\n"
                         "  disconnect\n"
                         "Device commands:\n"
                         "  ping | caps\n"
                         "  time-sync [epoch_ms]\n"
                         "  mode <mode>\n"
                         "  session-start <lift> [epoch_ms]\n"
                         "  session-end\n"
                         "  sessions-list [cursor [limit]]\n"
                         "  sessions-clear\n"
                         "  session-stream <session_id>\n");
}

static int send_one_line(const std::string &sock, const std::string &line)
{
    if (line.empty() || line.find('\n') != std::string::npos)
    {
        print_usage();
        if (line.empty())
            std::fprintf(stderr, "error: empty command line to daemon\n");
        else
            std::fprintf(stderr, "error: command line must not contain newline characters\n");

        return exitc::bad_args;
    }
    std::string reply;
    if (!ipc::request(sock, line, reply))
    {
        std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
        return exitc::no_server;
    }
    if (!reply.empty())
        std::fputs(reply.c_str(), stdout);
    // daemon replies to a failed request with "error: ..."
    if (reply.rfind("error:", 0) == 0)
        return exitc::failed;
    return exitc::ok;
}

static std::string join(const std::vector<std::string> &v, size_t from)
{
    std::string out;
    for (size_t i = from; i < v.size(); ++i)
    {
        if (!out.empty())
            out.push_back(' ');
        out += v[i];
    }
    return out;
}

static int run_cmd(const std::string                             &cmd,
                   const std::vector<std::string>                &args,
                   const std::function<int(const std::string &)> &send_line)
{
    // device command with a fixed argument count range, numeric positions checked
    auto device_cmd = [&](const char *wire, size_t min_args, size_t max_args,
                          std::vector<size_t> numeric) -> int {
        const size_t n = args.size() - 1;
        if (n < min_args || n > max_args)
        {
            print_usage();
            return exitc::bad_args;
        }
        for (size_t pos : numeric)
        {
            if (pos < args.size() && !is_integer(args[pos]))
            {
                std::fprintf(stderr, "error: expected a number, got '%s'\n", args[pos].c_str());
                return exitc::bad_args;
            }
        }
        std::string line = std::string("CMD ") + wire;
        if (n > 0)
            line += " " + join(args, 1);
        return send_line(line);
    };

    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"up", [&]() -> int { return send_line("UP"); }},
        {"down", [&]() -> int { return send_line("DOWN"); }},
        {"status", [&]() -> int { return send_line("STATUS"); }},
        {"scan", [&]() -> int { return send_line("SCAN"); }},
        {"stop", [&]() -> int { return send_line("STOP"); }},
        {"devices", [&]() -> int { return send_line("DEVICES"); }},
        {"connect",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             std::string mac = to_upper_mac(args[1]);
             if (!is_valid_mac(mac))
             {
                 std::fprintf(stderr, "error: invalid MAC address: %s\n", args[1].c_str());
                 return exitc::bad_args;
             }
             return send_line("CONNECT " + mac);
         }},
        {"disconnect", [&]() -> int { return send_line("DISCONNECT"); }},
        {"ping", [&]() -> int { return device_cmd("ping", 0, 0, {}); }},
        {"caps", [&]() -> int { return device_cmd("capabilities.get", 0, 0, {}); }},
        {"time-sync", [&]() -> int { return device_cmd("time.sync", 0, 1, {1}); }},
        {"mode", [&]() -> int { return device_cmd("mode.set", 1, 1, {}); }},
        {"session-start", [&]() -> int { return device_cmd("session.start", 1, 2, {2}); }},
        {"session-end", [&]() -> int { return device_cmd("session.end", 0, 0, {}); }},
        {"sessions-list", [&]() -> int { return device_cmd("sessions.list", 0, 2, {1, 2}); }},
        {"sessions-clear", [&]() -> int { return device_cmd("sessions.clear", 0, 0, {}); }},
        {"session-stream", [&]() -> int { return device_cmd("session.stream", 1, 1, {}); }},
        {"quit", [&]() -> int { return send_line("QUIT"); }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }
    if (const char *lv = std::getenv("LIFTRR_LOG_LEVEL"))
        liftrr::set_log_level_by_name(lv);
    else
        liftrr::set_log_level(liftrr::Level::Warning);

    // LIFTRR_CTL_SOCK is honoured by ctl_sock_path(); --sock overrides both
    std::string sock;

    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--sock" && i + 1 < argc)
        {
            sock = ipc::expand_user(argv[++i]);
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }
    if (sock.empty())
        sock = ipc::expand_user(constants::ctl_sock_path());

    const std::string &cmd = args[0];
    auto sender = [&](const std::string &line) -> int { return send_one_line(sock, line); };

    int rc = run_cmd(cmd, args, sender);
    return rc;
}
