#include <cerrno>
#include <cstdlib>

#include "proto/command.hpp"
#include "util/log.hpp"

namespace proto
{

using nlohmann::json;

Command Command::ping()
{
    return Command{"ping", json::object()};
}

Command Command::capabilities_get()
{
    return Command{"capabilities.get", json::object()};
}

Command Command::time_sync(std::int64_t phone_epoch_ms)
{
    return Command{"time.sync", json{{K_PHONE_MS, phone_epoch_ms}}};
}

Command Command::mode_set(const std::string &mode)
{
    return Command{"mode.set", json{{"mode", mode}}};
}

Command Command::session_start(const std::string &lift, std::optional<std::int64_t> phone_epoch_ms)
{
    Command c{"session.start", json{{"lift", lift}}};
    if (phone_epoch_ms)
        c.body[K_PHONE_MS] = *phone_epoch_ms;
    return c;
}

Command Command::session_end()
{
    return Command{"session.end", json::object()};
}

Command Command::sessions_list(std::int64_t cursor, std::int64_t limit)
{
    return Command{"sessions.list", json{{"cursor", cursor}, {"limit", limit}}};
}

Command Command::sessions_clear()
{
    return Command{"sessions.clear", json::object()};
}

Command Command::session_stream(const std::string &session_id)
{
    return Command{"session.stream", json{{"sessionId", session_id}}};
}

std::vector<std::uint8_t> encode(const Command &cmd, const util::EpochClock &clock)
{
    json body = cmd.body.is_object() ? cmd.body : json::object();
    if (!body.contains(K_PHONE_MS))
        body[K_PHONE_MS] = clock ? clock() : util::epoch_ms();

    json envelope;
    envelope[K_CMD]  = cmd.name;
    envelope[K_BODY] = std::move(body);

    // replace invalid UTF-8 from user text instead of throwing
    const std::string s = envelope.dump(-1, ' ', false, json::error_handler_t::replace);
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

static bool to_int64(const std::string &s, std::int64_t &out)
{
    if (s.empty())
        return false;
    char *end = nullptr;
    errno     = 0;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0')
        return false;
    out = static_cast<std::int64_t>(v);
    return true;
}

std::optional<Command> command_from_args(const std::string              &name,
                                         const std::vector<std::string> &args,
                                         const util::EpochClock         &clock)
{
    if (name == "ping" && args.empty())
        return Command::ping();
    if ((name == "capabilities.get" || name == "caps") && args.empty())
        return Command::capabilities_get();
    if (name == "time.sync" && args.size() <= 1)
    {
        std::int64_t ms = 0;
        if (args.empty())
            ms = clock ? clock() : util::epoch_ms();
        else if (!to_int64(args[0], ms))
            return std::nullopt;
        return Command::time_sync(ms);
    }
    if (name == "mode.set" && args.size() == 1)
        return Command::mode_set(args[0]);
    if (name == "session.start" && (args.size() == 1 || args.size() == 2))
    {
        if (args.size() == 1)
            return Command::session_start(args[0]);
        std::int64_t ms = 0;
        if (!to_int64(args[1], ms))
            return std::nullopt;
        return Command::session_start(args[0], ms);
    }
    if (name == "session.end" && args.empty())
        return Command::session_end();
    if (name == "sessions.list" && args.size() <= 2)
    {
        std::int64_t cursor = 0;
        std::int64_t limit  = 20;
        if (args.size() >= 1 && !to_int64(args[0], cursor))
            return std::nullopt;
        if (args.size() == 2 && !to_int64(args[1], limit))
            return std::nullopt;
        if (cursor < 0 || limit <= 0)
            return std::nullopt;
        return Command::sessions_list(cursor, limit);
    }
    if (name == "sessions.clear" && args.empty())
        return Command::sessions_clear();
    if (name == "session.stream" && args.size() == 1 && !args[0].empty())
        return Command::session_stream(args[0]);

    LOG_DEBUG("no command '%s' taking %zu argument(s)", name.c_str(), args.size());
    return std::nullopt;
}

}  // namespace proto
