#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "util/clock.hpp"

/*
TX:
facade.send(Command)
  -> encode(cmd, clock)        // body.phoneEpochMs filled in when missing
     -> {"cmd": name, "body": {...}} as UTF-8 JSON
        -> link.write(bytes)   // one write on the command characteristic

RX:
link.on_notify(bytes)
  -> decode(bytes) -> StatusEvent (see proto/status.hpp)
*/

namespace proto
{

inline constexpr const char *K_CMD       = "cmd";
inline constexpr const char *K_EVT       = "evt";
inline constexpr const char *K_BODY      = "body";
inline constexpr const char *K_PHONE_MS  = "phoneEpochMs";

// Outbound request. name is fixed per command kind, body is always an object.
struct Command
{
    std::string    name;
    nlohmann::json body = nlohmann::json::object();

    static Command ping();
    static Command capabilities_get();
    static Command time_sync(std::int64_t phone_epoch_ms);
    static Command mode_set(const std::string &mode);
    static Command session_start(const std::string &lift,
                                 std::optional<std::int64_t> phone_epoch_ms = std::nullopt);
    static Command session_end();
    static Command sessions_list(std::int64_t cursor, std::int64_t limit);
    static Command sessions_clear();
    static Command session_stream(const std::string &session_id);
};

// Serialize into the wire envelope. Sets body.phoneEpochMs from clock when absent.
std::vector<std::uint8_t> encode(const Command &cmd, const util::EpochClock &clock = util::epoch_ms);

// Build a command from control-line words, e.g. ("mode.set", {"live"}).
// nullopt for unknown names, wrong arity or non-numeric numbers.
std::optional<Command> command_from_args(const std::string              &name,
                                         const std::vector<std::string> &args,
                                         const util::EpochClock         &clock = util::epoch_ms);

}  // namespace proto
