#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace proto
{

// One decoded notification from the status characteristic.
// Either a response (`cmd`) or an unsolicited event (`evt`).
struct StatusEvent
{
    std::string                kind;              // command or event name, empty if neither
    bool                       is_event  = false;  // came as `evt`
    std::optional<bool>        ok;
    std::optional<std::string> error;
    nlohmann::json             body  = nlohmann::json::object();
    nlohmann::json             extra = nlohmann::json::object();  // unknown top-level fields
    std::string                raw;
    bool                       malformed = false;
};

// Never fails; payloads that are not a JSON object come back with malformed set.
StatusEvent decode(const std::vector<std::uint8_t> &bytes);

// Single-line summary for logs and the control socket.
std::string describe(const StatusEvent &ev);

}  // namespace proto
