#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
// GATT identifiers exported by the lift sensor firmware
inline constexpr std::string_view SVC_UUID = "c7ccb0e4-7cd7-45f6-9693-b3dda2d77672";
inline constexpr std::string_view CMD_UUID = "b0f2a8fb-9a63-4d9f-8ffc-80501fda2359";  // Write
inline constexpr std::string_view STATUS_UUID =
    "27746aa3-5fae-44c1-a1eb-65844cc315dc";  // Notify
inline constexpr std::string_view CCCD_UUID = "00002902-0000-1000-8000-00805f9b34fb";

inline constexpr std::int64_t SCAN_DURATION_MS = 5000;
inline constexpr const char  *UNKNOWN_DEVICE   = "Unknown Device";
inline constexpr const char  *UNKNOWN_LIFT     = "Unknown";

inline std::string cache_dir()
{
    const char *home = std::getenv("HOME");
    std::string base = home && *home ? std::string(home) : "/tmp";
    return base + "/.cache/liftrr-link";
}

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("LIFTRR_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    std::string sock_path = cache_dir() + "/ctl.sock";
    LOG_SYSTEM("Listening on %s", sock_path.c_str());
    return sock_path;
}

}  // namespace constants
