#pragma once
#include <cstdint>
#include <string>

namespace util
{

enum class RadioKind
{
    Bluez,
    Fake
};

// Daemon settings, read once from LIFTRR_* environment variables
struct Config
{
    RadioKind    radio        = RadioKind::Bluez;
    std::string  adapter      = "hci0";
    std::int64_t scan_ms      = 5000;
    std::string  ctl_sock;
    std::string  download_dir;

    static Config from_env();
    void          log() const;
};

// Parse a decimal integer in [lo, hi]; false leaves out untouched.
bool parse_ranged(const char *s, std::int64_t lo, std::int64_t hi, std::int64_t &out);

}  // namespace util
