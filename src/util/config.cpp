#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>

#include "ctl/ipc.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace util
{

bool parse_ranged(const char *s, std::int64_t lo, std::int64_t hi, std::int64_t &out)
{
    if (!s || !*s)
        return false;
    char *end = nullptr;
    errno     = 0;
    long long v = std::strtoll(s, &end, 10);
    if (errno != 0 || !end || *end != '\0')
        return false;
    if (v < lo || v > hi)
        return false;
    out = static_cast<std::int64_t>(v);
    return true;
}

Config Config::from_env()
{
    Config c;

    if (const char *lv = std::getenv("LIFTRR_LOG_LEVEL"))
    {
        if (!liftrr::set_log_level_by_name(lv))
            LOG_WARN("Unknown LIFTRR_LOG_LEVEL='%s', using info", lv);
    }

    if (const char *r = std::getenv("LIFTRR_RADIO"))
    {
        std::string rs = r;
        for (auto &ch : rs)
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        if (rs == "fake")
            c.radio = RadioKind::Fake;
        else if (rs != "bluez")
            LOG_WARN("Ignoring invalid LIFTRR_RADIO='%s' (expect bluez|fake)", r);
    }

    if (const char *a = std::getenv("LIFTRR_ADAPTER"); a && *a)
        c.adapter = a;

    if (const char *e = std::getenv("LIFTRR_SCAN_MS"))
    {
        if (!parse_ranged(e, 500, 60000, c.scan_ms))
            LOG_WARN("Ignoring invalid LIFTRR_SCAN_MS='%s' (expect 500..60000)", e);
    }

    c.ctl_sock = ipc::expand_user(constants::ctl_sock_path());

    if (const char *d = std::getenv("LIFTRR_DOWNLOAD_DIR"); d && *d)
        c.download_dir = ipc::expand_user(d);
    else
        c.download_dir = constants::cache_dir() + "/sessions";

    return c;
}

void Config::log() const
{
    LOG_SYSTEM("Config: radio=%s adapter=%s scan_ms=%lld sock=%s downloads=%s",
               radio == RadioKind::Fake ? "fake" : "bluez", adapter.c_str(), (long long)scan_ms,
               ctl_sock.c_str(), download_dir.c_str());
}

}  // namespace util
