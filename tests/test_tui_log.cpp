#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

#ifndef LIFTRR_SOURCE_DIR
#error "LIFTRR_SOURCE_DIR must be defined by CMake to the project source root"
#endif

struct Check
{
    const char              *label;
    const char              *rel_path;
    std::vector<std::string> needles;  // all substrings must appear in the SAME line
    bool                     allow_prev_line_macro = true;  // sometimes macro is on prev line
};

static std::string read_file(const std::string &path)
{
    std::ifstream      ifs(path);
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

static bool line_has_all(const std::string &line, const std::vector<std::string> &needles)
{
    for (const auto &n : needles)
    {
        if (line.find(n) == std::string::npos)
            return false;
    }
    return true;
}

static bool has_system_macro_near(const std::string              &content,
                                  const std::vector<std::string> &needles,
                                  bool                            allow_prev)
{
    std::istringstream iss(content);
    std::string        line, prev;
    while (std::getline(iss, line))
    {
        if (line_has_all(line, needles))
        {
            const bool on_same = line.find("LOG_SYSTEM(") != std::string::npos;
            const bool on_prev = allow_prev && prev.find("LOG_SYSTEM(") != std::string::npos;
            return on_same || on_prev;
        }
        prev = line;
    }
    // message not found => fail
    return false;
}

TEST(TuiLogs, AllSystemLevel)
{
    const std::vector<Check> checks = {
        // clang-format off
        // state transitions
        {"scan started", "src/discovery/discovery_engine.cpp", {"[SCAN] started"}},
        {"scan complete", "src/discovery/discovery_engine.cpp", {"[SCAN] complete:"}},
        {"scan stopped", "src/discovery/discovery_engine.cpp", {"[SCAN] stopped with"}},
        {"scan error", "src/discovery/discovery_engine.cpp", {"[SCAN] %s"}},
        {"link connecting", "src/conn/connection_engine.cpp", {"[LINK] connecting to"}},
        {"link connected", "src/conn/connection_engine.cpp", {"[LINK] connected to"}},
        {"link ready", "src/conn/connection_engine.cpp", {"[LINK] ready, status notifications on"}},
        {"link lost", "src/conn/connection_engine.cpp", {"[LINK] lost"}},
        {"link cancelled", "src/conn/connection_engine.cpp", {"[LINK] connect to", "cancelled"}},
        {"service running", "src/host/service_lifecycle.cpp", {"[SERVICE] running"}},
        {"service stopped", "src/host/service_lifecycle.cpp", {"[SERVICE] stopped"}},
        {"host died", "src/host/service_lifecycle.cpp", {"[SERVICE] host went away"}},
        // radio milestones
        {"StartDiscovery OK", "src/transport/bluez_radio.cpp", {"StartDiscovery OK"}},
        {"StopDiscovery OK", "src/transport/bluez_radio.cpp", {"StopDiscovery OK"}},
        {"Notifications enabled", "src/transport/bluez_radio.cpp", {"Notifications enabled on"}},
        {"scan lost", "src/transport/bluez_radio.cpp", {"[BLUEZ] scan lost on"}},
        {"Device connected", "src/transport/bluez_signals.cpp", {"Device connected:"}},
        {"Connected property true", "src/transport/bluez_signals.cpp", {"Connected property became true"}},
        {"Disconnected", "src/transport/bluez_signals.cpp", {"[BLUEZ] Disconnected ("}},
        {"InterfacesRemoved", "src/transport/bluez_signals.cpp", {"InterfacesRemoved -> device"}},
        {"ServicesResolved", "src/transport/bluez_signals.cpp", {"ServicesResolved=true"}},
        // daemon
        {"session saved", "src/daemon/main.cpp", {"[SESSION] saved"}},
        {"status event", "src/daemon/main.cpp", {"[STATUS] %s"}},
        // clang-format on
    };

    for (const auto &c : checks)
    {
        const std::string path    = std::string(LIFTRR_SOURCE_DIR) + "/" + c.rel_path;
        const std::string content = read_file(path);
        ASSERT_FALSE(content.empty()) << "Missing file: " << path;
        const bool ok = has_system_macro_near(content, c.needles, c.allow_prev_line_macro);
        if (!ok)
        {
            std::ostringstream err;
            err << "Log for [" << c.label << "] is not LOG_SYSTEM near message in " << path
                << " (needles: ";
            for (size_t i = 0; i < c.needles.size(); ++i)
            {
                if (i)
                    err << ", ";
                err << '"' << c.needles[i] << '"';
            }
            err << ")";
            ADD_FAILURE() << err.str();
        }
    }
}
