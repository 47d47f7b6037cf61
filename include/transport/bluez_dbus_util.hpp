// include/transport/bluez_dbus_util.hpp
#pragma once
#include <cctype>
#include <cstdint>
#include <string>
#include <utility>

#if LIFTRR_HAVE_SDBUS
#include <systemd/sd-bus.h>
#endif

namespace transport
{

static inline bool ieq(std::string a, std::string b)
{
    auto norm = [](std::string s) {
        for (auto &c : s)
            c = (char)std::tolower((unsigned char)c);
        return s;
    };
    return norm(std::move(a)) == norm(std::move(b));
}

// "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF[/...]" -> "AA:BB:CC:DD:EE:FF", "" when not a device path
[[maybe_unused]] static inline std::string mac_from_path(const std::string &obj_path)
{
    auto pos = obj_path.find("/dev_");
    if (pos == std::string::npos)
        return "";
    std::string tail = obj_path.substr(pos + 5);
    auto        end  = tail.find('/');
    if (end != std::string::npos)
        tail.resize(end);
    for (auto &c : tail)
        c = (c == '_') ? ':' : (char)std::toupper((unsigned char)c);
    return tail;
}

// "AA:BB:CC:DD:EE:FF" on adapter "/org/bluez/hci0" -> "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF"
[[maybe_unused]] static inline std::string device_path(const std::string &adapter_path,
                                                       const std::string &mac)
{
    std::string tail = mac;
    for (auto &c : tail)
        c = (c == ':') ? '_' : (char)std::toupper((unsigned char)c);
    return adapter_path + "/dev_" + tail;
}

#if LIFTRR_HAVE_SDBUS
// TU-local wrapper to unref and null a slot ptr
[[maybe_unused]] static inline void unref_slot(sd_bus_slot *&s)
{
    if (s)
    {
        sd_bus_slot_unref(s);
        s = nullptr;
    }
}

[[maybe_unused]] static inline int read_var_s(sd_bus_message *m, std::string &out)
{
    // read variant "s"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "s");
    if (r < 0)
        return r;
    const char *s = nullptr;
    r             = sd_bus_message_read(m, "s", &s);
    if (r >= 0 && s)
        out = s;
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_i16(sd_bus_message *m, int16_t &out)
{
    // read variant "n" (int16)
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "n");
    if (r < 0)
        return r;
    r      = sd_bus_message_read(m, "n", &out);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_b(sd_bus_message *m, bool &out)
{
    // read variant "b"; sd-bus hands booleans out as int
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "b");
    if (r < 0)
        return r;
    int b  = 0;
    r      = sd_bus_message_read(m, "b", &b);
    out    = (b != 0);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}
#endif

}  // namespace transport
