#include "transport/bluez_signals.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "transport/bluez_radio_impl.hpp"
#include "util/log.hpp"

#include <cerrno>
#include <cstring>
#include <optional>
#include <string>

#if LIFTRR_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace transport
{

namespace
{

// Device1 properties we care about
struct DeviceProps
{
    std::string                address;
    std::optional<std::string> name;
    int16_t                    rssi = 0;
    bool                       have_rssi{false};
    bool                       connected_hit{false};
    bool                       connected{false};
    bool                       resolved_hit{false};
    bool                       resolved{false};
};

// ======================================================================
// Function: read_device_props
// - In: m positioned at an a{sv} of org.bluez.Device1
// - Out: DeviceProps filled, container consumed
// ======================================================================
int read_device_props(sd_bus_message *m, DeviceProps &d)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;

        if (key && std::strcmp(key, "Address") == 0)
        {
            if ((r = read_var_s(m, d.address)) < 0)
                return r;
        }
        else if (key && (std::strcmp(key, "Name") == 0))
        {
            std::string n;
            if ((r = read_var_s(m, n)) < 0)
                return r;
            if (!n.empty())
                d.name = n;
        }
        else if (key && std::strcmp(key, "RSSI") == 0)
        {
            if ((r = read_var_i16(m, d.rssi)) < 0)
                return r;
            d.have_rssi = true;
        }
        else if (key && std::strcmp(key, "Connected") == 0)
        {
            if ((r = read_var_b(m, d.connected)) < 0)
                return r;
            d.connected_hit = true;
        }
        else if (key && std::strcmp(key, "ServicesResolved") == 0)
        {
            if ((r = read_var_b(m, d.resolved)) < 0)
                return r;
            d.resolved_hit = true;
        }
        else
        {
            if ((r = sd_bus_message_skip(m, "v")) < 0)
                return r;
        }
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);
}

bool is_device_path(const BluezRadio::Impl &impl, const std::string &path)
{
    const std::string prefix = impl.adapter_path + "/dev_";
    return path.rfind(prefix, 0) == 0 && path.find('/', prefix.size()) == std::string::npos;
}

void report_sighting(BluezRadio::Impl &impl, const std::string &path, const DeviceProps &d)
{
    if (!impl.scanning || !impl.on_sighting || !d.have_rssi)
        return;
    Sighting s;
    s.address = d.address.empty() ? mac_from_path(path) : d.address;
    s.name    = d.name;
    s.rssi    = d.rssi;
    if (s.address.empty())
        return;
    impl.on_sighting(s);
}

// Adapter1 properties that end a running scan
struct AdapterProps
{
    bool discovering_hit{false};
    bool discovering{false};
    bool powered_hit{false};
    bool powered{false};
};

int read_adapter_props(sd_bus_message *m, AdapterProps &a)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;

        if (key && std::strcmp(key, "Discovering") == 0)
        {
            if ((r = read_var_b(m, a.discovering)) < 0)
                return r;
            a.discovering_hit = true;
        }
        else if (key && std::strcmp(key, "Powered") == 0)
        {
            if ((r = read_var_b(m, a.powered)) < 0)
                return r;
            a.powered_hit = true;
        }
        else
        {
            if ((r = sd_bus_message_skip(m, "v")) < 0)
                return r;
        }
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);
}

// A Discovering=false queued from an earlier StopDiscovery can arrive after a
// new StartDiscovery, so ask the adapter before calling the scan lost.
bool adapter_still_discovering(BluezRadio::Impl &impl)
{
    sd_bus_error err{};
    int          v = 0;
    int r = sd_bus_get_property_trivial(impl.bus, "org.bluez", impl.adapter_path.c_str(),
                                        "org.bluez.Adapter1", "Discovering", &err, 'b', &v);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] read Discovering failed: %s", err.message ? err.message : std::strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    return v != 0;
}

void report_services(BluezRadio::Impl &impl)
{
    auto &l = *impl.link;
    if (!l.services_wanted)
        return;
    l.services_wanted = false;
    const bool ok     = find_gatt_paths_locked(impl);
    if (!ok)
        LOG_WARN("[BLUEZ] services resolved but lift service not found on %s", l.dev_path.c_str());
    if (l.cb.on_services)
        l.cb.on_services(ok ? STATUS_SUCCESS : STATUS_FAILURE);
}

}  // namespace

int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *impl = static_cast<BluezRadio::Impl *>(userdata);

    const char *obj = nullptr;
    int         r   = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;

    const std::string obj_path(obj);
    if (!is_device_path(*impl, obj_path))
        return 0;

    DeviceProps d;
    bool        is_device = false;

    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sa{sv}}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
    {
        const char *iface = nullptr;
        if ((r = sd_bus_message_read(m, "s", &iface)) < 0)
            return r;

        if (iface && std::strcmp(iface, "org.bluez.Device1") == 0)
        {
            is_device = true;
            if ((r = read_device_props(m, d)) < 0)
                return r;
        }
        else
        {
            if ((r = sd_bus_message_skip(m, "a{sv}")) < 0)
                return r;
        }
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    if ((r = sd_bus_message_exit_container(m)) < 0)
        return r;

    if (is_device)
    {
        LOG_DEBUG("[BLUEZ] InterfacesAdded %s addr=%s rssi=%d", obj,
                  d.address.empty() ? "?" : d.address.c_str(), (int)d.rssi);
        report_sighting(*impl, obj_path, d);
    }
    return 0;
}

int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *impl = static_cast<BluezRadio::Impl *>(userdata);
    const char *obj  = nullptr;
    int         r    = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;
    bool adapter_gone = false;
    if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "s")) < 0)
        return r;
    const char *iface = nullptr;
    while ((r = sd_bus_message_read(m, "s", &iface)) > 0)
    {
        if (iface && std::strcmp(iface, "org.bluez.Adapter1") == 0)
            adapter_gone = true;
    }
    if (r < 0)
        return r;
    if ((r = sd_bus_message_exit_container(m)) < 0)
        return r;

    if (adapter_gone && impl->adapter_path == obj)
    {
        LOG_SYSTEM("[BLUEZ] InterfacesRemoved -> adapter %s gone", obj);
        (void)scan_lost_locked(*impl, SCAN_ADAPTER_GONE);
        return 0;
    }

    if (impl->link && impl->link->dev_path == obj)
    {
        auto &l = *impl->link;
        LOG_SYSTEM("[BLUEZ] InterfacesRemoved -> device %s gone", obj);
        const bool was = l.connected;
        l.connected    = false;
        l.notifying    = false;
        if (l.cb.on_state)
            l.cb.on_state(was ? STATUS_SUCCESS : STATUS_ERROR, LinkState::Disconnected);
    }
    return 0;
}

int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret_error*/)
{
    auto       *impl  = static_cast<BluezRadio::Impl *>(userdata);
    const char *iface = nullptr;
    int         r     = sd_bus_message_read(m, "s", &iface);
    if (r < 0)
        return r;

    const char       *path_c = sd_bus_message_get_path(m);
    const std::string path   = path_c ? path_c : "";

    if (iface && std::strcmp(iface, "org.bluez.Adapter1") == 0)
    {
        AdapterProps a;
        if ((r = read_adapter_props(m, a)) < 0)
            return r;
        if ((r = sd_bus_message_skip(m, "as")) < 0)
            return r;
        if (path != impl->adapter_path || !impl->scanning)
            return 0;

        if (a.powered_hit && !a.powered)
        {
            LOG_SYSTEM("[BLUEZ] adapter %s powered off while scanning", path.c_str());
            (void)scan_lost_locked(*impl, SCAN_ADAPTER_GONE);
        }
        else if (a.discovering_hit && !a.discovering && !adapter_still_discovering(*impl))
        {
            LOG_SYSTEM("[BLUEZ] adapter %s stopped discovering while scanning", path.c_str());
            (void)scan_lost_locked(*impl, SCAN_INTERRUPTED);
        }
        return 0;
    }

    if (iface && std::strcmp(iface, "org.bluez.Device1") == 0)
    {
        DeviceProps d;
        if ((r = read_device_props(m, d)) < 0)
            return r;
        if ((r = sd_bus_message_skip(m, "as")) < 0)
            return r;

        if (is_device_path(*impl, path))
            report_sighting(*impl, path, d);

        if (!impl->link || impl->link->dev_path != path)
            return 0;
        auto &l = *impl->link;

        if (d.connected_hit)
        {
            if (d.connected && !l.connected)
            {
                l.connected = true;
                LOG_SYSTEM("[BLUEZ] Connected property became true (%s)", path.c_str());
                if (l.cb.on_state)
                    l.cb.on_state(STATUS_SUCCESS, LinkState::Connected);
            }
            else if (!d.connected)
            {
                l.connected = false;
                l.notifying = false;
                LOG_SYSTEM("[BLUEZ] Disconnected (%s)", path.c_str());
                if (l.cb.on_state)
                    l.cb.on_state(STATUS_SUCCESS, LinkState::Disconnected);
            }
        }
        if (d.resolved_hit && d.resolved)
        {
            LOG_SYSTEM("[BLUEZ] ServicesResolved=true on %s", path.c_str());
            report_services(*impl);
        }
        return 0;
    }

    if (iface && std::strcmp(iface, "org.bluez.GattCharacteristic1") == 0)
    {
        bool        value_hit = false;
        const void *val_buf   = nullptr;
        size_t      val_len   = 0;

        r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
        if (r < 0)
            return r;
        while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
        {
            const char *key = nullptr;
            if ((r = sd_bus_message_read(m, "s", &key)) < 0)
                return r;
            if (key && std::strcmp(key, "Value") == 0)
            {
                if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "ay")) < 0)
                    return r;
                if ((r = sd_bus_message_read_array(m, 'y', &val_buf, &val_len)) < 0)
                    return r;
                value_hit = true;
                if ((r = sd_bus_message_exit_container(m)) < 0)
                    return r;
            }
            else
            {
                if ((r = sd_bus_message_skip(m, "v")) < 0)
                    return r;
            }
            if ((r = sd_bus_message_exit_container(m)) < 0)
                return r;
        }
        if (r < 0)
            return r;
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;

        if (!value_hit || !impl->link || impl->link->status_path != path)
            return 0;
        LOG_DEBUG("[BLUEZ] notify on %s len=%zu", path.c_str(), val_len);
        if (val_buf && val_len && impl->link->cb.on_notify)
        {
            const auto *p = static_cast<const uint8_t *>(val_buf);
            impl->link->cb.on_notify(Frame(p, p + val_len));
        }
        return 0;
    }
    return 0;
}

// ======================================================================
// Function: bluez_on_connect_reply
// - In: reply of Device1.Connect, userdata is the Impl
// - Out: on_state(0, Connected) or on_state(STATUS_ERROR, Disconnected)
// - Note: a reply for a link that has been released is ignored
// ======================================================================
int bluez_on_connect_reply(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *impl = static_cast<BluezRadio::Impl *>(userdata);
    if (!impl->link)
        return 1;
    auto &l = *impl->link;

    if (sd_bus_message_is_method_error(m, nullptr))
    {
        const sd_bus_error *e     = sd_bus_message_get_error(m);
        const char         *ename = (e && e->name) ? e->name : "unknown";
        const char         *emsg  = (e && e->message) ? e->message : "no message";
        LOG_ERROR("[BLUEZ] Device1.Connect failed: %s: %s", ename, emsg);
        l.connected = false;
        if (l.cb.on_state)
            l.cb.on_state(STATUS_ERROR, LinkState::Disconnected);
        return 1;
    }

    if (!l.connected)
    {
        l.connected = true;
        LOG_SYSTEM("[BLUEZ] Device connected: %s", l.dev_path.c_str());
        if (l.cb.on_state)
            l.cb.on_state(STATUS_SUCCESS, LinkState::Connected);
    }
    return 1;
}

}  // namespace transport

#endif
