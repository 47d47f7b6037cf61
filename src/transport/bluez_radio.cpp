/* ======================================================================
 * BlueZ radio — normal path
 *
 *  Executor thread                   Radio host thread            BlueZ/DBus           Lift sensor
 *  ---------------                   -----------------            ----------           -----------
 *                                    open()
 *                                      └─ subscribe signals ───────────────────────▶  ObjectManager / Properties
 *                                      └─ set_discovery_filter ────────────────────▶  Adapter1.SetDiscoveryFilter
 *  start_scan()
 *    └─ StartDiscovery ─────────────────────────────────────────────────────────────▶  Adapter1.StartDiscovery
 *    └─ cold_scan (cached devices) ─────────────────────────────────────────────────▶  GetManagedObjects
 *                                    process()
 *                                      ◀── InterfacesAdded / RSSI changes ──────────  advertisements
 *                                      └─ on_sighting
 *  stop_scan() ─────────────────────────────────────────────────────────────────────▶  Adapter1.StopDiscovery
 *
 *  open_link(addr) ─────────────────────────────────────────────────────────────────▶  Device1.Connect (async)
 *                                      ◀── on_connect_reply ─────────────────────────
 *                                      └─ on_state(0, Connected)
 *  link.discover_services()            ◀── PropertiesChanged: ServicesResolved=true
 *                                      └─ find_gatt_paths → on_services
 *  link.enable_notify() ────────────────────────────────────────────────────────────▶  GattCharacteristic1.StartNotify (status)
 *  link.write(frame) ───────────────────────────────────────────────────────────────▶  GattCharacteristic1.WriteValue (command)
 *                                      ◀── PropertiesChanged: Value (status) ──────────  notifications
 *                                      └─ on_notify
 *
 *  All sd-bus access is under impl_->bus_mu; handlers run inside process() with it held.
 * ====================================================================== */

#include <cerrno>
#include <chrono>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// clang-format off
#include "transport/bluez_radio.hpp"
#include "transport/bluez_radio_impl.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "util/log.hpp"
// clang-format on

#if LIFTRR_HAVE_SDBUS
#include <systemd/sd-bus.h>
#include "transport/bluez_signals.hpp"
namespace
{

// ======================================================================
// Function: adapter_start_discovery_locked
// - In: bus_mu locked, adapter_path valid
// - Out: true if StartDiscovery succeeds and discovery_on becomes true
// - Note: safe to call repeatedly, only starts when off
// ======================================================================
static bool adapter_start_discovery_locked(sd_bus *bus, const std::string &adapter_path,
                                           bool &discovery_on)
{
    if (!bus)
        return false;
    if (discovery_on)
        return true;

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), "org.bluez.Adapter1",
                               "StartDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        if (err.name && std::string(err.name) == "org.bluez.Error.InProgress")
        {
            discovery_on = true;
            LOG_INFO("[BLUEZ] StartDiscovery already in progress on %s", adapter_path.c_str());
            sd_bus_error_free(&err);
            return true;
        }
        LOG_WARN("[BLUEZ] StartDiscovery failed: %s", err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    discovery_on = true;
    LOG_SYSTEM("[BLUEZ] StartDiscovery OK on %s", adapter_path.c_str());
    return true;
}

// ======================================================================
// Function: adapter_stop_discovery_locked
// - In: bus_mu locked, adapter_path valid
// - Out: true if discovery was on (whatever StopDiscovery answered)
// - Note: clears discovery_on even if StopDiscovery fails
// ======================================================================
static bool adapter_stop_discovery_locked(sd_bus *bus, const std::string &adapter_path,
                                          bool &discovery_on)
{
    if (!bus)
        return false;
    const bool was = discovery_on;

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), "org.bluez.Adapter1",
                               "StopDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        // usually "not discovering" after a state desync
        LOG_WARN("[BLUEZ] StopDiscovery failed (treat as off): %s",
                 err.message ? err.message : strerror(-r));
    }
    else
    {
        LOG_SYSTEM("[BLUEZ] StopDiscovery OK");
    }
    discovery_on = false;
    sd_bus_error_free(&err);
    return was;
}

// ======================================================================
// Function: char_start_notify_locked
// - In: bus_mu locked, path is the status characteristic
// - Out: true if StartNotify returns success on DBus
// ======================================================================
static bool char_start_notify_locked(sd_bus *bus, const std::string &path)
{
    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", path.c_str(), "org.bluez.GattCharacteristic1",
                               "StartNotify", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] StartNotify failed: %s",
                 err.message && *err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    LOG_SYSTEM("[BLUEZ] Notifications enabled on %s", path.c_str());
    return true;
}

static void device_call_locked(sd_bus *bus, const std::string &dev_path, const char *method)
{
    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", dev_path.c_str(), "org.bluez.Device1", method,
                               &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
        LOG_DEBUG("[BLUEZ] Device1.%s on %s: %s", method, dev_path.c_str(),
                  err.message ? err.message : strerror(-r));
    sd_bus_error_free(&err);
}

}  // namespace
#endif

namespace transport
{

BluezRadio::BluezRadio(BluezConfig cfg) : cfg_(std::move(cfg)), impl_(std::make_unique<Impl>(cfg_))
{
    impl_->adapter_path = "/org/bluez/" + cfg_.adapter;
}

BluezRadio::~BluezRadio()
{
    close();
}

// ======================================================================
// Function: BluezRadio::open
// - In: radio host thread
// - Out: system bus connected, BlueZ signals subscribed
// ======================================================================
bool BluezRadio::open()
{
#if !LIFTRR_HAVE_SDBUS
    LOG_ERROR("[BLUEZ] sd-bus not available (LIFTRR_HAVE_SDBUS=0)");
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (impl_->bus)
        return true;

    sd_bus *bus = nullptr;
    int     r   = sd_bus_open_system(&bus);
    if (r < 0 || !bus)
    {
        LOG_ERROR("[BLUEZ] failed to connect system bus: %s", strerror(-r));
        return false;
    }
    impl_->bus = bus;

    const char *name = nullptr;
    if (sd_bus_get_unique_name(impl_->bus, &name) >= 0 && name)
        impl_->unique_name = name;

    r = sd_bus_match_signal(impl_->bus, &impl_->added_slot, "org.bluez", "/",
                            "org.freedesktop.DBus.ObjectManager", "InterfacesAdded",
                            bluez_on_iface_added, impl_.get());
    if (r >= 0)
        r = sd_bus_match_signal(impl_->bus, &impl_->removed_slot, "org.bluez", "/",
                                "org.freedesktop.DBus.ObjectManager", "InterfacesRemoved",
                                bluez_on_iface_removed, impl_.get());
    if (r >= 0)
        r = sd_bus_match_signal(impl_->bus, &impl_->props_slot, "org.bluez", nullptr,
                                "org.freedesktop.DBus.Properties", "PropertiesChanged",
                                bluez_on_props_changed, impl_.get());
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] signal subscription failed: %s", strerror(-r));
        unref_slot(impl_->added_slot);
        unref_slot(impl_->removed_slot);
        unref_slot(impl_->props_slot);
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
        return false;
    }
    LOG_INFO("[BLUEZ] bus open as %s, adapter %s", impl_->unique_name.c_str(),
             impl_->adapter_path.c_str());

    (void)set_discovery_filter_locked();
    return true;
#endif
}

// ======================================================================
// Function: BluezRadio::close
// - In: radio host thread after the pump loop ended, or destructor
// - Out: discovery off, link dropped (best effort), bus released
// ======================================================================
void BluezRadio::close()
{
#if LIFTRR_HAVE_SDBUS
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return;

    if (impl_->link)
    {
        auto &l = *impl_->link;
        if (!l.dev_path.empty())
            device_call_locked(impl_->bus, l.dev_path, "Disconnect");
        unref_slot(l.connect_call_slot);
        l.connected = false;
        l.notifying = false;
        l.cb        = LinkCallbacks{};
    }
    if (impl_->discovery_on)
        (void)adapter_stop_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on);
    impl_->scanning      = false;
    impl_->on_sighting   = nullptr;
    impl_->on_scan_error = nullptr;

    unref_slot(impl_->added_slot);
    unref_slot(impl_->removed_slot);
    unref_slot(impl_->props_slot);
    sd_bus_flush_close_unref(impl_->bus);
    impl_->bus = nullptr;
    LOG_INFO("[BLUEZ] bus closed");
#endif
}

bool BluezRadio::is_open() const
{
#if !LIFTRR_HAVE_SDBUS
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    return impl_->bus != nullptr;
#endif
}

void BluezRadio::process(std::uint32_t wait_ms)
{
#if !LIFTRR_HAVE_SDBUS
    std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
#else
    sd_bus *bus = nullptr;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        bus = impl_->bus;
        if (bus)
        {
            while (true)
            {
                int pr = sd_bus_process(bus, nullptr);
                if (pr < 0)
                {
                    LOG_WARN("[BLUEZ] sd_bus_process: %s", strerror(-pr));
                    break;
                }
                if (pr == 0)
                    break;
            }
        }
    }
    if (!bus)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
        return;
    }
    // do not hold the lock while waiting, engine calls would stall behind us
    (void)sd_bus_wait(bus, (uint64_t)wait_ms * 1000u);
#endif
}

// ======================================================================
// Function: BluezRadio::start_scan
// - Out: true once StartDiscovery is on; cached devices are reported right away
// ======================================================================
bool BluezRadio::start_scan(OnSighting on_sighting, OnScanError on_error)
{
#if !LIFTRR_HAVE_SDBUS
    (void)on_sighting;
    (void)on_error;
    LOG_ERROR("[BLUEZ] scan unavailable without sd-bus");
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return false;
    if (!adapter_start_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on))
        return false;

    impl_->scanning      = true;
    impl_->on_sighting   = std::move(on_sighting);
    impl_->on_scan_error = std::move(on_error);

    if (!cold_scan_locked())
        LOG_DEBUG("[BLUEZ] cold scan skipped");
    return true;
#endif
}

bool BluezRadio::stop_scan()
{
#if !LIFTRR_HAVE_SDBUS
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    const bool was       = impl_->scanning;
    impl_->scanning      = false;
    impl_->on_sighting   = nullptr;
    impl_->on_scan_error = nullptr;
    if (!impl_->bus)
        return false;
    if (impl_->discovery_on)
        (void)adapter_stop_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on);
    return was;
#endif
}

bool scan_lost_locked(BluezRadio::Impl &impl, int code)
{
    if (!impl.scanning)
        return false;
    auto cb            = std::move(impl.on_scan_error);
    impl.scanning      = false;
    impl.discovery_on  = false;
    impl.on_sighting   = nullptr;
    impl.on_scan_error = nullptr;
    LOG_SYSTEM("[BLUEZ] scan lost on %s (code %d)", impl.adapter_path.c_str(), code);
    if (cb)
        cb(code);
    return true;
}

// ======================================================================
// Function: BluezRadio::set_discovery_filter_locked
// - In: bus_mu locked
// - Out: Adapter1.SetDiscoveryFilter(Transport=le, DuplicateData=true[, UUIDs])
// - Note: duplicates on so RSSI keeps updating while a scan runs
// ======================================================================
bool BluezRadio::set_discovery_filter_locked()
{
#if !LIFTRR_HAVE_SDBUS
    return false;
#else
    sd_bus_message *msg = nullptr, *rep = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez",
                                           impl_->adapter_path.c_str(), "org.bluez.Adapter1",
                                           "SetDiscoveryFilter");
    if (r < 0)
        goto out;

    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        goto out;
    r = sd_bus_message_append(msg, "{sv}", "Transport", "s", "le");
    if (r < 0)
        goto out;
    r = sd_bus_message_append(msg, "{sv}", "DuplicateData", "b", 1);
    if (r < 0)
        goto out;
    if (cfg_.service_filter)
    {
        r = sd_bus_message_append(msg, "{sv}", "UUIDs", "as", 1, cfg_.svc_uuid.c_str());
        if (r < 0)
            goto out;
    }
    r = sd_bus_message_close_container(msg);  // a{sv}
    if (r < 0)
        goto out;

    r = sd_bus_call(impl_->bus, msg, 0, &err, &rep);
out:
    if (msg)
        sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);

    if (r < 0)
    {
        LOG_WARN("[BLUEZ] SetDiscoveryFilter failed: %s",
                 err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    LOG_INFO("[BLUEZ] SetDiscoveryFilter OK (Transport=le%s%s)",
             cfg_.service_filter ? ", UUID=" : "", cfg_.service_filter ? cfg_.svc_uuid.c_str() : "");
    return true;
#endif
}

// ======================================================================
// Function: BluezRadio::cold_scan_locked
// - In: bus_mu locked, scanning callbacks set
// - Out: every cached Device1 with an RSSI is reported as a sighting
// - Note: does not touch discovery
// ======================================================================
bool BluezRadio::cold_scan_locked()
{
#if !LIFTRR_HAVE_SDBUS
    return false;
#else
    sd_bus_message *reply = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_call_method(impl_->bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &err, &reply, "");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] GetManagedObjects failed: %s", err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        if (reply)
            sd_bus_message_unref(reply);
        return false;
    }

    const std::string dev_prefix = impl_->adapter_path + "/dev_";
    std::vector<Sighting> found;

    // Walk a{oa{sa{sv}}}
    r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    if (r < 0)
        goto out;
    while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &obj)) < 0)
            goto out;
        std::string path(obj ? obj : "");
        if (path.rfind(dev_prefix, 0) != 0 || path.find('/', dev_prefix.size()) != std::string::npos)
        {
            if ((r = sd_bus_message_skip(reply, "a{sa{sv}}")) < 0)
                goto out;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;
            continue;
        }

        Sighting s;
        bool     have_rssi = false;

        if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
            goto out;
        while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
        {
            const char *iface = nullptr;
            if ((r = sd_bus_message_read(reply, "s", &iface)) < 0)
                goto out;
            if (iface && std::strcmp(iface, "org.bluez.Device1") == 0)
            {
                if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sv}")) < 0)
                    goto out;
                while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sv")) >
                       0)
                {
                    const char *key = nullptr;
                    if ((r = sd_bus_message_read(reply, "s", &key)) < 0)
                        goto out;
                    if (key && std::strcmp(key, "Address") == 0)
                    {
                        if ((r = read_var_s(reply, s.address)) < 0)
                            goto out;
                    }
                    else if (key && std::strcmp(key, "Name") == 0)
                    {
                        std::string n;
                        if ((r = read_var_s(reply, n)) < 0)
                            goto out;
                        if (!n.empty())
                            s.name = n;
                    }
                    else if (key && std::strcmp(key, "RSSI") == 0)
                    {
                        if ((r = read_var_i16(reply, s.rssi)) < 0)
                            goto out;
                        have_rssi = true;
                    }
                    else
                    {
                        if ((r = sd_bus_message_skip(reply, "v")) < 0)
                            goto out;
                    }
                    if ((r = sd_bus_message_exit_container(reply)) < 0)
                        goto out;  // dict-entry
                }
                if ((r = sd_bus_message_exit_container(reply)) < 0)
                    goto out;  // a{sv}
            }
            else
            {
                if ((r = sd_bus_message_skip(reply, "a{sv}")) < 0)
                    goto out;
            }
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;  // {sa{sv}}
        }
        if (r < 0)
            goto out;
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;  // a{sa{sv}}
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;  // {oa{sa{sv}}}

        if (s.address.empty())
            s.address = mac_from_path(path);
        // devices without RSSI are only remembered by BlueZ, not in range
        if (have_rssi && !s.address.empty())
            found.push_back(std::move(s));
    }

out:
    if (reply)
        sd_bus_message_unref(reply);
    sd_bus_error_free(&err);

    if (impl_->on_sighting)
    {
        for (const auto &s : found)
            impl_->on_sighting(s);
    }
    LOG_DEBUG("[BLUEZ] cold scan: %zu cached device(s) in range", found.size());
    return r >= 0;
#endif
}

// ======================================================================
// Function: BluezRadio::open_link
// - Out: a BluezLink with Device1.Connect submitted, nullptr if the bus is down
//        or another link is still held
// ======================================================================
std::unique_ptr<ILink> BluezRadio::open_link(const std::string &address, LinkCallbacks cb)
{
#if !LIFTRR_HAVE_SDBUS
    (void)address;
    (void)cb;
    LOG_ERROR("[BLUEZ] links unavailable without sd-bus");
    return nullptr;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return nullptr;
    if (impl_->link)
    {
        LOG_WARN("[BLUEZ] open_link(%s): link to %s still held", address.c_str(),
                 impl_->link->address.c_str());
        return nullptr;
    }

    Impl::Link l;
    l.id       = impl_->next_link_id++;
    l.address  = address;
    l.dev_path = device_path(impl_->adapter_path, address);
    l.cb       = std::move(cb);
    impl_->link = std::move(l);

    int r = sd_bus_call_method_async(impl_->bus, &impl_->link->connect_call_slot, "org.bluez",
                                     impl_->link->dev_path.c_str(), "org.bluez.Device1", "Connect",
                                     bluez_on_connect_reply, impl_.get(), "");
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] submit Connect() failed: %s", strerror(-r));
        impl_->link.reset();
        return nullptr;
    }
    LOG_DEBUG("[BLUEZ] Connect() submitted to %s", impl_->link->dev_path.c_str());
    return std::make_unique<BluezLink>(*this, impl_->link->id, address);
#endif
}

// ---------------- link operations ----------------

bool BluezRadio::link_discover_services(std::uint64_t id)
{
#if !LIFTRR_HAVE_SDBUS
    (void)id;
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus || !impl_->link || impl_->link->id != id || !impl_->link->connected)
        return false;
    auto &l           = *impl_->link;
    l.services_wanted = true;

    // already resolved: BlueZ will not announce it again
    int resolved = 0;
    sd_bus_error err{};
    int r = sd_bus_get_property_trivial(impl_->bus, "org.bluez", l.dev_path.c_str(),
                                        "org.bluez.Device1", "ServicesResolved", &err, 'b',
                                        &resolved);
    sd_bus_error_free(&err);
    if (r >= 0 && resolved)
    {
        l.services_wanted = false;
        const bool ok     = find_gatt_paths_locked(*impl_);
        if (l.cb.on_services)
            l.cb.on_services(ok ? STATUS_SUCCESS : STATUS_FAILURE);
    }
    else
    {
        LOG_DEBUG("[BLUEZ] waiting for ServicesResolved on %s", l.dev_path.c_str());
    }
    return true;
#endif
}

bool BluezRadio::link_enable_notify(std::uint64_t id)
{
#if !LIFTRR_HAVE_SDBUS
    (void)id;
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus || !impl_->link || impl_->link->id != id)
        return false;
    auto &l = *impl_->link;
    if (l.status_path.empty())
        return false;
    if (l.notifying)
        return true;
    l.notifying = char_start_notify_locked(impl_->bus, l.status_path);
    return l.notifying;
#endif
}

// ======================================================================
// Function: BluezRadio::link_write
// - In: link connected with the command characteristic resolved
// - Out: true if WriteValue (type=request) succeeds on DBus
// ======================================================================
bool BluezRadio::link_write(std::uint64_t id, const Frame &f)
{
#if !LIFTRR_HAVE_SDBUS
    (void)id;
    (void)f;
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus || !impl_->link || impl_->link->id != id || f.empty())
        return false;
    const auto &l = *impl_->link;
    if (l.cmd_path.empty())
    {
        LOG_WARN("[BLUEZ] write: command characteristic not resolved");
        return false;
    }

    sd_bus_message *msg = nullptr;
    sd_bus_message *rep = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez", l.cmd_path.c_str(),
                                           "org.bluez.GattCharacteristic1", "WriteValue");
    if (r >= 0)
        r = sd_bus_message_append_array(msg, 'y', f.data(), f.size());
    // options a{sv}: Write Request (expect ATT response), offset 0
    if (r >= 0)
        r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r >= 0)
        r = sd_bus_message_append(msg, "{sv}", "type", "s", "request");
    if (r >= 0)
        r = sd_bus_message_append(msg, "{sv}", "offset", "q", (uint16_t)0);
    if (r >= 0)
        r = sd_bus_message_close_container(msg);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] WriteValue build failed: %s", strerror(-r));
        if (msg)
            sd_bus_message_unref(msg);
        return false;
    }

    r = sd_bus_call(impl_->bus, msg, 0, &err, &rep);
    sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] WriteValue failed: %s", err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    LOG_DEBUG("[BLUEZ] WriteValue OK (len=%zu)", f.size());
    return true;
#endif
}

void BluezRadio::link_disconnect(std::uint64_t id)
{
#if !LIFTRR_HAVE_SDBUS
    (void)id;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus || !impl_->link || impl_->link->id != id)
        return;
    auto &l = *impl_->link;
    // drops a pending Connect() as well
    unref_slot(l.connect_call_slot);
    device_call_locked(impl_->bus, l.dev_path, "Disconnect");
    LOG_INFO("[BLUEZ] Disconnect requested for %s", l.dev_path.c_str());
#endif
}

void BluezRadio::link_release(std::uint64_t id)
{
#if !LIFTRR_HAVE_SDBUS
    (void)id;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->link || impl_->link->id != id)
        return;
    auto &l = *impl_->link;
    if (impl_->bus && l.notifying && !l.status_path.empty())
    {
        sd_bus_error    err{};
        sd_bus_message *rep = nullptr;
        (void)sd_bus_call_method(impl_->bus, "org.bluez", l.status_path.c_str(),
                                 "org.bluez.GattCharacteristic1", "StopNotify", &err, &rep, "");
        if (rep)
            sd_bus_message_unref(rep);
        sd_bus_error_free(&err);
    }
    unref_slot(l.connect_call_slot);
    impl_->link.reset();
    LOG_DEBUG("[BLUEZ] link %llu released", (unsigned long long)id);
#endif
}

#if LIFTRR_HAVE_SDBUS
// ======================================================================
// Function: find_gatt_paths_locked
// - In: bus_mu locked, impl.link set
// - Out: true when service, command and status characteristic are known
// - Note: the CCCD is recorded when present; BlueZ writes it on StartNotify
// ======================================================================
bool find_gatt_paths_locked(BluezRadio::Impl &impl)
{
    if (!impl.bus || !impl.link)
        return false;
    auto &l = *impl.link;

    sd_bus_message *reply = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_call_method(impl.bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &err, &reply, "");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] GetManagedObjects failed: %s", err.message ? err.message : strerror(-r));
        if (reply)
            sd_bus_message_unref(reply);
        sd_bus_error_free(&err);
        return false;
    }

    const std::string dev_prefix = l.dev_path + "/";
    std::string       svc, cmd, status, cccd;
    // descriptors may arrive before their characteristic in the walk
    std::vector<std::pair<std::string, std::string>> descriptors;  // path, uuid

    r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    if (r < 0)
        goto done;
    // ==========================
    // Hierarchy:
    // Object path (o)
    // |- Interfaces (a{sa{sv}})
    //     |- Properties ({sv})
    // ==========================
    while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &obj)) < 0)
            break;
        std::string path(obj ? obj : "");
        if (path.rfind(dev_prefix, 0) != 0)
        {
            if ((r = sd_bus_message_skip(reply, "a{sa{sv}}")) < 0)
                break;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                break;
            continue;
        }

        if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
            break;
        while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
        {
            const char *iface = nullptr;
            if ((r = sd_bus_message_read(reply, "s", &iface)) < 0)
                break;
            const bool gatt = iface && (std::strcmp(iface, "org.bluez.GattService1") == 0 ||
                                        std::strcmp(iface, "org.bluez.GattCharacteristic1") == 0 ||
                                        std::strcmp(iface, "org.bluez.GattDescriptor1") == 0);
            if (!gatt)
            {
                if ((r = sd_bus_message_skip(reply, "a{sv}")) < 0)
                    break;
            }
            else
            {
                // every GATT object carries a UUID property
                std::string uuid;
                if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sv}")) < 0)
                    break;
                while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY,
                                                           "sv")) > 0)
                {
                    const char *key = nullptr;
                    if ((r = sd_bus_message_read(reply, "s", &key)) < 0)
                        break;
                    if (key && std::strcmp(key, "UUID") == 0)
                        r = read_var_s(reply, uuid);
                    else
                        r = sd_bus_message_skip(reply, "v");
                    if (r < 0)
                        break;
                    if ((r = sd_bus_message_exit_container(reply)) < 0)
                        break;
                }
                if (r < 0)
                    break;
                if ((r = sd_bus_message_exit_container(reply)) < 0)
                    break;  // a{sv}

                if (std::strcmp(iface, "org.bluez.GattService1") == 0 &&
                    ieq(uuid, impl.cfg.svc_uuid))
                    svc = path;
                else if (std::strcmp(iface, "org.bluez.GattCharacteristic1") == 0)
                {
                    if (ieq(uuid, impl.cfg.cmd_uuid))
                        cmd = path;
                    else if (ieq(uuid, impl.cfg.status_uuid))
                        status = path;
                }
                else if (std::strcmp(iface, "org.bluez.GattDescriptor1") == 0 &&
                         ieq(uuid, impl.cfg.cccd_uuid))
                    descriptors.emplace_back(path, uuid);
            }
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                break;  // {sa{sv}}
        }
        if (r < 0)
            break;
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            break;  // a{sa{sv}}
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            break;  // {oa{sa{sv}}}
    }

done:
    if (reply)
        sd_bus_message_unref(reply);
    sd_bus_error_free(&err);

    if (!status.empty())
    {
        for (const auto &d : descriptors)
        {
            if (d.first.rfind(status + "/", 0) == 0)
                cccd = d.first;
        }
    }

    l.svc_path    = svc;
    l.cmd_path    = cmd;
    l.status_path = status;
    l.cccd_path   = cccd;

    const bool have_all = !svc.empty() && !cmd.empty() && !status.empty();
    if (have_all)
        LOG_INFO("[BLUEZ] GATT discovered: svc=%s cmd=%s status=%s cccd=%s", svc.c_str(),
                 cmd.c_str(), status.c_str(), cccd.empty() ? "-" : cccd.c_str());
    return have_all;
}
#endif

}  // namespace transport
