// include/transport/bluez_radio_impl.hpp
#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "transport/bluez_radio.hpp"

struct sd_bus;
struct sd_bus_slot;

namespace transport
{

struct BluezRadio::Impl
{
    explicit Impl(const BluezConfig &c) : cfg(c) {}

    const BluezConfig &cfg;

#if LIFTRR_HAVE_SDBUS
    sd_bus      *bus          = nullptr;
    sd_bus_slot *added_slot   = nullptr;  // ObjectManager.InterfacesAdded
    sd_bus_slot *removed_slot = nullptr;  // ObjectManager.InterfacesRemoved
    sd_bus_slot *props_slot   = nullptr;  // Properties.PropertiesChanged
#endif

    // serialize all sd-bus access; signal handlers run with it held
    std::mutex bus_mu;

    std::string adapter_path;  // "/org/bluez/hci0"
    std::string unique_name;   // our bus unique name (debug)
    bool        discovery_on{false};

    // ---- scan (guarded by bus_mu) ----
    bool        scanning{false};
    OnSighting  on_sighting{};
    OnScanError on_scan_error{};

    // ---- the single link (guarded by bus_mu) ----
    struct Link
    {
        std::uint64_t id = 0;
        std::string   address;
        std::string   dev_path;
        std::string   svc_path;
        std::string   cmd_path;     // command characteristic (write)
        std::string   status_path;  // status characteristic (notify)
        std::string   cccd_path;
        LinkCallbacks cb{};
#if LIFTRR_HAVE_SDBUS
        sd_bus_slot *connect_call_slot = nullptr;
#endif
        bool connected{false};
        bool services_wanted{false};    // discover_services() asked, not yet reported
        bool notifying{false};
    };
    std::optional<Link> link;
    std::uint64_t       next_link_id{1};
};

// A running scan ended underneath us. bus_mu must be held. Clears the scan
// callbacks and fires on_scan_error(code) once; false when no scan was running.
bool scan_lost_locked(BluezRadio::Impl &impl, int code);

#if LIFTRR_HAVE_SDBUS
// GetManagedObjects walk under link->dev_path; fills svc/cmd/status/cccd paths.
// bus_mu must be held. True once service, command and status are known.
bool find_gatt_paths_locked(BluezRadio::Impl &impl);
#endif

}  // namespace transport
