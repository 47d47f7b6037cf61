#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace transport
{

using Frame = std::vector<std::uint8_t>;

// Link status codes, numbered after the GATT status values devices report
inline constexpr int STATUS_SUCCESS      = 0;
inline constexpr int STATUS_ERROR        = 133;    // generic link error
inline constexpr int STATUS_FAILURE      = 257;    // operation failed
inline constexpr int SCAN_UNAVAILABLE    = -1;     // radio could not start scanning
inline constexpr int SCAN_INTERRUPTED    = -2;     // adapter stopped discovering mid-scan
inline constexpr int SCAN_ADAPTER_GONE   = -3;     // adapter powered off or removed

// One advertisement seen during discovery
struct Sighting
{
    std::string                address;  // "AA:BB:CC:DD:EE:FF"
    std::optional<std::string> name;
    std::int16_t               rssi = 0;
};

using OnSighting  = std::function<void(const Sighting &)>;
using OnScanError = std::function<void(int error_code)>;

enum class LinkState
{
    Connected,
    Disconnected
};

// Fired on the radio's callback context; receivers must hop to their own executor.
struct LinkCallbacks
{
    std::function<void(int status, LinkState state)> on_state;
    std::function<void(int status)>                  on_services;
    std::function<void(const Frame &)>               on_notify;
};

// One physical link handle. Destroying it releases the handle.
struct ILink
{
    virtual bool        discover_services() = 0;
    virtual bool        enable_notify()     = 0;  // subscribe to the status channel
    virtual bool        write(const Frame &f) = 0;  // command channel, one write
    virtual void        disconnect()        = 0;  // request link drop, handle stays valid
    virtual std::string address() const     = 0;
    virtual ~ILink() = default;
};

struct IRadio
{
    // Host side: acquire/release the radio and pump its callback context.
    virtual bool open()                      = 0;
    virtual void close()                     = 0;
    virtual bool is_open() const             = 0;
    virtual void process(std::uint32_t wait_ms) = 0;

    // Discovery: false when scanning could not start.
    virtual bool start_scan(OnSighting on_sighting, OnScanError on_error) = 0;
    virtual bool stop_scan()                                              = 0;

    // Connection: nullptr when no link could be opened.
    virtual std::unique_ptr<ILink> open_link(const std::string &address, LinkCallbacks cb) = 0;

    virtual std::string name() const { return ""; }
    virtual ~IRadio() = default;
};

}  // namespace transport
