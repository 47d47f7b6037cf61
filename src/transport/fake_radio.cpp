#include <chrono>
#include <thread>

#include "transport/fake_radio.hpp"
#include "util/log.hpp"

namespace transport
{
// FakeRadio: stands in for the BlueZ adapter so the scan/connect pipeline
// (facade -> engines -> radio) runs without hardware.
bool FakeRadio::open()
{
    std::lock_guard<std::mutex> lk(mu_);
    open_ = true;
    return true;
}

void FakeRadio::close()
{
    std::lock_guard<std::mutex> lk(mu_);
    open_     = false;
    scanning_ = false;
    on_sighting_   = nullptr;
    on_scan_error_ = nullptr;
}

bool FakeRadio::is_open() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return open_;
}

void FakeRadio::process(std::uint32_t wait_ms)
{
    std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
}

bool FakeRadio::start_scan(OnSighting on_sighting, OnScanError on_error)
{
    std::vector<Sighting> adverts;
    OnSighting            cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!open_ || fail_scan_start_)
            return false;
        ++scan_starts_;
        scanning_      = true;
        on_sighting_   = std::move(on_sighting);
        on_scan_error_ = std::move(on_error);
        adverts        = opts_.advertise;
        cb             = on_sighting_;
    }
    for (const auto &s : adverts)
        cb(s);
    return true;
}

bool FakeRadio::stop_scan()
{
    std::lock_guard<std::mutex> lk(mu_);
    ++scan_stops_;
    const bool was = scanning_;
    scanning_      = false;
    on_sighting_   = nullptr;
    on_scan_error_ = nullptr;
    return was;
}

std::unique_ptr<ILink> FakeRadio::open_link(const std::string &address, LinkCallbacks cb)
{
    std::function<void(int, LinkState)> connected_cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!open_ || refuse_links_)
            return nullptr;
        ++links_opened_;
        ++live_links_;
        link_cb_   = std::move(cb);
        link_addr_ = address;
        if (opts_.auto_connect)
            connected_cb = link_cb_.on_state;
    }
    auto link = std::make_unique<FakeLink>(*this, address);
    if (connected_cb)
        connected_cb(STATUS_SUCCESS, LinkState::Connected);
    return link;
}

void FakeRadio::sight(const Sighting &s)
{
    OnSighting cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!scanning_)
            return;
        cb = on_sighting_;
    }
    if (cb)
        cb(s);
}

void FakeRadio::scan_error(int code)
{
    OnScanError cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!scanning_)
            return;
        cb = on_scan_error_;
    }
    if (cb)
        cb(code);
}

void FakeRadio::link_event(int status, LinkState state)
{
    std::function<void(int, LinkState)> cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        cb = link_cb_.on_state;
    }
    if (cb)
        cb(status, state);
}

void FakeRadio::services_event(int status)
{
    std::function<void(int)> cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        cb = link_cb_.on_services;
    }
    if (cb)
        cb(status);
}

void FakeRadio::notify(const Frame &f)
{
    std::function<void(const Frame &)> cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        cb = link_cb_.on_notify;
    }
    if (cb)
        cb(f);
}

bool FakeRadio::scanning() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return scanning_;
}

int FakeRadio::live_links() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return live_links_;
}

std::vector<Frame> FakeRadio::written() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return written_;
}

std::optional<std::string> FakeRadio::last_link_address() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return link_addr_;
}

void FakeRadio::link_closed()
{
    std::lock_guard<std::mutex> lk(mu_);
    --live_links_;
    link_cb_ = LinkCallbacks{};
}

// ---------------- FakeLink ----------------
bool FakeLink::discover_services()
{
    bool auto_ok = false;
    {
        std::lock_guard<std::mutex> lk(radio_.mu_);
        ++radio_.discoveries_;
        auto_ok = radio_.opts_.auto_connect;
    }
    if (auto_ok)
        radio_.services_event(STATUS_SUCCESS);
    return true;
}

bool FakeLink::enable_notify()
{
    std::lock_guard<std::mutex> lk(radio_.mu_);
    ++radio_.notify_enables_;
    return true;
}

bool FakeLink::write(const Frame &f)
{
    bool echo = false;
    {
        std::lock_guard<std::mutex> lk(radio_.mu_);
        radio_.written_.push_back(f);
        echo = radio_.opts_.echo_writes;
    }
    if (echo)
        radio_.notify(f);
    return true;
}

void FakeLink::disconnect()
{
    std::lock_guard<std::mutex> lk(radio_.mu_);
    ++radio_.disconnects_;
}

}  // namespace transport
