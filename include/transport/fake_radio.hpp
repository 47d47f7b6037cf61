#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "transport/radio.hpp"

namespace transport
{

class FakeLink;

// FakeRadio: an in-memory radio to drive the engines without BLE hardware.
// Tests play the radio side through sight()/scan_error()/link_event(); the
// daemon uses the options to get a self-contained demo device.
class FakeRadio final : public IRadio
{
  public:
    struct Options
    {
        std::vector<Sighting> advertise;             // reported on every start_scan
        bool                  auto_connect = false;  // open_link reports Connected at once
        bool                  echo_writes  = false;  // writes come back as notifications
    };

    FakeRadio() = default;
    explicit FakeRadio(Options opts) : opts_(std::move(opts)) {}

    bool open() override;
    void close() override;
    bool is_open() const override;
    void process(std::uint32_t wait_ms) override;

    bool start_scan(OnSighting on_sighting, OnScanError on_error) override;
    bool stop_scan() override;

    std::unique_ptr<ILink> open_link(const std::string &address, LinkCallbacks cb) override;
    std::string            name() const override { return "fake"; }

    // ---- radio side, driven by tests ----
    void sight(const Sighting &s);
    void scan_error(int code);
    void link_event(int status, LinkState state);
    void services_event(int status);
    void notify(const Frame &f);

    void set_fail_scan_start(bool v) { fail_scan_start_ = v; }
    void set_refuse_links(bool v) { refuse_links_ = v; }

    // ---- counters ----
    bool                 scanning() const;
    std::size_t          scan_starts() const { return scan_starts_; }
    std::size_t          scan_stops() const { return scan_stops_; }
    std::size_t          links_opened() const { return links_opened_; }
    int                  live_links() const;
    std::size_t          service_discoveries() const { return discoveries_; }
    std::size_t          notify_enables() const { return notify_enables_; }
    std::size_t          disconnect_requests() const { return disconnects_; }
    std::vector<Frame>   written() const;
    std::optional<std::string> last_link_address() const;

  private:
    friend class FakeLink;
    void link_closed();

    Options opts_;

    mutable std::mutex mu_;
    bool               open_{false};
    bool               scanning_{false};
    bool               fail_scan_start_{false};
    bool               refuse_links_{false};
    OnSighting         on_sighting_{};
    OnScanError        on_scan_error_{};
    LinkCallbacks      link_cb_{};
    std::optional<std::string> link_addr_{};
    std::vector<Frame> written_;

    std::size_t scan_starts_{0};
    std::size_t scan_stops_{0};
    std::size_t links_opened_{0};
    int         live_links_{0};
    std::size_t discoveries_{0};
    std::size_t notify_enables_{0};
    std::size_t disconnects_{0};
};

class FakeLink final : public ILink
{
  public:
    FakeLink(FakeRadio &radio, std::string address) : radio_(radio), addr_(std::move(address)) {}
    ~FakeLink() override { radio_.link_closed(); }

    bool        discover_services() override;
    bool        enable_notify() override;
    bool        write(const Frame &f) override;
    void        disconnect() override;
    std::string address() const override { return addr_; }

  private:
    FakeRadio  &radio_;
    std::string addr_;
};

}  // namespace transport
