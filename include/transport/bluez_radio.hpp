#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "transport/radio.hpp"
#include "util/constants.hpp"

namespace transport
{

struct BluezConfig
{
    std::string adapter     = "hci0";
    std::string svc_uuid    = std::string(constants::SVC_UUID);
    std::string cmd_uuid    = std::string(constants::CMD_UUID);     // Write
    std::string status_uuid = std::string(constants::STATUS_UUID);  // Notify
    std::string cccd_uuid   = std::string(constants::CCCD_UUID);
    bool        service_filter = false;  // only report devices advertising svc_uuid
};

// BlueZ over sd-bus. open()/process()/close() belong to the radio host thread;
// everything else may be called from any thread, all bus access runs under bus_mu.
// One link at a time.
class BluezRadio final : public IRadio
{
  public:
    explicit BluezRadio(BluezConfig cfg);
    ~BluezRadio() override;

    BluezRadio(const BluezRadio &)            = delete;
    BluezRadio &operator=(const BluezRadio &) = delete;

    bool open() override;
    void close() override;
    bool is_open() const override;
    void process(std::uint32_t wait_ms) override;

    bool start_scan(OnSighting on_sighting, OnScanError on_error) override;
    bool stop_scan() override;

    std::unique_ptr<ILink> open_link(const std::string &address, LinkCallbacks cb) override;
    std::string            name() const override { return "bluez:" + cfg_.adapter; }

    const BluezConfig &config() const { return cfg_; }

    // state shared with the sd-bus signal handlers (bluez_signals.cpp)
    struct Impl;

  private:
    friend class BluezLink;

    // link operations, keyed by the link id handed to BluezLink
    bool link_discover_services(std::uint64_t id);
    bool link_enable_notify(std::uint64_t id);
    bool link_write(std::uint64_t id, const Frame &f);
    void link_disconnect(std::uint64_t id);
    void link_release(std::uint64_t id);

    bool set_discovery_filter_locked();
    bool cold_scan_locked();

    BluezConfig           cfg_;
    std::unique_ptr<Impl> impl_;
};

class BluezLink final : public ILink
{
  public:
    BluezLink(BluezRadio &radio, std::uint64_t id, std::string address)
        : radio_(radio), id_(id), addr_(std::move(address))
    {
    }
    ~BluezLink() override { radio_.link_release(id_); }

    bool        discover_services() override { return radio_.link_discover_services(id_); }
    bool        enable_notify() override { return radio_.link_enable_notify(id_); }
    bool        write(const Frame &f) override { return radio_.link_write(id_, f); }
    void        disconnect() override { radio_.link_disconnect(id_); }
    std::string address() const override { return addr_; }

  private:
    BluezRadio   &radio_;
    std::uint64_t id_;
    std::string   addr_;
};

}  // namespace transport
