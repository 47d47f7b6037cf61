#pragma once
#include <cstdint>
#include <memory>
#include <optional>

#include "discovery/scan_state.hpp"
#include "transport/radio.hpp"
#include "util/clock.hpp"
#include "util/executor.hpp"
#include "util/observable.hpp"

namespace discovery
{

struct DiscoveryConfig
{
    std::int64_t    scan_duration_ms = 5000;
    util::EpochClock clock           = util::epoch_ms;
};

class DiscoveryEngine
{
  public:
    DiscoveryEngine(transport::IRadio &radio, util::IExecutor &exec, DiscoveryConfig cfg = {});
    ~DiscoveryEngine();

    DiscoveryEngine(const DiscoveryEngine &)            = delete;
    DiscoveryEngine &operator=(const DiscoveryEngine &) = delete;

    void start_scan();
    void stop_scan();

    util::Observable<ScanState> &scan_state() { return state_; }
    // Lookup in the current Scanning/Complete set.
    std::optional<DiscoveredDevice> find(const std::string &address) const;

  private:
    // executor-only below
    void start_scan_on_loop();
    void stop_scan_on_loop();
    void teardown_on_loop();
    void on_sighting(std::uint64_t gen, const transport::Sighting &s);
    void on_scan_error(std::uint64_t gen, int code);
    void on_timeout(std::uint64_t gen);
    bool scanning() const;

    transport::IRadio &radio_;
    util::IExecutor   &exec_;
    DiscoveryConfig    cfg_;

    util::Observable<ScanState> state_{ScanIdle{}};

    DeviceList    devices_;          // working set of the running scan
    std::uint64_t generation_{0};    // bumps whenever a scan ends
    util::TimerId timeout_id_{0};
    bool          radio_active_{false};
    // expires when the engine goes away; queued callbacks check it first
    std::shared_ptr<int> token_ = std::make_shared<int>(0);
};

}  // namespace discovery
