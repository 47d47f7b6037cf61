/* ======================================================================
 * DiscoveryEngine — scan lifecycle
 *
 *  Caller thread            Executor                              Radio host thread
 *  -------------            --------                              -----------------
 *  start_scan() ──sync──▶  teardown previous, clear set
 *                           radio.start_scan(cb) ───────────────▶  discovery on
 *                           state = Scanning{}
 *                           schedule(timeout)
 *                                        ◀── post(on_sighting) ───  sighting
 *                           merge by address, publish if changed
 *                                        ◀── post(on_scan_error) ─  radio error
 *                           state = Error{msg}, radio released
 *                           timeout fires:
 *                           state = Complete{devices}, radio released
 *  stop_scan()  ──sync──▶  cancel timer, state = Complete{so far}
 *
 *  Every scan runs under a generation number; callbacks carrying an old
 *  generation are dropped, so nothing leaks from a scan that already ended.
 * ====================================================================== */

#include <algorithm>
#include <string>
#include <utility>

#include "discovery/discovery_engine.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace discovery
{

const char *state_name(const ScanState &s)
{
    struct Namer
    {
        const char *operator()(const ScanIdle &) const { return "Idle"; }
        const char *operator()(const ScanScanning &) const { return "Scanning"; }
        const char *operator()(const ScanComplete &) const { return "Complete"; }
        const char *operator()(const ScanError &) const { return "Error"; }
    };
    return std::visit(Namer{}, s);
}

DeviceList devices_of(const ScanState &s)
{
    struct Picker
    {
        DeviceList operator()(const ScanIdle &) const { return {}; }
        DeviceList operator()(const ScanScanning &v) const { return v.devices; }
        DeviceList operator()(const ScanComplete &v) const { return v.devices; }
        DeviceList operator()(const ScanError &) const { return {}; }
    };
    return std::visit(Picker{}, s);
}

DiscoveryEngine::DiscoveryEngine(transport::IRadio &radio,
                                 util::IExecutor   &exec,
                                 DiscoveryConfig    cfg)
    : radio_(radio), exec_(exec), cfg_(std::move(cfg))
{
    if (!cfg_.clock)
        cfg_.clock = util::epoch_ms;
}

DiscoveryEngine::~DiscoveryEngine()
{
    auto finish = [this] {
        teardown_on_loop();
        token_.reset();
    };
    if (!exec_.dispatch_sync(finish))
        finish();  // executor already stopped, nothing else runs
}

void DiscoveryEngine::start_scan()
{
    exec_.dispatch_sync([this] { start_scan_on_loop(); });
}

void DiscoveryEngine::stop_scan()
{
    exec_.dispatch_sync([this] { stop_scan_on_loop(); });
}

std::optional<DiscoveredDevice> DiscoveryEngine::find(const std::string &address) const
{
    for (const auto &d : devices_of(state_.value()))
    {
        if (d.address == address)
            return d;
    }
    return std::nullopt;
}

bool DiscoveryEngine::scanning() const
{
    return std::holds_alternative<ScanScanning>(state_.value());
}

// ======================================================================
// Function: DiscoveryEngine::start_scan_on_loop
// - In: executor thread
// - Out: Scanning{} with the radio active and the timeout armed, or Error
// - Note: no-op while a scan is running
// ======================================================================
void DiscoveryEngine::start_scan_on_loop()
{
    if (scanning())
    {
        LOG_DEBUG("[SCAN] already scanning, ignoring start");
        return;
    }

    teardown_on_loop();
    devices_.clear();

    const std::uint64_t gen  = generation_;
    std::weak_ptr<int>  w    = token_;
    util::IExecutor    *exec = &exec_;

    bool ok = radio_.start_scan(
        [this, exec, w, gen](const transport::Sighting &s) {
            exec->post([this, w, gen, s] {
                if (w.expired())
                    return;
                on_sighting(gen, s);
            });
        },
        [this, exec, w, gen](int code) {
            exec->post([this, w, gen, code] {
                if (w.expired())
                    return;
                on_scan_error(gen, code);
            });
        });

    if (!ok)
    {
        const std::string msg =
            "BLE scan failed with error code: " + std::to_string(transport::SCAN_UNAVAILABLE);
        LOG_SYSTEM("[SCAN] %s", msg.c_str());
        state_.set(ScanError{msg});
        return;
    }

    radio_active_ = true;
    state_.set(ScanScanning{});
    LOG_SYSTEM("[SCAN] started (budget %lld ms)", (long long)cfg_.scan_duration_ms);

    timeout_id_ = exec_.schedule(static_cast<std::uint64_t>(cfg_.scan_duration_ms),
                                 [this, w, gen] {
                                     if (w.expired())
                                         return;
                                     on_timeout(gen);
                                 });
}

void DiscoveryEngine::stop_scan_on_loop()
{
    DeviceList current;
    if (scanning())
        current = devices_;

    teardown_on_loop();
    devices_.clear();
    LOG_SYSTEM("[SCAN] stopped with %zu device(s)", current.size());
    state_.set(ScanComplete{std::move(current)});
}

// ======================================================================
// Function: DiscoveryEngine::teardown_on_loop
// - In: executor thread
// - Out: timer cancelled, radio scan released, generation bumped
// - Note: a radio that reports nothing to stop is logged and ignored
// ======================================================================
void DiscoveryEngine::teardown_on_loop()
{
    if (timeout_id_)
    {
        (void)exec_.cancel(timeout_id_);
        timeout_id_ = 0;
    }
    if (radio_active_)
    {
        if (!radio_.stop_scan())
            LOG_WARN("[SCAN] radio had no active scan to stop (ignored)");
        radio_active_ = false;
    }
    ++generation_;
}

void DiscoveryEngine::on_sighting(std::uint64_t gen, const transport::Sighting &s)
{
    if (gen != generation_ || !scanning())
        return;
    if (s.address.empty())
        return;

    const std::string name =
        (s.name && !s.name->empty()) ? *s.name : std::string(constants::UNKNOWN_DEVICE);
    const std::int64_t now = cfg_.clock();

    auto it = std::find_if(devices_.begin(), devices_.end(),
                           [&](const DiscoveredDevice &d) { return d.address == s.address; });
    bool changed = false;
    if (it == devices_.end())
    {
        devices_.push_back(DiscoveredDevice{s.address, name, s.rssi, now});
        changed = true;
        LOG_INFO("[SCAN] found %s name='%s' rssi=%d", s.address.c_str(), name.c_str(),
                 (int)s.rssi);
    }
    else
    {
        DiscoveredDevice upd = *it;
        upd.rssi             = s.rssi;
        upd.last_seen        = now;
        if (s.name && !s.name->empty())
            upd.name = *s.name;
        changed = (upd != *it);
        *it     = std::move(upd);
    }

    if (changed)
        state_.set(ScanScanning{devices_});
}

void DiscoveryEngine::on_scan_error(std::uint64_t gen, int code)
{
    if (gen != generation_ || !scanning())
        return;

    teardown_on_loop();
    devices_.clear();
    const std::string msg = "BLE scan failed with error code: " + std::to_string(code);
    LOG_SYSTEM("[SCAN] %s", msg.c_str());
    state_.set(ScanError{msg});
}

void DiscoveryEngine::on_timeout(std::uint64_t gen)
{
    if (gen != generation_ || !scanning())
        return;

    timeout_id_ = 0;  // already fired
    teardown_on_loop();
    DeviceList found = std::move(devices_);
    devices_.clear();
    LOG_SYSTEM("[SCAN] complete: %zu device(s)", found.size());
    state_.set(ScanComplete{std::move(found)});
}

}  // namespace discovery
