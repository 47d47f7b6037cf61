#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "discovery/discovery_engine.hpp"
#include "transport/fake_radio.hpp"
#include "util/executor.hpp"

using discovery::DiscoveryEngine;
using discovery::ScanComplete;
using discovery::ScanError;
using discovery::ScanScanning;
using discovery::ScanState;

namespace
{
struct DiscoveryFixture : ::testing::Test
{
    transport::FakeRadio       radio;
    util::ManualExecutor       exec;
    std::int64_t               now = 1000;
    std::vector<std::string>   transitions;
    std::unique_ptr<DiscoveryEngine> engine;

    void SetUp() override
    {
        ASSERT_TRUE(radio.open());
        discovery::DiscoveryConfig cfg;
        cfg.scan_duration_ms = 5000;
        cfg.clock            = [this] { return now; };
        engine               = std::make_unique<DiscoveryEngine>(radio, exec, cfg);
        engine->scan_state().subscribe(
            [this](const ScanState &s) { transitions.push_back(discovery::state_name(s)); });
    }

    ScanState state() { return engine->scan_state().value(); }
};
}  // namespace

TEST_F(DiscoveryFixture, SameAddressKeepsOneEntryWithLatestSignal)
{
    engine->start_scan();
    radio.sight({"AA:00:00:00:00:01", std::string("Sensor"), -70});
    exec.run_pending();
    now = 2000;
    radio.sight({"AA:00:00:00:00:01", std::string("Sensor"), -50});
    exec.run_pending();

    auto devs = discovery::devices_of(state());
    ASSERT_EQ(devs.size(), 1u);
    EXPECT_EQ(devs[0].rssi, -50);
    EXPECT_EQ(devs[0].last_seen, 2000);
    EXPECT_EQ(devs[0].name, "Sensor");
}

TEST_F(DiscoveryFixture, UnchangedSightingPublishesNothing)
{
    engine->start_scan();
    radio.sight({"AA:00:00:00:00:01", std::nullopt, -70});
    exec.run_pending();
    const auto before = transitions.size();
    radio.sight({"AA:00:00:00:00:01", std::nullopt, -70});
    exec.run_pending();
    EXPECT_EQ(transitions.size(), before);
}

TEST_F(DiscoveryFixture, MissingNameBecomesUnknownDeviceUntilLearned)
{
    engine->start_scan();
    radio.sight({"AA:00:00:00:00:01", std::nullopt, -70});
    exec.run_pending();
    EXPECT_EQ(discovery::devices_of(state())[0].name, "Unknown Device");

    radio.sight({"AA:00:00:00:00:01", std::string("Liftrr"), -71});
    exec.run_pending();
    EXPECT_EQ(discovery::devices_of(state())[0].name, "Liftrr");
}

TEST_F(DiscoveryFixture, StopWhileIdleCompletesWithoutRadio)
{
    engine->stop_scan();
    const auto c_state = engine->scan_state().value();
    auto *c = std::get_if<ScanComplete>(&c_state);
    ASSERT_NE(c, nullptr);
    EXPECT_TRUE(c->devices.empty());
    EXPECT_EQ(radio.scan_starts(), 0u);
    EXPECT_EQ(radio.scan_stops(), 0u);
}

TEST_F(DiscoveryFixture, TimeoutCompletesWithEveryUniqueDevice)
{
    engine->start_scan();
    for (int i = 0; i < 4; ++i)
    {
        radio.sight({"AA:00:00:00:00:0" + std::to_string(i), std::nullopt, (std::int16_t)(-40 - i)});
        radio.sight({"AA:00:00:00:00:0" + std::to_string(i), std::nullopt, (std::int16_t)(-60 - i)});
    }
    exec.advance(4999);
    EXPECT_TRUE(std::holds_alternative<ScanScanning>(state()));

    exec.advance(1);
    const auto c_state = engine->scan_state().value();
    auto *c = std::get_if<ScanComplete>(&c_state);
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->devices.size(), 4u);
    EXPECT_FALSE(radio.scanning());
}

TEST_F(DiscoveryFixture, TwoDevicesThenTimeoutKeepsFirstSightingOrder)
{
    engine->start_scan();
    radio.sight({"AA:AA:AA:AA:AA:AA", std::string("A"), -55});
    radio.sight({"BB:BB:BB:BB:BB:BB", std::string("B"), -90});
    exec.advance(5000);

    const auto c_state = engine->scan_state().value();
    auto *c = std::get_if<ScanComplete>(&c_state);
    ASSERT_NE(c, nullptr);
    ASSERT_EQ(c->devices.size(), 2u);
    EXPECT_EQ(c->devices[0].address, "AA:AA:AA:AA:AA:AA");
    EXPECT_EQ(c->devices[0].rssi, -55);
    EXPECT_EQ(c->devices[1].address, "BB:BB:BB:BB:BB:BB");
    EXPECT_EQ(c->devices[1].rssi, -90);
    EXPECT_EQ(transitions.front(), "Scanning");
    EXPECT_EQ(transitions.back(), "Complete");
}

TEST_F(DiscoveryFixture, RadioErrorEndsScanWithMessage)
{
    engine->start_scan();
    radio.sight({"AA:00:00:00:00:01", std::nullopt, -70});
    radio.scan_error(2);
    exec.run_pending();

    const auto e_state = engine->scan_state().value();
    auto *e = std::get_if<ScanError>(&e_state);
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->message, "BLE scan failed with error code: 2");
    EXPECT_FALSE(radio.scanning());
    EXPECT_EQ(exec.pending_timers(), 0u);
}

TEST_F(DiscoveryFixture, AdapterLossMidScanIsErrorNotComplete)
{
    engine->start_scan();
    exec.advance(2000);
    radio.scan_error(transport::SCAN_ADAPTER_GONE);
    exec.run_pending();
    exec.advance(5000);

    const auto e_state = engine->scan_state().value();
    auto *e = std::get_if<ScanError>(&e_state);
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->message, "BLE scan failed with error code: -3");
    EXPECT_EQ(transitions.back(), "Error");
}

TEST_F(DiscoveryFixture, RadioThatCannotScanReportsMinusOne)
{
    radio.set_fail_scan_start(true);
    engine->start_scan();
    const auto e_state = engine->scan_state().value();
    auto *e = std::get_if<ScanError>(&e_state);
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->message, "BLE scan failed with error code: -1");
    EXPECT_EQ(exec.pending_timers(), 0u);
}

TEST_F(DiscoveryFixture, StartWhileScanningIsIgnored)
{
    engine->start_scan();
    radio.sight({"AA:00:00:00:00:01", std::nullopt, -70});
    exec.run_pending();
    engine->start_scan();
    EXPECT_EQ(radio.scan_starts(), 1u);
    EXPECT_EQ(discovery::devices_of(state()).size(), 1u);
}

TEST_F(DiscoveryFixture, NewScanStartsFromEmptySet)
{
    engine->start_scan();
    radio.sight({"AA:00:00:00:00:01", std::nullopt, -70});
    exec.advance(5000);
    ASSERT_EQ(discovery::devices_of(state()).size(), 1u);

    engine->start_scan();
    const auto s_state = engine->scan_state().value();
    auto *s = std::get_if<ScanScanning>(&s_state);
    ASSERT_NE(s, nullptr);
    EXPECT_TRUE(s->devices.empty());
    EXPECT_EQ(radio.scan_starts(), 2u);
}

TEST_F(DiscoveryFixture, StopPublishesDevicesSoFarAndDropsLateSightings)
{
    engine->start_scan();
    radio.sight({"AA:00:00:00:00:01", std::nullopt, -70});
    exec.run_pending();
    radio.sight({"AA:00:00:00:00:02", std::nullopt, -80});  // queued, not yet merged

    engine->stop_scan();
    exec.run_pending();

    const auto c_state = engine->scan_state().value();
    auto *c = std::get_if<ScanComplete>(&c_state);
    ASSERT_NE(c, nullptr);
    ASSERT_EQ(c->devices.size(), 1u);
    EXPECT_EQ(c->devices[0].address, "AA:00:00:00:00:01");
    EXPECT_FALSE(radio.scanning());
    EXPECT_EQ(exec.pending_timers(), 0u);
    EXPECT_TRUE(engine->find("AA:00:00:00:00:01").has_value());
    EXPECT_FALSE(engine->find("AA:00:00:00:00:02").has_value());
}

TEST_F(DiscoveryFixture, EngineTeardownReleasesRadio)
{
    engine->start_scan();
    ASSERT_TRUE(radio.scanning());
    engine.reset();
    EXPECT_FALSE(radio.scanning());
    EXPECT_EQ(exec.pending_timers(), 0u);
}
