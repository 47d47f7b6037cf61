#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <thread>

#include "fake_host.hpp"
#include "host/radio_host.hpp"
#include "host/service_lifecycle.hpp"
#include "transport/fake_radio.hpp"
#include "util/executor.hpp"

using namespace std::chrono_literals;

TEST(ServiceLifecycle, RunningOnlyAfterBindAcknowledged)
{
    FakeHost               h;
    util::ManualExecutor   exec;
    host::ServiceLifecycle lc(h, exec);

    ASSERT_TRUE(lc.start_service());
    EXPECT_EQ(h.launches, 1);
    EXPECT_EQ(h.binds, 1);
    EXPECT_FALSE(lc.is_service_running().value());

    h.ack();
    exec.run_pending();
    EXPECT_TRUE(lc.is_service_running().value());
}

TEST(ServiceLifecycle, SecondStartIsNoOpWhileStartingOrRunning)
{
    FakeHost               h;
    util::ManualExecutor   exec;
    host::ServiceLifecycle lc(h, exec);

    ASSERT_TRUE(lc.start_service());
    EXPECT_FALSE(lc.start_service());  // still waiting for the bind
    h.ack();
    exec.run_pending();
    EXPECT_FALSE(lc.start_service());  // running
    EXPECT_EQ(h.launches, 1);
    EXPECT_EQ(h.binds, 1);
}

TEST(ServiceLifecycle, StopUnbindsAndShutsDown)
{
    FakeHost               h;
    util::ManualExecutor   exec;
    host::ServiceLifecycle lc(h, exec);
    lc.start_service();
    h.ack();
    exec.run_pending();

    lc.stop_service();
    EXPECT_EQ(h.unbinds, 1);
    EXPECT_EQ(h.shutdowns, 1);
    EXPECT_FALSE(lc.is_service_running().value());
}

TEST(ServiceLifecycle, NotBoundDuringStopIsIgnored)
{
    FakeHost h;
    h.unbind_ok = false;
    util::ManualExecutor   exec;
    host::ServiceLifecycle lc(h, exec);
    lc.start_service();
    h.ack();
    exec.run_pending();

    testing::internal::CaptureStderr();
    lc.stop_service();
    const std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("not bound (ignored)"), std::string::npos);
    EXPECT_EQ(h.shutdowns, 1);
    EXPECT_FALSE(lc.is_service_running().value());
}

TEST(ServiceLifecycle, StopWithoutStartStillMarksStopped)
{
    FakeHost               h;
    util::ManualExecutor   exec;
    host::ServiceLifecycle lc(h, exec);
    lc.stop_service();
    EXPECT_EQ(h.unbinds, 0);
    EXPECT_EQ(h.shutdowns, 1);
    EXPECT_FALSE(lc.is_service_running().value());
}

TEST(ServiceLifecycle, LateAckAfterStopIsIgnored)
{
    FakeHost               h;
    util::ManualExecutor   exec;
    host::ServiceLifecycle lc(h, exec);
    lc.start_service();
    h.ack();  // queued, not yet applied
    lc.stop_service();
    exec.run_pending();
    EXPECT_FALSE(lc.is_service_running().value());

    // a new start works after the stale ack was dropped
    EXPECT_TRUE(lc.start_service());
}

TEST(ServiceLifecycle, HostDeathMarksNotRunning)
{
    FakeHost               h;
    util::ManualExecutor   exec;
    host::ServiceLifecycle lc(h, exec);
    lc.start_service();
    h.ack();
    exec.run_pending();
    ASSERT_TRUE(lc.is_service_running().value());

    h.die();
    exec.run_pending();
    EXPECT_FALSE(lc.is_service_running().value());
    EXPECT_TRUE(lc.start_service());
}

TEST(ServiceLifecycle, FailedBindShutsHostDown)
{
    FakeHost h;
    h.bind_ok = false;
    util::ManualExecutor   exec;
    host::ServiceLifecycle lc(h, exec);
    EXPECT_FALSE(lc.start_service());
    EXPECT_EQ(h.shutdowns, 1);
    EXPECT_FALSE(lc.is_service_running().value());

    h.bind_ok = true;
    EXPECT_TRUE(lc.start_service());
}

TEST(ServiceLifecycle, FailedLaunchDoesNotBind)
{
    FakeHost h;
    h.launch_ok = false;
    util::ManualExecutor   exec;
    host::ServiceLifecycle lc(h, exec);
    EXPECT_FALSE(lc.start_service());
    EXPECT_EQ(h.binds, 0);
}

// ---------------- RadioHost with a real thread ----------------

namespace
{
template <typename Pred> bool wait_until(Pred p)
{
    for (int i = 0; i < 200; ++i)
    {
        if (p())
            return true;
        std::this_thread::sleep_for(10ms);
    }
    return p();
}

// radio that never opens, as when the adapter is missing
struct DeadRadio : transport::IRadio
{
    bool open() override { return false; }
    void close() override {}
    bool is_open() const override { return false; }
    void process(std::uint32_t) override {}
    bool start_scan(transport::OnSighting, transport::OnScanError) override { return false; }
    bool stop_scan() override { return false; }
    std::unique_ptr<transport::ILink> open_link(const std::string &,
                                                transport::LinkCallbacks) override
    {
        return nullptr;
    }
};
}  // namespace

TEST(RadioHost, LifecycleOpensAndClosesRadio)
{
    transport::FakeRadio   radio;
    util::ThreadExecutor   exec;
    host::RadioHost        rh(radio, 5);
    host::ServiceLifecycle lc(rh, exec);

    ASSERT_TRUE(lc.start_service());
    ASSERT_TRUE(wait_until([&] { return lc.is_service_running().value(); }));
    EXPECT_TRUE(radio.is_open());

    lc.stop_service();
    EXPECT_FALSE(lc.is_service_running().value());
    EXPECT_FALSE(radio.is_open());

    // restart after a clean stop
    ASSERT_TRUE(lc.start_service());
    ASSERT_TRUE(wait_until([&] { return lc.is_service_running().value(); }));
    lc.stop_service();
}

TEST(RadioHost, RadioThatWontOpenNeverRuns)
{
    DeadRadio              radio;
    util::ThreadExecutor   exec;
    host::RadioHost        rh(radio, 5);
    host::ServiceLifecycle lc(rh, exec);

    // the host thread may die before or after bind; either way nothing runs
    (void)lc.start_service();
    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(lc.is_service_running().value());
    lc.stop_service();
}

TEST(RadioHost, UnbindWithoutBindReportsFalse)
{
    transport::FakeRadio radio;
    host::RadioHost      rh(radio, 5);
    EXPECT_FALSE(rh.bind({}));  // not launched
    EXPECT_FALSE(rh.unbind());
    rh.request_shutdown();
}
