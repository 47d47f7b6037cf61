#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <thread>

#include "host/host.hpp"
#include "transport/radio.hpp"

namespace host
{

// Runs the radio on a dedicated thread: open, pump process() until shutdown, close.
// That thread is the context every radio callback fires on.
class RadioHost final : public IHost
{
  public:
    explicit RadioHost(transport::IRadio &radio, std::uint32_t pump_ms = 100);
    ~RadioHost() override;

    RadioHost(const RadioHost &)            = delete;
    RadioHost &operator=(const RadioHost &) = delete;

    bool launch() override;
    bool bind(HostCallbacks cb) override;
    bool unbind() override;
    void request_shutdown() override;

    bool launched() const { return thr_.joinable(); }

  private:
    void run();
    void ack_bound_locked(std::unique_lock<std::mutex> &lk);

    transport::IRadio &radio_;
    std::uint32_t      pump_ms_;

    std::mutex    mu_;
    HostCallbacks cb_{};
    bool          bound_{false};
    bool          acked_{false};
    bool          radio_open_{false};

    std::atomic<bool> stop_{false};
    std::atomic<bool> alive_{false};
    std::thread       thr_;
};

}  // namespace host
