#pragma once
#include <cstdint>
#include <memory>

#include "host/host.hpp"
#include "util/executor.hpp"
#include "util/observable.hpp"

namespace host
{

// Starts/stops the radio host. Running follows the host's bind acknowledgements.
class ServiceLifecycle
{
  public:
    ServiceLifecycle(IHost &host, util::IExecutor &exec);
    ~ServiceLifecycle();

    ServiceLifecycle(const ServiceLifecycle &)            = delete;
    ServiceLifecycle &operator=(const ServiceLifecycle &) = delete;

    // false when already running or a start is still waiting for its bind
    bool start_service();
    void stop_service();

    util::Observable<bool> &is_service_running() { return running_; }

  private:
    void on_bound(std::uint64_t gen);
    void on_unbound(std::uint64_t gen);

    IHost           &host_;
    util::IExecutor &exec_;

    util::Observable<bool> running_{false};
    bool                   starting_{false};
    bool                   bound_{false};
    std::uint64_t          generation_{0};

    std::shared_ptr<int> token_ = std::make_shared<int>(0);
};

}  // namespace host
