#include "app/connection_facade.hpp"
#include "util/log.hpp"

namespace app
{

conn::ConnectResult ConnectionFacade::connect_within(const discovery::DiscoveredDevice &device,
                                                    std::chrono::milliseconds          deadline)
{
    auto fut = connection_.connect(device);
    if (fut.wait_for(deadline) != std::future_status::ready)
    {
        LOG_WARN("connect to %s still pending after %lld ms, cancelling", device.address.c_str(),
                 (long long)deadline.count());
        connection_.cancel_connect();
    }
    return fut.get();
}

void ConnectionFacade::stop_service()
{
    LOG_INFO("stopping service: scan, link, host");
    discovery_.stop_scan();
    connection_.disconnect();
    lifecycle_.stop_service();
}

}  // namespace app
