#pragma once
#include <chrono>
#include <cstddef>
#include <future>
#include <utility>

#include "conn/connection_engine.hpp"
#include "discovery/discovery_engine.hpp"
#include "host/service_lifecycle.hpp"
#include "proto/command.hpp"

namespace app
{

// Single entry point over discovery, connection and service lifecycle.
// Holds no state of its own.
class ConnectionFacade
{
  public:
    ConnectionFacade(discovery::DiscoveryEngine &discovery, conn::ConnectionEngine &connection,
                     host::ServiceLifecycle &lifecycle)
        : discovery_(discovery), connection_(connection), lifecycle_(lifecycle)
    {
    }

    util::Observable<discovery::ScanState> &scan_state() { return discovery_.scan_state(); }
    util::Observable<conn::ConnectionState> &connection_state()
    {
        return connection_.connection_state();
    }
    util::Observable<bool> &is_service_running() { return lifecycle_.is_service_running(); }

    void start_scan() { discovery_.start_scan(); }
    void stop_scan() { discovery_.stop_scan(); }

    std::future<conn::ConnectResult> connect(const discovery::DiscoveredDevice &device)
    {
        return connection_.connect(device);
    }
    // Blocking connect with a deadline. A deadline that passes cancels the
    // attempt, so the result is always final.
    conn::ConnectResult connect_within(const discovery::DiscoveredDevice &device,
                                       std::chrono::milliseconds deadline);
    void disconnect() { connection_.disconnect(); }
    void cancel_connect() { connection_.cancel_connect(); }

    bool send(const proto::Command &cmd) { return connection_.send(cmd); }
    std::size_t on_status(conn::StatusListener l) { return connection_.on_status(std::move(l)); }

    bool start_service() { return lifecycle_.start_service(); }
    // scan first, then the link, then the host
    void stop_service();

  private:
    discovery::DiscoveryEngine &discovery_;
    conn::ConnectionEngine     &connection_;
    host::ServiceLifecycle     &lifecycle_;
};

}  // namespace app
