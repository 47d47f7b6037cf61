#pragma once
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

#include "conn/connection_state.hpp"
#include "proto/command.hpp"
#include "proto/status.hpp"
#include "transport/radio.hpp"
#include "util/clock.hpp"
#include "util/executor.hpp"
#include "util/observable.hpp"

namespace conn
{

using StatusListener = std::function<void(const proto::StatusEvent &)>;

// Owns the single link to a lift sensor. At most one link handle and one pending
// connect() exist at a time; every pending connect() resolves exactly once.
class ConnectionEngine
{
  public:
    ConnectionEngine(transport::IRadio &radio, util::IExecutor &exec,
                     util::EpochClock clock = util::epoch_ms);
    ~ConnectionEngine();

    ConnectionEngine(const ConnectionEngine &)            = delete;
    ConnectionEngine &operator=(const ConnectionEngine &) = delete;

    std::future<ConnectResult> connect(const discovery::DiscoveredDevice &device);
    void                       disconnect();
    void                       cancel_connect();

    // false unless Connected and the write was accepted
    bool send(const proto::Command &cmd);

    util::Observable<ConnectionState> &connection_state() { return state_; }

    std::size_t on_status(StatusListener l);
    void        remove_status_listener(std::size_t id);

  private:
    // executor-only below
    void connect_on_loop(const discovery::DiscoveredDevice &device,
                         std::promise<ConnectResult>        p);
    void on_link_state(std::uint64_t attempt, int status, transport::LinkState st);
    void on_services(std::uint64_t attempt, int status);
    void on_notify(std::uint64_t attempt, const transport::Frame &f);
    void release_link();
    void resolve(ConnectResult::Status s, int code, std::string message);
    bool connected() const;
    bool connecting() const;

    transport::IRadio &radio_;
    util::IExecutor   &exec_;
    util::EpochClock   clock_;

    util::Observable<ConnectionState> state_{ConnDisconnected{}};

    std::unique_ptr<transport::ILink>          link_;
    std::optional<std::promise<ConnectResult>> pending_;
    discovery::DiscoveredDevice                target_;
    std::uint64_t                              attempt_{0};  // bumps when a link is released

    std::mutex                            listeners_mu_;
    std::map<std::size_t, StatusListener> listeners_;
    std::size_t                           next_listener_{1};

    std::shared_ptr<int> token_ = std::make_shared<int>(0);
};

}  // namespace conn
