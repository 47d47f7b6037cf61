/* ======================================================================
 * ConnectionEngine — one link, one pending connect
 *
 *   Disconnected/Error --connect()--> Connecting --status!=0---------> Error     (LinkFailed)
 *                                          |     --Connected---------> Connected (Ok)
 *                                          |     --Disconnected------> Disconnected (LinkLost)
 *                                          '-----cancel/disconnect--> Disconnected (Cancelled)
 *   Connected --link drop / disconnect()--> Disconnected
 *
 *  Each opened link runs under an attempt number. Releasing the link bumps
 *  it, so late radio callbacks for a released handle are ignored.
 * ====================================================================== */

#include <string>
#include <utility>
#include <vector>

#include "conn/connection_engine.hpp"
#include "util/log.hpp"

namespace conn
{

using transport::LinkState;

const char *state_name(const ConnectionState &s)
{
    struct Namer
    {
        const char *operator()(const ConnDisconnected &) const { return "Disconnected"; }
        const char *operator()(const ConnConnecting &) const { return "Connecting"; }
        const char *operator()(const ConnConnected &) const { return "Connected"; }
        const char *operator()(const ConnError &) const { return "Error"; }
    };
    return std::visit(Namer{}, s);
}

const char *status_name(ConnectResult::Status s)
{
    switch (s)
    {
        case ConnectResult::Status::Ok:
            return "ok";
        case ConnectResult::Status::AlreadyConnected:
            return "already-connected";
        case ConnectResult::Status::InProgress:
            return "in-progress";
        case ConnectResult::Status::LinkFailed:
            return "link-failed";
        case ConnectResult::Status::LinkLost:
            return "link-lost";
        case ConnectResult::Status::Cancelled:
            return "cancelled";
        case ConnectResult::Status::RadioUnavailable:
            return "radio-unavailable";
    }
    return "?";
}

ConnectionEngine::ConnectionEngine(transport::IRadio &radio, util::IExecutor &exec,
                                   util::EpochClock clock)
    : radio_(radio), exec_(exec), clock_(std::move(clock))
{
    if (!clock_)
        clock_ = util::epoch_ms;
}

ConnectionEngine::~ConnectionEngine()
{
    auto finish = [this] {
        release_link();
        resolve(ConnectResult::Status::Cancelled, 0, "connection engine shut down");
        token_.reset();
    };
    if (!exec_.dispatch_sync(finish))
        finish();
}

std::future<ConnectResult> ConnectionEngine::connect(const discovery::DiscoveredDevice &device)
{
    auto p   = std::make_shared<std::promise<ConnectResult>>();
    auto fut = p->get_future();
    bool ran = exec_.dispatch_sync([this, &device, p] { connect_on_loop(device, std::move(*p)); });
    if (!ran)
        p->set_value(ConnectResult{ConnectResult::Status::RadioUnavailable, 0,
                                   "connection engine stopped"});
    return fut;
}

void ConnectionEngine::disconnect()
{
    exec_.dispatch_sync([this] {
        if (connecting())
        {
            LOG_INFO("[LINK] disconnect while connecting, cancelling");
            release_link();
            state_.set(ConnDisconnected{});
            resolve(ConnectResult::Status::Cancelled, 0, "connect cancelled by disconnect");
            return;
        }
        if (!link_)
        {
            LOG_DEBUG("[LINK] disconnect: no link");
            if (!std::holds_alternative<ConnDisconnected>(state_.value()))
                state_.set(ConnDisconnected{});
            return;
        }
        release_link();
        LOG_SYSTEM("[LINK] disconnected from %s", target_.address.c_str());
        state_.set(ConnDisconnected{});
    });
}

void ConnectionEngine::cancel_connect()
{
    exec_.dispatch_sync([this] {
        if (!connecting())
            return;
        release_link();
        LOG_SYSTEM("[LINK] connect to %s cancelled", target_.address.c_str());
        state_.set(ConnDisconnected{});
        resolve(ConnectResult::Status::Cancelled, 0, "connect cancelled");
    });
}

bool ConnectionEngine::send(const proto::Command &cmd)
{
    bool ok = false;
    exec_.dispatch_sync([this, &cmd, &ok] {
        if (!connected() || !link_)
        {
            LOG_WARN("[CMD] %s dropped: not connected", cmd.name.c_str());
            return;
        }
        const auto bytes = proto::encode(cmd, clock_);
        ok               = link_->write(bytes);
        if (ok)
            LOG_INFO("[CMD] %s (%zu bytes)", cmd.name.c_str(), bytes.size());
        else
            LOG_ERROR("[CMD] %s: write failed", cmd.name.c_str());
    });
    return ok;
}

std::size_t ConnectionEngine::on_status(StatusListener l)
{
    std::lock_guard<std::mutex> lk(listeners_mu_);
    const std::size_t           id = next_listener_++;
    listeners_.emplace(id, std::move(l));
    return id;
}

void ConnectionEngine::remove_status_listener(std::size_t id)
{
    std::lock_guard<std::mutex> lk(listeners_mu_);
    listeners_.erase(id);
}

bool ConnectionEngine::connected() const
{
    return std::holds_alternative<ConnConnected>(state_.value());
}

bool ConnectionEngine::connecting() const
{
    return std::holds_alternative<ConnConnecting>(state_.value());
}

// ======================================================================
// Function: ConnectionEngine::connect_on_loop
// - In: executor thread, target device, promise of the caller
// - Out: Connecting with a fresh link handle, or an immediate result
// - Note: rejected while Connected or Connecting, state untouched
// ======================================================================
void ConnectionEngine::connect_on_loop(const discovery::DiscoveredDevice &device,
                                       std::promise<ConnectResult>        p)
{
    if (connected())
    {
        LOG_WARN("[LINK] connect(%s) rejected: already connected", device.address.c_str());
        p.set_value(ConnectResult{ConnectResult::Status::AlreadyConnected, 0, "already connected"});
        return;
    }
    if (connecting())
    {
        LOG_WARN("[LINK] connect(%s) rejected: connect in progress", device.address.c_str());
        p.set_value(ConnectResult{ConnectResult::Status::InProgress, 0, "connect in progress"});
        return;
    }

    release_link();
    pending_.emplace(std::move(p));
    target_    = device;
    state_.set(ConnConnecting{});
    LOG_SYSTEM("[LINK] connecting to %s (%s)", device.address.c_str(), device.name.c_str());

    const std::uint64_t attempt = attempt_;
    std::weak_ptr<int>  w       = token_;
    util::IExecutor    *exec    = &exec_;

    transport::LinkCallbacks cb;
    cb.on_state = [this, exec, w, attempt](int status, LinkState st) {
        exec->post([this, w, attempt, status, st] {
            if (w.expired())
                return;
            on_link_state(attempt, status, st);
        });
    };
    cb.on_services = [this, exec, w, attempt](int status) {
        exec->post([this, w, attempt, status] {
            if (w.expired())
                return;
            on_services(attempt, status);
        });
    };
    cb.on_notify = [this, exec, w, attempt](const transport::Frame &f) {
        exec->post([this, w, attempt, f] {
            if (w.expired())
                return;
            on_notify(attempt, f);
        });
    };

    link_ = radio_.open_link(device.address, std::move(cb));
    if (!link_)
    {
        const std::string msg = "Connection failed: radio unavailable";
        LOG_SYSTEM("[LINK] %s", msg.c_str());
        ++attempt_;
        state_.set(ConnError{msg});
        resolve(ConnectResult::Status::RadioUnavailable, 0, msg);
    }
}

void ConnectionEngine::on_link_state(std::uint64_t attempt, int status, LinkState st)
{
    if (attempt != attempt_ || !link_)
        return;

    if (connecting())
    {
        if (status != transport::STATUS_SUCCESS)
        {
            const std::string msg = "Connection failed: " + std::to_string(status);
            LOG_SYSTEM("[LINK] %s", msg.c_str());
            release_link();
            state_.set(ConnError{msg});
            resolve(ConnectResult::Status::LinkFailed, status, msg);
            return;
        }
        if (st == LinkState::Connected)
        {
            LOG_SYSTEM("[LINK] connected to %s", target_.address.c_str());
            state_.set(ConnConnected{target_});
            resolve(ConnectResult::Status::Ok, status, "connected");
            if (link_ && !link_->discover_services())
                LOG_WARN("[LINK] service discovery could not start");
            return;
        }
        LOG_SYSTEM("[LINK] %s dropped before connecting", target_.address.c_str());
        release_link();
        state_.set(ConnDisconnected{});
        resolve(ConnectResult::Status::LinkLost, status, "link lost before connecting");
        return;
    }

    if (!connected())
        return;
    if (status != transport::STATUS_SUCCESS)
    {
        const std::string msg = "Connection failed: " + std::to_string(status);
        LOG_SYSTEM("[LINK] %s on %s", msg.c_str(), target_.address.c_str());
        release_link();
        state_.set(ConnError{msg});
        return;
    }
    if (st == LinkState::Disconnected)
    {
        LOG_SYSTEM("[LINK] lost %s", target_.address.c_str());
        release_link();
        state_.set(ConnDisconnected{});
    }
}

void ConnectionEngine::on_services(std::uint64_t attempt, int status)
{
    if (attempt != attempt_ || !link_ || !connected())
        return;
    if (status != transport::STATUS_SUCCESS)
    {
        LOG_WARN("[LINK] service discovery failed (status %d)", status);
        return;
    }
    if (!link_->enable_notify())
    {
        LOG_WARN("[LINK] could not subscribe to status notifications");
        return;
    }
    LOG_SYSTEM("[LINK] ready, status notifications on");
}

void ConnectionEngine::on_notify(std::uint64_t attempt, const transport::Frame &f)
{
    if (attempt != attempt_ || !link_)
        return;

    const proto::StatusEvent ev = proto::decode(f);
    LOG_INFO("[STATUS] %s", proto::describe(ev).c_str());

    std::vector<StatusListener> snapshot;
    {
        std::lock_guard<std::mutex> lk(listeners_mu_);
        for (const auto &kv : listeners_)
            snapshot.push_back(kv.second);
    }
    for (const auto &l : snapshot)
        l(ev);
}

// ======================================================================
// Function: ConnectionEngine::release_link
// - Out: link asked to drop and its handle destroyed; attempt bumped
// ======================================================================
void ConnectionEngine::release_link()
{
    if (link_)
    {
        link_->disconnect();
        link_.reset();
    }
    ++attempt_;
}

void ConnectionEngine::resolve(ConnectResult::Status s, int code, std::string message)
{
    if (!pending_)
        return;
    pending_->set_value(ConnectResult{s, code, std::move(message)});
    pending_.reset();
}

}  // namespace conn
