#include <utility>

#include "host/service_lifecycle.hpp"
#include "util/log.hpp"

namespace host
{

ServiceLifecycle::ServiceLifecycle(IHost &host, util::IExecutor &exec) : host_(host), exec_(exec) {}

ServiceLifecycle::~ServiceLifecycle()
{
    auto finish = [this] { token_.reset(); };
    if (!exec_.dispatch_sync(finish))
        finish();
}

bool ServiceLifecycle::start_service()
{
    bool started = false;
    exec_.dispatch_sync([this, &started] {
        if (running_.value() || starting_)
        {
            LOG_DEBUG("[SERVICE] start ignored: %s", starting_ ? "starting" : "running");
            return;
        }
        if (!host_.launch())
        {
            LOG_ERROR("[SERVICE] host launch failed");
            return;
        }

        const std::uint64_t gen  = ++generation_;
        std::weak_ptr<int>  w    = token_;
        util::IExecutor    *exec = &exec_;

        HostCallbacks cb;
        cb.on_bound = [this, exec, w, gen] {
            exec->post([this, w, gen] {
                if (w.expired())
                    return;
                on_bound(gen);
            });
        };
        cb.on_unbound = [this, exec, w, gen] {
            exec->post([this, w, gen] {
                if (w.expired())
                    return;
                on_unbound(gen);
            });
        };

        starting_ = true;
        if (!host_.bind(std::move(cb)))
        {
            LOG_ERROR("[SERVICE] bind to host failed");
            starting_ = false;
            host_.request_shutdown();
            return;
        }
        LOG_INFO("[SERVICE] host launched, waiting for bind");
        started = true;
    });
    return started;
}

// ======================================================================
// Function: ServiceLifecycle::stop_service
// - Out: unbound, host asked to shut down, running = false
// - Note: a host that reports "not bound" is logged and ignored
// ======================================================================
void ServiceLifecycle::stop_service()
{
    exec_.dispatch_sync([this] {
        if (bound_ || starting_)
        {
            if (!host_.unbind())
                LOG_WARN("[SERVICE] unbind: not bound (ignored)");
        }
        host_.request_shutdown();
        ++generation_;
        starting_ = false;
        bound_    = false;
        running_.set(false);
        LOG_SYSTEM("[SERVICE] stopped");
    });
}

void ServiceLifecycle::on_bound(std::uint64_t gen)
{
    if (gen != generation_)
        return;
    starting_ = false;
    bound_    = true;
    running_.set(true);
    LOG_SYSTEM("[SERVICE] running");
}

void ServiceLifecycle::on_unbound(std::uint64_t gen)
{
    if (gen != generation_)
        return;
    starting_ = false;
    bound_    = false;
    if (running_.value())
        running_.set(false);
    LOG_SYSTEM("[SERVICE] host went away");
}

}  // namespace host
