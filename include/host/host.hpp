#pragma once
#include <functional>

namespace host
{

// Acknowledgements from the host. Called on the host's own thread.
struct HostCallbacks
{
    std::function<void()> on_bound;
    std::function<void()> on_unbound;  // host went away without being asked
};

// Background host owning the radio
struct IHost
{
    virtual bool launch()                 = 0;  // false if it could not be started
    virtual bool bind(HostCallbacks cb)   = 0;  // on_bound fires once the host is usable
    virtual bool unbind()                 = 0;  // false when not bound
    virtual void request_shutdown()       = 0;  // best effort, idempotent
    virtual ~IHost() = default;
};

}  // namespace host
