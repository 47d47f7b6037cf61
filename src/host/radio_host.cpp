#include <functional>
#include <utility>

#include "host/radio_host.hpp"
#include "util/log.hpp"

namespace host
{

RadioHost::RadioHost(transport::IRadio &radio, std::uint32_t pump_ms)
    : radio_(radio), pump_ms_(pump_ms ? pump_ms : 100)
{
}

RadioHost::~RadioHost()
{
    request_shutdown();
}

bool RadioHost::launch()
{
    if (thr_.joinable())
    {
        if (alive_.load())
        {
            LOG_DEBUG("radio host already launched");
            return true;
        }
        thr_.join();  // previous run ended on its own
    }
    stop_.store(false);
    alive_.store(true);
    thr_ = std::thread([this] { run(); });
    return true;
}

bool RadioHost::bind(HostCallbacks cb)
{
    std::unique_lock<std::mutex> lk(mu_);
    if (!thr_.joinable() || !alive_.load())
    {
        LOG_WARN("bind: radio host not running");
        return false;
    }
    cb_    = std::move(cb);
    bound_ = true;
    acked_ = false;
    if (radio_open_)
        ack_bound_locked(lk);
    return true;
}

bool RadioHost::unbind()
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!bound_)
        return false;
    bound_ = false;
    acked_ = false;
    cb_    = HostCallbacks{};
    return true;
}

// ======================================================================
// Function: RadioHost::request_shutdown
// - Out: pump loop stopped and joined, radio closed by the loop itself
// - Note: safe to call repeatedly and before launch()
// ======================================================================
void RadioHost::request_shutdown()
{
    stop_.store(true);
    if (!thr_.joinable())
        return;
    if (thr_.get_id() == std::this_thread::get_id())
    {
        thr_.detach();
        return;
    }
    thr_.join();
    LOG_INFO("radio host stopped");
}

void RadioHost::ack_bound_locked(std::unique_lock<std::mutex> &lk)
{
    acked_                     = true;
    std::function<void()> ack  = cb_.on_bound;
    lk.unlock();
    if (ack)
        ack();
    lk.lock();
}

void RadioHost::run()
{
    LOG_INFO("radio host starting (%s)", radio_.name().c_str());
    if (!radio_.open())
    {
        LOG_ERROR("radio host: could not open radio '%s'", radio_.name().c_str());
        std::function<void()> gone;
        {
            std::lock_guard<std::mutex> lk(mu_);
            alive_.store(false);
            if (bound_)
                gone = cb_.on_unbound;
        }
        if (gone)
            gone();
        return;
    }

    {
        std::unique_lock<std::mutex> lk(mu_);
        radio_open_ = true;
        if (bound_ && !acked_)
            ack_bound_locked(lk);
    }

    while (!stop_.load())
        radio_.process(pump_ms_);

    {
        std::lock_guard<std::mutex> lk(mu_);
        radio_open_ = false;
    }
    radio_.close();
    alive_.store(false);
}

}  // namespace host
