#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace util
{

// Current-value holder. Writers call set() from the owning executor only, so listeners see
// values in the order they were produced. Readers on any thread use value().
template <typename T>
class Observable
{
  public:
    using Listener = std::function<void(const T &)>;

    explicit Observable(T initial) : value_(std::move(initial)) {}

    T value() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return value_;
    }

    std::size_t subscribe(Listener l)
    {
        std::lock_guard<std::mutex> lk(mu_);
        const std::size_t id = next_id_++;
        listeners_.emplace(id, std::move(l));
        return id;
    }

    void unsubscribe(std::size_t id)
    {
        std::lock_guard<std::mutex> lk(mu_);
        listeners_.erase(id);
    }

    void set(T v)
    {
        std::vector<Listener> snapshot;
        T                     current = v;
        {
            std::lock_guard<std::mutex> lk(mu_);
            value_ = std::move(v);
            snapshot.reserve(listeners_.size());
            for (const auto &kv : listeners_)
                snapshot.push_back(kv.second);
        }
        // listeners run unlocked; they may read value() or unsubscribe
        for (const auto &l : snapshot)
            l(current);
    }

  private:
    mutable std::mutex              mu_;
    T                               value_;
    std::map<std::size_t, Listener> listeners_;
    std::size_t                     next_id_{1};
};

}  // namespace util
