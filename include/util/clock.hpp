#pragma once
#include <chrono>
#include <cstdint>
#include <functional>

namespace util
{

using EpochClock = std::function<std::int64_t()>;

inline std::int64_t epoch_ms()
{
    using namespace std::chrono;
    return (std::int64_t)duration_cast<milliseconds>(system_clock::now().time_since_epoch())
        .count();
}

inline std::uint64_t steady_ms()
{
    using namespace std::chrono;
    return (std::uint64_t)duration_cast<milliseconds>(steady_clock::now().time_since_epoch())
        .count();
}

}  // namespace util
