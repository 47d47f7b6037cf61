#pragma once
#include <string>
#include <variant>

#include "discovery/scan_state.hpp"

namespace conn
{

struct ConnDisconnected
{
};
struct ConnConnecting
{
};
struct ConnConnected
{
    discovery::DiscoveredDevice device;
};
struct ConnError
{
    std::string message;
};

using ConnectionState = std::variant<ConnDisconnected, ConnConnecting, ConnConnected, ConnError>;

const char *state_name(const ConnectionState &s);

// Outcome of one connect() call
struct ConnectResult
{
    enum class Status
    {
        Ok,
        AlreadyConnected,
        InProgress,
        LinkFailed,
        LinkLost,
        Cancelled,
        RadioUnavailable
    };

    Status      status = Status::Ok;
    int         code   = 0;  // last radio status code
    std::string message;

    bool ok() const { return status == Status::Ok; }
};

const char *status_name(ConnectResult::Status s);

}  // namespace conn
