#include <string>

#include "proto/command.hpp"
#include "proto/status.hpp"
#include "util/log.hpp"

namespace proto
{

using nlohmann::json;

StatusEvent decode(const std::vector<std::uint8_t> &bytes)
{
    StatusEvent ev;
    ev.raw.assign(bytes.begin(), bytes.end());

    // non-throwing parse: a discarded value means the text was not JSON
    json j = json::parse(ev.raw, nullptr, false);
    if (j.is_discarded() || !j.is_object())
    {
        LOG_WARN("malformed status payload (%zu bytes)", bytes.size());
        ev.malformed = true;
        return ev;
    }

    for (auto it = j.begin(); it != j.end(); ++it)
    {
        const std::string &key = it.key();
        const json        &v   = it.value();

        if (key == K_CMD && v.is_string() && ev.kind.empty())
        {
            ev.kind = v.get<std::string>();
        }
        else if (key == K_EVT && v.is_string())
        {
            ev.kind     = v.get<std::string>();
            ev.is_event = true;
        }
        else if (key == "ok" && v.is_boolean())
        {
            ev.ok = v.get<bool>();
        }
        else if (key == "err" && v.is_string())
        {
            ev.error = v.get<std::string>();
        }
        else if (key == K_BODY && v.is_object())
        {
            ev.body = v;
        }
        else
        {
            // wrong-typed known fields land here too
            ev.extra[key] = v;
        }
    }

    if (!ev.extra.empty())
        LOG_DEBUG("status '%s' carries unknown fields: %s", ev.kind.c_str(),
                  ev.extra.dump(-1, ' ', false, json::error_handler_t::replace).c_str());
    return ev;
}

std::string describe(const StatusEvent &ev)
{
    if (ev.malformed)
        return "malformed: " + ev.raw;

    std::string out = ev.is_event ? "evt " : "cmd ";
    out += ev.kind.empty() ? "?" : ev.kind;
    if (ev.ok)
        out += *ev.ok ? " ok" : " FAILED";
    if (ev.error)
        out += " err=" + *ev.error;
    if (!ev.body.empty())
        out += " body=" + ev.body.dump(-1, ' ', false, json::error_handler_t::replace);
    if (!ev.extra.empty())
        out += " extra=" + ev.extra.dump(-1, ' ', false, json::error_handler_t::replace);
    return out;
}

}  // namespace proto
