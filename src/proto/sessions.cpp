#include <sodium.h>

#include <string>

#include "proto/sessions.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace proto
{

using nlohmann::json;

std::string lift_name_of(const std::string &file_name)
{
    // empty segments count, "a--b" has three fields
    std::size_t field = 0;
    std::size_t start = 0;
    while (true)
    {
        const std::size_t dash = file_name.find('-', start);
        if (field == 4)
            return file_name.substr(start, dash == std::string::npos ? std::string::npos
                                                                     : dash - start);
        if (dash == std::string::npos)
            break;
        start = dash + 1;
        ++field;
    }
    return constants::UNKNOWN_LIFT;
}

std::string SessionItem::lift_name() const
{
    return lift_name_of(file_name);
}

static std::int64_t int_or_zero(const json &obj, const char *key)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number_integer())
        return 0;
    return it->get<std::int64_t>();
}

std::optional<SessionListPage> parse_sessions_list(const StatusEvent &ev)
{
    if (ev.malformed || ev.kind != "sessions.list")
        return std::nullopt;
    if (ev.ok && !*ev.ok)
    {
        LOG_WARN("sessions.list failed: %s", ev.error ? ev.error->c_str() : "(no reason)");
        return std::nullopt;
    }

    SessionListPage page;
    auto            items = ev.body.find("items");
    if (items != ev.body.end() && items->is_array())
    {
        for (const auto &it : *items)
        {
            if (!it.is_object())
                continue;
            auto name = it.find("name");
            if (name == it.end() || !name->is_string())
                continue;
            SessionItem s;
            s.file_name = name->get<std::string>();
            s.size      = int_or_zero(it, "size");
            s.mtime     = int_or_zero(it, "mtime");
            page.items.push_back(std::move(s));
        }
    }

    auto next = ev.body.find("next");
    if (next != ev.body.end() && next->is_number_integer())
        page.next = next->get<std::int64_t>();
    return page;
}

// ======================================================================
// Function: decode_b64
// - In: base64 text (standard alphabet, padded)
// - Out: decoded bytes, or false on any invalid input
// ======================================================================
static bool decode_b64(const std::string &in, std::vector<std::uint8_t> &out)
{
    static const bool sodium_ready = (sodium_init() >= 0);
    if (!sodium_ready)
    {
        LOG_ERROR("sodium_init failed");
        return false;
    }

    out.assign(in.size() / 4 * 3 + 3, 0);
    std::size_t bin_len = 0;
    const char *end     = nullptr;
    if (sodium_base642bin(out.data(), out.size(), in.data(), in.size(), nullptr, &bin_len, &end,
                          sodium_base64_VARIANT_ORIGINAL) != 0 ||
        end != in.data() + in.size())
    {
        out.clear();
        return false;
    }
    out.resize(bin_len);
    return true;
}

std::optional<SessionChunk> parse_session_chunk(const StatusEvent &ev)
{
    if (ev.malformed || ev.kind != "session.chunk")
        return std::nullopt;

    auto id   = ev.body.find("sessionId");
    auto data = ev.body.find("data");
    if (id == ev.body.end() || !id->is_string() || data == ev.body.end() || !data->is_string())
    {
        LOG_WARN("session.chunk without sessionId/data");
        return std::nullopt;
    }

    SessionChunk c;
    c.session_id = id->get<std::string>();

    auto off = ev.body.find("offset");
    if (off != ev.body.end())
    {
        if (!off->is_number_unsigned() && !(off->is_number_integer() && off->get<std::int64_t>() >= 0))
            return std::nullopt;
        c.offset = off->get<std::uint64_t>();
    }

    auto eof = ev.body.find("eof");
    c.eof    = eof != ev.body.end() && eof->is_boolean() && eof->get<bool>();

    if (!decode_b64(data->get<std::string>(), c.data))
    {
        LOG_WARN("session.chunk %s@%llu: bad base64", c.session_id.c_str(),
                 (unsigned long long)c.offset);
        return std::nullopt;
    }
    return c;
}

SessionDownload::Feed SessionDownload::feed(const SessionChunk &c)
{
    if (done_ || c.session_id != id_)
        return Feed::Rejected;
    if (c.offset != buf_.size())
    {
        LOG_WARN("session %s: chunk at %llu, expected %zu", id_.c_str(),
                 (unsigned long long)c.offset, buf_.size());
        return Feed::Rejected;
    }
    buf_.insert(buf_.end(), c.data.begin(), c.data.end());
    if (c.eof)
    {
        done_ = true;
        return Feed::Complete;
    }
    return Feed::Accepted;
}

}  // namespace proto
