#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "proto/status.hpp"

/*
sessions.list  -> {"cmd":"sessions.list","ok":true,
                   "body":{"items":[{"name":..,"size":..,"mtime":..}], "next": <cursor>}}
session.stream -> repeated {"evt":"session.chunk",
                   "body":{"sessionId":..,"offset":..,"data":<base64>,"eof":bool}}
*/

namespace proto
{

struct SessionItem
{
    std::string  file_name;
    std::int64_t size  = 0;
    std::int64_t mtime = 0;

    // 5th '-' separated field of file_name, "Unknown" when there is none
    std::string lift_name() const;
};

std::string lift_name_of(const std::string &file_name);

struct SessionListPage
{
    std::vector<SessionItem>    items;
    std::optional<std::int64_t> next;  // absent once the listing is exhausted
};

// nullopt unless ev is a successful sessions.list response.
std::optional<SessionListPage> parse_sessions_list(const StatusEvent &ev);

struct SessionChunk
{
    std::string               session_id;
    std::uint64_t             offset = 0;
    std::vector<std::uint8_t> data;  // already base64-decoded
    bool                      eof = false;
};

// nullopt unless ev is a well-formed session.chunk event with valid base64 data.
std::optional<SessionChunk> parse_session_chunk(const StatusEvent &ev);

// Collects the chunks of one session.stream transfer, in order.
class SessionDownload
{
  public:
    enum class Feed
    {
        Accepted,
        Complete,
        Rejected  // wrong session, gap or overlap; buffer unchanged
    };

    explicit SessionDownload(std::string session_id) : id_(std::move(session_id)) {}

    Feed feed(const SessionChunk &c);

    const std::string               &session_id() const { return id_; }
    const std::vector<std::uint8_t> &bytes() const { return buf_; }
    bool                             complete() const { return done_; }

  private:
    std::string               id_;
    std::vector<std::uint8_t> buf_;
    bool                      done_{false};
};

}  // namespace proto
