#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "proto/sessions.hpp"
#include "proto/status.hpp"

namespace
{
proto::StatusEvent event_of(const std::string &s)
{
    return proto::decode(std::vector<std::uint8_t>(s.begin(), s.end()));
}

proto::SessionChunk chunk(const std::string &id, std::uint64_t off, const std::string &data,
                          bool eof)
{
    proto::SessionChunk c;
    c.session_id = id;
    c.offset     = off;
    c.data.assign(data.begin(), data.end());
    c.eof = eof;
    return c;
}
}  // namespace

TEST(LiftName, FifthFieldOfFileName)
{
    EXPECT_EQ(proto::lift_name_of("2024-01-01-12-Squat-raw.bin"), "Squat");
    EXPECT_EQ(proto::lift_name_of("2024-01-01-12-Bench"), "Bench");
    EXPECT_EQ(proto::lift_name_of("bad"), "Unknown");
    EXPECT_EQ(proto::lift_name_of(""), "Unknown");
    EXPECT_EQ(proto::lift_name_of("a-b-c-d"), "Unknown");
    EXPECT_EQ(proto::lift_name_of("a--c-d-Row-x"), "Row");  // empty fields still count

    proto::SessionItem it{"2024-06-30-07-Deadlift-imu.bin", 1024, 1719730000};
    EXPECT_EQ(it.lift_name(), "Deadlift");
}

TEST(SessionsList, ParsesItemsAndCursor)
{
    auto ev = event_of(R"({"cmd":"sessions.list","ok":true,"body":{"items":[
        {"name":"2024-01-01-12-Squat-raw.bin","size":2048,"mtime":1704110400},
        {"name":"2024-01-02-08-Bench-raw.bin"},
        {"size":10},
        {"name":"bad","size":1,"mtime":2}
    ],"next":3}})");
    auto page = proto::parse_sessions_list(ev);
    ASSERT_TRUE(page.has_value());
    ASSERT_EQ(page->items.size(), 3u);
    EXPECT_EQ(page->items[0].size, 2048);
    EXPECT_EQ(page->items[0].lift_name(), "Squat");
    EXPECT_EQ(page->items[1].size, 0);
    EXPECT_EQ(page->items[1].mtime, 0);
    EXPECT_EQ(page->items[2].lift_name(), "Unknown");
    ASSERT_TRUE(page->next.has_value());
    EXPECT_EQ(*page->next, 3);
}

TEST(SessionsList, LastPageHasNoCursor)
{
    auto page = proto::parse_sessions_list(event_of(R"({"cmd":"sessions.list","body":{"items":[]}})"));
    ASSERT_TRUE(page.has_value());
    EXPECT_TRUE(page->items.empty());
    EXPECT_FALSE(page->next.has_value());
}

TEST(SessionsList, RejectsOtherEventsAndFailures)
{
    EXPECT_FALSE(proto::parse_sessions_list(event_of(R"({"cmd":"ping","ok":true})")).has_value());
    EXPECT_FALSE(proto::parse_sessions_list(event_of(R"({"cmd":"sessions.list","ok":false,"err":"io"})"))
                     .has_value());
    EXPECT_FALSE(proto::parse_sessions_list(event_of("garbage")).has_value());
}

TEST(SessionChunk, DecodesBase64Payload)
{
    auto c = proto::parse_session_chunk(event_of(
        R"({"evt":"session.chunk","body":{"sessionId":"s1","offset":0,"data":"aGVsbG8=","eof":false}})"));
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->session_id, "s1");
    EXPECT_EQ(c->offset, 0u);
    EXPECT_EQ(std::string(c->data.begin(), c->data.end()), "hello");
    EXPECT_FALSE(c->eof);
}

TEST(SessionChunk, RejectsBrokenChunks)
{
    // invalid base64
    EXPECT_FALSE(proto::parse_session_chunk(
                     event_of(R"({"evt":"session.chunk","body":{"sessionId":"s1","data":"@@@"}})"))
                     .has_value());
    // missing id
    EXPECT_FALSE(proto::parse_session_chunk(
                     event_of(R"({"evt":"session.chunk","body":{"data":"aGk="}})"))
                     .has_value());
    // negative offset
    EXPECT_FALSE(proto::parse_session_chunk(
                     event_of(R"({"evt":"session.chunk","body":{"sessionId":"s1","offset":-4,"data":"aGk="}})"))
                     .has_value());
    // not a chunk
    EXPECT_FALSE(proto::parse_session_chunk(event_of(R"({"cmd":"ping"})")).has_value());
}

TEST(SessionDownload, ReassemblesInOrderChunks)
{
    proto::SessionDownload dl("s1");
    EXPECT_EQ(dl.feed(chunk("s1", 0, "abc", false)), proto::SessionDownload::Feed::Accepted);
    EXPECT_EQ(dl.feed(chunk("s1", 3, "def", false)), proto::SessionDownload::Feed::Accepted);
    EXPECT_EQ(dl.feed(chunk("s1", 6, "g", true)), proto::SessionDownload::Feed::Complete);
    EXPECT_TRUE(dl.complete());
    EXPECT_EQ(std::string(dl.bytes().begin(), dl.bytes().end()), "abcdefg");

    // nothing after eof
    EXPECT_EQ(dl.feed(chunk("s1", 7, "h", false)), proto::SessionDownload::Feed::Rejected);
}

TEST(SessionDownload, GapsOverlapsAndForeignChunksLeaveBufferAlone)
{
    proto::SessionDownload dl("s1");
    ASSERT_EQ(dl.feed(chunk("s1", 0, "abc", false)), proto::SessionDownload::Feed::Accepted);
    EXPECT_EQ(dl.feed(chunk("s1", 5, "xx", false)), proto::SessionDownload::Feed::Rejected);
    EXPECT_EQ(dl.feed(chunk("s1", 1, "xx", false)), proto::SessionDownload::Feed::Rejected);
    EXPECT_EQ(dl.feed(chunk("s2", 3, "xx", false)), proto::SessionDownload::Feed::Rejected);
    EXPECT_EQ(std::string(dl.bytes().begin(), dl.bytes().end()), "abc");
    EXPECT_FALSE(dl.complete());
}
