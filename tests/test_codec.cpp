#include <gtest/gtest.h>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "proto/command.hpp"
#include "proto/status.hpp"

using nlohmann::json;

namespace
{
json as_json(const std::vector<std::uint8_t> &bytes)
{
    return json::parse(std::string(bytes.begin(), bytes.end()));
}

std::vector<std::uint8_t> bytes_of(const std::string &s)
{
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

const util::EpochClock kClock = [] { return (std::int64_t)1700000000123; };
}  // namespace

TEST(Encode, SessionStartWithoutTimestampUsesClock)
{
    auto j = as_json(proto::encode(proto::Command::session_start("Squat"), kClock));
    EXPECT_EQ(j["cmd"], "session.start");
    EXPECT_EQ(j["body"]["lift"], "Squat");
    EXPECT_EQ(j["body"]["phoneEpochMs"].get<std::int64_t>(), 1700000000123);
}

TEST(Encode, SessionStartKeepsCallerTimestamp)
{
    auto j = as_json(proto::encode(proto::Command::session_start("Bench", 42), kClock));
    EXPECT_EQ(j["body"]["phoneEpochMs"].get<std::int64_t>(), 42);
}

TEST(Encode, DefaultClockIsWallTime)
{
    const auto before = util::epoch_ms();
    auto       j      = as_json(proto::encode(proto::Command::ping()));
    const auto after  = util::epoch_ms();
    const auto ts     = j["body"]["phoneEpochMs"].get<std::int64_t>();
    EXPECT_GE(ts, before);
    EXPECT_LE(ts, after);
}

TEST(Encode, EveryCommandHasNameAndObjectBody)
{
    const std::vector<std::pair<proto::Command, std::string>> cases = {
        {proto::Command::ping(), "ping"},
        {proto::Command::capabilities_get(), "capabilities.get"},
        {proto::Command::time_sync(5), "time.sync"},
        {proto::Command::mode_set("live"), "mode.set"},
        {proto::Command::session_start("Squat"), "session.start"},
        {proto::Command::session_end(), "session.end"},
        {proto::Command::sessions_list(0, 20), "sessions.list"},
        {proto::Command::sessions_clear(), "sessions.clear"},
        {proto::Command::session_stream("s1"), "session.stream"},
    };
    for (const auto &c : cases)
    {
        auto j = as_json(proto::encode(c.first, kClock));
        EXPECT_EQ(j["cmd"], c.second);
        ASSERT_TRUE(j["body"].is_object()) << c.second;
        EXPECT_TRUE(j["body"].contains("phoneEpochMs")) << c.second;
        EXPECT_EQ(j.size(), 2u) << c.second;
    }
}

TEST(Encode, CommandFieldsLandInBody)
{
    auto ts = as_json(proto::encode(proto::Command::time_sync(99), kClock));
    EXPECT_EQ(ts["body"]["phoneEpochMs"], 99);

    auto ls = as_json(proto::encode(proto::Command::sessions_list(40, 10), kClock));
    EXPECT_EQ(ls["body"]["cursor"], 40);
    EXPECT_EQ(ls["body"]["limit"], 10);

    auto st = as_json(proto::encode(proto::Command::session_stream("2024-01-01-12-Squat"), kClock));
    EXPECT_EQ(st["body"]["sessionId"], "2024-01-01-12-Squat");
}

TEST(Encode, InvalidUtf8IsReplacedNotThrown)
{
    std::string bad = "Sq";
    bad.push_back(static_cast<char>(0xff));
    auto bytes = proto::encode(proto::Command::mode_set(bad), kClock);
    EXPECT_FALSE(bytes.empty());
    EXPECT_NO_THROW(as_json(bytes));
}

TEST(CommandFromArgs, BuildsKnownCommands)
{
    auto ping = proto::command_from_args("ping", {}, kClock);
    ASSERT_TRUE(ping.has_value());
    EXPECT_EQ(ping->name, "ping");

    auto caps = proto::command_from_args("caps", {}, kClock);
    ASSERT_TRUE(caps.has_value());
    EXPECT_EQ(caps->name, "capabilities.get");

    auto sync = proto::command_from_args("time.sync", {}, kClock);
    ASSERT_TRUE(sync.has_value());
    EXPECT_EQ(sync->body["phoneEpochMs"].get<std::int64_t>(), 1700000000123);

    auto start = proto::command_from_args("session.start", {"Deadlift", "77"}, kClock);
    ASSERT_TRUE(start.has_value());
    EXPECT_EQ(start->body["lift"], "Deadlift");
    EXPECT_EQ(start->body["phoneEpochMs"], 77);

    auto list = proto::command_from_args("sessions.list", {}, kClock);
    ASSERT_TRUE(list.has_value());
    EXPECT_EQ(list->body["cursor"], 0);
    EXPECT_EQ(list->body["limit"], 20);
}

TEST(CommandFromArgs, RejectsBadInput)
{
    EXPECT_FALSE(proto::command_from_args("reboot", {}, kClock).has_value());
    EXPECT_FALSE(proto::command_from_args("ping", {"x"}, kClock).has_value());
    EXPECT_FALSE(proto::command_from_args("mode.set", {}, kClock).has_value());
    EXPECT_FALSE(proto::command_from_args("time.sync", {"soon"}, kClock).has_value());
    EXPECT_FALSE(proto::command_from_args("session.start", {"Squat", "12x"}, kClock).has_value());
    EXPECT_FALSE(proto::command_from_args("sessions.list", {"-1"}, kClock).has_value());
    EXPECT_FALSE(proto::command_from_args("sessions.list", {"0", "0"}, kClock).has_value());
    EXPECT_FALSE(proto::command_from_args("session.stream", {""}, kClock).has_value());
}

TEST(Decode, ResponseWithAllKnownFields)
{
    auto ev = proto::decode(bytes_of(R"({"cmd":"capabilities.get","ok":true,"body":{"fw":"1.2"}})"));
    EXPECT_FALSE(ev.malformed);
    EXPECT_FALSE(ev.is_event);
    EXPECT_EQ(ev.kind, "capabilities.get");
    ASSERT_TRUE(ev.ok.has_value());
    EXPECT_TRUE(*ev.ok);
    EXPECT_FALSE(ev.error.has_value());
    EXPECT_EQ(ev.body["fw"], "1.2");
    EXPECT_TRUE(ev.extra.empty());
}

TEST(Decode, EventWithErrorAndMissingBody)
{
    auto ev = proto::decode(bytes_of(R"({"evt":"battery.low","err":"3%"})"));
    EXPECT_TRUE(ev.is_event);
    EXPECT_EQ(ev.kind, "battery.low");
    EXPECT_FALSE(ev.ok.has_value());
    ASSERT_TRUE(ev.error.has_value());
    EXPECT_EQ(*ev.error, "3%");
    EXPECT_TRUE(ev.body.is_object());
    EXPECT_TRUE(ev.body.empty());
}

TEST(Decode, UnknownAndMistypedFieldsGoToExtra)
{
    auto ev = proto::decode(bytes_of(R"({"cmd":"ping","ok":"yes","rssi":-60,"fwRev":"b7"})"));
    EXPECT_FALSE(ev.malformed);
    EXPECT_EQ(ev.kind, "ping");
    EXPECT_FALSE(ev.ok.has_value());
    EXPECT_EQ(ev.extra["ok"], "yes");
    EXPECT_EQ(ev.extra["rssi"], -60);
    EXPECT_EQ(ev.extra["fwRev"], "b7");
}

TEST(Decode, GarbageIsMalformedNotFatal)
{
    for (const std::string s : {"", "not json", "[1,2,3]", "\"str\"", "{\"cmd\":"})
    {
        auto ev = proto::decode(bytes_of(s));
        EXPECT_TRUE(ev.malformed) << s;
        EXPECT_EQ(ev.raw, s);
        EXPECT_NE(proto::describe(ev).find("malformed"), std::string::npos);
    }
}

TEST(Decode, DescribeSummarisesEvent)
{
    auto ev = proto::decode(bytes_of(R"({"cmd":"mode.set","ok":false,"err":"busy"})"));
    const std::string d = proto::describe(ev);
    EXPECT_NE(d.find("cmd mode.set"), std::string::npos);
    EXPECT_NE(d.find("FAILED"), std::string::npos);
    EXPECT_NE(d.find("err=busy"), std::string::npos);
}
