#include <gtest/gtest.h>
#include "signaling_message.hpp"

using namespace monkeychat;

TEST(SignalingMessageTest, ParsesJoinWithPayload) {
    ParseResult result = parse_message(R"({"event":"join","roomId":"r1","payload":{"userName":"alice"}})");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.message->event, EventType::JOIN);
    EXPECT_EQ(result.message->room_id, "r1");
    EXPECT_EQ(extract_user_name(result.message->payload), "alice");
}

TEST(SignalingMessageTest, RelayEventsKeepRawBytes) {
    const std::string raw = R"({"event":"offer",  "roomId":"r1","payload":{"sdp":"v=0\r\n","type":"offer"},"extra":[1,2]})";
    ParseResult result = parse_message(raw);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.message->event, EventType::OFFER);
    EXPECT_EQ(result.message->raw, raw);
    EXPECT_TRUE(result.message->payload.is_null());
}

TEST(SignalingMessageTest, AcceptsEveryClientEvent) {
    for (const char* tag : {"join", "leave", "offer", "answer", "ice-candidate"}) {
        ParseResult result = parse_message(std::string(R"({"event":")") + tag + R"(","roomId":"r"})");
        ASSERT_TRUE(result.ok()) << tag;
        EXPECT_STREQ(to_string(result.message->event), tag);
    }
}

TEST(SignalingMessageTest, ReportsMalformedInput) {
    EXPECT_EQ(parse_message("{\"event\":").status, ParseStatus::MALFORMED_JSON);
    EXPECT_EQ(parse_message("").status, ParseStatus::MALFORMED_JSON);
    EXPECT_EQ(parse_message("[1,2]").status, ParseStatus::NOT_AN_OBJECT);
    EXPECT_EQ(parse_message(R"({"roomId":"r1"})").status, ParseStatus::MISSING_EVENT);
    EXPECT_EQ(parse_message(R"({"event":5,"roomId":"r1"})").status, ParseStatus::MISSING_EVENT);
}

TEST(SignalingMessageTest, RejectsUnknownAndServerEvents) {
    ParseResult unknown = parse_message(R"({"event":"chat","roomId":"r1"})");
    EXPECT_EQ(unknown.status, ParseStatus::UNKNOWN_EVENT);
    EXPECT_EQ(unknown.detail, "chat");

    EXPECT_EQ(parse_message(R"({"event":"user-joined","roomId":"r1"})").status, ParseStatus::UNKNOWN_EVENT);
    EXPECT_EQ(parse_message(R"({"event":"joined","roomId":"r1"})").status, ParseStatus::UNKNOWN_EVENT);
}

TEST(SignalingMessageTest, RequiresNonEmptyRoomId) {
    EXPECT_EQ(parse_message(R"({"event":"join"})").status, ParseStatus::MISSING_ROOM_ID);
    EXPECT_EQ(parse_message(R"({"event":"join","roomId":""})").status, ParseStatus::MISSING_ROOM_ID);
    EXPECT_EQ(parse_message(R"({"event":"offer","roomId":7})").status, ParseStatus::MISSING_ROOM_ID);
}

TEST(SignalingMessageTest, ExtractsUserNameDefensively) {
    EXPECT_EQ(extract_user_name(json::parse(R"({"userName":"bob"})")), "bob");
    EXPECT_EQ(extract_user_name(json::parse(R"({"userName":42})")), "");
    EXPECT_EQ(extract_user_name(json::parse(R"("bob")")), "");
    EXPECT_EQ(extract_user_name(json()), "");
}

TEST(SignalingMessageTest, BuildsServerMessages) {
    json joined = json::parse(make_joined_message("r1"));
    EXPECT_EQ(joined["event"], "joined");
    EXPECT_EQ(joined["roomId"], "r1");

    json user_joined = json::parse(make_user_joined_message("r1", "alice"));
    EXPECT_EQ(user_joined["event"], "user-joined");
    EXPECT_EQ(user_joined["roomId"], "r1");
    EXPECT_EQ(user_joined["payload"]["userName"], "alice");

    json user_left = json::parse(make_user_left_message("r1", "bob"));
    EXPECT_EQ(user_left["event"], "user-left");
    EXPECT_EQ(user_left["payload"]["userName"], "bob");
}

TEST(SignalingMessageTest, ClassifiesEvents) {
    EXPECT_TRUE(is_relay_event(EventType::ICE_CANDIDATE));
    EXPECT_FALSE(is_relay_event(EventType::JOIN));
    EXPECT_TRUE(is_client_event(EventType::LEAVE));
    EXPECT_FALSE(is_client_event(EventType::USER_LEFT));
    EXPECT_FALSE(event_from_string("Offer").has_value());
}
