#include <gtest/gtest.h>
#include "signaling_hub.hpp"
#include "signaling_session.hpp"
#include "database_manager.hpp"
#include "recording_transport.hpp"

using namespace monkeychat;
using test_support::RecordingTransport;

namespace {

const AuthenticatedIdentity kAlice{"alice", 1};
const AuthenticatedIdentity kBob{"bob", 2};

} // namespace

class SignalingHubTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(db_.initialize(":memory:"));
        hub_ = std::make_unique<SignalingHub>(&db_);
    }

    DatabaseManager db_;
    std::unique_ptr<SignalingHub> hub_;
};

TEST_F(SignalingHubTest, RestoresDurableRoomsAsEmptyRooms) {
    ASSERT_TRUE(db_.create_room_record("standup", 1));
    ASSERT_TRUE(db_.create_room_record("retro", 2));

    EXPECT_EQ(hub_->restore_rooms(), 2u);
    EXPECT_TRUE(hub_->registry().contains_room("standup"));
    EXPECT_TRUE(hub_->registry().contains_room("retro"));
    EXPECT_EQ(hub_->registry().member_count("standup"), 0u);

    EXPECT_EQ(hub_->restore_rooms(), 0u);
}

TEST_F(SignalingHubTest, RestoredRoomDoesNotCreateSecondRecord) {
    ASSERT_TRUE(db_.create_room_record("standup", 1));
    hub_->restore_rooms();

    auto transport = std::make_shared<RecordingTransport>();
    auto session = hub_->open_session(transport, kBob);
    session->handle_message(R"({"event":"join","roomId":"standup","payload":{"userName":"bob"}})");

    EXPECT_EQ(db_.list_room_records().size(), 1u);
    EXPECT_EQ(db_.find_room_record("standup")->created_by, 1);
}

TEST_F(SignalingHubTest, CreatorCanDeleteRoom) {
    ASSERT_TRUE(db_.create_room_record("r1", kAlice.user_id));
    hub_->restore_rooms();

    EXPECT_EQ(hub_->delete_room("r1", kAlice), DeleteRoomResult::DELETED);
    EXPECT_FALSE(db_.find_room_record("r1").has_value());
    EXPECT_FALSE(hub_->registry().contains_room("r1"));
}

TEST_F(SignalingHubTest, DeleteEvictsMembersWithoutClosingThem) {
    auto transport = std::make_shared<RecordingTransport>();
    auto session = hub_->open_session(transport, kAlice);
    session->handle_message(R"({"event":"join","roomId":"r1"})");
    ASSERT_TRUE(db_.find_room_record("r1").has_value());

    EXPECT_EQ(hub_->delete_room("r1", kAlice), DeleteRoomResult::DELETED);
    EXPECT_FALSE(hub_->registry().contains_room("r1"));
    EXPECT_NE(session->state(), SessionState::CLOSED);
    EXPECT_TRUE(transport->send_text("still open"));
}

TEST_F(SignalingHubTest, OnlyCreatorMayDelete) {
    ASSERT_TRUE(db_.create_room_record("r1", kAlice.user_id));

    EXPECT_EQ(hub_->delete_room("r1", kBob), DeleteRoomResult::FORBIDDEN);
    EXPECT_TRUE(db_.find_room_record("r1").has_value());
}

TEST_F(SignalingHubTest, DeleteValidatesRequest) {
    EXPECT_EQ(hub_->delete_room("", kAlice), DeleteRoomResult::INVALID_REQUEST);
    EXPECT_EQ(hub_->delete_room("r1", AnonymousIdentity{}), DeleteRoomResult::UNAUTHORIZED);
    EXPECT_EQ(hub_->delete_room("missing", kAlice), DeleteRoomResult::NOT_FOUND);
}

// Store that knows one room but refuses to delete anything
class ReadOnlyRoomStore : public RoomStore {
public:
    bool create_room_record(const std::string&, int64_t) override { return false; }
    bool delete_room_record(const std::string&) override { return false; }

    std::optional<RoomRecord> find_room_record(const std::string& room_id) override {
        if (room_id != "r1") {
            return std::nullopt;
        }
        return RoomRecord{"r1", kAlice.user_id, "2024-01-01 00:00:00"};
    }

    std::vector<RoomRecord> list_room_records() override {
        return {RoomRecord{"r1", kAlice.user_id, "2024-01-01 00:00:00"}};
    }

    std::vector<RoomRecord> list_room_records_by_creator(int64_t creator_id) override {
        if (creator_id != kAlice.user_id) {
            return {};
        }
        return list_room_records();
    }
};

TEST(SignalingHubStoreFailureTest, DeleteReportsStoreError) {
    ReadOnlyRoomStore store;
    SignalingHub hub(&store);
    EXPECT_EQ(hub.restore_rooms(), 1u);

    EXPECT_EQ(hub.delete_room("r1", kAlice), DeleteRoomResult::STORE_ERROR);
    EXPECT_TRUE(hub.registry().contains_room("r1"));
}

TEST(SignalingHubWithoutStoreTest, WorksInMemoryOnly) {
    SignalingHub hub;
    EXPECT_EQ(hub.store(), nullptr);
    EXPECT_EQ(hub.restore_rooms(), 0u);

    auto transport = std::make_shared<RecordingTransport>();
    auto session = hub.open_session(transport, kAlice);
    session->handle_message(R"({"event":"join","roomId":"r1"})");

    EXPECT_TRUE(hub.registry().contains_room("r1"));
    EXPECT_EQ(hub.delete_room("r1", kAlice), DeleteRoomResult::NOT_FOUND);
}

TEST(DeleteRoomResultTest, HasReadableNames) {
    EXPECT_STREQ(to_string(DeleteRoomResult::FORBIDDEN), "only the room creator can delete the room");
    EXPECT_STREQ(to_string(DeleteRoomResult::NOT_FOUND), "room not found");
}
