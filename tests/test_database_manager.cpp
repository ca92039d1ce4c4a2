#include <gtest/gtest.h>
#include "database_manager.hpp"

using namespace monkeychat;

class DatabaseManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(db_.initialize(":memory:"));
    }

    DatabaseManager db_;
};

TEST_F(DatabaseManagerTest, CreatesAndFindsRoom) {
    EXPECT_TRUE(db_.is_connected());
    ASSERT_TRUE(db_.create_room_record("lobby", 42));

    std::optional<RoomRecord> record = db_.find_room_record("lobby");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->id, "lobby");
    EXPECT_EQ(record->created_by, 42);
    EXPECT_FALSE(record->created_at.empty());

    EXPECT_FALSE(db_.find_room_record("missing").has_value());
}

TEST_F(DatabaseManagerTest, DuplicateRoomIsRejected) {
    ASSERT_TRUE(db_.create_room_record("lobby", 1));
    EXPECT_FALSE(db_.create_room_record("lobby", 2));

    std::optional<RoomRecord> record = db_.find_room_record("lobby");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->created_by, 1);
    EXPECT_EQ(db_.list_room_records().size(), 1u);
}

TEST_F(DatabaseManagerTest, DeletesRoom) {
    ASSERT_TRUE(db_.create_room_record("lobby", 1));
    EXPECT_TRUE(db_.delete_room_record("lobby"));
    EXPECT_FALSE(db_.find_room_record("lobby").has_value());
    EXPECT_EQ(db_.list_room_records().size(), 0u);
}

TEST_F(DatabaseManagerTest, ListsRoomsAndFiltersByCreator) {
    ASSERT_TRUE(db_.create_room_record("a", 1));
    ASSERT_TRUE(db_.create_room_record("b", 2));
    ASSERT_TRUE(db_.create_room_record("c", 1));

    EXPECT_EQ(db_.list_room_records().size(), 3u);

    std::vector<RoomRecord> mine = db_.list_room_records_by_creator(1);
    ASSERT_EQ(mine.size(), 2u);
    for (const auto& room : mine) {
        EXPECT_EQ(room.created_by, 1);
    }
    EXPECT_TRUE(db_.list_room_records_by_creator(99).empty());
}

TEST_F(DatabaseManagerTest, OperationsFailAfterClose) {
    db_.close();
    EXPECT_FALSE(db_.is_connected());
    EXPECT_FALSE(db_.create_room_record("lobby", 1));
    EXPECT_FALSE(db_.find_room_record("lobby").has_value());
    EXPECT_TRUE(db_.list_room_records().empty());
}
