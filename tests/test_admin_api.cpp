#include <gtest/gtest.h>
#include <stdexcept>
#include <filesystem>
#include "utils/logger.hpp"
#include <nlohmann/json.hpp>
#include "admin_api.hpp"
#include "database_manager.hpp"

using namespace monkeychat;

class AdminApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(db_.initialize(":memory:"));
        hub_ = std::make_unique<SignalingHub>(&db_);
        api_ = std::make_unique<AdminApi>(*hub_, resolver_);
    }

    HttpResponse delete_room(const std::string& body, const std::string& authorization) {
        HttpRequest request;
        request.method = "POST";
        request.path = "/rooms/delete";
        request.body = body;
        if (!authorization.empty()) {
            request.headers["Authorization"] = authorization;
        }
        return api_->handle(request);
    }

    static std::string error_of(const HttpResponse& response) {
        return nlohmann::json::parse(response.body).value("error", "");
    }

    DatabaseManager db_;
    StaticTokenResolver resolver_{std::vector<TokenGrant>{{"t-alice", "alice", 1}, {"t-bob", "bob", 2}}};
    std::unique_ptr<SignalingHub> hub_;
    std::unique_ptr<AdminApi> api_;
};

TEST_F(AdminApiTest, HealthCheck) {
    HttpRequest request;
    request.method = "GET";
    request.path = "/health";

    HttpResponse response = api_->handle(request);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, "OK");
    EXPECT_EQ(response.content_type, "text/plain");
}

TEST_F(AdminApiTest, UnknownRouteIs404) {
    HttpRequest request;
    request.method = "GET";
    request.path = "/rooms/list";

    HttpResponse response = api_->handle(request);
    EXPECT_EQ(response.status, 404);
    EXPECT_EQ(error_of(response), "Not Found");

    request.method = "GET";
    request.path = "/rooms/delete";
    EXPECT_EQ(api_->handle(request).status, 404);
}

TEST_F(AdminApiTest, PreflightIsAccepted) {
    HttpRequest request;
    request.method = "OPTIONS";
    request.path = "/rooms/delete";
    EXPECT_EQ(api_->handle(request).status, 200);
}

TEST_F(AdminApiTest, CreatorDeletesRoom) {
    ASSERT_TRUE(db_.create_room_record("r1", 1));
    hub_->restore_rooms();

    HttpResponse response = delete_room(R"({"roomId":"r1"})", "Bearer t-alice");
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(nlohmann::json::parse(response.body)["message"], "room deleted successfully");
    EXPECT_FALSE(db_.find_room_record("r1").has_value());
    EXPECT_FALSE(hub_->registry().contains_room("r1"));
}

TEST_F(AdminApiTest, RequiresValidToken) {
    ASSERT_TRUE(db_.create_room_record("r1", 1));

    HttpResponse missing = delete_room(R"({"roomId":"r1"})", "");
    EXPECT_EQ(missing.status, 401);
    EXPECT_EQ(error_of(missing), "unauthorized: missing token");

    HttpResponse invalid = delete_room(R"({"roomId":"r1"})", "Bearer nope");
    EXPECT_EQ(invalid.status, 401);
    EXPECT_EQ(error_of(invalid), "unauthorized: invalid token");

    EXPECT_TRUE(db_.find_room_record("r1").has_value());
}

TEST_F(AdminApiTest, OtherUsersAreForbidden) {
    ASSERT_TRUE(db_.create_room_record("r1", 1));

    HttpResponse response = delete_room(R"({"roomId":"r1"})", "Bearer t-bob");
    EXPECT_EQ(response.status, 403);
    EXPECT_EQ(error_of(response), "only the room creator can delete the room");
    EXPECT_TRUE(db_.find_room_record("r1").has_value());
}

TEST_F(AdminApiTest, MissingRoomIs404) {
    HttpResponse response = delete_room(R"({"roomId":"ghost"})", "Bearer t-alice");
    EXPECT_EQ(response.status, 404);
    EXPECT_EQ(error_of(response), "room not found");
}

TEST_F(AdminApiTest, BadBodiesAre400) {
    EXPECT_EQ(delete_room("{not json", "Bearer t-alice").status, 400);
    EXPECT_EQ(delete_room("[]", "Bearer t-alice").status, 400);

    HttpResponse no_room = delete_room("{}", "Bearer t-alice");
    EXPECT_EQ(no_room.status, 400);
    EXPECT_EQ(error_of(no_room), "room ID is required");

    EXPECT_EQ(delete_room(R"({"roomId":17})", "Bearer t-alice").status, 400);
}

TEST_F(AdminApiTest, CustomRoutesAreDispatched) {
    api_->add_route("GET", "/boom", [](const HttpRequest&) -> HttpResponse {
        throw std::runtime_error("boom");
    });
    api_->add_route("GET", "/rooms/count", [this](const HttpRequest&) {
        HttpResponse response;
        response.body = std::to_string(hub_->registry().room_count());
        return response;
    });

    HttpRequest request;
    request.method = "GET";
    request.path = "/boom";
    EXPECT_EQ(api_->handle(request).status, 500);

    request.path = "/rooms/count";
    HttpResponse count = api_->handle(request);
    EXPECT_EQ(count.status, 200);
    EXPECT_EQ(count.body, "0");
}

TEST_F(AdminApiTest, ListsStoredRoomsWithLiveMemberCounts) {
    ASSERT_TRUE(db_.create_room_record("standup", 1));
    ASSERT_TRUE(db_.create_room_record("retro", 2));
    hub_->restore_rooms();

    HttpRequest request;
    request.method = "GET";
    request.path = "/rooms";
    request.headers["Authorization"] = "Bearer t-bob";

    HttpResponse response = api_->handle(request);
    ASSERT_EQ(response.status, 200);

    nlohmann::json rooms = nlohmann::json::parse(response.body);
    ASSERT_TRUE(rooms.is_array());
    ASSERT_EQ(rooms.size(), 2u);
    for (const auto& room : rooms) {
        EXPECT_TRUE(room["id"] == "standup" || room["id"] == "retro");
        EXPECT_EQ(room["members"], 0);
        EXPECT_FALSE(room["createdAt"].get<std::string>().empty());
    }
}

TEST_F(AdminApiTest, ListsOnlyCallersRooms) {
    ASSERT_TRUE(db_.create_room_record("standup", 1));
    ASSERT_TRUE(db_.create_room_record("retro", 2));

    HttpRequest request;
    request.method = "GET";
    request.path = "/rooms/mine";
    request.headers["Authorization"] = "Bearer t-alice";

    HttpResponse response = api_->handle(request);
    ASSERT_EQ(response.status, 200);

    nlohmann::json rooms = nlohmann::json::parse(response.body);
    ASSERT_EQ(rooms.size(), 1u);
    EXPECT_EQ(rooms[0]["id"], "standup");
    EXPECT_EQ(rooms[0]["createdBy"], 1);
}

TEST_F(AdminApiTest, RoomListingRequiresToken) {
    HttpRequest request;
    request.method = "GET";
    request.path = "/rooms";
    EXPECT_EQ(api_->handle(request).status, 401);

    request.path = "/logs";
    EXPECT_EQ(api_->handle(request).status, 401);
}

TEST_F(AdminApiTest, DownloadsCurrentLogFile) {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "monkeychat_admin_logs";
    fs::remove_all(dir);
    const std::string path = (dir / "signal.log").string();

    Logger::Level previous = Logger::get_level();
    Logger::set_level(Logger::Level::INFO);
    Logger::set_log_file(path, 1024 * 1024, true);
    Logger::info("AdminApiTest", "marker line for download");

    HttpRequest request;
    request.method = "GET";
    request.path = "/logs";
    request.headers["Authorization"] = "Bearer t-alice";
    HttpResponse response = api_->handle(request);

    Logger::close_log_file();
    Logger::set_level(previous);
    fs::remove_all(dir);

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.content_type, "text/plain");
    EXPECT_NE(response.body.find("marker line for download"), std::string::npos);
    EXPECT_EQ(response.headers["Content-Disposition"], "attachment; filename=monkeychat_server_logs.log");
}

TEST_F(AdminApiTest, LogDownloadWithoutLogFileIs500) {
    Logger::close_log_file();

    HttpRequest request;
    request.method = "GET";
    request.path = "/logs";
    request.headers["Authorization"] = "Bearer t-alice";

    HttpResponse response = api_->handle(request);
    EXPECT_EQ(response.status, 500);
    EXPECT_EQ(error_of(response), "log file not configured");
}
