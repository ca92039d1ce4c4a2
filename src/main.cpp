#include <iostream>
#include <memory>
#include <string>
#include "config_manager.hpp"
#include "database_manager.hpp"
#include "identity.hpp"
#include "signaling_hub.hpp"
#include "signaling_server.hpp"
#include "utils/logger.hpp"

using namespace monkeychat;

class SignalingApp {
public:
    SignalingApp() = default;

    bool initialize(const std::string& config_file) {
        if (!config_manager_.load_from_file(config_file)) {
            Logger::warn("Using default configuration");
        }

        if (!config_manager_.validate_config()) {
            Logger::error("Configuration validation failed");
            return false;
        }

        LoggingSettings logging = config_manager_.get_logging_settings();
        Logger::set_level(Logger::level_from_string(logging.level));
        Logger::set_log_file(logging.file, logging.max_size, logging.rotate);
        Logger::info("=== MonkeyChat Signaling Server Started ===");

        if (!database_.initialize(config_manager_.get_database_path())) {
            Logger::error("Failed to initialize database");
            return false;
        }

        resolver_ = std::make_unique<StaticTokenResolver>(config_manager_.get_token_grants());

        hub_ = std::make_unique<SignalingHub>(&database_);
        hub_->restore_rooms();

        server_ = std::make_unique<SignalingServer>(config_manager_.get_server_settings(), *hub_, *resolver_);

        Logger::info("Server initialization complete");
        return true;
    }

    bool run() {
        if (!server_->start()) {
            Logger::error("Failed to start signaling server");
            return false;
        }

        server_->shutdown_on_signals();

        // Blocks until SIGINT/SIGTERM drains the I/O loop
        server_->wait();
        return true;
    }

    void shutdown() {
        if (server_) {
            server_->stop();
            server_.reset();
        }
        hub_.reset();
        database_.close();
        Logger::info("Server stopped");
    }

private:
    ConfigManager config_manager_;
    DatabaseManager database_;
    std::unique_ptr<StaticTokenResolver> resolver_;
    std::unique_ptr<SignalingHub> hub_;
    std::unique_ptr<SignalingServer> server_;
};

int main(int argc, char* argv[]) {
    Logger::set_level(Logger::Level::INFO);

    std::string config_file = "config/config.json";
    if (argc > 1) {
        config_file = argv[1];
    }

    try {
        SignalingApp app;

        if (!app.initialize(config_file)) {
            Logger::error("Failed to initialize server");
            return 1;
        }

        bool ok = app.run();
        app.shutdown();
        return ok ? 0 : 1;

    } catch (const std::exception& e) {
        Logger::error("Server error: " + std::string(e.what()));
        return 1;
    }
}
