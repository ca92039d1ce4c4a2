#include "config_manager.hpp"
#include "utils/logger.hpp"
#include <fstream>
#include <sstream>

namespace monkeychat {

ConfigManager::ConfigManager() {
    // Default configuration values
    config_["server"] = {
        {"host", "0.0.0.0"},
        {"port", 8080},
        {"threads", 4},
        {"max_message_size", 65536}
    };

    config_["database"] = {
        {"path", "monkeychat.db"}
    };

    config_["logging"] = {
        {"level", "info"},
        {"file", "logs/monkeychat.log"},
        {"max_size", 10485760}, // 10MB
        {"rotate", true}
    };

    config_["auth"] = {
        {"tokens", json::array()}
    };
}

bool ConfigManager::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        Logger::warn("ConfigManager", "Could not open config file: " + filename +
                     ". Using default configuration.");
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (!load_from_string(buffer.str())) {
        Logger::error("ConfigManager", "Error loading config file: " + filename);
        return false;
    }

    Logger::info("ConfigManager", "Configuration loaded from: " + filename);
    return true;
}

bool ConfigManager::load_from_string(const std::string& content) {
    try {
        json overrides = json::parse(content);
        if (!overrides.is_object()) {
            Logger::error("ConfigManager", "Configuration root must be a JSON object");
            return false;
        }
        merge(overrides);
        return true;
    } catch (const json::exception& e) {
        Logger::error("ConfigManager", "Error parsing configuration: " + std::string(e.what()));
        return false;
    }
}

void ConfigManager::merge(const json& overrides) {
    for (auto it = overrides.begin(); it != overrides.end(); ++it) {
        if (it.value().is_object() && config_.contains(it.key()) && config_[it.key()].is_object()) {
            for (auto field = it.value().begin(); field != it.value().end(); ++field) {
                config_[it.key()][field.key()] = field.value();
            }
        } else {
            config_[it.key()] = it.value();
        }
    }
}

json ConfigManager::get_section(const std::string& section) const {
    auto it = config_.find(section);
    if (it != config_.end()) {
        return *it;
    }
    return json::object(); // Return empty object if section not found
}

bool ConfigManager::get_bool(const std::string& section, const std::string& key, bool default_value) const {
    try {
        if (config_.contains(section) && config_[section].contains(key)) {
            return config_[section][key].get<bool>();
        }
    } catch (const json::exception& e) {
        Logger::warn("ConfigManager", "Error reading bool config " + section + "." + key + ": " + e.what());
    }
    return default_value;
}

int ConfigManager::get_int(const std::string& section, const std::string& key, int default_value) const {
    try {
        if (config_.contains(section) && config_[section].contains(key)) {
            return config_[section][key].get<int>();
        }
    } catch (const json::exception& e) {
        Logger::warn("ConfigManager", "Error reading int config " + section + "." + key + ": " + e.what());
    }
    return default_value;
}

std::string ConfigManager::get_string(const std::string& section, const std::string& key,
                                      const std::string& default_value) const {
    try {
        if (config_.contains(section) && config_[section].contains(key)) {
            return config_[section][key].get<std::string>();
        }
    } catch (const json::exception& e) {
        Logger::warn("ConfigManager", "Error reading string config " + section + "." + key + ": " + e.what());
    }
    return default_value;
}

ServerSettings ConfigManager::get_server_settings() const {
    ServerSettings settings;
    settings.host = get_string("server", "host", "0.0.0.0");
    settings.port = get_int("server", "port", 8080);
    settings.threads = get_int("server", "threads", 4);
    settings.max_message_size = static_cast<size_t>(get_int("server", "max_message_size", 65536));
    return settings;
}

LoggingSettings ConfigManager::get_logging_settings() const {
    LoggingSettings settings;
    settings.level = get_string("logging", "level", "info");
    settings.file = get_string("logging", "file", "");
    settings.max_size = static_cast<size_t>(get_int("logging", "max_size", 10485760));
    settings.rotate = get_bool("logging", "rotate", true);
    return settings;
}

std::string ConfigManager::get_database_path() const {
    return get_string("database", "path", "monkeychat.db");
}

std::vector<TokenGrant> ConfigManager::get_token_grants() const {
    std::vector<TokenGrant> grants;

    json auth = get_section("auth");
    if (!auth.contains("tokens") || !auth["tokens"].is_array()) {
        return grants;
    }

    for (const auto& entry : auth["tokens"]) {
        if (!entry.is_object()) {
            continue;
        }
        try {
            TokenGrant grant;
            grant.token = entry.value("token", "");
            grant.username = entry.value("username", "");
            grant.user_id = entry.value("user_id", static_cast<int64_t>(0));
            grants.push_back(grant);
        } catch (const json::exception& e) {
            Logger::warn("ConfigManager", "Skipping malformed auth token entry: " + std::string(e.what()));
        }
    }

    return grants;
}

bool ConfigManager::validate_config() const {
    bool valid = true;

    const std::vector<std::string> required_sections = {"server", "database", "logging"};
    for (const auto& section : required_sections) {
        if (!config_.contains(section) || !config_[section].is_object()) {
            Logger::error("ConfigManager", "Missing required config section: " + section);
            valid = false;
        }
    }

    ServerSettings server = get_server_settings();
    if (server.port <= 0 || server.port > 65535) {
        Logger::error("ConfigManager", "Invalid server port: " + std::to_string(server.port));
        valid = false;
    }

    if (server.threads < 1) {
        Logger::error("ConfigManager", "Server needs at least one worker thread, got " +
                      std::to_string(server.threads));
        valid = false;
    }

    int max_message_size = get_int("server", "max_message_size", 65536);
    if (max_message_size < 1024) {
        Logger::error("ConfigManager", "max_message_size too small: " +
                      std::to_string(max_message_size));
        valid = false;
    }

    if (get_database_path().empty()) {
        Logger::error("ConfigManager", "Database path must not be empty");
        valid = false;
    }

    json auth = get_section("auth");
    if (auth.contains("tokens") && !auth["tokens"].is_array()) {
        Logger::error("ConfigManager", "auth.tokens must be an array");
        valid = false;
    }

    for (const auto& grant : get_token_grants()) {
        if (grant.token.empty() || grant.username.empty() || grant.user_id <= 0) {
            Logger::error("ConfigManager", "Invalid auth token entry for user '" + grant.username + "'");
            valid = false;
        }
    }

    return valid;
}

} // namespace monkeychat
