#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include <vector>
#include <nlohmann/json.hpp>

namespace monkeychat {

using json = nlohmann::json;

struct ServerSettings {
    std::string host;
    int port;
    int threads;
    size_t max_message_size;
};

struct LoggingSettings {
    std::string level;
    std::string file;
    size_t max_size;
    bool rotate;
};

// One pre-issued access token mapped to the account it authenticates
struct TokenGrant {
    std::string token;
    std::string username;
    int64_t user_id;
};

class ConfigManager {
public:
    ConfigManager();

    // Overlays the file's sections on top of the defaults.
    // Returns false when the file is missing or unparseable; defaults stay in effect.
    bool load_from_file(const std::string& filename);
    bool load_from_string(const std::string& content);

    json get_section(const std::string& section) const;

    bool get_bool(const std::string& section, const std::string& key, bool default_value) const;
    int get_int(const std::string& section, const std::string& key, int default_value) const;
    std::string get_string(const std::string& section, const std::string& key,
                           const std::string& default_value) const;

    ServerSettings get_server_settings() const;
    LoggingSettings get_logging_settings() const;
    std::string get_database_path() const;
    std::vector<TokenGrant> get_token_grants() const;

    bool validate_config() const;

private:
    void merge(const json& overrides);

    json config_;
};

} // namespace monkeychat
