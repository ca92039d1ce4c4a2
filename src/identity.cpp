#include "identity.hpp"
#include "utils/logger.hpp"
#include <cctype>

namespace monkeychat {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(const std::string& value) {
    std::string decoded;
    decoded.reserve(value.size());

    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            decoded += ' ';
        } else if (c == '%' && i + 2 < value.size()) {
            int hi = hex_value(value[i + 1]);
            int lo = hex_value(value[i + 2]);
            if (hi < 0 || lo < 0) {
                decoded += c;
                continue;
            }
            decoded += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            decoded += c;
        }
    }

    return decoded;
}

} // namespace

bool is_authenticated(const Identity& identity) {
    return std::holds_alternative<AuthenticatedIdentity>(identity);
}

const AuthenticatedIdentity* as_authenticated(const Identity& identity) {
    return std::get_if<AuthenticatedIdentity>(&identity);
}

std::string describe(const Identity& identity) {
    if (const auto* user = as_authenticated(identity)) {
        return user->username + " (" + std::to_string(user->user_id) + ")";
    }
    return "anonymous";
}

Identity AnonymousResolver::resolve(const std::string& /*token*/) const {
    return AnonymousIdentity{};
}

StaticTokenResolver::StaticTokenResolver(const std::vector<TokenGrant>& grants) {
    for (const auto& grant : grants) {
        if (grant.token.empty() || grant.username.empty() || grant.user_id <= 0) {
            Logger::warn("StaticTokenResolver", "Ignoring incomplete token grant for '" + grant.username + "'");
            continue;
        }
        grants_[grant.token] = AuthenticatedIdentity{grant.username, grant.user_id};
    }

    Logger::info("StaticTokenResolver", "Loaded " + std::to_string(grants_.size()) + " token grant(s)");
}

Identity StaticTokenResolver::resolve(const std::string& token) const {
    if (token.empty()) {
        return AnonymousIdentity{};
    }

    auto it = grants_.find(token);
    if (it == grants_.end()) {
        Logger::debug("StaticTokenResolver", "Unknown token, continuing as anonymous");
        return AnonymousIdentity{};
    }

    return it->second;
}

std::string extract_query_token(const std::string& resource) {
    size_t query_start = resource.find('?');
    if (query_start == std::string::npos) {
        return "";
    }

    std::string query = resource.substr(query_start + 1);
    size_t fragment = query.find('#');
    if (fragment != std::string::npos) {
        query.erase(fragment);
    }

    size_t pos = 0;
    while (pos <= query.size()) {
        size_t end = query.find('&', pos);
        if (end == std::string::npos) {
            end = query.size();
        }

        std::string pair = query.substr(pos, end - pos);
        size_t eq = pair.find('=');
        std::string key = pair.substr(0, eq);
        if (key == "token") {
            return eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
        }

        pos = end + 1;
    }

    return "";
}

std::string extract_bearer_token(const std::string& authorization_header) {
    const std::string scheme = "Bearer ";
    if (authorization_header.size() <= scheme.size() ||
        authorization_header.compare(0, scheme.size(), scheme) != 0) {
        return "";
    }

    std::string token = authorization_header.substr(scheme.size());
    while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back()))) {
        token.pop_back();
    }
    if (token.find(' ') != std::string::npos) {
        return "";
    }
    return token;
}

} // namespace monkeychat
