#pragma once
#include <string>
#include <cstdint>
#include <variant>
#include <unordered_map>
#include <vector>
#include "config_manager.hpp"

namespace monkeychat {

struct AnonymousIdentity {};

struct AuthenticatedIdentity {
    std::string username;
    int64_t user_id = 0;
};

// Who is on the other end of a connection, as established at upgrade time
using Identity = std::variant<AnonymousIdentity, AuthenticatedIdentity>;

bool is_authenticated(const Identity& identity);
const AuthenticatedIdentity* as_authenticated(const Identity& identity);
std::string describe(const Identity& identity);

/**
 * Maps a bearer token to an identity. Token issuance and validation are
 * owned by the authentication service; the signaling core only consumes
 * the resolved identity.
 */
class IdentityResolver {
public:
    virtual ~IdentityResolver() = default;

    // Unknown or empty tokens resolve to AnonymousIdentity
    virtual Identity resolve(const std::string& token) const = 0;
};

class AnonymousResolver : public IdentityResolver {
public:
    Identity resolve(const std::string& token) const override;
};

// Resolver over a fixed token table loaded from the "auth" config section
class StaticTokenResolver : public IdentityResolver {
public:
    explicit StaticTokenResolver(const std::vector<TokenGrant>& grants);

    Identity resolve(const std::string& token) const override;
    size_t size() const { return grants_.size(); }

private:
    std::unordered_map<std::string, AuthenticatedIdentity> grants_;
};

// "token" query parameter of a request URI or resource ("/ws?token=abc")
std::string extract_query_token(const std::string& resource);

// Token from an "Authorization: Bearer <token>" header value
std::string extract_bearer_token(const std::string& authorization_header);

} // namespace monkeychat
