// components/edge-gateway/include/edge_gateway/auth_gate.hpp
#pragma once

#include "edge_gateway/clock.hpp"
#include "edge_gateway/jwt.hpp"
#include "edge_gateway/revocation_store.hpp"
#include "edge_gateway/route_table.hpp"
#include "edge_gateway/types.hpp"

#include <chrono>
#include <memory>
#include <set>
#include <string>

namespace edge_gateway {

/**
 * @brief Caller identity derived from a verified bearer token
 *
 * Lives for one request and is never persisted.
 */
struct Identity {
    std::string subjectId;
    std::string email;
    std::set<std::string> roles;
    std::chrono::system_clock::time_point tokenExpiry;
    std::chrono::system_clock::time_point issuedAt;
    std::string tokenId;    // jti, when present
};

enum class AuthError {
    NONE,
    MISSING,
    INVALID,
    EXPIRED
};

std::string authErrorToString(AuthError error);

// MISSING_TOKEN, INVALID_TOKEN or TOKEN_EXPIRED
ErrorCode authErrorToCode(AuthError error);

struct AuthResult {
    AuthError error = AuthError::NONE;
    Identity identity;
    std::string message;

    bool ok() const { return error == AuthError::NONE; }

    static AuthResult success(Identity identity) {
        return AuthResult{AuthError::NONE, std::move(identity), ""};
    }

    static AuthResult failure(AuthError error, std::string message) {
        return AuthResult{error, Identity{}, std::move(message)};
    }
};

/**
 * @class AuthGate
 * @brief Bearer token authentication, route authorization and identity re-signing
 *
 * Tokens are HS256 JWTs. A token must carry "sub" and "exp"; roles are read
 * from a "role" string and/or a "roles" array. After the signature and
 * expiry checks the revocation store is consulted; when the store cannot
 * answer, the token is rejected unless revocationFailClosed is off.
 *
 * Identity is never forwarded as client-controlled headers. Instead
 * mintAssertion produces a short-lived JWT signed with a separate internal
 * secret, which backends verify.
 */
class AuthGate {
public:
    struct Config {
        std::string jwtSecret;
        std::string internalSecret;
        std::chrono::seconds clockSkew{0};
        std::chrono::seconds assertionTtl{60};
        bool revocationFailClosed = true;
        std::string assertionIssuer = "edge-gateway";
        std::string assertionAudience = "internal";
    };

    /**
     * @param revocation Revocation store, may be null to disable revocation checks
     * @throws std::invalid_argument if either secret is empty
     */
    AuthGate(const Config& config, std::shared_ptr<IRevocationStore> revocation,
             std::shared_ptr<IClock> clock);

    AuthResult authenticate(const std::string& rawToken) const;

    /**
     * @brief Token of an "Authorization: Bearer <token>" header
     * @return Empty when the header is absent, uses another scheme or has no token
     */
    static std::string extractBearer(const HeaderList& headers);

    static bool authorize(const Identity* identity, const AuthRequirement& requirement);

    /**
     * @brief Signed X-Internal-Identity value for the identity
     */
    std::string mintAssertion(const Identity& identity) const;

    /**
     * @brief False when revocation is fail-closed and its store is unhealthy
     */
    bool isReady() const;

    const Config& config() const { return config_; }

private:
    Config config_;
    JwtCodec clientCodec_;
    JwtCodec internalCodec_;
    std::shared_ptr<IRevocationStore> revocation_;
    std::shared_ptr<IClock> clock_;
};

} // namespace edge_gateway
