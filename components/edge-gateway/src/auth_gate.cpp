// components/edge-gateway/src/auth_gate.cpp
#include "edge_gateway/auth_gate.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace edge_gateway {

namespace {

// Numeric date claim as seconds since the epoch
bool readNumericDate(const nlohmann::json& claims, const char* name,
                     std::chrono::system_clock::time_point& out) {
    if (!claims.contains(name) || !claims[name].is_number()) {
        return false;
    }
    double seconds = claims[name].get<double>();
    if (!std::isfinite(seconds)) {
        return false;
    }
    // Keep far-future dates representable, with headroom for the clock skew
    const double limit = static_cast<double>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::duration::max()).count() / 2);
    seconds = std::max(-limit, std::min(seconds, limit));
    out = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(seconds)));
    return true;
}

long long toEpochSeconds(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}

} // anonymous namespace

std::string authErrorToString(AuthError error) {
    switch (error) {
        case AuthError::NONE:    return "NONE";
        case AuthError::MISSING: return "MISSING";
        case AuthError::INVALID: return "INVALID";
        case AuthError::EXPIRED: return "EXPIRED";
        default:                 return "UNKNOWN";
    }
}

ErrorCode authErrorToCode(AuthError error) {
    switch (error) {
        case AuthError::NONE:    return ErrorCode::SUCCESS;
        case AuthError::MISSING: return ErrorCode::MISSING_TOKEN;
        case AuthError::EXPIRED: return ErrorCode::TOKEN_EXPIRED;
        case AuthError::INVALID:
        default:                 return ErrorCode::INVALID_TOKEN;
    }
}

AuthGate::AuthGate(const Config& config, std::shared_ptr<IRevocationStore> revocation,
                   std::shared_ptr<IClock> clock)
    : config_(config)
    , clientCodec_(config.jwtSecret)
    , internalCodec_(config.internalSecret)
    , revocation_(std::move(revocation))
    , clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("AuthGate requires a clock");
    }
}

AuthResult AuthGate::authenticate(const std::string& rawToken) const {
    if (rawToken.empty()) {
        return AuthResult::failure(AuthError::MISSING, "Missing bearer token");
    }

    auto verified = clientCodec_.verify(rawToken);
    if (!verified) {
        return AuthResult::failure(AuthError::INVALID, verified.errorMessage);
    }
    const nlohmann::json& claims = verified.value;

    Identity identity;
    if (!claims.contains("sub") || !claims["sub"].is_string() ||
        claims["sub"].get<std::string>().empty()) {
        return AuthResult::failure(AuthError::INVALID, "Token has no subject");
    }
    identity.subjectId = claims["sub"].get<std::string>();

    if (!readNumericDate(claims, "exp", identity.tokenExpiry)) {
        return AuthResult::failure(AuthError::INVALID, "Token has no expiry");
    }

    const auto now = clock_->wallTime();
    if (now > identity.tokenExpiry + config_.clockSkew) {
        return AuthResult::failure(AuthError::EXPIRED, "Token has expired");
    }

    std::chrono::system_clock::time_point notBefore;
    if (readNumericDate(claims, "nbf", notBefore) && now + config_.clockSkew < notBefore) {
        return AuthResult::failure(AuthError::INVALID, "Token is not valid yet");
    }

    readNumericDate(claims, "iat", identity.issuedAt);

    if (claims.contains("email") && claims["email"].is_string()) {
        identity.email = claims["email"].get<std::string>();
    }
    if (claims.contains("jti") && claims["jti"].is_string()) {
        identity.tokenId = claims["jti"].get<std::string>();
    }
    if (claims.contains("role") && claims["role"].is_string()) {
        identity.roles.insert(claims["role"].get<std::string>());
    }
    if (claims.contains("roles") && claims["roles"].is_array()) {
        for (const auto& role : claims["roles"]) {
            if (role.is_string()) {
                identity.roles.insert(role.get<std::string>());
            }
        }
    }

    if (revocation_) {
        auto revoked = revocation_->isRevoked(rawToken, identity.tokenExpiry);
        if (!revoked) {
            if (config_.revocationFailClosed) {
                spdlog::error("Revocation check unavailable, rejecting token for '{}': {}",
                              identity.subjectId, revoked.errorMessage);
                return AuthResult::failure(AuthError::INVALID, "Token revocation status unknown");
            }
            spdlog::warn("Revocation check unavailable, accepting token for '{}': {}",
                         identity.subjectId, revoked.errorMessage);
        } else if (revoked.value) {
            return AuthResult::failure(AuthError::INVALID, "Token has been revoked");
        }
    }

    return AuthResult::success(std::move(identity));
}

std::string AuthGate::extractBearer(const HeaderList& headers) {
    static const std::string scheme = "bearer";

    const std::string* value = findHeader(headers, "Authorization");
    if (!value || value->size() <= scheme.size()) {
        return "";
    }
    if (!iequals(value->substr(0, scheme.size()), scheme) ||
        !std::isspace(static_cast<unsigned char>((*value)[scheme.size()]))) {
        return "";
    }

    size_t begin = value->find_first_not_of(" \t", scheme.size());
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = value->find_last_not_of(" \t");
    return value->substr(begin, end - begin + 1);
}

bool AuthGate::authorize(const Identity* identity, const AuthRequirement& requirement) {
    switch (requirement.kind) {
        case AuthRequirement::Kind::NONE:
            return true;
        case AuthRequirement::Kind::AUTHENTICATED:
            return identity != nullptr;
        case AuthRequirement::Kind::ROLES:
            if (identity == nullptr) {
                return false;
            }
            for (const auto& role : identity->roles) {
                if (requirement.roles.count(role) > 0) {
                    return true;
                }
            }
            return false;
    }
    return false;
}

std::string AuthGate::mintAssertion(const Identity& identity) const {
    const auto issuedAt = clock_->wallTime();

    nlohmann::json claims = {
        {"sub", identity.subjectId},
        {"roles", nlohmann::json(identity.roles)},
        {"iss", config_.assertionIssuer},
        {"aud", config_.assertionAudience},
        {"iat", toEpochSeconds(issuedAt)},
        {"exp", toEpochSeconds(issuedAt + config_.assertionTtl)}
    };
    if (!identity.email.empty()) {
        claims["email"] = identity.email;
    }

    return internalCodec_.sign(claims);
}

bool AuthGate::isReady() const {
    if (!revocation_ || !config_.revocationFailClosed) {
        return true;
    }
    return revocation_->isHealthy();
}

} // namespace edge_gateway
