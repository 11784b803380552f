// components/edge-gateway/include/edge_gateway/jwt.hpp
#pragma once

#include "edge_gateway/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace edge_gateway {

// Base64url (RFC 4648 section 5) without padding
std::string base64UrlEncode(const std::string& data);

/**
 * @brief Decode base64url, with or without padding
 * @return false on characters outside the alphabet or an impossible length
 */
bool base64UrlDecode(const std::string& input, std::string& output);

/**
 * @class JwtCodec
 * @brief Compact HS256 JSON Web Token signer and verifier
 *
 * verify checks structure, the algorithm and the signature only; claim
 * policy (expiry, subject, revocation) belongs to AuthGate.
 */
class JwtCodec {
public:
    explicit JwtCodec(std::string secret);

    /**
     * @brief Check the token and return its payload claims
     *
     * Fails with INVALID_TOKEN on a malformed token, an alg other than
     * HS256 or a signature mismatch.
     */
    Result<nlohmann::json> verify(const std::string& token) const;

    /**
     * @brief Produce header.payload.signature for the given claims
     */
    std::string sign(const nlohmann::json& claims) const;

private:
    std::string hmacSha256(const std::string& data) const;

    std::string secret_;
};

} // namespace edge_gateway
