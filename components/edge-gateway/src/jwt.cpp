// components/edge-gateway/src/jwt.cpp
#include "edge_gateway/jwt.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <array>
#include <stdexcept>

namespace edge_gateway {

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

int decodeChar(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '-') return 62;
    if (c == '_') return 63;
    return -1;
}

Result<nlohmann::json> invalid(const std::string& message) {
    return Result<nlohmann::json>::error(ErrorCode::INVALID_TOKEN, message);
}

} // anonymous namespace

std::string base64UrlEncode(const std::string& data) {
    std::string result;
    result.reserve((data.size() * 4 + 2) / 3);

    for (size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(static_cast<unsigned char>(data[i])) << 16;
        if (i + 1 < data.size()) {
            n |= static_cast<uint32_t>(static_cast<unsigned char>(data[i + 1])) << 8;
        }
        if (i + 2 < data.size()) {
            n |= static_cast<uint32_t>(static_cast<unsigned char>(data[i + 2]));
        }

        result.push_back(kAlphabet[(n >> 18) & 0x3F]);
        result.push_back(kAlphabet[(n >> 12) & 0x3F]);
        if (i + 1 < data.size()) {
            result.push_back(kAlphabet[(n >> 6) & 0x3F]);
        }
        if (i + 2 < data.size()) {
            result.push_back(kAlphabet[n & 0x3F]);
        }
    }
    return result;
}

bool base64UrlDecode(const std::string& input, std::string& output) {
    std::string trimmed = input;
    while (!trimmed.empty() && trimmed.back() == '=') {
        trimmed.pop_back();
    }
    // A single leftover character carries fewer than 8 bits
    if (trimmed.size() % 4 == 1) {
        return false;
    }

    output.clear();
    output.reserve(trimmed.size() * 3 / 4);

    uint32_t buffer = 0;
    int bits = 0;
    for (char c : trimmed) {
        int value = decodeChar(c);
        if (value < 0) {
            return false;
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            output.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }
    return true;
}

JwtCodec::JwtCodec(std::string secret)
    : secret_(std::move(secret)) {
    if (secret_.empty()) {
        throw std::invalid_argument("JWT secret must not be empty");
    }
}

std::string JwtCodec::hmacSha256(const std::string& data) const {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;

    unsigned char* out = HMAC(EVP_sha256(),
                              secret_.data(), static_cast<int>(secret_.size()),
                              reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                              digest.data(), &length);
    if (out == nullptr) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    return std::string(reinterpret_cast<const char*>(digest.data()), length);
}

Result<nlohmann::json> JwtCodec::verify(const std::string& token) const {
    auto firstDot = token.find('.');
    if (firstDot == std::string::npos) {
        return invalid("Token is not a JWT");
    }
    auto secondDot = token.find('.', firstDot + 1);
    if (secondDot == std::string::npos || token.find('.', secondDot + 1) != std::string::npos) {
        return invalid("Token is not a JWT");
    }

    const std::string headerPart = token.substr(0, firstDot);
    const std::string payloadPart = token.substr(firstDot + 1, secondDot - firstDot - 1);
    const std::string signaturePart = token.substr(secondDot + 1);

    std::string headerJson;
    std::string payloadJson;
    std::string signature;
    if (!base64UrlDecode(headerPart, headerJson) ||
        !base64UrlDecode(payloadPart, payloadJson) ||
        !base64UrlDecode(signaturePart, signature)) {
        return invalid("Token contains invalid base64url");
    }

    nlohmann::json header = nlohmann::json::parse(headerJson, nullptr, false);
    if (header.is_discarded() || !header.is_object()) {
        return invalid("Token header is not a JSON object");
    }
    if (!header.contains("alg") || !header["alg"].is_string() ||
        header["alg"].get<std::string>() != "HS256") {
        return invalid("Unsupported token algorithm");
    }

    std::string expected;
    try {
        expected = hmacSha256(headerPart + "." + payloadPart);
    } catch (const std::exception& e) {
        return Result<nlohmann::json>::error(ErrorCode::INTERNAL_ERROR, e.what());
    }

    if (signature.size() != expected.size() ||
        CRYPTO_memcmp(signature.data(), expected.data(), expected.size()) != 0) {
        return invalid("Token signature mismatch");
    }

    nlohmann::json claims = nlohmann::json::parse(payloadJson, nullptr, false);
    if (claims.is_discarded() || !claims.is_object()) {
        return invalid("Token payload is not a JSON object");
    }

    return Result<nlohmann::json>::ok(std::move(claims));
}

std::string JwtCodec::sign(const nlohmann::json& claims) const {
    static const nlohmann::json header = {{"alg", "HS256"}, {"typ", "JWT"}};

    std::string signingInput = base64UrlEncode(header.dump()) + "." + base64UrlEncode(claims.dump());
    return signingInput + "." + base64UrlEncode(hmacSha256(signingInput));
}

} // namespace edge_gateway
