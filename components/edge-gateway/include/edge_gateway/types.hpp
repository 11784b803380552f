// components/edge-gateway/include/edge_gateway/types.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace edge_gateway {

// Error codes, doubling as the machine codes of HTTP error bodies
enum class ErrorCode {
    SUCCESS = 0,
    BAD_REQUEST,
    MISSING_TOKEN,
    INVALID_TOKEN,
    TOKEN_EXPIRED,
    FORBIDDEN,
    ROUTE_NOT_FOUND,
    RATE_LIMITED,
    SERVICE_UNAVAILABLE,
    UPSTREAM_TIMEOUT,
    BAD_GATEWAY,
    CLIENT_CLOSED_REQUEST,
    INTERNAL_ERROR,
    DEPENDENCY_FAILURE,
    INVALID_CONFIGURATION
};

// Convert ErrorCode to string
inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:               return "SUCCESS";
        case ErrorCode::BAD_REQUEST:           return "BAD_REQUEST";
        case ErrorCode::MISSING_TOKEN:         return "MISSING_TOKEN";
        case ErrorCode::INVALID_TOKEN:         return "INVALID_TOKEN";
        case ErrorCode::TOKEN_EXPIRED:         return "TOKEN_EXPIRED";
        case ErrorCode::FORBIDDEN:             return "FORBIDDEN";
        case ErrorCode::ROUTE_NOT_FOUND:       return "ROUTE_NOT_FOUND";
        case ErrorCode::RATE_LIMITED:          return "RATE_LIMITED";
        case ErrorCode::SERVICE_UNAVAILABLE:   return "SERVICE_UNAVAILABLE";
        case ErrorCode::UPSTREAM_TIMEOUT:      return "UPSTREAM_TIMEOUT";
        case ErrorCode::BAD_GATEWAY:           return "BAD_GATEWAY";
        case ErrorCode::CLIENT_CLOSED_REQUEST: return "CLIENT_CLOSED_REQUEST";
        case ErrorCode::INTERNAL_ERROR:        return "INTERNAL_ERROR";
        case ErrorCode::DEPENDENCY_FAILURE:    return "DEPENDENCY_FAILURE";
        case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";
        default:                               return "UNKNOWN_ERROR";
    }
}

// HTTP status for an error code surfaced to clients
inline int errorCodeToStatus(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:               return 200;
        case ErrorCode::BAD_REQUEST:           return 400;
        case ErrorCode::MISSING_TOKEN:
        case ErrorCode::INVALID_TOKEN:
        case ErrorCode::TOKEN_EXPIRED:         return 401;
        case ErrorCode::FORBIDDEN:             return 403;
        case ErrorCode::ROUTE_NOT_FOUND:       return 404;
        case ErrorCode::RATE_LIMITED:          return 429;
        case ErrorCode::CLIENT_CLOSED_REQUEST: return 499;
        case ErrorCode::BAD_GATEWAY:           return 502;
        case ErrorCode::SERVICE_UNAVAILABLE:
        case ErrorCode::DEPENDENCY_FAILURE:    return 503;
        case ErrorCode::UPSTREAM_TIMEOUT:      return 504;
        default:                               return 500;
    }
}

// Result structure for operations
template<typename T>
struct Result {
    bool success = false;
    ErrorCode errorCode = ErrorCode::SUCCESS;
    std::string errorMessage;
    T value;

    static Result<T> ok(T value) {
        Result<T> result;
        result.success = true;
        result.value = std::move(value);
        return result;
    }

    static Result<T> error(ErrorCode code, const std::string& message) {
        Result<T> result;
        result.success = false;
        result.errorCode = code;
        result.errorMessage = message;
        return result;
    }

    explicit operator bool() const {
        return success;
    }
};

// Void result for operations without return value
using VoidResult = Result<bool>;

inline VoidResult makeSuccessResult() {
    return Result<bool>::ok(true);
}

inline VoidResult makeErrorResult(ErrorCode code, const std::string& message) {
    return Result<bool>::error(code, message);
}

// Ordered header list; names compare case-insensitively
using HeaderList = std::vector<std::pair<std::string, std::string>>;

bool iequals(const std::string& lhs, const std::string& rhs);

// First value of a header, or nullptr
const std::string* findHeader(const HeaderList& headers, const std::string& name);

// Replace every occurrence of a header with a single value
void setHeader(HeaderList& headers, const std::string& name, const std::string& value);

void removeHeader(HeaderList& headers, const std::string& name);

// Inbound request as handed over by the HTTP front end
struct GatewayRequest {
    std::string method;
    std::string path;           // Without query string
    std::string query;          // Without leading '?'
    HeaderList headers;
    std::string body;
    std::string remoteAddress;
};

// Response returned to the client
struct GatewayResponse {
    int status = 200;
    HeaderList headers;
    std::string body;
};

// Split "path?query" into its parts
std::pair<std::string, std::string> splitTarget(const std::string& target);

// UTC timestamp formatted as 2024-01-31T12:00:00.000Z
std::string formatIso8601(std::chrono::system_clock::time_point time);

/**
 * @brief Build the JSON error response {"error","code","timestamp"}
 */
GatewayResponse makeErrorResponse(ErrorCode code, const std::string& message,
                                  std::chrono::system_clock::time_point now);

} // namespace edge_gateway
