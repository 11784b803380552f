// components/edge-gateway/src/types.cpp
#include "edge_gateway/types.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace edge_gateway {

bool iequals(const std::string& lhs, const std::string& rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

const std::string* findHeader(const HeaderList& headers, const std::string& name) {
    for (const auto& header : headers) {
        if (iequals(header.first, name)) {
            return &header.second;
        }
    }
    return nullptr;
}

void setHeader(HeaderList& headers, const std::string& name, const std::string& value) {
    removeHeader(headers, name);
    headers.emplace_back(name, value);
}

void removeHeader(HeaderList& headers, const std::string& name) {
    headers.erase(std::remove_if(headers.begin(), headers.end(),
                                 [&name](const auto& header) { return iequals(header.first, name); }),
                  headers.end());
}

std::pair<std::string, std::string> splitTarget(const std::string& target) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return {target, ""};
    }
    return {target.substr(0, pos), target.substr(pos + 1)};
}

std::string formatIso8601(std::chrono::system_clock::time_point time) {
    auto seconds = std::chrono::system_clock::to_time_t(time);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      time.time_since_epoch()).count() % 1000;
    if (millis < 0) {
        millis += 1000;
    }

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

GatewayResponse makeErrorResponse(ErrorCode code, const std::string& message,
                                  std::chrono::system_clock::time_point now) {
    nlohmann::json body = {
        {"error", message},
        {"code", errorCodeToString(code)},
        {"timestamp", formatIso8601(now)}
    };

    GatewayResponse response;
    response.status = errorCodeToStatus(code);
    response.headers.emplace_back("Content-Type", "application/json");
    response.body = body.dump();
    return response;
}

} // namespace edge_gateway
