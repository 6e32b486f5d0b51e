#include "notifier/notifier.hpp"

#include <cctype>
#include <iomanip>
#include <optional>
#include <sstream>
#include <utility>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace remindbot::notifier {
namespace {

using remindbot::utils::LogLevel;

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string base_path;
};

std::optional<ParsedUrl> ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        try {
            parsed.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    } else {
        parsed.host = host_port;
    }

    while (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }
    if (parsed.host.empty()) {
        return std::nullopt;
    }
    return parsed;
}

std::string EncodePathSegment(const std::string& value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase;
    for (const unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string MaskKey(const std::string& key) {
    if (key.size() <= 8) {
        return "****";
    }
    return key.substr(0, 4) + "****" + key.substr(key.size() - 4);
}

}  // namespace

HttpNotifier::HttpNotifier(remindbot::config::NotifierConfig config)
    : config_(std::move(config)) {}

DeliveryResult HttpNotifier::Notify(const std::string& agent_id, const std::string& text) {
    DeliveryResult result{};
    const auto parsed = ParseUrl(config_.base_url);
    if (!parsed.has_value()) {
        result.error = "notifier base url is not configured";
        remindbot::utils::Log("notifier", LogLevel::kError, result.error);
        return result;
    }

    const std::string endpoint = parsed->base_path + "/agents/" + EncodePathSegment(agent_id) + "/messages";
    std::string scheme_host_port = parsed->https ? "https://" : "http://";
    scheme_host_port += parsed->host + ":" + std::to_string(parsed->port);
    httplib::Client client(scheme_host_port);
    client.set_connection_timeout(config_.timeout_s);
    client.set_read_timeout(config_.timeout_s);
    client.set_write_timeout(config_.timeout_s);

    httplib::Headers headers{{"Accept", "application/json"}};
    if (!config_.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.api_key);
    }
    const nlohmann::json payload = {{"message", text}};

    remindbot::utils::Log("notifier", remindbot::utils::LogMessage{
        LogLevel::kDebug, "POST " + scheme_host_port + endpoint, {{"api_key", MaskKey(config_.api_key)}}});

    auto response = client.Post(endpoint, headers, payload.dump(), "application/json");
    if (!response) {
        const auto err = response.error();
        result.error = "request failed: " + httplib::to_string(err);
        remindbot::utils::Log("notifier", remindbot::utils::LogMessage{
            LogLevel::kWarn, "delivery failed", {{"agent", agent_id}, {"error", result.error}}});
        return result;
    }
    result.http_status = response->status;
    if (response->status < 200 || response->status >= 300) {
        result.error = "HTTP " + std::to_string(response->status);
        remindbot::utils::Log("notifier", remindbot::utils::LogMessage{
            LogLevel::kWarn, "delivery failed", {{"agent", agent_id}, {"status", std::to_string(response->status)},
                                                 {"body", response->body}}});
        return result;
    }
    result.ok = true;
    return result;
}

std::unique_ptr<Notifier> CreateNotifier(const remindbot::config::Config& config) {
    return std::make_unique<HttpNotifier>(config.notifier);
}

}  // namespace remindbot::notifier
