#include "server/reminder_http_server.hpp"

#include <optional>
#include <stdexcept>

#include "agent/tools/reminder.hpp"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace remindbot::server {
namespace {

using remindbot::reminder::Reminder;
using remindbot::reminder::ReminderStatus;
using remindbot::utils::LogLevel;

constexpr const char* kJson = "application/json";

void Reply(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), kJson);
}

void ReplyMessage(httplib::Response& res, int status, const std::string& message) {
    Reply(res, status, nlohmann::json{{"message", message}});
}

int HttpStatusFor(ReminderStatus status) {
    switch (status) {
        case ReminderStatus::kOk: return 200;
        case ReminderStatus::kInvalidRequest:
        case ReminderStatus::kInvalidSchedule: return 400;
        case ReminderStatus::kDuplicateDescription: return 409;
        case ReminderStatus::kNotFound: return 404;
        case ReminderStatus::kDeliveryFailure: return 502;
        case ReminderStatus::kStoreFailure: return 500;
    }
    return 500;
}

std::optional<long long> ParseQueryInteger(const std::string& value) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::optional<std::string> OptionalString(const nlohmann::json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw std::invalid_argument(std::string(key) + " must be a string");
    }
    return it->get<std::string>();
}

std::optional<long long> OptionalInteger(const nlohmann::json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_number_integer()) {
        return it->get<long long>();
    }
    if (it->is_string()) {
        const auto parsed = ParseQueryInteger(it->get<std::string>());
        if (parsed.has_value()) {
            return parsed;
        }
    }
    throw std::invalid_argument(std::string(key) + " must be an integer");
}

nlohmann::json OptionalTime(const std::optional<remindbot::utils::TimePoint>& tp) {
    return tp.has_value() ? nlohmann::json(remindbot::utils::FormatLocalTime(*tp)) : nlohmann::json(nullptr);
}

nlohmann::json BuildReminderJson(const Reminder& reminder) {
    return {
        {"id", reminder.id},
        {"agentId", reminder.agent_id},
        {"description", reminder.description},
        {"recurrenceRule", reminder.recurrence_rule.has_value() ? nlohmann::json(*reminder.recurrence_rule)
                                                                : nlohmann::json(nullptr)},
        {"createdAt", remindbot::utils::FormatLocalTime(reminder.created_at)},
        {"updatedAt", remindbot::utils::FormatLocalTime(reminder.modified_at)},
        {"nextFireAt", OptionalTime(reminder.next_fire_at)}
    };
}

void LogRequest(const httplib::Request& req, const httplib::Response& res) {
    remindbot::utils::Log("http", remindbot::utils::LogMessage{
        LogLevel::kDebug, req.method + " " + req.path, {{"status", std::to_string(res.status)}}});
}

}  // namespace

ReminderHttpServer::ReminderHttpServer(remindbot::reminder::ReminderService& reminders,
                                       const remindbot::reminder::SchedulerEngine& engine)
    : reminders_(reminders)
    , engine_(engine) {
    RegisterRoutes();
}

void ReminderHttpServer::RegisterRoutes() {
    server_.set_logger(LogRequest);

    server_.Post("/reminders", [this](const httplib::Request& req, httplib::Response& res) {
        const auto body = nlohmann::json::parse(req.body, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            ReplyMessage(res, 400, "Error: request body must be a JSON object");
            return;
        }
        std::string agent_id;
        std::string description;
        remindbot::reminder::ScheduleRequest request;
        try {
            agent_id = OptionalString(body, "agentId").value_or("");
            description = OptionalString(body, "description").value_or("");
            request.recurrence_rule = OptionalString(body, "recurrenceRule");
            request.timestamp = OptionalString(body, "timestamp");
            request.delay_minutes = OptionalInteger(body, "delayMinutes");
        } catch (const std::invalid_argument& ex) {
            ReplyMessage(res, 400, std::string("Error: ") + ex.what());
            return;
        }
        const auto result = reminders_.Create(agent_id, description, request);
        const int status = result.ok() ? 201 : HttpStatusFor(result.status);
        ReplyMessage(res, status, remindbot::reminder::ReminderService::CreateMessage(result));
    });

    server_.Delete(R"(/reminders/(\d+))", [this](const httplib::Request& req, httplib::Response& res) {
        const auto agent_id = req.get_param_value("agentId");
        if (agent_id.empty()) {
            ReplyMessage(res, 400, "Error: agentId is required");
            return;
        }
        const auto id = ParseQueryInteger(req.matches[1].str());
        if (!id.has_value()) {
            ReplyMessage(res, 400, "Error: invalid reminder id");
            return;
        }
        const auto result = reminders_.Delete(agent_id, id, std::nullopt);
        ReplyMessage(res, HttpStatusFor(result.status), remindbot::reminder::ReminderService::DeleteMessage(result));
    });

    server_.Delete("/reminders", [this](const httplib::Request& req, httplib::Response& res) {
        const auto agent_id = req.get_param_value("agentId");
        if (agent_id.empty()) {
            ReplyMessage(res, 400, "Error: agentId is required");
            return;
        }
        std::optional<std::string> description;
        if (req.has_param("description")) {
            description = req.get_param_value("description");
        }
        const auto result = reminders_.Delete(agent_id, std::nullopt, description);
        ReplyMessage(res, HttpStatusFor(result.status), remindbot::reminder::ReminderService::DeleteMessage(result));
    });

    server_.Get("/reminders", [this](const httplib::Request& req, httplib::Response& res) {
        const auto agent_id = req.get_param_value("agentId");
        if (agent_id.empty()) {
            ReplyMessage(res, 400, "Error: agentId is required");
            return;
        }
        long long page = 0;
        if (req.has_param("page")) {
            const auto parsed = ParseQueryInteger(req.get_param_value("page"));
            if (!parsed.has_value() || *parsed < 0) {
                ReplyMessage(res, 400, "Error: page must be a non-negative integer");
                return;
            }
            page = *parsed;
        }
        const auto listing = reminders_.List(agent_id, static_cast<std::size_t>(page));
        if (!listing.ok()) {
            ReplyMessage(res, HttpStatusFor(listing.status), "Error: " + listing.detail);
            return;
        }
        nlohmann::json items = nlohmann::json::array();
        for (const auto& reminder : listing.items) {
            items.push_back(BuildReminderJson(reminder));
        }
        Reply(res, 200, nlohmann::json{
            {"reminders", items},
            {"pagination", {
                {"total", listing.total},
                {"page", listing.page},
                {"pageSize", listing.page_size},
                {"totalPages", listing.total_pages}
            }}
        });
    });

    server_.Get("/tools", [this](const httplib::Request& req, httplib::Response& res) {
        const auto registry = remindbot::agent::tools::BuildReminderTools(&reminders_, req.get_param_value("agentId"));
        Reply(res, 200, nlohmann::json{{"tools", registry->Catalogue()}});
    });

    server_.Post(R"(/tools/([a-z_]+))", [this](const httplib::Request& req, httplib::Response& res) {
        const auto body = nlohmann::json::parse(req.body, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            ReplyMessage(res, 400, "Error: request body must be a JSON object");
            return;
        }
        const auto agent_it = body.find("agentId");
        if (agent_it == body.end() || !agent_it->is_string() || agent_it->get<std::string>().empty()) {
            ReplyMessage(res, 400, "Error: agentId is required");
            return;
        }
        const auto name = req.matches[1].str();
        auto registry = remindbot::agent::tools::BuildReminderTools(&reminders_, agent_it->get<std::string>());
        const auto args_it = body.find("arguments");
        const auto result = registry->ExecuteJson(name, args_it != body.end() ? *args_it : nlohmann::json::object());
        if (!result.has_value()) {
            ReplyMessage(res, 404, "Error: Tool '" + name + "' not found");
            return;
        }
        Reply(res, 200, nlohmann::json{{"result", *result}});
    });

    server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        const auto status = engine_.GetStatus();
        Reply(res, 200, nlohmann::json{
            {"status", "ok"},
            {"running", status.running},
            {"pending", status.pending},
            {"nextWakeAt", OptionalTime(status.next_wake_at)}
        });
    });
}

bool ReminderHttpServer::Listen(const std::string& host, int port) {
    remindbot::utils::Log("http", remindbot::utils::LogMessage{
        LogLevel::kInfo, "listening", {{"host", host}, {"port", std::to_string(port)}}});
    const bool ok = server_.listen(host, port);
    if (!ok) {
        remindbot::utils::Log("http", LogLevel::kError,
                              "failed to listen on " + host + ":" + std::to_string(port));
    }
    return ok;
}

int ReminderHttpServer::BindToAnyPort(const std::string& host) {
    return server_.bind_to_any_port(host);
}

bool ReminderHttpServer::ListenAfterBind() {
    return server_.listen_after_bind();
}

void ReminderHttpServer::Stop() {
    server_.stop();
}

void ReminderHttpServer::WaitUntilReady() {
    server_.wait_until_ready();
}

}  // namespace remindbot::server
