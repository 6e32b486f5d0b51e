#include "agent/tools/reminder.hpp"

#include <optional>
#include <stdexcept>

#include "utils/common.hpp"

namespace remindbot::agent::tools {
namespace {

std::string GetParam(const ToolParams& params,
                     const std::string& name) {
    auto it = params.find(name);
    if (it == params.end()) {
        return {};
    }
    return remindbot::utils::Trim(it->second);
}

std::optional<std::string> GetOptionalParam(const ToolParams& params,
                                            const std::string& name) {
    auto value = GetParam(params, name);
    if (value.empty() || value == "null") {
        return std::nullopt;
    }
    return value;
}

std::optional<long long> ParseLongLong(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
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

}  // namespace

ToolDefinition CreateReminderTool::Definition() const {
    return ToolDefinition{
        "create_reminder",
        "Create a reminder. Give either a recurrence_rule (iCalendar RRULE such as "
        "FREQ=DAILY;BYHOUR=21;BYMINUTE=30), a timestamp (YYYY-MM-DD HH:MM:SS) or delay_minutes. "
        "A timestamp wins over delay_minutes, which wins over the rule.",
        R"({"type":"object","properties":{"description":{"type":"string","description":"What to remind about; unique per agent"},"recurrence_rule":{"type":"string","description":"RRULE, e.g. FREQ=WEEKLY;BYDAY=MO,WE;BYHOUR=9;BYMINUTE=0"},"timestamp":{"type":"string","description":"Local time: YYYY-MM-DD HH:MM:SS"},"delay_minutes":{"type":"integer","minimum":0}},"required":["description"]})"};
}

std::string CreateReminderTool::Execute(const ToolParams& params) {
    if (!reminders_) {
        return "Error: reminder service not configured";
    }
    const auto description = GetParam(params, "description");
    if (description.empty()) {
        return "Error: description is required";
    }
    remindbot::reminder::ScheduleRequest request;
    request.recurrence_rule = GetOptionalParam(params, "recurrence_rule");
    request.timestamp = GetOptionalParam(params, "timestamp");
    const auto delay_raw = GetOptionalParam(params, "delay_minutes");
    if (delay_raw.has_value()) {
        request.delay_minutes = ParseLongLong(*delay_raw);
        if (!request.delay_minutes.has_value()) {
            return "Error: delay_minutes must be an integer";
        }
    }
    return reminders_->CreateReminder(agent_id_, description, request);
}

ToolDefinition DeleteReminderTool::Definition() const {
    return ToolDefinition{
        "delete_reminder",
        "Delete a reminder by its ID or by its exact description.",
        R"({"type":"object","properties":{"description":{"type":"string"},"reminder_id":{"type":"integer"}}})"};
}

std::string DeleteReminderTool::Execute(const ToolParams& params) {
    if (!reminders_) {
        return "Error: reminder service not configured";
    }
    const auto description = GetOptionalParam(params, "description");
    const auto id_raw = GetOptionalParam(params, "reminder_id");
    std::optional<long long> id;
    if (id_raw.has_value()) {
        id = ParseLongLong(*id_raw);
        if (!id.has_value()) {
            return "Error: reminder_id must be an integer";
        }
    }
    if (!id.has_value() && !description.has_value()) {
        return "Error: description or reminder_id is required";
    }
    return reminders_->DeleteReminder(agent_id_, id, description);
}

ToolDefinition ListRemindersTool::Definition() const {
    return ToolDefinition{
        "list_reminders",
        "List the reminders of this agent, one page at a time.",
        R"({"type":"object","properties":{"page":{"type":"integer","minimum":0,"description":"0-based page"}}})"};
}

std::string ListRemindersTool::Execute(const ToolParams& params) {
    if (!reminders_) {
        return "Error: reminder service not configured";
    }
    long long page = 0;
    const auto page_raw = GetOptionalParam(params, "page");
    if (page_raw.has_value()) {
        const auto parsed = ParseLongLong(*page_raw);
        if (!parsed.has_value() || *parsed < 0) {
            return "Error: page must be a non-negative integer";
        }
        page = *parsed;
    }
    return reminders_->ListReminders(agent_id_, static_cast<std::size_t>(page));
}

std::unique_ptr<ToolRegistry> BuildReminderTools(remindbot::reminder::ReminderService* reminders,
                                                 const std::string& agent_id) {
    auto registry = std::make_unique<ToolRegistry>(agent_id);
    registry->Register(std::make_unique<CreateReminderTool>(reminders));
    registry->Register(std::make_unique<DeleteReminderTool>(reminders));
    registry->Register(std::make_unique<ListRemindersTool>(reminders));
    return registry;
}

}  // namespace remindbot::agent::tools
