#pragma once

#include <memory>
#include <string>

#include "agent/tools/tool.hpp"
#include "agent/tools/tool_registry.hpp"
#include "reminder/reminder_service.hpp"

namespace remindbot::agent::tools {

class ReminderTool : public Tool {
public:
    explicit ReminderTool(remindbot::reminder::ReminderService* reminders)
        : reminders_(reminders) {}

    void SetContext(const std::string& agent_id) override { agent_id_ = agent_id; }

protected:
    remindbot::reminder::ReminderService* reminders_ = nullptr;
    std::string agent_id_;
};

class CreateReminderTool : public ReminderTool {
public:
    using ReminderTool::ReminderTool;

    ToolDefinition Definition() const override;
    std::string Execute(const ToolParams& params) override;
};

class DeleteReminderTool : public ReminderTool {
public:
    using ReminderTool::ReminderTool;

    ToolDefinition Definition() const override;
    std::string Execute(const ToolParams& params) override;
};

class ListRemindersTool : public ReminderTool {
public:
    using ReminderTool::ReminderTool;

    ToolDefinition Definition() const override;
    std::string Execute(const ToolParams& params) override;
};

// Registry holding the three reminder tools bound to one agent.
std::unique_ptr<ToolRegistry> BuildReminderTools(remindbot::reminder::ReminderService* reminders,
                                                 const std::string& agent_id);

}  // namespace remindbot::agent::tools
