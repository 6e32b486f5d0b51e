#pragma once

#include <string>
#include <unordered_map>

namespace remindbot::agent::tools {

using ToolParams = std::unordered_map<std::string, std::string>;

// What an agent sees of a tool: its name, a one-line purpose and a JSON schema for the arguments.
struct ToolDefinition {
    std::string name;
    std::string description;
    std::string parameters_json;
};

// A tool acts for exactly one agent. Arguments arrive as strings; tools parse and validate them
// and answer with text, prefixed "Error: " when the call was rejected.
class Tool {
public:
    virtual ~Tool() = default;
    virtual ToolDefinition Definition() const = 0;
    virtual void SetContext(const std::string& agent_id) = 0;
    virtual std::string Execute(const ToolParams& params) = 0;
};

}  // namespace remindbot::agent::tools
