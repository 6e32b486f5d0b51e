#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "agent/tools/tool.hpp"
#include "nlohmann/json.hpp"

namespace remindbot::agent::tools {

// Tools bound to one agent. Registering a tool hands it the agent context.
class ToolRegistry {
public:
    explicit ToolRegistry(std::string agent_id);

    const std::string& AgentId() const { return agent_id_; }

    void Register(std::unique_ptr<Tool> tool);
    bool Has(const std::string& name) const;
    // Sorted by name.
    std::vector<ToolDefinition> GetDefinitions() const;
    // [{name, description, parameters}], parameters as a parsed schema.
    nlohmann::json Catalogue() const;

    std::string Execute(const std::string& name, const ToolParams& params);
    // JSON arguments are flattened to strings; nulls count as absent. nullopt for an unknown tool.
    std::optional<std::string> ExecuteJson(const std::string& name, const nlohmann::json& arguments);

private:
    std::string agent_id_;
    std::map<std::string, std::unique_ptr<Tool>> tools_;
};

}  // namespace remindbot::agent::tools
