#include "agent/tools/tool_registry.hpp"

#include <utility>

#include "utils/logging.hpp"

namespace remindbot::agent::tools {
namespace {

std::string ArgumentText(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

}  // namespace

ToolRegistry::ToolRegistry(std::string agent_id)
    : agent_id_(std::move(agent_id)) {}

void ToolRegistry::Register(std::unique_ptr<Tool> tool) {
    tool->SetContext(agent_id_);
    auto name = tool->Definition().name;
    tools_.insert_or_assign(std::move(name), std::move(tool));
}

bool ToolRegistry::Has(const std::string& name) const {
    return tools_.count(name) > 0;
}

std::vector<ToolDefinition> ToolRegistry::GetDefinitions() const {
    std::vector<ToolDefinition> defs;
    defs.reserve(tools_.size());
    for (const auto& entry : tools_) {
        defs.push_back(entry.second->Definition());
    }
    return defs;
}

nlohmann::json ToolRegistry::Catalogue() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& def : GetDefinitions()) {
        tools.push_back({
            {"name", def.name},
            {"description", def.description},
            {"parameters", nlohmann::json::parse(def.parameters_json)}
        });
    }
    return tools;
}

std::string ToolRegistry::Execute(const std::string& name, const ToolParams& params) {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return "Error: Tool '" + name + "' not found";
    }
    remindbot::utils::LogMessage start{remindbot::utils::LogLevel::kInfo, "start name=" + name,
                                       {{"agent", agent_id_}}};
    for (const auto& [key, value] : params) {
        start.fields.emplace(key, value);
    }
    remindbot::utils::Log("tool", start);
    const auto result = it->second->Execute(params);
    const bool rejected = result.rfind("Error:", 0) == 0;
    remindbot::utils::Log("tool", remindbot::utils::LogMessage{
        rejected ? remindbot::utils::LogLevel::kWarn : remindbot::utils::LogLevel::kInfo,
        "end name=" + name, {{"agent", agent_id_}, {"size", std::to_string(result.size())}}});
    return result;
}

std::optional<std::string> ToolRegistry::ExecuteJson(const std::string& name, const nlohmann::json& arguments) {
    if (!Has(name)) {
        return std::nullopt;
    }
    ToolParams params;
    if (arguments.is_object()) {
        for (const auto& [key, value] : arguments.items()) {
            if (!value.is_null()) {
                params.emplace(key, ArgumentText(value));
            }
        }
    }
    return Execute(name, params);
}

}  // namespace remindbot::agent::tools
