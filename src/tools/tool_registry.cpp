#include "tools/tool_registry.hpp"

#include <algorithm>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace mathguard::tools {
namespace {

constexpr std::size_t kLoggedParamBytes = 120;

}  // namespace

void ToolRegistry::Register(std::unique_ptr<Tool> tool) {
    auto name = tool->Name();
    tools_[std::move(name)] = std::move(tool);
}

Tool* ToolRegistry::Get(const std::string& name) {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nullptr;
    }
    return it->second.get();
}

bool ToolRegistry::Has(const std::string& name) const {
    return tools_.find(name) != tools_.end();
}

std::vector<ToolDefinition> ToolRegistry::GetDefinitions() const {
    std::vector<ToolDefinition> defs;
    for (const auto& [name, tool] : tools_) {
        ToolDefinition def{};
        def.name = name;
        def.description = tool->Description();
        def.parameters_json = tool->ParametersJson();
        defs.push_back(def);
    }
    std::sort(defs.begin(), defs.end(),
              [](const ToolDefinition& a, const ToolDefinition& b) { return a.name < b.name; });
    return defs;
}

std::string ToolRegistry::Execute(
    const std::string& name,
    const std::unordered_map<std::string, std::string>& params) {
    auto tool = Get(name);
    if (!tool) {
        utils::Log(utils::LogLevel::kWarn, "tool", "unknown tool", {{"name", name}});
        return "Error: Tool '" + name + "' not found";
    }
    std::unordered_map<std::string, std::string> fields{{"name", name}};
    for (const auto& [key, value] : params) {
        fields.emplace("param." + key, utils::Truncate(value, kLoggedParamBytes));
    }
    utils::Log(utils::LogLevel::kInfo, "tool", "start", fields);
    const auto result = tool->Execute(params);
    utils::Log(utils::LogLevel::kInfo, "tool", "end",
               {{"name", name}, {"size", std::to_string(result.size())}});
    return result;
}

std::vector<std::string> ToolRegistry::List() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace mathguard::tools
