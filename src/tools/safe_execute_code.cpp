#include "tools/safe_execute_code.hpp"

namespace mathguard::tools {
namespace {

std::string InvalidArguments(const std::string& message) {
    nlohmann::json reply = {{"ok", false}, {"error", "invalid_arguments"}, {"message", message}};
    return reply.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool IsScalar(const nlohmann::json& value) {
    return value.is_string() || value.is_number() || value.is_boolean();
}

}  // namespace

SafeExecuteCodeTool::SafeExecuteCodeTool(const pipeline::SubmissionPipeline& pipeline)
    : pipeline_(pipeline) {}

std::string SafeExecuteCodeTool::Description() const {
    return "Run a self-contained Python function that computes a numeric answer. "
           "Only the math-oriented standard modules (math, cmath, fractions, decimal, "
           "statistics, itertools, functools, operator, random) may be imported. "
           "Returns the function's return value as JSON.";
}

std::string SafeExecuteCodeTool::ParametersJson() const {
    return R"({"type":"object","properties":{)"
           R"("code_string":{"type":"string","description":"Python source defining the function"},)"
           R"("function_name":{"type":"string","description":"Name of the function to call"},)"
           R"("args":{"type":"string","description":"JSON array of string, number or boolean arguments"}},)"
           R"("required":["code_string","function_name"]})";
}

std::string SafeExecuteCodeTool::Execute(const std::unordered_map<std::string, std::string>& params) {
    auto code = params.find("code_string");
    if (code == params.end() || code->second.empty()) {
        return InvalidArguments("missing code_string");
    }
    auto function = params.find("function_name");
    if (function == params.end() || function->second.empty()) {
        return InvalidArguments("missing function_name");
    }

    nlohmann::json args = nlohmann::json::array();
    auto raw_args = params.find("args");
    if (raw_args != params.end() && !raw_args->second.empty()) {
        try {
            args = nlohmann::json::parse(raw_args->second);
        } catch (const nlohmann::json::parse_error& ex) {
            return InvalidArguments(std::string("args is not valid JSON: ") + ex.what());
        }
        if (!args.is_array()) {
            return InvalidArguments("args must be a JSON array");
        }
        for (const auto& item : args) {
            if (!IsScalar(item)) {
                return InvalidArguments("args may only hold strings, numbers and booleans");
            }
        }
    }

    const auto result = pipeline_.Solve(code->second, function->second, args);
    return ToJson(result).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json ToJson(const pipeline::SolveResult& result) {
    if (result.ok) {
        return {{"ok", true}, {"value", result.value}, {"display", result.display}};
    }
    return {{"ok", false}, {"error", pipeline::ToString(result.error)}, {"message", result.message}};
}

}  // namespace mathguard::tools
