#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "config/config_loader.hpp"
#include "pipeline/submission_pipeline.hpp"
#include "tools/safe_execute_code.hpp"
#include "tools/tool_registry.hpp"
#include "utils/logging.hpp"
#include "validator/static_validator.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void PrintUsage() {
    std::cerr << "Usage: mathguard_cli check <file>\n"
              << "       mathguard_cli run <file> <entry_point> [json-args]\n"
              << "       mathguard_cli tool <json-params>" << std::endl;
}

std::optional<std::string> ReadSource(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

void ApplyLogging(const mathguard::config::Config& config) {
    mathguard::utils::LogConfig log_config;
    log_config.min_level = mathguard::utils::ParseLogLevel(config.logging.level);
    mathguard::utils::SetLogConfig(log_config);
}

int CheckFile(const std::string& path, const mathguard::config::Config& config) {
    const auto source = ReadSource(path);
    if (!source) {
        std::cerr << "cannot read " << path << std::endl;
        return kExitUsage;
    }
    mathguard::validator::ValidatorOptions options;
    options.max_source_bytes = config.validator.max_source_bytes;
    options.max_function_depth = config.validator.max_function_depth;
    const mathguard::validator::StaticValidator validator(mathguard::catalog::CapabilityCatalog::Default(),
                                                          options);
    const auto outcome = validator.Validate(*source);
    if (outcome.accepted) {
        std::cout << "accepted" << std::endl;
        return kExitOk;
    }
    std::cout << "rejected (" << mathguard::validator::ToString(outcome.rule) << ") line "
              << outcome.line << ", column " << outcome.column << ": " << outcome.reason << std::endl;
    return kExitFailure;
}

int RunFile(const std::string& path,
            const std::string& entry_point,
            const std::string& raw_args,
            const mathguard::config::Config& config) {
    const auto source = ReadSource(path);
    if (!source) {
        std::cerr << "cannot read " << path << std::endl;
        return kExitUsage;
    }
    nlohmann::json args = nlohmann::json::array();
    if (!raw_args.empty()) {
        try {
            args = nlohmann::json::parse(raw_args);
        } catch (const nlohmann::json::parse_error& ex) {
            std::cerr << "invalid json-args: " << ex.what() << std::endl;
            return kExitUsage;
        }
        if (!args.is_array()) {
            std::cerr << "json-args must be a JSON array" << std::endl;
            return kExitUsage;
        }
    }

    auto pipeline = mathguard::pipeline::CreatePipeline(config);
    const auto result = pipeline->Solve(*source, entry_point, args);
    std::cout << mathguard::tools::ToJson(result).dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
    return result.ok ? kExitOk : kExitFailure;
}

// The params object names the tool with "name" (default safe_execute_code);
// every other member becomes a string parameter.
int RunTool(const std::string& raw_params, const mathguard::config::Config& config) {
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(raw_params);
    } catch (const nlohmann::json::parse_error& ex) {
        std::cerr << "invalid json-params: " << ex.what() << std::endl;
        return kExitUsage;
    }
    if (!data.is_object()) {
        std::cerr << "json-params must be a JSON object" << std::endl;
        return kExitUsage;
    }

    std::string name = "safe_execute_code";
    std::unordered_map<std::string, std::string> params;
    for (auto it = data.begin(); it != data.end(); ++it) {
        const std::string text = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
        if (it.key() == "name") {
            name = text;
        } else {
            params[it.key()] = text;
        }
    }

    auto pipeline = mathguard::pipeline::CreatePipeline(config);
    mathguard::tools::ToolRegistry registry;
    registry.Register(std::make_unique<mathguard::tools::SafeExecuteCodeTool>(*pipeline));
    if (!registry.Has(name)) {
        std::cerr << "unknown tool '" << name << "'" << std::endl;
        return kExitUsage;
    }

    const auto reply = registry.Execute(name, params);
    std::cout << reply << std::endl;
    try {
        const auto parsed = nlohmann::json::parse(reply);
        return parsed.value("ok", false) ? kExitOk : kExitFailure;
    } catch (const nlohmann::json::parse_error&) {
        return kExitFailure;
    }
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return kExitUsage;
    }
    const std::string command = argv[1];
    const auto config = mathguard::config::LoadConfig();
    ApplyLogging(config);

    if (command == "check" && argc == 3) {
        return CheckFile(argv[2], config);
    }
    if (command == "run" && (argc == 4 || argc == 5)) {
        return RunFile(argv[2], argv[3], argc == 5 ? argv[4] : "", config);
    }
    if (command == "tool" && argc == 3) {
        return RunTool(argv[2], config);
    }
    PrintUsage();
    return kExitUsage;
}
