#include "sandbox/worker_protocol.hpp"

#include <stdexcept>

namespace mathguard::sandbox {
namespace {

template <class T>
T Required(const nlohmann::json& data, const char* key) {
    if (!data.is_object() || !data.contains(key)) {
        throw std::invalid_argument(std::string("missing field '") + key + "'");
    }
    try {
        return data.at(key).get<T>();
    } catch (const nlohmann::json::exception& ex) {
        throw std::invalid_argument(std::string("bad field '") + key + "': " + ex.what());
    }
}

template <class T>
void Optional(const nlohmann::json& data, const char* key, T& out) {
    if (data.is_object() && data.contains(key)) {
        out = Required<T>(data, key);
    }
}

}  // namespace

const char* ToString(WorkerStatus status) {
    switch (status) {
        case WorkerStatus::kValue: return "value";
        case WorkerStatus::kError: return "error";
        case WorkerStatus::kBudgetExceeded: return "budget_exceeded";
    }
    return "error";
}

WorkerResponse WorkerResponse::Value(nlohmann::json value, std::string display) {
    WorkerResponse response;
    response.status = WorkerStatus::kValue;
    response.value = std::move(value);
    response.display = std::move(display);
    return response;
}

WorkerResponse WorkerResponse::Error(std::string error_type, std::string message) {
    WorkerResponse response;
    response.status = WorkerStatus::kError;
    response.error_type = std::move(error_type);
    response.message = std::move(message);
    return response;
}

WorkerResponse WorkerResponse::BudgetExceeded(std::string message) {
    WorkerResponse response;
    response.status = WorkerStatus::kBudgetExceeded;
    response.message = std::move(message);
    return response;
}

nlohmann::json ToJson(const WorkerRequest& request) {
    return {
        {"code", request.code},
        {"entry_point", request.entry_point},
        {"args", request.args},
        {"limits", {
            {"max_steps", request.limits.max_steps},
            {"max_recursion_depth", request.limits.max_recursion_depth},
            {"max_collection_size", request.limits.max_collection_size},
            {"memory_limit_bytes", request.limits.memory_limit_bytes},
            {"cpu_seconds", request.limits.cpu_seconds},
            {"max_output_bytes", request.limits.max_output_bytes}
        }}
    };
}

nlohmann::json ToJson(const WorkerResponse& response) {
    nlohmann::json out{{"status", ToString(response.status)}};
    switch (response.status) {
        case WorkerStatus::kValue:
            out["value"] = response.value;
            out["display"] = response.display;
            break;
        case WorkerStatus::kError:
            out["error_type"] = response.error_type;
            out["message"] = response.message;
            break;
        case WorkerStatus::kBudgetExceeded:
            out["message"] = response.message;
            break;
    }
    return out;
}

WorkerRequest ParseRequest(const nlohmann::json& data) {
    WorkerRequest request;
    request.code = Required<std::string>(data, "code");
    request.entry_point = Required<std::string>(data, "entry_point");
    if (data.contains("args")) {
        request.args = data.at("args");
        if (!request.args.is_array()) {
            throw std::invalid_argument("field 'args' must be an array");
        }
    }
    if (data.contains("limits")) {
        const auto& limits = data.at("limits");
        Optional(limits, "max_steps", request.limits.max_steps);
        Optional(limits, "max_recursion_depth", request.limits.max_recursion_depth);
        Optional(limits, "max_collection_size", request.limits.max_collection_size);
        Optional(limits, "memory_limit_bytes", request.limits.memory_limit_bytes);
        Optional(limits, "cpu_seconds", request.limits.cpu_seconds);
        Optional(limits, "max_output_bytes", request.limits.max_output_bytes);
    }
    return request;
}

WorkerResponse ParseResponse(const nlohmann::json& data) {
    const auto status = Required<std::string>(data, "status");
    if (status == "value") {
        if (!data.contains("value")) {
            throw std::invalid_argument("missing field 'value'");
        }
        std::string display;
        Optional(data, "display", display);
        return WorkerResponse::Value(data.at("value"), std::move(display));
    }
    if (status == "error") {
        return WorkerResponse::Error(Required<std::string>(data, "error_type"),
                                     Required<std::string>(data, "message"));
    }
    if (status == "budget_exceeded") {
        std::string message;
        Optional(data, "message", message);
        return WorkerResponse::BudgetExceeded(std::move(message));
    }
    throw std::invalid_argument("unknown status '" + status + "'");
}

}  // namespace mathguard::sandbox
