#pragma once

#include <string>

#include "pipeline/submission_pipeline.hpp"
#include "tools/tool.hpp"

namespace mathguard::tools {

// Exposes SubmissionPipeline::Solve to a function-calling model. The reply is
// always a JSON document, including for malformed parameters.
class SafeExecuteCodeTool : public Tool {
public:
    explicit SafeExecuteCodeTool(const pipeline::SubmissionPipeline& pipeline);

    std::string Name() const override { return "safe_execute_code"; }
    std::string Description() const override;
    std::string ParametersJson() const override;
    std::string Execute(const std::unordered_map<std::string, std::string>& params) override;

private:
    const pipeline::SubmissionPipeline& pipeline_;
};

// {"ok":true,"value":...,"display":"..."} or {"ok":false,"error":"...","message":"..."}
nlohmann::json ToJson(const pipeline::SolveResult& result);

}  // namespace mathguard::tools
