#include "sandbox/worker_runner.hpp"

#include <new>
#include <stdexcept>
#include <vector>

#include "lang/parser.hpp"
#include "runtime/errors.hpp"
#include "runtime/interpreter.hpp"
#include "runtime/namespace.hpp"
#include "runtime/serialization.hpp"

namespace mathguard::sandbox {

WorkerResponse RunRequest(const WorkerRequest& request) {
    runtime::Limits limits;
    limits.max_steps = request.limits.max_steps;
    limits.max_recursion_depth = request.limits.max_recursion_depth;
    limits.max_collection_size = request.limits.max_collection_size;
    try {
        const lang::Module parsed = lang::Parse(request.code);
        runtime::Interpreter interpreter(runtime::BuildNamespace(parsed), limits);
        interpreter.Run(request.code);

        std::vector<runtime::Value> args;
        for (const auto& arg : request.args) {
            args.push_back(runtime::FromJson(arg));
        }
        const runtime::Value result = interpreter.CallEntryPoint(request.entry_point, std::move(args));
        if (result.IsNone()) {
            return WorkerResponse::Error("TypeError", "the entry point returned None");
        }
        nlohmann::json encoded = runtime::ToJson(result);
        return WorkerResponse::Value(std::move(encoded), runtime::Repr(result));
    } catch (const lang::SyntaxError& ex) {
        return WorkerResponse::Error("SyntaxError", ex.what());
    } catch (const runtime::ScriptError& ex) {
        return WorkerResponse::Error(ex.type(), ex.message());
    } catch (const runtime::BudgetExceeded& ex) {
        return WorkerResponse::BudgetExceeded(ex.what());
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const std::overflow_error& ex) {
        return WorkerResponse::Error("OverflowError", ex.what());
    } catch (const std::range_error& ex) {
        return WorkerResponse::Error("OverflowError", ex.what());
    } catch (const std::domain_error& ex) {
        return WorkerResponse::Error("ValueError", ex.what());
    } catch (const std::exception& ex) {
        // Library failures that the runtime did not translate itself.
        return WorkerResponse::Error("SystemError", ex.what());
    }
}

}  // namespace mathguard::sandbox
