#include <string>
#include <utility>
#include <vector>

#include "runtime/interpreter.hpp"
#include "runtime/iterators.hpp"
#include "runtime/modules/module_support.hpp"

namespace mathguard::runtime::modules {
namespace {

Value Reduce(Interpreter& interp, CallArgs& args) {
    ExpectCount("reduce", args, 2, 3);
    const Value function = args.positional[0];
    auto source = GetIterator(args.positional[1]);
    Value total;
    bool has_total = args.positional.size() == 3;
    if (has_total) {
        total = args.positional[2];
    }
    Value item;
    while (interp.Next(*source, item)) {
        if (!has_total) {
            total = std::move(item);
            has_total = true;
            continue;
        }
        CallArgs call;
        call.positional = {total, item};
        total = interp.Call(function, std::move(call));
    }
    if (!has_total) {
        throw TypeError("reduce() of empty iterable with no initial value");
    }
    return total;
}

Value Partial(Interpreter&, CallArgs& args) {
    if (args.positional.empty()) {
        throw TypeError("partial expected at least 1 argument, got 0");
    }
    const Value function = args.positional[0];
    if (!function.Is(ValueKind::kFunction) && !function.Is(ValueKind::kBuiltin) && !function.Is(ValueKind::kType)) {
        throw TypeError("the first argument must be callable");
    }
    std::vector<Value> bound(args.positional.begin() + 1, args.positional.end());
    const auto keywords = args.keywords;

    Value result = MakeBuiltin("partial", [function, bound, keywords](Interpreter& interp, CallArgs& call) {
        CallArgs merged;
        merged.positional = bound;
        merged.positional.insert(merged.positional.end(), call.positional.begin(), call.positional.end());
        merged.keywords = keywords;
        for (auto& [name, value] : call.keywords) {
            bool replaced = false;
            for (auto& existing : merged.keywords) {
                if (existing.first == name) {
                    existing.second = value;
                    replaced = true;
                }
            }
            if (!replaced) {
                merged.keywords.emplace_back(name, value);
            }
        }
        return interp.Call(function, std::move(merged));
    });
    auto& attributes = result.As<BuiltinObject>().attributes;
    attributes["func"] = function;
    attributes["args"] = Value::Tuple(bound);
    Value keyword_dict = Value::Dict();
    for (const auto& [name, value] : keywords) {
        keyword_dict.As<DictObject>().entries.Set(Value::Str(name), value);
    }
    attributes["keywords"] = keyword_dict;
    return result;
}

}  // namespace

MemberTable FunctoolsMembers() {
    MemberTable table;
    Define(table, "reduce", Reduce);
    Define(table, "partial", Partial);
    return table;
}

}  // namespace mathguard::runtime::modules
