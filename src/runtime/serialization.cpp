#include "runtime/serialization.hpp"

#include <cmath>
#include <limits>

#include "runtime/errors.hpp"

namespace mathguard::runtime {
namespace {

// Container nesting deeper than this is treated as a reference cycle.
constexpr int kMaxNesting = 512;

nlohmann::json Encode(const Value& value, int depth) {
    if (depth > kMaxNesting) {
        throw ValueError("Circular reference detected");
    }
    switch (value.kind()) {
        case ValueKind::kBool:
            return value.AsBool();
        case ValueKind::kInt: {
            const BigInt& number = value.AsInt();
            if (number >= std::numeric_limits<long long>::min() && number <= std::numeric_limits<long long>::max()) {
                return number.convert_to<long long>();
            }
            return number.str();
        }
        case ValueKind::kFloat: {
            const double number = value.AsFloat();
            if (std::isnan(number)) {
                return "nan";
            }
            if (std::isinf(number)) {
                return number > 0 ? "inf" : "-inf";
            }
            return number;
        }
        case ValueKind::kComplex:
        case ValueKind::kFraction:
        case ValueKind::kDecimal:
        case ValueKind::kStr:
            return Str(value);
        case ValueKind::kList:
        case ValueKind::kTuple: {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& item : Items(value)) {
                out.push_back(Encode(item, depth + 1));
            }
            return out;
        }
        case ValueKind::kSet:
        case ValueKind::kFrozenSet: {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& item : value.As<SetObject>().entries.Keys()) {
                out.push_back(Encode(item, depth + 1));
            }
            return out;
        }
        case ValueKind::kDict: {
            nlohmann::json out = nlohmann::json::object();
            for (const auto& [key, item] : value.As<DictObject>().entries.Items()) {
                out[Str(key)] = Encode(item, depth + 1);
            }
            return out;
        }
        case ValueKind::kNone:
            return nullptr;
        default:
            throw TypeError("cannot serialize a value of type '" + TypeName(value) + "'");
    }
}

}  // namespace

nlohmann::json ToJson(const Value& value) {
    return Encode(value, 0);
}

Value FromJson(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
            return Value();
        case nlohmann::json::value_t::boolean:
            return Value::Bool(value.get<bool>());
        case nlohmann::json::value_t::number_integer:
            return Value::Int(value.get<long long>());
        case nlohmann::json::value_t::number_unsigned:
            return Value::Int(BigInt(value.get<unsigned long long>()));
        case nlohmann::json::value_t::number_float:
            return Value::Float(value.get<double>());
        case nlohmann::json::value_t::string:
            return Value::Str(value.get<std::string>());
        case nlohmann::json::value_t::array: {
            std::vector<Value> items;
            items.reserve(value.size());
            for (const auto& item : value) {
                items.push_back(FromJson(item));
            }
            return Value::List(std::move(items));
        }
        case nlohmann::json::value_t::object: {
            Value out = Value::Dict();
            auto& entries = out.As<DictObject>().entries;
            for (auto it = value.begin(); it != value.end(); ++it) {
                entries.Set(Value::Str(it.key()), FromJson(it.value()));
            }
            return out;
        }
        default:
            throw TypeError("unsupported JSON argument");
    }
}

}  // namespace mathguard::runtime
