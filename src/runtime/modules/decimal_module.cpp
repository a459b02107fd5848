#include <string>

#include "runtime/interpreter.hpp"
#include "runtime/modules/module_support.hpp"

namespace mathguard::runtime {
namespace {

runtime::Decimal ToDecimal(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kBool:
        case ValueKind::kInt:
            return runtime::Decimal::FromInt(ToBigInt(value));
        case ValueKind::kFloat:
            return runtime::Decimal::FromDouble(value.AsFloat());
        case ValueKind::kStr:
            return runtime::Decimal::Parse(value.AsStr());
        case ValueKind::kDecimal:
            return value.As<DecimalObject>().value;
        case ValueKind::kTuple: {
            // (sign, digits, exponent)
            const auto& parts = Items(value);
            if (parts.size() != 3) {
                throw ValueError("argument must be a sequence of length 3");
            }
            const BigInt sign = ToBigInt(parts[0]);
            if (sign != 0 && sign != 1) {
                throw ValueError("sign must be an integer with the value 0 or 1");
            }
            BigInt coefficient = 0;
            for (const auto& digit : Items(parts[1])) {
                const BigInt d = ToBigInt(digit);
                if (d < 0 || d > 9) {
                    throw ValueError("coefficient must be a tuple of digits");
                }
                coefficient = coefficient * 10 + d;
            }
            return runtime::Decimal::FromParts(sign == 1, coefficient, ToInt64(parts[2]));
        }
        default:
            throw TypeError("conversion from " + TypeName(value) + " to Decimal is not supported");
    }
}

Value Construct(Interpreter&, CallArgs& args) {
    ArgReader reader("Decimal", args, {"value", "context"}, 0);
    if (reader.HasValue(1)) {
        throw TypeError("Decimal() does not accept a context argument");
    }
    if (!reader.Has(0)) {
        return Value::Decimal(runtime::Decimal::FromInt(0));
    }
    return Value::Decimal(ToDecimal(reader.Get(0)));
}

}  // namespace

Value DecimalType() {
    static const Value type = [] {
        auto object = std::make_shared<TypeObject>();
        object->name = "Decimal";
        object->construct = Construct;
        object->matches = [](const Value& value) { return value.Is(ValueKind::kDecimal); };
        object->attributes["from_float"] = MakeBuiltin("from_float", [](Interpreter&, CallArgs& args) {
            ExpectCount("from_float", args, 1, 1);
            const Value& value = args.positional[0];
            if (!value.Is(ValueKind::kFloat) && !IsIntegral(value)) {
                throw TypeError("argument must be int or float");
            }
            return Value::Decimal(ToDecimal(value));
        });
        return Value::FromObject(ValueKind::kType, std::move(object));
    }();
    return type;
}

namespace modules {

MemberTable DecimalMembers() {
    MemberTable table;
    table["Decimal"] = DecimalType();
    for (const Rounding rounding : {Rounding::kHalfUp, Rounding::kHalfEven, Rounding::kHalfDown, Rounding::kUp,
                                    Rounding::kDown, Rounding::kCeiling, Rounding::kFloor}) {
        table[ToString(rounding)] = Value::Str(ToString(rounding));
    }
    return table;
}

}  // namespace modules
}  // namespace mathguard::runtime
