#include <string>
#include <vector>

#include "runtime/interpreter.hpp"
#include "runtime/modules/module_support.hpp"

namespace mathguard::runtime::modules {
namespace {

using lang::BinaryOperator;
using lang::CompareOperator;
using lang::UnaryOperator;

void DefineBinary(MemberTable& table, const std::string& name, BinaryOperator op) {
    Define(table, name, [name, op](Interpreter& interp, CallArgs& args) {
        ExpectCount(name, args, 2, 2);
        return interp.BinaryOp(op, args.positional[0], args.positional[1]);
    });
}

void DefineUnary(MemberTable& table, const std::string& name, UnaryOperator op) {
    Define(table, name, [name, op](Interpreter& interp, CallArgs& args) {
        ExpectCount(name, args, 1, 1);
        return interp.UnaryOp(op, args.positional[0]);
    });
}

void DefineCompare(MemberTable& table, const std::string& name, CompareOperator op) {
    Define(table, name, [name, op](Interpreter& interp, CallArgs& args) {
        ExpectCount(name, args, 2, 2);
        return Value::Bool(interp.Compare(op, args.positional[0], args.positional[1]));
    });
}

bool IsSequence(const Value& value) {
    return value.Is(ValueKind::kList) || value.Is(ValueKind::kTuple) || value.Is(ValueKind::kStr);
}

}  // namespace

MemberTable OperatorMembers() {
    MemberTable table;
    DefineBinary(table, "add", BinaryOperator::kAdd);
    DefineBinary(table, "sub", BinaryOperator::kSub);
    DefineBinary(table, "mul", BinaryOperator::kMult);
    DefineBinary(table, "truediv", BinaryOperator::kDiv);
    DefineBinary(table, "floordiv", BinaryOperator::kFloorDiv);
    DefineBinary(table, "mod", BinaryOperator::kMod);
    DefineBinary(table, "pow", BinaryOperator::kPow);
    DefineBinary(table, "and_", BinaryOperator::kBitAnd);
    DefineBinary(table, "or_", BinaryOperator::kBitOr);
    DefineBinary(table, "xor", BinaryOperator::kBitXor);
    DefineBinary(table, "lshift", BinaryOperator::kLShift);
    DefineBinary(table, "rshift", BinaryOperator::kRShift);
    DefineUnary(table, "neg", UnaryOperator::kUSub);
    DefineUnary(table, "pos", UnaryOperator::kUAdd);
    DefineUnary(table, "invert", UnaryOperator::kInvert);
    DefineUnary(table, "not_", UnaryOperator::kNot);
    DefineCompare(table, "eq", CompareOperator::kEq);
    DefineCompare(table, "ne", CompareOperator::kNotEq);
    DefineCompare(table, "lt", CompareOperator::kLt);
    DefineCompare(table, "le", CompareOperator::kLtE);
    DefineCompare(table, "gt", CompareOperator::kGt);
    DefineCompare(table, "ge", CompareOperator::kGtE);

    Define(table, "abs", [](Interpreter&, CallArgs& args) {
        ExpectCount("abs", args, 1, 1);
        if (!IsNumber(args.positional[0])) {
            throw TypeError("bad operand type for abs(): '" + TypeName(args.positional[0]) + "'");
        }
        return NumericAbs(args.positional[0]);
    });
    Define(table, "truth", [](Interpreter&, CallArgs& args) {
        ExpectCount("truth", args, 1, 1);
        return Value::Bool(Truthy(args.positional[0]));
    });
    Define(table, "index", [](Interpreter&, CallArgs& args) {
        ExpectCount("index", args, 1, 1);
        if (!IsIntegral(args.positional[0])) {
            throw TypeError("'" + TypeName(args.positional[0]) +
                            "' object cannot be interpreted as an integer");
        }
        return Value::Int(ToBigInt(args.positional[0]));
    });
    Define(table, "concat", [](Interpreter& interp, CallArgs& args) {
        ExpectCount("concat", args, 2, 2);
        if (!IsSequence(args.positional[0])) {
            throw TypeError("'" + TypeName(args.positional[0]) + "' object can't be concatenated");
        }
        return interp.BinaryOp(BinaryOperator::kAdd, args.positional[0], args.positional[1]);
    });
    Define(table, "contains", [](Interpreter& interp, CallArgs& args) {
        ExpectCount("contains", args, 2, 2);
        return Value::Bool(interp.Contains(args.positional[0], args.positional[1]));
    });
    Define(table, "itemgetter", [](Interpreter&, CallArgs& args) {
        NoKeywords("itemgetter", args);
        if (args.positional.empty()) {
            throw TypeError("itemgetter expected 1 argument, got 0");
        }
        const std::vector<Value> items = args.positional;
        return MakeBuiltin("itemgetter", [items](Interpreter& interp, CallArgs& call) {
            ExpectCount("itemgetter", call, 1, 1);
            const Value& object = call.positional[0];
            if (items.size() == 1) {
                return interp.GetItem(object, items[0]);
            }
            std::vector<Value> row;
            row.reserve(items.size());
            for (const auto& item : items) {
                row.push_back(interp.GetItem(object, item));
            }
            return Value::Tuple(std::move(row));
        });
    });
    return table;
}

}  // namespace mathguard::runtime::modules
