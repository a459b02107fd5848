#include <boost/multiprecision/integer.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include "runtime/interpreter.hpp"
#include "runtime/modules/module_support.hpp"

namespace mathguard::runtime::modules {
namespace {

using lang::BinaryOperator;

ScriptError StatisticsError(const std::string& message) {
    return ScriptError("StatisticsError", message);
}

// Result type of a sum over mixed data: int widens to Fraction or float,
// Decimal only mixes with int.
enum class NumType { kInt, kFraction, kFloat, kDecimal };

const char* Name(NumType type) {
    switch (type) {
        case NumType::kInt: return "int";
        case NumType::kFraction: return "Fraction";
        case NumType::kFloat: return "float";
        case NumType::kDecimal: return "Decimal";
    }
    return "int";
}

NumType TypeOf(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kBool:
        case ValueKind::kInt:
            return NumType::kInt;
        case ValueKind::kFraction:
            return NumType::kFraction;
        case ValueKind::kFloat:
            return NumType::kFloat;
        case ValueKind::kDecimal:
            return NumType::kDecimal;
        default:
            throw TypeError("can't convert type '" + TypeName(value) + "' to numerator/denominator");
    }
}

NumType Coerce(NumType a, NumType b) {
    if (a == b || b == NumType::kInt) {
        return a;
    }
    if (a == NumType::kInt) {
        return b;
    }
    if (a != NumType::kDecimal && b != NumType::kDecimal) {
        return NumType::kFloat;
    }
    throw TypeError(std::string("don't know how to coerce ") + Name(a) + " and " + Name(b));
}

Value Convert(const Rational& value, NumType type) {
    if (type == NumType::kInt && denominator(value) != 1) {
        type = NumType::kFloat;
    }
    switch (type) {
        case NumType::kInt:
            return Value::Int(BigInt(numerator(value)));
        case NumType::kFraction:
            return Value::Fraction(value);
        case NumType::kFloat:
            return Value::Float(RationalToDouble(value));
        case NumType::kDecimal:
            return Value::Decimal(runtime::Decimal::Divide(runtime::Decimal::FromInt(numerator(value)),
                                                           runtime::Decimal::FromInt(denominator(value)),
                                                           DecimalContext{}));
    }
    return Value();
}

// Exact view of a data set. Infinite and NaN floats or Decimals are summed
// separately and poison the result.
struct Exact {
    NumType type = NumType::kInt;
    std::vector<Rational> values;
    bool special = false;
    std::size_t special_count = 0;
    double special_sum = 0.0;

    std::size_t size() const { return values.size() + special_count; }
    Rational Sum() const {
        Rational total = 0;
        for (const auto& value : values) {
            total += value;
        }
        return total;
    }
};

Exact ExactData(const std::vector<Value>& data) {
    Exact exact;
    for (const auto& item : data) {
        exact.type = Coerce(exact.type, TypeOf(item));
        const double approx = ToDouble(item);
        if ((item.Is(ValueKind::kFloat) || item.Is(ValueKind::kDecimal)) && !std::isfinite(approx)) {
            exact.special = true;
            ++exact.special_count;
            exact.special_sum += approx;
            continue;
        }
        exact.values.push_back(ToRational(item));
    }
    return exact;
}

std::vector<Value> Data(Interpreter& interp, const Value& iterable) {
    return interp.Collect(iterable);
}

std::vector<Value> SortedData(Interpreter& interp, const Value& iterable) {
    std::vector<Value> data = Data(interp, iterable);
    SortValues(interp, data, Value(), false);
    return data;
}

double FloatArg(const Value& value) {
    if (!IsReal(value)) {
        throw TypeError("can't convert type '" + TypeName(value) + "' to numerator/denominator");
    }
    return ToDouble(value);
}

// Exact sum of doubles rounded once, like math.fsum.
double FSum(const std::vector<double>& values) {
    Rational total = 0;
    double special = 0.0;
    bool has_special = false;
    for (double x : values) {
        if (!std::isfinite(x)) {
            special += x;
            has_special = true;
        } else {
            total += RationalFromDouble(x);
        }
    }
    return has_special ? special : RationalToDouble(total);
}

std::vector<double> Floats(Interpreter& interp, const Value& iterable) {
    std::vector<double> out;
    interp.ForEach(iterable, [&](const Value& item) { out.push_back(FloatArg(item)); });
    return out;
}

double SumProduct(const std::vector<double>& a, const std::vector<double>& b) {
    std::vector<double> products;
    Rational total = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!std::isfinite(a[i]) || !std::isfinite(b[i])) {
            products.push_back(a[i] * b[i]);
            continue;
        }
        total += RationalFromDouble(a[i]) * RationalFromDouble(b[i]);
    }
    products.push_back(RationalToDouble(total));
    return FSum(products);
}

// Square root of a non-negative rational, rounded to double with enough
// guard bits that double rounding does not occur in practice.
double SqrtOfRational(const Rational& value) {
    if (value <= 0) {
        return 0.0;
    }
    const BigInt num = numerator(value);
    const BigInt den = denominator(value);
    const long long magnitude = static_cast<long long>(boost::multiprecision::msb(num)) -
                                static_cast<long long>(boost::multiprecision::msb(den));
    const long long shift = std::max(0LL, (240 - magnitude) / 2 + 1);
    const BigInt scaled = (num << static_cast<unsigned>(2 * shift)) / den;
    const BigInt root = boost::multiprecision::sqrt(scaled);
    return RationalToDouble(Rational(root, BigInt(BigInt(1) << static_cast<unsigned>(shift))));
}

Value SqrtResult(const Rational& value, NumType type) {
    if (type == NumType::kDecimal) {
        return Value::Decimal(Convert(value, type).As<DecimalObject>().value.Sqrt(DecimalContext{}));
    }
    return Value::Float(SqrtOfRational(value));
}

Value Mean(Interpreter& interp, CallArgs& args) {
    ExpectCount("mean", args, 1, 1);
    const Exact exact = ExactData(Data(interp, args.positional[0]));
    if (exact.size() < 1) {
        throw StatisticsError("mean requires at least one data point");
    }
    if (exact.special) {
        return Value::Float(exact.special_sum);
    }
    return Convert(exact.Sum() / static_cast<long long>(exact.size()), exact.type);
}

Value FMean(Interpreter& interp, CallArgs& args) {
    ArgReader reader("fmean", args, {"data", "weights"}, 1);
    const std::vector<double> data = Floats(interp, reader.Get(0));
    if (!reader.HasValue(1)) {
        if (data.empty()) {
            throw StatisticsError("fmean requires at least one data point");
        }
        return Value::Float(FSum(data) / static_cast<double>(data.size()));
    }
    const std::vector<double> weights = Floats(interp, reader.Get(1));
    if (weights.size() != data.size()) {
        throw StatisticsError("data and weights must be the same length");
    }
    const double total = FSum(weights);
    if (total == 0.0) {
        throw StatisticsError("sum of weights must be non-zero");
    }
    return Value::Float(SumProduct(data, weights) / total);
}

Value GeometricMean(Interpreter& interp, CallArgs& args) {
    ExpectCount("geometric_mean", args, 1, 1);
    const std::vector<double> data = Floats(interp, args.positional[0]);
    if (data.empty()) {
        throw StatisticsError("Must have a non-empty dataset");
    }
    std::vector<double> logs;
    bool found_zero = false;
    for (double x : data) {
        if (x < 0.0 || std::isnan(x)) {
            throw StatisticsError("No negative inputs allowed");
        }
        if (x == 0.0) {
            found_zero = true;
            continue;
        }
        logs.push_back(std::log(x));
    }
    if (found_zero) {
        return Value::Float(0.0);
    }
    return Value::Float(std::exp(FSum(logs) / static_cast<double>(logs.size())));
}

Value HarmonicMean(Interpreter& interp, CallArgs& args) {
    ArgReader reader("harmonic_mean", args, {"data", "weights"}, 1);
    const std::vector<Value> data = Data(interp, reader.Get(0));
    if (data.empty()) {
        throw StatisticsError("harmonic_mean requires at least one data point");
    }
    std::vector<Value> weights;
    if (reader.HasValue(1)) {
        weights = Data(interp, reader.Get(1));
        if (weights.size() != data.size()) {
            throw StatisticsError("Number of weights does not match data size");
        }
    } else if (data.size() == 1 && IsReal(data[0]) && !data[0].Is(ValueKind::kBool)) {
        if (ToDouble(data[0]) < 0.0) {
            throw StatisticsError("harmonic mean does not support negative values");
        }
        return data[0];
    }
    const Exact exact = ExactData(data);
    NumType type = exact.type;
    Rational weight_sum = 0;
    Rational total = 0;
    for (std::size_t i = 0; i < data.size(); ++i) {
        const Rational weight = weights.empty() ? Rational(1) : ToRational(weights[i]);
        if (!weights.empty()) {
            type = Coerce(type, TypeOf(weights[i]));
            if (weight < 0) {
                throw StatisticsError("Weighted sums must be non-negative");
            }
        }
        const double x = ToDouble(data[i]);
        if (x < 0.0) {
            throw StatisticsError("harmonic mean does not support negative values");
        }
        if (x == 0.0) {
            return Value::Int(0LL);
        }
        if (!std::isfinite(x)) {
            continue;
        }
        weight_sum += weight;
        total += weight / ToRational(data[i]);
    }
    if (weight_sum <= 0) {
        throw StatisticsError("Weighted sum must be positive");
    }
    // The reciprocals are true divisions, so int data yields a float.
    if (type == NumType::kInt) {
        type = NumType::kFloat;
    }
    return Convert(weight_sum / total, type);
}

Value Median(Interpreter& interp, CallArgs& args) {
    ExpectCount("median", args, 1, 1);
    const std::vector<Value> data = SortedData(interp, args.positional[0]);
    if (data.empty()) {
        throw StatisticsError("no median for empty data");
    }
    const std::size_t n = data.size();
    if (n % 2 == 1) {
        return data[n / 2];
    }
    const Value sum = interp.BinaryOp(BinaryOperator::kAdd, data[n / 2 - 1], data[n / 2]);
    return interp.BinaryOp(BinaryOperator::kDiv, sum, Value::Int(2LL));
}

Value MedianLow(Interpreter& interp, CallArgs& args) {
    ExpectCount("median_low", args, 1, 1);
    const std::vector<Value> data = SortedData(interp, args.positional[0]);
    if (data.empty()) {
        throw StatisticsError("no median for empty data");
    }
    const std::size_t n = data.size();
    return n % 2 == 1 ? data[n / 2] : data[n / 2 - 1];
}

Value MedianHigh(Interpreter& interp, CallArgs& args) {
    ExpectCount("median_high", args, 1, 1);
    const std::vector<Value> data = SortedData(interp, args.positional[0]);
    if (data.empty()) {
        throw StatisticsError("no median for empty data");
    }
    return data[data.size() / 2];
}

Value MedianGrouped(Interpreter& interp, CallArgs& args) {
    ArgReader reader("median_grouped", args, {"data", "interval"}, 1);
    const std::vector<Value> data = SortedData(interp, reader.Get(0));
    if (data.empty()) {
        throw StatisticsError("no median for empty data");
    }
    const std::size_t n = data.size();
    const Value& middle = data[n / 2];
    std::size_t i = 0;
    while (i < n && interp.Less(data[i], middle)) {
        ++i;
    }
    std::size_t j = i;
    while (j < n && !interp.Less(middle, data[j])) {
        ++j;
    }
    const Value interval_value = reader.Get(1, Value::Int(1LL));
    if (!IsReal(interval_value) || !IsReal(middle)) {
        throw TypeError("Value cannot be converted to a float");
    }
    const double interval = ToDouble(interval_value);
    const double x = ToDouble(middle);
    const double lower = x - interval / 2.0;
    const double cumulative = static_cast<double>(i);
    const double frequency = static_cast<double>(j - i);
    return Value::Float(lower + interval * (static_cast<double>(n) / 2.0 - cumulative) / frequency);
}

// Occurrence counts in first-seen order.
std::vector<std::pair<Value, long long>> Counts(Interpreter& interp, const Value& iterable) {
    DictStorage index;
    std::vector<std::pair<Value, long long>> counts;
    interp.ForEach(iterable, [&](const Value& item) {
        if (Value* slot = index.Find(item)) {
            ++counts[static_cast<std::size_t>(ToInt64(*slot))].second;
            return;
        }
        index.Set(item, Value::Int(static_cast<long long>(counts.size())));
        counts.emplace_back(item, 1);
    });
    return counts;
}

Value Mode(Interpreter& interp, CallArgs& args) {
    ExpectCount("mode", args, 1, 1);
    const auto counts = Counts(interp, args.positional[0]);
    if (counts.empty()) {
        throw StatisticsError("no mode for empty data");
    }
    const std::pair<Value, long long>* best = &counts.front();
    for (const auto& entry : counts) {
        if (entry.second > best->second) {
            best = &entry;
        }
    }
    return best->first;
}

Value MultiMode(Interpreter& interp, CallArgs& args) {
    ExpectCount("multimode", args, 1, 1);
    const auto counts = Counts(interp, args.positional[0]);
    long long best = 0;
    for (const auto& entry : counts) {
        best = std::max(best, entry.second);
    }
    std::vector<Value> modes;
    for (const auto& entry : counts) {
        if (entry.second == best) {
            modes.push_back(entry.first);
        }
    }
    return Value::List(std::move(modes));
}

// Sum of squared deviations about the exact mean, or about `center` when
// one is given.
struct Deviation {
    NumType type = NumType::kInt;
    Rational ssd = 0;
    std::size_t count = 0;
    bool special = false;
};

Deviation SquaredDeviations(const std::vector<Value>& data, const Value* center) {
    const Exact exact = ExactData(data);
    Deviation out;
    out.type = exact.type;
    out.count = exact.size();
    out.special = exact.special;
    if (exact.special || exact.values.empty()) {
        return out;
    }
    Rational c;
    if (center != nullptr) {
        out.type = Coerce(out.type, TypeOf(*center));
        c = ToRational(*center);
    } else {
        c = exact.Sum() / static_cast<long long>(exact.values.size());
    }
    for (const auto& value : exact.values) {
        const Rational d = value - c;
        out.ssd += d * d;
    }
    return out;
}

Value Spread(Interpreter& interp, CallArgs& args, const std::string& function, bool sample, bool root) {
    ArgReader reader(function, args, {"data", sample ? "xbar" : "mu"}, 1);
    const std::vector<Value> data = Data(interp, reader.Get(0));
    const std::size_t minimum = sample ? 2 : 1;
    if (data.size() < minimum) {
        throw StatisticsError(function + " requires at least " + (sample ? "two data points" : "one data point"));
    }
    const Value center = reader.Get(1, Value());
    const Deviation deviation = SquaredDeviations(data, center.IsNone() ? nullptr : &center);
    if (deviation.special) {
        return Value::Float(std::nan(""));
    }
    const Rational mss = deviation.ssd / static_cast<long long>(deviation.count - (sample ? 1 : 0));
    if (root) {
        return SqrtResult(mss, deviation.type);
    }
    return Convert(mss, deviation.type);
}

Value Quantiles(Interpreter& interp, CallArgs& args) {
    ArgReader reader("quantiles", args, {"data", "n", "method"}, 1);
    if (args.positional.size() > 1) {
        throw TypeError("quantiles() takes 1 positional argument but " + std::to_string(args.positional.size()) +
                        " were given");
    }
    const long long n = reader.Has(1) ? ToInt64(reader.Get(1)) : 4;
    const std::string method = reader.Has(2) ? Str(reader.Get(2)) : "exclusive";
    if (n < 1) {
        throw StatisticsError("n must be at least 1");
    }
    const std::vector<Value> data = SortedData(interp, reader.Get(0));
    const auto ld = static_cast<long long>(data.size());
    if (ld < 2) {
        if (ld == 1) {
            return Value::List(std::vector<Value>(static_cast<std::size_t>(n - 1), data[0]));
        }
        throw StatisticsError("must have at least one data point");
    }
    auto weighted = [&](const Value& a, long long wa, const Value& b, long long wb) {
        const Value left = interp.BinaryOp(BinaryOperator::kMult, a, Value::Int(wa));
        const Value right = interp.BinaryOp(BinaryOperator::kMult, b, Value::Int(wb));
        const Value sum = interp.BinaryOp(BinaryOperator::kAdd, left, right);
        return interp.BinaryOp(BinaryOperator::kDiv, sum, Value::Int(n));
    };
    std::vector<Value> result;
    if (method == "inclusive") {
        const long long m = ld - 1;
        for (long long i = 1; i < n; ++i) {
            const long long j = i * m / n;
            const long long delta = i * m - j * n;
            const Value& upper = j + 1 < ld ? data[static_cast<std::size_t>(j + 1)] : data[static_cast<std::size_t>(j)];
            result.push_back(weighted(data[static_cast<std::size_t>(j)], n - delta, upper, delta));
        }
    } else if (method == "exclusive") {
        const long long m = ld + 1;
        for (long long i = 1; i < n; ++i) {
            long long j = i * m / n;
            j = j < 1 ? 1 : (j > ld - 1 ? ld - 1 : j);
            const long long delta = i * m - j * n;
            result.push_back(weighted(data[static_cast<std::size_t>(j - 1)], n - delta,
                                      data[static_cast<std::size_t>(j)], delta));
        }
    } else {
        throw ValueError("Unknown method: " + Repr(reader.Get(2)));
    }
    return Value::List(std::move(result));
}

void PairedData(Interpreter& interp, CallArgs& args, const std::string& label, std::vector<double>& x,
                std::vector<double>& y) {
    x = Floats(interp, args.positional[0]);
    y = Floats(interp, args.positional[1]);
    if (x.size() != y.size()) {
        throw StatisticsError(label + " requires that both inputs have same number of data points");
    }
    if (x.size() < 2) {
        throw StatisticsError(label + " requires at least two data points");
    }
}

double Centered(std::vector<double>& values) {
    const double mean = FSum(values) / static_cast<double>(values.size());
    for (double& value : values) {
        value -= mean;
    }
    return mean;
}

Value Covariance(Interpreter& interp, CallArgs& args) {
    ExpectCount("covariance", args, 2, 2);
    std::vector<double> x;
    std::vector<double> y;
    PairedData(interp, args, "covariance", x, y);
    Centered(x);
    Centered(y);
    return Value::Float(SumProduct(x, y) / static_cast<double>(x.size() - 1));
}

// Average ranks, 1-based, ties sharing the mean of their positions.
std::vector<double> Ranks(const std::vector<double>& values) {
    std::vector<std::size_t> order(values.size());
    for (std::size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
    }
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) { return values[a] < values[b]; });
    std::vector<double> ranks(values.size());
    std::size_t start = 0;
    while (start < order.size()) {
        std::size_t end = start + 1;
        while (end < order.size() && values[order[end]] == values[order[start]]) {
            ++end;
        }
        const double rank = (static_cast<double>(start + 1) + static_cast<double>(end)) / 2.0;
        for (std::size_t k = start; k < end; ++k) {
            ranks[order[k]] = rank;
        }
        start = end;
    }
    return ranks;
}

Value Correlation(Interpreter& interp, CallArgs& args) {
    ArgReader reader("correlation", args, {"x", "y", "method"}, 2);
    const std::string method = reader.Has(2) ? Str(reader.Get(2)) : "linear";
    if (method != "linear" && method != "ranked") {
        throw ValueError("Unknown method: " + Repr(reader.Get(2)));
    }
    CallArgs pair;
    pair.positional = {reader.Get(0), reader.Get(1)};
    std::vector<double> x;
    std::vector<double> y;
    PairedData(interp, pair, "correlation", x, y);
    if (method == "ranked") {
        x = Ranks(x);
        y = Ranks(y);
    }
    Centered(x);
    Centered(y);
    const double sxy = SumProduct(x, y);
    const double sxx = SumProduct(x, x);
    const double syy = SumProduct(y, y);
    const double denominator_value = std::sqrt(sxx * syy);
    if (denominator_value == 0.0) {
        throw StatisticsError("at least one of the inputs is constant");
    }
    return Value::Float(sxy / denominator_value);
}

Value LinearRegression(Interpreter& interp, CallArgs& args) {
    ArgReader reader("linear_regression", args, {"x", "y", "proportional"}, 2);
    const bool proportional = reader.Has(2) && Truthy(reader.Get(2));
    CallArgs pair;
    pair.positional = {reader.Get(0), reader.Get(1)};
    std::vector<double> x;
    std::vector<double> y;
    PairedData(interp, pair, "linear regression", x, y);
    double xbar = 0.0;
    double ybar = 0.0;
    if (!proportional) {
        xbar = Centered(x);
        ybar = Centered(y);
    }
    const double sxy = SumProduct(x, y);
    const double sxx = SumProduct(x, x);
    if (sxx == 0.0) {
        throw StatisticsError("x is constant");
    }
    const double slope = sxy / sxx;
    const double intercept = proportional ? 0.0 : ybar - slope * xbar;
    return Value::Tuple({Value::Float(slope), Value::Float(intercept)});
}

}  // namespace

MemberTable StatisticsMembers() {
    MemberTable table;
    Define(table, "mean", Mean);
    Define(table, "fmean", FMean);
    Define(table, "geometric_mean", GeometricMean);
    Define(table, "harmonic_mean", HarmonicMean);
    Define(table, "median", Median);
    Define(table, "median_low", MedianLow);
    Define(table, "median_high", MedianHigh);
    Define(table, "median_grouped", MedianGrouped);
    Define(table, "mode", Mode);
    Define(table, "multimode", MultiMode);
    Define(table, "variance", [](Interpreter& interp, CallArgs& args) {
        return Spread(interp, args, "variance", true, false);
    });
    Define(table, "pvariance", [](Interpreter& interp, CallArgs& args) {
        return Spread(interp, args, "pvariance", false, false);
    });
    Define(table, "stdev", [](Interpreter& interp, CallArgs& args) {
        return Spread(interp, args, "stdev", true, true);
    });
    Define(table, "pstdev", [](Interpreter& interp, CallArgs& args) {
        return Spread(interp, args, "pstdev", false, true);
    });
    Define(table, "quantiles", Quantiles);
    Define(table, "covariance", Covariance);
    Define(table, "correlation", Correlation);
    Define(table, "linear_regression", LinearRegression);
    return table;
}

}  // namespace mathguard::runtime::modules
