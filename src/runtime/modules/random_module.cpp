#include <boost/multiprecision/integer.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "runtime/interpreter.hpp"
#include "runtime/modules/module_support.hpp"

namespace mathguard::runtime::modules {
namespace {

double Random(Interpreter& interp) {
    return static_cast<double>(interp.random()() >> 11) * (1.0 / 9007199254740992.0);
}

// Uniform integer in [0, n) by rejection sampling over msb(n)+1 bits.
BigInt RandBelow(Interpreter& interp, const BigInt& n) {
    const std::size_t bits = boost::multiprecision::msb(n) + 1;
    while (true) {
        BigInt candidate = 0;
        std::size_t filled = 0;
        while (filled < bits) {
            const std::size_t take = std::min<std::size_t>(64, bits - filled);
            std::uint64_t chunk = interp.random()();
            if (take < 64) {
                chunk >>= 64 - take;
            }
            candidate = (candidate << static_cast<unsigned>(take)) | BigInt(chunk);
            filled += take;
        }
        if (candidate < n) {
            return candidate;
        }
        interp.Step();
    }
}

std::size_t RandIndex(Interpreter& interp, std::size_t n) {
    return static_cast<std::size_t>(RandBelow(interp, BigInt(n)).convert_to<unsigned long long>());
}

BigInt IntegerArg(const Value& value) {
    if (!IsIntegral(value)) {
        throw TypeError("'" + TypeName(value) + "' object cannot be interpreted as an integer");
    }
    return ToBigInt(value);
}

Value RandRange(Interpreter& interp, const BigInt& start, const BigInt* stop, const BigInt& step) {
    if (stop == nullptr) {
        if (start > 0) {
            return Value::Int(RandBelow(interp, start));
        }
        throw ValueError("empty range for randrange()");
    }
    const BigInt width = *stop - start;
    if (step == 1) {
        if (width > 0) {
            return Value::Int(start + RandBelow(interp, width));
        }
        throw ValueError("empty range in randrange(" + start.str() + ", " + stop->str() + ")");
    }
    if (step == 0) {
        throw ValueError("zero step for randrange()");
    }
    const BigInt n = step > 0 ? BigInt((width + step - 1) / step) : BigInt((width + step + 1) / step);
    if (n <= 0) {
        throw ValueError("empty range in randrange(" + start.str() + ", " + stop->str() + ", " + step.str() + ")");
    }
    return Value::Int(start + step * RandBelow(interp, n));
}

std::vector<Value> Population(Interpreter& interp, const Value& population) {
    if (population.Is(ValueKind::kSet) || population.Is(ValueKind::kFrozenSet) ||
        population.Is(ValueKind::kDict) || population.Is(ValueKind::kIterator)) {
        throw TypeError("Population must be a sequence.  For dicts or sets, use sorted(d).");
    }
    return interp.Collect(population);
}

double Gauss(Interpreter& interp, double mu, double sigma) {
    double u1 = Random(interp);
    while (u1 <= 0.0) {
        u1 = Random(interp);
    }
    const double u2 = Random(interp);
    const double z = std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * 3.141592653589793 * u2);
    return mu + z * sigma;
}

Value Seed(Interpreter& interp, CallArgs& args) {
    ArgReader reader("seed", args, {"a", "version"}, 0);
    if (!reader.HasValue(0)) {
        std::random_device device;
        interp.random().seed((static_cast<std::uint64_t>(device()) << 32) | device());
        return Value();
    }
    const Value& a = reader.Get(0);
    if (IsIntegral(a)) {
        BigInt magnitude = ToBigInt(a);
        if (magnitude < 0) {
            magnitude = -magnitude;
        }
        // Folds every 64-bit limb of the seed into the state.
        std::seed_seq::result_type words[8] = {};
        std::size_t count = 0;
        while (count < 8) {
            const auto limb = static_cast<std::uint64_t>(magnitude & BigInt(0xFFFFFFFFFFFFFFFFull));
            words[count++] = static_cast<std::seed_seq::result_type>(limb);
            words[count++] = static_cast<std::seed_seq::result_type>(limb >> 32);
            magnitude >>= 64;
            if (magnitude == 0) {
                break;
            }
        }
        std::seed_seq seq(words, words + count);
        interp.random().seed(seq);
        return Value();
    }
    if (a.Is(ValueKind::kFloat) || a.Is(ValueKind::kStr)) {
        interp.random().seed(static_cast<std::uint64_t>(Hash(a)));
        return Value();
    }
    throw TypeError("The only supported seed types are: None, int, float, str, bytes, and bytearray.");
}

Value Uniform(Interpreter& interp, CallArgs& args) {
    ArgReader reader("uniform", args, {"a", "b"}, 2);
    const double a = RealArg(reader.Get(0));
    const double b = RealArg(reader.Get(1));
    return Value::Float(a + (b - a) * Random(interp));
}

Value RandInt(Interpreter& interp, CallArgs& args) {
    ArgReader reader("randint", args, {"a", "b"}, 2);
    const BigInt a = IntegerArg(reader.Get(0));
    const BigInt stop = IntegerArg(reader.Get(1)) + 1;
    return RandRange(interp, a, &stop, 1);
}

Value RandRangeFn(Interpreter& interp, CallArgs& args) {
    ArgReader reader("randrange", args, {"start", "stop", "step"}, 1);
    const BigInt start = IntegerArg(reader.Get(0));
    const BigInt step = reader.Has(2) ? IntegerArg(reader.Get(2)) : BigInt(1);
    if (!reader.HasValue(1)) {
        if (step != 1) {
            throw TypeError("Missing a non-None stop argument");
        }
        return RandRange(interp, start, nullptr, step);
    }
    const BigInt stop = IntegerArg(reader.Get(1));
    return RandRange(interp, start, &stop, step);
}

Value Choice(Interpreter& interp, CallArgs& args) {
    ExpectCount("choice", args, 1, 1);
    const Value& seq = args.positional[0];
    if (seq.Is(ValueKind::kRange)) {
        const RangeObject& range = seq.As<RangeObject>();
        const long long length = range.Length();
        if (length == 0) {
            throw IndexError("Cannot choose from an empty sequence");
        }
        const auto index = static_cast<long long>(RandIndex(interp, static_cast<std::size_t>(length)));
        return Value::Int(range.At(index));
    }
    const std::vector<Value> items = Population(interp, seq);
    if (items.empty()) {
        throw IndexError("Cannot choose from an empty sequence");
    }
    return items[RandIndex(interp, items.size())];
}

Value Choices(Interpreter& interp, CallArgs& args) {
    ArgReader reader("choices", args, {"population", "weights", "cum_weights", "k"}, 1);
    const std::vector<Value> population = Population(interp, reader.Get(0));
    const long long k = reader.Has(3) ? ToInt64(reader.Get(3)) : 1;
    interp.CheckSize(static_cast<std::size_t>(std::max(0LL, k)));
    const std::size_t n = population.size();
    std::vector<Value> result;
    if (!reader.HasValue(1) && !reader.HasValue(2)) {
        if (n == 0 && k > 0) {
            throw IndexError("Cannot choose from an empty population");
        }
        for (long long i = 0; i < k; ++i) {
            const auto index = static_cast<std::size_t>(std::floor(Random(interp) * static_cast<double>(n)));
            result.push_back(population[std::min(index, n - 1)]);
        }
        return Value::List(std::move(result));
    }
    if (reader.HasValue(1) && reader.HasValue(2)) {
        throw TypeError("Cannot specify both weights and cumulative weights");
    }
    std::vector<double> cumulative;
    if (reader.HasValue(1)) {
        double total = 0.0;
        interp.ForEach(reader.Get(1), [&](const Value& weight) {
            total += RealArg(weight);
            cumulative.push_back(total);
        });
    } else {
        interp.ForEach(reader.Get(2), [&](const Value& weight) { cumulative.push_back(RealArg(weight)); });
    }
    if (cumulative.size() != n) {
        throw ValueError("The number of weights does not match the population");
    }
    const double total = n == 0 ? 0.0 : cumulative.back();
    if (total <= 0.0) {
        throw ValueError("Total of weights must be greater than zero");
    }
    if (!std::isfinite(total)) {
        throw ValueError("Total of weights must be finite");
    }
    for (long long i = 0; i < k; ++i) {
        const double target = Random(interp) * total;
        const auto it = std::upper_bound(cumulative.begin(), cumulative.end() - 1, target);
        result.push_back(population[static_cast<std::size_t>(it - cumulative.begin())]);
    }
    return Value::List(std::move(result));
}

Value Shuffle(Interpreter& interp, CallArgs& args) {
    ExpectCount("shuffle", args, 1, 1);
    const Value& target = args.positional[0];
    if (!target.Is(ValueKind::kList)) {
        throw TypeError("'" + TypeName(target) + "' object does not support item assignment");
    }
    auto& items = target.As<ListObject>().items;
    for (std::size_t i = items.size(); i > 1; --i) {
        interp.Step();
        std::swap(items[i - 1], items[RandIndex(interp, i)]);
    }
    return Value();
}

Value Sample(Interpreter& interp, CallArgs& args) {
    ArgReader reader("sample", args, {"population", "k", "counts"}, 2);
    std::vector<Value> pool = Population(interp, reader.Get(0));
    if (reader.HasValue(2)) {
        const std::vector<Value> counts = interp.Collect(reader.Get(2));
        if (counts.size() != pool.size()) {
            throw ValueError("The number of counts does not match the population");
        }
        std::vector<Value> expanded;
        for (std::size_t i = 0; i < pool.size(); ++i) {
            const long long count = ToInt64(counts[i]);
            if (count < 0) {
                throw ValueError("Counts must be non-negative");
            }
            for (long long c = 0; c < count; ++c) {
                expanded.push_back(pool[i]);
                interp.CheckSize(expanded.size());
            }
        }
        pool = std::move(expanded);
    }
    const long long k = ToInt64(reader.Get(1));
    const std::size_t n = pool.size();
    if (k < 0 || static_cast<unsigned long long>(k) > n) {
        throw ValueError("Sample larger than population or is negative");
    }
    std::vector<Value> result;
    for (long long i = 0; i < k; ++i) {
        const std::size_t remaining = n - static_cast<std::size_t>(i);
        const std::size_t j = RandIndex(interp, remaining);
        result.push_back(pool[j]);
        pool[j] = pool[remaining - 1];
    }
    return Value::List(std::move(result));
}

Value Normal(Interpreter& interp, CallArgs& args, const char* name) {
    ArgReader reader(name, args, {"mu", "sigma"}, 0);
    const double mu = reader.Has(0) ? RealArg(reader.Get(0)) : 0.0;
    const double sigma = reader.Has(1) ? RealArg(reader.Get(1)) : 1.0;
    return Value::Float(Gauss(interp, mu, sigma));
}

Value ExpoVariate(Interpreter& interp, CallArgs& args) {
    ArgReader reader("expovariate", args, {"lambd"}, 0);
    const double lambd = reader.Has(0) ? RealArg(reader.Get(0)) : 1.0;
    if (lambd == 0.0) {
        throw ZeroDivisionError("float division by zero");
    }
    return Value::Float(-std::log(1.0 - Random(interp)) / lambd);
}

}  // namespace

MemberTable RandomMembers() {
    MemberTable table;
    Define(table, "seed", Seed);
    Define(table, "random", [](Interpreter& interp, CallArgs& args) {
        ExpectCount("random", args, 0, 0);
        return Value::Float(Random(interp));
    });
    Define(table, "uniform", Uniform);
    Define(table, "randint", RandInt);
    Define(table, "randrange", RandRangeFn);
    Define(table, "choice", Choice);
    Define(table, "choices", Choices);
    Define(table, "shuffle", Shuffle);
    Define(table, "sample", Sample);
    Define(table, "gauss", [](Interpreter& interp, CallArgs& args) { return Normal(interp, args, "gauss"); });
    Define(table, "normalvariate", [](Interpreter& interp, CallArgs& args) {
        return Normal(interp, args, "normalvariate");
    });
    Define(table, "expovariate", ExpoVariate);
    return table;
}

}  // namespace mathguard::runtime::modules
