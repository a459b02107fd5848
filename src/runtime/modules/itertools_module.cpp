#include <algorithm>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "runtime/interpreter.hpp"
#include "runtime/iterators.hpp"
#include "runtime/modules/module_support.hpp"

namespace mathguard::runtime::modules {
namespace {

Value CallWith(Interpreter& interp, const Value& fn, std::vector<Value> positional) {
    CallArgs call;
    call.positional = std::move(positional);
    return interp.Call(fn, std::move(call));
}

bool Predicate(Interpreter& interp, const Value& fn, const Value& item) {
    if (fn.IsNone()) {
        return Truthy(item);
    }
    return Truthy(CallWith(interp, fn, {item}));
}

// Optional non-negative count argument ("r", "times", "n").
long long CountArg(const std::string& function, const Value& value) {
    if (!IsIntegral(value)) {
        throw TypeError("Expected int as r");
    }
    const long long n = ToInt64(value);
    if (n < 0) {
        throw ValueError(function == "batched" ? "n must be at least one" : "r must be non-negative");
    }
    return n;
}

std::vector<Value> Pool(Interpreter& interp, const Value& iterable) {
    std::vector<Value> pool = interp.Collect(iterable);
    interp.CheckSize(pool.size());
    return pool;
}

Value TupleOf(const std::vector<Value>& pool, const std::vector<std::size_t>& indices, std::size_t count) {
    std::vector<Value> row;
    row.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        row.push_back(pool[indices[i]]);
    }
    return Value::Tuple(std::move(row));
}

Value Count(Interpreter&, CallArgs& args) {
    ArgReader reader("count", args, {"start", "step"}, 0);
    auto current = std::make_shared<Value>(reader.Get(0, Value::Int(0LL)));
    const Value step = reader.Get(1, Value::Int(1LL));
    if (!IsNumber(*current) || !IsNumber(step)) {
        throw TypeError("a number is required");
    }
    return MakeLambdaIterator("count", [current, step](Interpreter& interp, Value& out) {
        out = *current;
        *current = interp.BinaryOp(lang::BinaryOperator::kAdd, *current, step);
        return true;
    });
}

Value Cycle(Interpreter&, CallArgs& args) {
    ExpectCount("cycle", args, 1, 1);
    struct State {
        std::shared_ptr<Iterator> source;
        std::vector<Value> saved;
        std::size_t index = 0;
        bool replaying = false;
    };
    auto state = std::make_shared<State>();
    state->source = GetIterator(args.positional[0]);
    return MakeLambdaIterator("cycle", [state](Interpreter& interp, Value& out) {
        if (!state->replaying) {
            if (interp.Next(*state->source, out)) {
                state->saved.push_back(out);
                interp.CheckSize(state->saved.size());
                return true;
            }
            state->replaying = true;
            state->source.reset();
        }
        if (state->saved.empty()) {
            return false;
        }
        out = state->saved[state->index];
        state->index = (state->index + 1) % state->saved.size();
        return true;
    });
}

Value Repeat(Interpreter&, CallArgs& args) {
    ArgReader reader("repeat", args, {"object", "times"}, 1);
    const Value object = reader.Get(0);
    auto remaining = std::make_shared<long long>(-1);
    if (reader.Has(1)) {
        *remaining = std::max(0LL, ToInt64(reader.Get(1)));
    }
    return MakeLambdaIterator("repeat", [object, remaining](Interpreter&, Value& out) {
        if (*remaining == 0) {
            return false;
        }
        if (*remaining > 0) {
            --*remaining;
        }
        out = object;
        return true;
    });
}

Value Accumulate(Interpreter&, CallArgs& args) {
    ArgReader reader("accumulate", args, {"iterable", "func", "initial"}, 1);
    struct State {
        std::shared_ptr<Iterator> source;
        Value total;
        bool started = false;
    };
    auto state = std::make_shared<State>();
    state->source = GetIterator(reader.Get(0));
    const Value func = reader.Get(1, Value());
    auto pending_initial = std::make_shared<bool>(reader.HasValue(2));
    if (*pending_initial) {
        state->total = reader.Get(2);
    }
    return MakeLambdaIterator("accumulate", [state, func, pending_initial](Interpreter& interp, Value& out) {
        if (*pending_initial) {
            *pending_initial = false;
            state->started = true;
            out = state->total;
            return true;
        }
        Value item;
        if (!interp.Next(*state->source, item)) {
            return false;
        }
        if (!state->started) {
            state->started = true;
            state->total = item;
        } else if (func.IsNone()) {
            state->total = interp.BinaryOp(lang::BinaryOperator::kAdd, state->total, item);
        } else {
            state->total = CallWith(interp, func, {state->total, item});
        }
        out = state->total;
        return true;
    });
}

Value ChainIterables(std::shared_ptr<Iterator> iterables) {
    auto current = std::make_shared<std::shared_ptr<Iterator>>();
    return MakeLambdaIterator("chain", [iterables, current](Interpreter& interp, Value& out) {
        while (true) {
            if (*current && interp.Next(**current, out)) {
                return true;
            }
            Value next;
            if (!interp.Next(*iterables, next)) {
                return false;
            }
            *current = GetIterator(next);
        }
    });
}

Value Chain(Interpreter&, CallArgs& args) {
    NoKeywords("chain", args);
    return ChainIterables(std::make_shared<VectorIterator>("tuple_iterator", args.positional));
}

Value ChainFromIterable(Interpreter&, CallArgs& args) {
    ExpectCount("from_iterable", args, 1, 1);
    return ChainIterables(GetIterator(args.positional[0]));
}

Value Compress(Interpreter&, CallArgs& args) {
    ArgReader reader("compress", args, {"data", "selectors"}, 2);
    auto data = GetIterator(reader.Get(0));
    auto selectors = GetIterator(reader.Get(1));
    return MakeLambdaIterator("compress", [data, selectors](Interpreter& interp, Value& out) {
        Value item;
        Value selector;
        while (interp.Next(*data, item) && interp.Next(*selectors, selector)) {
            if (Truthy(selector)) {
                out = std::move(item);
                return true;
            }
        }
        return false;
    });
}

Value DropWhile(Interpreter&, CallArgs& args) {
    ExpectCount("dropwhile", args, 2, 2);
    const Value predicate = args.positional[0];
    auto source = GetIterator(args.positional[1]);
    auto dropping = std::make_shared<bool>(true);
    return MakeLambdaIterator("dropwhile", [predicate, source, dropping](Interpreter& interp, Value& out) {
        Value item;
        while (interp.Next(*source, item)) {
            if (*dropping && Truthy(CallWith(interp, predicate, {item}))) {
                continue;
            }
            *dropping = false;
            out = std::move(item);
            return true;
        }
        return false;
    });
}

Value TakeWhile(Interpreter&, CallArgs& args) {
    ExpectCount("takewhile", args, 2, 2);
    const Value predicate = args.positional[0];
    auto source = GetIterator(args.positional[1]);
    return MakeLambdaIterator("takewhile", [predicate, source](Interpreter& interp, Value& out) {
        Value item;
        if (!interp.Next(*source, item) || !Truthy(CallWith(interp, predicate, {item}))) {
            return false;
        }
        out = std::move(item);
        return true;
    });
}

Value FilterFalse(Interpreter&, CallArgs& args) {
    ExpectCount("filterfalse", args, 2, 2);
    const Value predicate = args.positional[0];
    auto source = GetIterator(args.positional[1]);
    return MakeLambdaIterator("filterfalse", [predicate, source](Interpreter& interp, Value& out) {
        Value item;
        while (interp.Next(*source, item)) {
            if (!Predicate(interp, predicate, item)) {
                out = std::move(item);
                return true;
            }
        }
        return false;
    });
}

long long SliceArg(const Value& value, const char* message) {
    if (value.IsNone()) {
        return -1;
    }
    if (!IsIntegral(value) || ToBigInt(value) < 0) {
        throw ValueError(message);
    }
    return ToInt64(value);
}

Value ISlice(Interpreter&, CallArgs& args) {
    ExpectCount("islice", args, 2, 4);
    const char* stop_message =
        "Stop argument for islice() must be None or an integer: 0 <= x <= sys.maxsize.";
    const char* other_message =
        "Indices for islice() must be None or an integer: 0 <= x <= sys.maxsize.";
    long long start = 0;
    long long stop = -1;
    long long step = 1;
    if (args.positional.size() == 2) {
        stop = SliceArg(args.positional[1], stop_message);
    } else {
        start = std::max(0LL, SliceArg(args.positional[1], other_message));
        stop = SliceArg(args.positional[2], stop_message);
        if (args.positional.size() == 4) {
            step = SliceArg(args.positional[3], "Step for islice() must be a positive integer or None.");
            if (step == -1) {
                step = 1;
            } else if (step == 0) {
                throw ValueError("Step for islice() must be a positive integer or None.");
            }
        }
    }
    auto source = GetIterator(args.positional[0]);
    auto position = std::make_shared<long long>(0);
    auto next_index = std::make_shared<long long>(start);
    return MakeLambdaIterator("islice", [source, position, next_index, stop, step](Interpreter& interp, Value& out) {
        if (stop >= 0 && *next_index >= stop) {
            return false;
        }
        Value item;
        while (*position <= *next_index) {
            if (!interp.Next(*source, item)) {
                return false;
            }
            ++*position;
        }
        out = std::move(item);
        *next_index += step;
        return true;
    });
}

Value StarMap(Interpreter&, CallArgs& args) {
    ExpectCount("starmap", args, 2, 2);
    const Value function = args.positional[0];
    auto source = GetIterator(args.positional[1]);
    return MakeLambdaIterator("starmap", [function, source](Interpreter& interp, Value& out) {
        Value item;
        if (!interp.Next(*source, item)) {
            return false;
        }
        out = CallWith(interp, function, interp.Collect(item));
        return true;
    });
}

Value Tee(Interpreter&, CallArgs& args) {
    ExpectCount("tee", args, 1, 2);
    const long long n = args.positional.size() > 1 ? ToInt64(args.positional[1]) : 2;
    if (n < 0) {
        throw ValueError("n must be >= 0");
    }
    // Buffered elements are shared; each copy keeps its own absolute offset.
    struct Shared {
        std::shared_ptr<Iterator> source;
        std::deque<Value> buffer;
        std::size_t base = 0;
        std::vector<std::size_t> offsets;
    };
    auto shared = std::make_shared<Shared>();
    shared->source = GetIterator(args.positional[0]);
    shared->offsets.assign(static_cast<std::size_t>(n), 0);
    std::vector<Value> copies;
    for (long long i = 0; i < n; ++i) {
        const auto slot = static_cast<std::size_t>(i);
        copies.push_back(MakeLambdaIterator("_tee", [shared, slot](Interpreter& interp, Value& out) {
            std::size_t& offset = shared->offsets[slot];
            if (offset - shared->base >= shared->buffer.size()) {
                Value item;
                if (!interp.Next(*shared->source, item)) {
                    return false;
                }
                shared->buffer.push_back(std::move(item));
                interp.CheckSize(shared->buffer.size());
            }
            out = shared->buffer[offset - shared->base];
            ++offset;
            const std::size_t lowest = *std::min_element(shared->offsets.begin(), shared->offsets.end());
            while (shared->base < lowest) {
                shared->buffer.pop_front();
                ++shared->base;
            }
            return true;
        }));
    }
    return Value::Tuple(std::move(copies));
}

Value ZipLongest(Interpreter&, CallArgs& args) {
    Value fill;
    for (const auto& [keyword, value] : args.keywords) {
        if (keyword != "fillvalue") {
            throw TypeError("zip_longest() got an unexpected keyword argument '" + keyword + "'");
        }
        fill = value;
    }
    struct State {
        std::vector<std::shared_ptr<Iterator>> sources;
        std::vector<bool> active;
        std::size_t remaining = 0;
    };
    auto state = std::make_shared<State>();
    for (const auto& iterable : args.positional) {
        state->sources.push_back(GetIterator(iterable));
    }
    state->active.assign(state->sources.size(), true);
    state->remaining = state->sources.size();
    return MakeLambdaIterator("zip_longest", [state, fill](Interpreter& interp, Value& out) {
        if (state->remaining == 0) {
            return false;
        }
        std::vector<Value> row;
        for (std::size_t i = 0; i < state->sources.size(); ++i) {
            Value item = fill;
            if (state->active[i] && !interp.Next(*state->sources[i], item)) {
                state->active[i] = false;
                --state->remaining;
                if (state->remaining == 0) {
                    return false;
                }
                item = fill;
            }
            row.push_back(std::move(item));
        }
        out = Value::Tuple(std::move(row));
        return true;
    });
}

Value Product(Interpreter& interp, CallArgs& args) {
    long long repeat = 1;
    for (const auto& [keyword, value] : args.keywords) {
        if (keyword != "repeat") {
            throw TypeError("product() got an unexpected keyword argument '" + keyword + "'");
        }
        repeat = ToInt64(value);
        if (repeat < 0) {
            throw ValueError("repeat argument cannot be negative");
        }
    }
    struct State {
        std::vector<std::vector<Value>> pools;
        std::vector<std::size_t> indices;
        bool first = true;
        bool done = false;
    };
    auto state = std::make_shared<State>();
    std::vector<std::vector<Value>> distinct;
    for (const auto& iterable : args.positional) {
        distinct.push_back(Pool(interp, iterable));
    }
    for (long long r = 0; r < repeat; ++r) {
        for (const auto& pool : distinct) {
            state->pools.push_back(pool);
        }
    }
    state->indices.assign(state->pools.size(), 0);
    for (const auto& pool : state->pools) {
        state->done = state->done || pool.empty();
    }
    return MakeLambdaIterator("product", [state](Interpreter&, Value& out) {
        if (state->done) {
            return false;
        }
        if (!state->first) {
            std::size_t i = state->pools.size();
            while (true) {
                if (i == 0) {
                    state->done = true;
                    return false;
                }
                --i;
                if (++state->indices[i] < state->pools[i].size()) {
                    break;
                }
                state->indices[i] = 0;
            }
        }
        state->first = false;
        std::vector<Value> row;
        for (std::size_t i = 0; i < state->pools.size(); ++i) {
            row.push_back(state->pools[i][state->indices[i]]);
        }
        out = Value::Tuple(std::move(row));
        return true;
    });
}

struct Selection {
    std::vector<Value> pool;
    std::vector<std::size_t> indices;
    std::vector<std::size_t> cycles;
    std::size_t r = 0;
    bool first = true;
    bool done = false;
};

std::shared_ptr<Selection> MakeSelection(Interpreter& interp, CallArgs& args, const std::string& function,
                                         bool r_required) {
    ArgReader reader(function, args, {"iterable", "r"}, r_required ? 2 : 1);
    auto state = std::make_shared<Selection>();
    state->pool = Pool(interp, reader.Get(0));
    state->r = reader.HasValue(1) ? static_cast<std::size_t>(CountArg(function, reader.Get(1))) : state->pool.size();
    return state;
}

Value Permutations(Interpreter& interp, CallArgs& args) {
    auto state = MakeSelection(interp, args, "permutations", false);
    const std::size_t n = state->pool.size();
    const std::size_t r = state->r;
    state->done = r > n;
    for (std::size_t i = 0; i < n; ++i) {
        state->indices.push_back(i);
    }
    for (std::size_t i = 0; i < r && i < n; ++i) {
        state->cycles.push_back(n - i);
    }
    return MakeLambdaIterator("permutations", [state, n, r](Interpreter&, Value& out) {
        if (state->done) {
            return false;
        }
        if (!state->first) {
            std::size_t i = r;
            while (true) {
                if (i == 0) {
                    state->done = true;
                    return false;
                }
                --i;
                if (--state->cycles[i] == 0) {
                    std::rotate(state->indices.begin() + static_cast<std::ptrdiff_t>(i),
                                state->indices.begin() + static_cast<std::ptrdiff_t>(i) + 1, state->indices.end());
                    state->cycles[i] = n - i;
                } else {
                    std::swap(state->indices[i], state->indices[n - state->cycles[i]]);
                    break;
                }
            }
        }
        state->first = false;
        out = TupleOf(state->pool, state->indices, r);
        return true;
    });
}

Value Combinations(Interpreter& interp, CallArgs& args) {
    auto state = MakeSelection(interp, args, "combinations", true);
    const std::size_t n = state->pool.size();
    const std::size_t r = state->r;
    state->done = r > n;
    for (std::size_t i = 0; i < r; ++i) {
        state->indices.push_back(i);
    }
    return MakeLambdaIterator("combinations", [state, n, r](Interpreter&, Value& out) {
        if (state->done) {
            return false;
        }
        if (!state->first) {
            std::size_t i = r;
            while (true) {
                if (i == 0) {
                    state->done = true;
                    return false;
                }
                --i;
                if (state->indices[i] != i + n - r) {
                    break;
                }
            }
            ++state->indices[i];
            for (std::size_t j = i + 1; j < r; ++j) {
                state->indices[j] = state->indices[j - 1] + 1;
            }
        }
        state->first = false;
        out = TupleOf(state->pool, state->indices, r);
        return true;
    });
}

Value CombinationsWithReplacement(Interpreter& interp, CallArgs& args) {
    auto state = MakeSelection(interp, args, "combinations_with_replacement", true);
    const std::size_t n = state->pool.size();
    const std::size_t r = state->r;
    state->done = n == 0 && r > 0;
    state->indices.assign(r, 0);
    return MakeLambdaIterator("combinations_with_replacement", [state, n, r](Interpreter&, Value& out) {
        if (state->done) {
            return false;
        }
        if (!state->first) {
            std::size_t i = r;
            while (true) {
                if (i == 0) {
                    state->done = true;
                    return false;
                }
                --i;
                if (state->indices[i] != n - 1) {
                    break;
                }
            }
            std::fill(state->indices.begin() + static_cast<std::ptrdiff_t>(i), state->indices.end(),
                      state->indices[i] + 1);
        }
        state->first = false;
        out = TupleOf(state->pool, state->indices, r);
        return true;
    });
}

// Each group is materialized when its key is produced.
Value GroupBy(Interpreter&, CallArgs& args) {
    ArgReader reader("groupby", args, {"iterable", "key"}, 1);
    struct State {
        std::shared_ptr<Iterator> source;
        Value key_fn;
        Value pending;
        Value pending_key;
        bool has_pending = false;
        bool started = false;
    };
    auto state = std::make_shared<State>();
    state->source = GetIterator(reader.Get(0));
    state->key_fn = reader.Get(1, Value());
    auto key_of = [state](Interpreter& interp, const Value& item) {
        return state->key_fn.IsNone() ? item : CallWith(interp, state->key_fn, {item});
    };
    return MakeLambdaIterator("groupby", [state, key_of](Interpreter& interp, Value& out) {
        if (!state->started) {
            state->started = true;
            state->has_pending = interp.Next(*state->source, state->pending);
            if (state->has_pending) {
                state->pending_key = key_of(interp, state->pending);
            }
        }
        if (!state->has_pending) {
            return false;
        }
        const Value key = state->pending_key;
        std::vector<Value> group{state->pending};
        state->has_pending = false;
        Value item;
        while (interp.Next(*state->source, item)) {
            Value item_key = key_of(interp, item);
            if (!Equals(item_key, key)) {
                state->pending = std::move(item);
                state->pending_key = std::move(item_key);
                state->has_pending = true;
                break;
            }
            group.push_back(std::move(item));
            interp.CheckSize(group.size());
        }
        out = Value::Tuple({key, MakeIterator(std::make_shared<VectorIterator>("_grouper", std::move(group)))});
        return true;
    });
}

Value Pairwise(Interpreter&, CallArgs& args) {
    ExpectCount("pairwise", args, 1, 1);
    auto source = GetIterator(args.positional[0]);
    auto previous = std::make_shared<Value>();
    auto started = std::make_shared<bool>(false);
    return MakeLambdaIterator("pairwise", [source, previous, started](Interpreter& interp, Value& out) {
        if (!*started) {
            *started = true;
            if (!interp.Next(*source, *previous)) {
                return false;
            }
        }
        Value item;
        if (!interp.Next(*source, item)) {
            return false;
        }
        out = Value::Tuple({*previous, item});
        *previous = std::move(item);
        return true;
    });
}

Value Batched(Interpreter&, CallArgs& args) {
    ArgReader reader("batched", args, {"iterable", "n"}, 2);
    const long long n = CountArg("batched", reader.Get(1));
    if (n < 1) {
        throw ValueError("n must be at least one");
    }
    auto source = GetIterator(reader.Get(0));
    return MakeLambdaIterator("batched", [source, n](Interpreter& interp, Value& out) {
        std::vector<Value> batch;
        Value item;
        while (static_cast<long long>(batch.size()) < n && interp.Next(*source, item)) {
            batch.push_back(std::move(item));
            interp.CheckSize(batch.size());
        }
        if (batch.empty()) {
            return false;
        }
        out = Value::Tuple(std::move(batch));
        return true;
    });
}

}  // namespace

MemberTable ItertoolsMembers() {
    MemberTable table;
    Define(table, "count", Count);
    Define(table, "cycle", Cycle);
    Define(table, "repeat", Repeat);
    Define(table, "accumulate", Accumulate);
    Define(table, "chain", Chain);
    table["chain"].As<BuiltinObject>().attributes["from_iterable"] = MakeBuiltin("from_iterable", ChainFromIterable);
    Define(table, "compress", Compress);
    Define(table, "dropwhile", DropWhile);
    Define(table, "takewhile", TakeWhile);
    Define(table, "filterfalse", FilterFalse);
    Define(table, "islice", ISlice);
    Define(table, "starmap", StarMap);
    Define(table, "tee", Tee);
    Define(table, "zip_longest", ZipLongest);
    Define(table, "product", Product);
    Define(table, "permutations", Permutations);
    Define(table, "combinations", Combinations);
    Define(table, "combinations_with_replacement", CombinationsWithReplacement);
    Define(table, "groupby", GroupBy);
    Define(table, "pairwise", Pairwise);
    Define(table, "batched", Batched);
    return table;
}

}  // namespace mathguard::runtime::modules
