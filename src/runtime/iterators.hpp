#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "runtime/value.hpp"

namespace mathguard::runtime {

// Iterator driven by a callable; used by the builtins and itertools to build
// lazy pipelines without one class per adapter.
class LambdaIterator : public Iterator {
public:
    using Step = std::function<bool(Interpreter&, Value&)>;

    LambdaIterator(std::string name, Step step) : name_(std::move(name)), step_(std::move(step)) {}

    bool Next(Interpreter& interp, Value& out) override;
    std::string Name() const override { return name_; }

private:
    std::string name_;
    Step step_;
    bool done_ = false;
};

// Walks a materialized vector; backs generator expressions and reversed().
class VectorIterator : public Iterator {
public:
    VectorIterator(std::string name, std::vector<Value> items)
        : name_(std::move(name)), items_(std::move(items)) {}

    bool Next(Interpreter& interp, Value& out) override;
    std::string Name() const override { return name_; }

private:
    std::string name_;
    std::vector<Value> items_;
    std::size_t index_ = 0;
};

// iter(value): the iterator itself for iterators, a fresh cursor otherwise.
// Throws TypeError ("'int' object is not iterable").
std::shared_ptr<Iterator> GetIterator(const Value& value);

Value MakeLambdaIterator(std::string name, LambdaIterator::Step step);

}  // namespace mathguard::runtime
