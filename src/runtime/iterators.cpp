#include "runtime/iterators.hpp"

#include "runtime/errors.hpp"
#include "runtime/text.hpp"

namespace mathguard::runtime {
namespace {

template <class Sequence>
class SequenceIterator : public Iterator {
public:
    SequenceIterator(std::string name, std::shared_ptr<Sequence> sequence)
        : name_(std::move(name)), sequence_(std::move(sequence)) {}

    bool Next(Interpreter&, Value& out) override {
        if (!sequence_ || index_ >= sequence_->items.size()) {
            sequence_.reset();
            return false;
        }
        out = sequence_->items[index_++];
        return true;
    }

    std::string Name() const override { return name_; }

private:
    std::string name_;
    std::shared_ptr<Sequence> sequence_;
    std::size_t index_ = 0;
};

class RangeIterator : public Iterator {
public:
    explicit RangeIterator(const RangeObject& range) : range_(range), length_(range.Length()) {}

    bool Next(Interpreter&, Value& out) override {
        if (index_ >= length_) {
            return false;
        }
        out = Value::Int(range_.At(index_++));
        return true;
    }

    std::string Name() const override { return "range_iterator"; }

private:
    RangeObject range_;
    long long length_;
    long long index_ = 0;
};

class StrIterator : public Iterator {
public:
    explicit StrIterator(const std::string& value) : code_points_(text::Decode(value)) {}

    bool Next(Interpreter&, Value& out) override {
        if (index_ >= code_points_.size()) {
            return false;
        }
        std::string item;
        text::AppendUtf8(item, code_points_[index_++]);
        out = Value::Str(std::move(item));
        return true;
    }

    std::string Name() const override { return "str_ascii_iterator"; }

private:
    std::u32string code_points_;
    std::size_t index_ = 0;
};

}  // namespace

bool LambdaIterator::Next(Interpreter& interp, Value& out) {
    if (done_) {
        return false;
    }
    if (!step_(interp, out)) {
        done_ = true;
        step_ = nullptr;
        return false;
    }
    return true;
}

bool VectorIterator::Next(Interpreter&, Value& out) {
    if (index_ >= items_.size()) {
        items_.clear();
        index_ = 0;
        return false;
    }
    out = items_[index_++];
    return true;
}

std::shared_ptr<Iterator> GetIterator(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kIterator:
            return value.Share<Iterator>();
        case ValueKind::kList:
            return std::make_shared<SequenceIterator<ListObject>>("list_iterator", value.Share<ListObject>());
        case ValueKind::kTuple:
            return std::make_shared<SequenceIterator<TupleObject>>("tuple_iterator", value.Share<TupleObject>());
        case ValueKind::kStr:
            return std::make_shared<StrIterator>(value.AsStr());
        case ValueKind::kRange:
            return std::make_shared<RangeIterator>(value.As<RangeObject>());
        case ValueKind::kDict:
            return std::make_shared<VectorIterator>("dict_keyiterator", value.As<DictObject>().entries.Keys());
        case ValueKind::kSet:
        case ValueKind::kFrozenSet:
            return std::make_shared<VectorIterator>("set_iterator", value.As<SetObject>().entries.Keys());
        default:
            throw TypeError("'" + TypeName(value) + "' object is not iterable");
    }
}

Value MakeLambdaIterator(std::string name, LambdaIterator::Step step) {
    return MakeIterator(std::make_shared<LambdaIterator>(std::move(name), std::move(step)));
}

}  // namespace mathguard::runtime
