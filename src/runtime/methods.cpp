#include <boost/multiprecision/integer.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ios>
#include <map>
#include <utility>

#include "runtime/builtins.hpp"
#include "runtime/errors.hpp"
#include "runtime/format.hpp"
#include "runtime/interpreter.hpp"
#include "runtime/numeric.hpp"
#include "runtime/text.hpp"

namespace mathguard::runtime {
namespace {

using Method = Value (*)(Interpreter&, const Value&, CallArgs&);
using MethodTable = std::map<std::string, Method>;

// ---------------------------------------------------------------------------
// str

std::u32string Code(const Value& value) {
    return text::Decode(value.AsStr());
}

Value FromCode(const std::u32string& code) {
    return Value::Str(text::Encode(code));
}

const std::string& StrArg(const std::string& method, const Value& value) {
    if (!value.Is(ValueKind::kStr)) {
        throw TypeError(method + "() argument must be str, not " + TypeName(value));
    }
    return value.AsStr();
}

int DigitChar(int c) { return std::isdigit(c); }
int AlphaChar(int c) { return std::isalpha(c); }
int AlnumChar(int c) { return std::isalnum(c); }
int SpaceChar(int c) { return std::isspace(c); }

bool IsSpace(char32_t c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

// Resolves optional start/end arguments (slice semantics) against a length.
void ResolveRange(const ArgReader& reader, std::size_t start_slot, std::size_t length, std::size_t& begin,
                  std::size_t& end) {
    auto resolve = [length](const Value& bound, std::size_t fallback) -> std::size_t {
        if (bound.IsNone()) {
            return fallback;
        }
        long long index = ToInt64(bound);
        const auto size = static_cast<long long>(length);
        if (index < 0) {
            index = std::max(0LL, index + size);
        }
        return static_cast<std::size_t>(std::min(index, size));
    };
    begin = resolve(reader.Get(start_slot, Value()), 0);
    end = resolve(reader.Get(start_slot + 1, Value()), length);
}

Value StrStrip(const Value& self, CallArgs& args, const std::string& method, bool left, bool right) {
    ArgReader reader(method, args, {"chars"}, 0);
    const std::u32string code = Code(self);
    std::u32string chars;
    const bool whitespace = !reader.HasValue(0);
    if (!whitespace) {
        chars = text::Decode(StrArg(method, reader.Get(0)));
    }
    auto strip = [&](char32_t c) {
        return whitespace ? IsSpace(c) : chars.find(c) != std::u32string::npos;
    };
    std::size_t begin = 0;
    std::size_t end = code.size();
    while (left && begin < end && strip(code[begin])) {
        ++begin;
    }
    while (right && end > begin && strip(code[end - 1])) {
        --end;
    }
    return FromCode(code.substr(begin, end - begin));
}

std::vector<Value> SplitWhitespace(const std::u32string& code, long long maxsplit, bool from_right) {
    std::vector<std::u32string> parts;
    if (!from_right) {
        std::size_t i = 0;
        while (true) {
            while (i < code.size() && IsSpace(code[i])) {
                ++i;
            }
            if (i >= code.size()) {
                break;
            }
            if (maxsplit >= 0 && static_cast<long long>(parts.size()) == maxsplit) {
                std::size_t end = code.size();
                while (end > i && IsSpace(code[end - 1])) {
                    --end;
                }
                parts.push_back(code.substr(i, end - i));
                break;
            }
            std::size_t j = i;
            while (j < code.size() && !IsSpace(code[j])) {
                ++j;
            }
            parts.push_back(code.substr(i, j - i));
            i = j;
        }
    } else {
        std::size_t i = code.size();
        while (true) {
            while (i > 0 && IsSpace(code[i - 1])) {
                --i;
            }
            if (i == 0) {
                break;
            }
            if (maxsplit >= 0 && static_cast<long long>(parts.size()) == maxsplit) {
                std::size_t begin = 0;
                while (begin < i && IsSpace(code[begin])) {
                    ++begin;
                }
                parts.push_back(code.substr(begin, i - begin));
                break;
            }
            std::size_t j = i;
            while (j > 0 && !IsSpace(code[j - 1])) {
                --j;
            }
            parts.push_back(code.substr(j, i - j));
            i = j;
        }
        std::reverse(parts.begin(), parts.end());
    }
    std::vector<Value> out;
    for (const auto& part : parts) {
        out.push_back(FromCode(part));
    }
    return out;
}

Value StrSplit(Interpreter& interp, const Value& self, CallArgs& args, bool from_right) {
    const std::string method = from_right ? "rsplit" : "split";
    ArgReader reader(method, args, {"sep", "maxsplit"}, 0);
    const long long maxsplit = reader.HasValue(1) ? ToInt64(reader.Get(1)) : -1;
    if (!reader.HasValue(0)) {
        std::vector<Value> parts = SplitWhitespace(Code(self), maxsplit, from_right);
        interp.CheckSize(parts.size());
        return Value::List(std::move(parts));
    }
    const std::string& sep = StrArg(method, reader.Get(0));
    if (sep.empty()) {
        throw ValueError("empty separator");
    }
    const std::string& value = self.AsStr();
    std::vector<std::string> parts;
    if (!from_right) {
        std::size_t start = 0;
        while (maxsplit < 0 || static_cast<long long>(parts.size()) < maxsplit) {
            const std::size_t found = value.find(sep, start);
            if (found == std::string::npos) {
                break;
            }
            parts.push_back(value.substr(start, found - start));
            start = found + sep.size();
            interp.Step();
        }
        parts.push_back(value.substr(start));
    } else {
        std::size_t end = value.size();
        while (maxsplit < 0 || static_cast<long long>(parts.size()) < maxsplit) {
            if (end < sep.size()) {
                break;
            }
            const std::size_t found = value.rfind(sep, end - sep.size());
            if (found == std::string::npos) {
                break;
            }
            parts.push_back(value.substr(found + sep.size(), end - found - sep.size()));
            end = found;
            interp.Step();
        }
        parts.push_back(value.substr(0, end));
        std::reverse(parts.begin(), parts.end());
    }
    interp.CheckSize(parts.size());
    std::vector<Value> out;
    for (auto& part : parts) {
        out.push_back(Value::Str(std::move(part)));
    }
    return Value::List(std::move(out));
}

Value StrJoin(Interpreter& interp, const Value& self, CallArgs& args) {
    ExpectCount("join", args, 1, 1);
    std::string out;
    std::size_t index = 0;
    interp.ForEach(args.positional[0], [&](const Value& item) {
        if (!item.Is(ValueKind::kStr)) {
            throw TypeError("sequence item " + std::to_string(index) + ": expected str instance, " + TypeName(item) +
                            " found");
        }
        if (index > 0) {
            out += self.AsStr();
        }
        out += item.AsStr();
        interp.CheckSize(out.size());
        ++index;
    });
    return Value::Str(std::move(out));
}

Value StrReplace(Interpreter& interp, const Value& self, CallArgs& args) {
    ArgReader reader("replace", args, {"old", "new", "count"}, 2);
    const std::u32string old_text = text::Decode(StrArg("replace", reader.Get(0)));
    const std::u32string new_text = text::Decode(StrArg("replace", reader.Get(1)));
    long long remaining = reader.HasValue(2) ? ToInt64(reader.Get(2)) : -1;
    const std::u32string code = Code(self);
    std::u32string out;
    if (old_text.empty()) {
        for (std::size_t i = 0; i <= code.size(); ++i) {
            if (remaining != 0) {
                out += new_text;
                --remaining;
            }
            if (i < code.size()) {
                out.push_back(code[i]);
            }
            interp.CheckSize(out.size());
        }
        return FromCode(out);
    }
    std::size_t start = 0;
    while (remaining != 0) {
        const std::size_t found = code.find(old_text, start);
        if (found == std::u32string::npos) {
            break;
        }
        out.append(code, start, found - start);
        out += new_text;
        start = found + old_text.size();
        --remaining;
        interp.CheckSize(out.size());
    }
    out.append(code, start, std::u32string::npos);
    interp.CheckSize(out.size());
    return FromCode(out);
}

Value StrFind(const Value& self, CallArgs& args, const std::string& method, bool from_right, bool raise) {
    ArgReader reader(method, args, {"sub", "start", "end"}, 1);
    const std::u32string needle = text::Decode(StrArg(method, reader.Get(0)));
    const std::u32string code = Code(self);
    std::size_t begin = 0;
    std::size_t end = 0;
    ResolveRange(reader, 1, code.size(), begin, end);
    long long result = -1;
    if (begin <= end && needle.size() <= end - begin) {
        const std::u32string window = code.substr(begin, end - begin);
        const std::size_t found = from_right ? window.rfind(needle) : window.find(needle);
        if (found != std::u32string::npos) {
            result = static_cast<long long>(begin + found);
        }
    }
    if (result < 0 && raise) {
        throw ValueError("substring not found");
    }
    return Value::Int(result);
}

Value StrCount(const Value& self, CallArgs& args) {
    ArgReader reader("count", args, {"sub", "start", "end"}, 1);
    const std::u32string needle = text::Decode(StrArg("count", reader.Get(0)));
    const std::u32string code = Code(self);
    std::size_t begin = 0;
    std::size_t end = 0;
    ResolveRange(reader, 1, code.size(), begin, end);
    if (begin > end) {
        return Value::Int(0LL);
    }
    if (needle.empty()) {
        return Value::Int(static_cast<long long>(end - begin + 1));
    }
    long long count = 0;
    std::size_t position = begin;
    while (true) {
        const std::size_t found = code.find(needle, position);
        if (found == std::u32string::npos || found + needle.size() > end) {
            break;
        }
        ++count;
        position = found + needle.size();
    }
    return Value::Int(count);
}

Value StrAffix(const Value& self, CallArgs& args, bool prefix) {
    const std::string method = prefix ? "startswith" : "endswith";
    ArgReader reader(method, args, {"prefix", "start", "end"}, 1);
    const std::u32string code = Code(self);
    std::size_t begin = 0;
    std::size_t end = 0;
    ResolveRange(reader, 1, code.size(), begin, end);
    std::vector<Value> candidates;
    if (reader.Get(0).Is(ValueKind::kTuple)) {
        candidates = Items(reader.Get(0));
    } else if (reader.Get(0).Is(ValueKind::kStr)) {
        candidates.push_back(reader.Get(0));
    } else {
        throw TypeError(method + " first arg must be str or a tuple of str, not " + TypeName(reader.Get(0)));
    }
    for (const auto& candidate : candidates) {
        const std::u32string affix = text::Decode(StrArg(method, candidate));
        if (begin > end || affix.size() > end - begin) {
            continue;
        }
        const std::size_t at = prefix ? begin : end - affix.size();
        if (code.compare(at, affix.size(), affix) == 0) {
            return Value::Bool(true);
        }
    }
    return Value::Bool(false);
}

Value StrPredicate(const Value& self, CallArgs& args, const std::string& method, int (*test)(int)) {
    ExpectCount(method, args, 0, 0);
    const std::u32string code = Code(self);
    if (code.empty()) {
        return Value::Bool(false);
    }
    for (char32_t c : code) {
        if (c >= 0x80 || test(static_cast<int>(c)) == 0) {
            return Value::Bool(false);
        }
    }
    return Value::Bool(true);
}

Value StrCase(const Value& self, CallArgs& args, const std::string& method, bool upper_case) {
    ExpectCount(method, args, 0, 0);
    std::string out = self.AsStr();
    for (auto& c : out) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte < 0x80) {
            c = static_cast<char>(upper_case ? std::toupper(byte) : std::tolower(byte));
        }
    }
    return Value::Str(std::move(out));
}

Value StrCased(const Value& self, CallArgs& args, const std::string& method, bool want_upper) {
    ExpectCount(method, args, 0, 0);
    bool cased = false;
    for (unsigned char c : self.AsStr()) {
        if (std::isupper(c) || std::islower(c)) {
            if ((std::isupper(c) != 0) != want_upper) {
                return Value::Bool(false);
            }
            cased = true;
        }
    }
    return Value::Bool(cased);
}

Value StrPad(Interpreter& interp, const Value& self, CallArgs& args, const std::string& method) {
    ArgReader reader(method, args, {"width", "fillchar"}, 1);
    const long long width = ToInt64(reader.Get(0));
    std::u32string fill = U" ";
    if (reader.Has(1)) {
        fill = text::Decode(StrArg(method, reader.Get(1)));
        if (fill.size() != 1) {
            throw TypeError("The fill character must be exactly one character long");
        }
    }
    const std::u32string code = Code(self);
    if (width <= static_cast<long long>(code.size())) {
        return self;
    }
    interp.CheckSize(static_cast<std::size_t>(width));
    const std::size_t total = static_cast<std::size_t>(width) - code.size();
    std::size_t left = 0;
    if (method == "rjust") {
        left = total;
    } else if (method == "center") {
        left = total / 2 + (total & static_cast<std::size_t>(width) & 1);
    }
    std::u32string out(left, fill[0]);
    out += code;
    out.append(total - left, fill[0]);
    return FromCode(out);
}

Value StrZfill(Interpreter& interp, const Value& self, CallArgs& args) {
    ExpectCount("zfill", args, 1, 1);
    const long long width = ToInt64(args.positional[0]);
    std::u32string code = Code(self);
    if (width <= static_cast<long long>(code.size())) {
        return self;
    }
    interp.CheckSize(static_cast<std::size_t>(width));
    const std::size_t pad = static_cast<std::size_t>(width) - code.size();
    const std::size_t at = (!code.empty() && (code[0] == '+' || code[0] == '-')) ? 1 : 0;
    code.insert(at, pad, U'0');
    return FromCode(code);
}

Value StrPartition(const Value& self, CallArgs& args, bool from_right) {
    const std::string method = from_right ? "rpartition" : "partition";
    ExpectCount(method, args, 1, 1);
    const std::string& sep = StrArg(method, args.positional[0]);
    if (sep.empty()) {
        throw ValueError("empty separator");
    }
    const std::string& value = self.AsStr();
    const std::size_t found = from_right ? value.rfind(sep) : value.find(sep);
    if (found == std::string::npos) {
        return from_right ? Value::Tuple({Value::Str(""), Value::Str(""), self})
                          : Value::Tuple({self, Value::Str(""), Value::Str("")});
    }
    return Value::Tuple({Value::Str(value.substr(0, found)), Value::Str(sep),
                         Value::Str(value.substr(found + sep.size()))});
}

Value StrSplitLines(const Value& self, CallArgs& args) {
    ArgReader reader("splitlines", args, {"keepends"}, 0);
    const bool keep = reader.Has(0) && Truthy(reader.Get(0));
    const std::string& value = self.AsStr();
    std::vector<Value> lines;
    std::size_t start = 0;
    std::size_t i = 0;
    while (i < value.size()) {
        if (value[i] == '\n' || value[i] == '\r') {
            std::size_t next = i + 1;
            if (value[i] == '\r' && next < value.size() && value[next] == '\n') {
                ++next;
            }
            lines.push_back(Value::Str(value.substr(start, (keep ? next : i) - start)));
            start = next;
            i = next;
        } else {
            ++i;
        }
    }
    if (start < value.size()) {
        lines.push_back(Value::Str(value.substr(start)));
    }
    return Value::List(std::move(lines));
}

Value StrTitle(const Value& self, CallArgs& args, bool capitalize_only) {
    ExpectCount(capitalize_only ? "capitalize" : "title", args, 0, 0);
    std::string out = self.AsStr();
    bool previous_cased = false;
    for (std::size_t i = 0; i < out.size(); ++i) {
        const auto c = static_cast<unsigned char>(out[i]);
        if (c >= 0x80) {
            previous_cased = false;
            continue;
        }
        if (capitalize_only) {
            out[i] = static_cast<char>(i == 0 ? std::toupper(c) : std::tolower(c));
            continue;
        }
        const bool cased = std::isalpha(c) != 0;
        out[i] = static_cast<char>(previous_cased ? std::tolower(c) : std::toupper(c));
        previous_cased = cased;
    }
    return Value::Str(std::move(out));
}

const MethodTable& StrMethods() {
    static const MethodTable table = {
        {"upper", [](Interpreter&, const Value& self, CallArgs& args) { return StrCase(self, args, "upper", true); }},
        {"lower", [](Interpreter&, const Value& self, CallArgs& args) { return StrCase(self, args, "lower", false); }},
        {"casefold",
         [](Interpreter&, const Value& self, CallArgs& args) { return StrCase(self, args, "casefold", false); }},
        {"swapcase",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("swapcase", args, 0, 0);
             std::string out = self.AsStr();
             for (auto& c : out) {
                 const auto byte = static_cast<unsigned char>(c);
                 if (std::isupper(byte)) {
                     c = static_cast<char>(std::tolower(byte));
                 } else if (std::islower(byte)) {
                     c = static_cast<char>(std::toupper(byte));
                 }
             }
             return Value::Str(std::move(out));
         }},
        {"title", [](Interpreter&, const Value& self, CallArgs& args) { return StrTitle(self, args, false); }},
        {"capitalize", [](Interpreter&, const Value& self, CallArgs& args) { return StrTitle(self, args, true); }},
        {"strip",
         [](Interpreter&, const Value& self, CallArgs& args) { return StrStrip(self, args, "strip", true, true); }},
        {"lstrip",
         [](Interpreter&, const Value& self, CallArgs& args) { return StrStrip(self, args, "lstrip", true, false); }},
        {"rstrip",
         [](Interpreter&, const Value& self, CallArgs& args) { return StrStrip(self, args, "rstrip", false, true); }},
        {"split", [](Interpreter& interp, const Value& self, CallArgs& args) {
             return StrSplit(interp, self, args, false);
         }},
        {"rsplit", [](Interpreter& interp, const Value& self, CallArgs& args) {
             return StrSplit(interp, self, args, true);
         }},
        {"splitlines", [](Interpreter&, const Value& self, CallArgs& args) { return StrSplitLines(self, args); }},
        {"join", StrJoin},
        {"replace", StrReplace},
        {"find",
         [](Interpreter&, const Value& self, CallArgs& args) { return StrFind(self, args, "find", false, false); }},
        {"rfind",
         [](Interpreter&, const Value& self, CallArgs& args) { return StrFind(self, args, "rfind", true, false); }},
        {"index",
         [](Interpreter&, const Value& self, CallArgs& args) { return StrFind(self, args, "index", false, true); }},
        {"rindex",
         [](Interpreter&, const Value& self, CallArgs& args) { return StrFind(self, args, "rindex", true, true); }},
        {"count", [](Interpreter&, const Value& self, CallArgs& args) { return StrCount(self, args); }},
        {"startswith", [](Interpreter&, const Value& self, CallArgs& args) { return StrAffix(self, args, true); }},
        {"endswith", [](Interpreter&, const Value& self, CallArgs& args) { return StrAffix(self, args, false); }},
        {"isdigit",
         [](Interpreter&, const Value& self, CallArgs& args) { return StrPredicate(self, args, "isdigit", DigitChar); }},
        {"isdecimal",
         [](Interpreter&, const Value& self, CallArgs& args) {
             return StrPredicate(self, args, "isdecimal", DigitChar);
         }},
        {"isnumeric",
         [](Interpreter&, const Value& self, CallArgs& args) {
             return StrPredicate(self, args, "isnumeric", DigitChar);
         }},
        {"isalpha",
         [](Interpreter&, const Value& self, CallArgs& args) { return StrPredicate(self, args, "isalpha", AlphaChar); }},
        {"isalnum",
         [](Interpreter&, const Value& self, CallArgs& args) { return StrPredicate(self, args, "isalnum", AlnumChar); }},
        {"isspace",
         [](Interpreter&, const Value& self, CallArgs& args) { return StrPredicate(self, args, "isspace", SpaceChar); }},
        {"isupper", [](Interpreter&, const Value& self, CallArgs& args) { return StrCased(self, args, "isupper", true); }},
        {"islower",
         [](Interpreter&, const Value& self, CallArgs& args) { return StrCased(self, args, "islower", false); }},
        {"center", [](Interpreter& interp, const Value& self, CallArgs& args) {
             return StrPad(interp, self, args, "center");
         }},
        {"ljust",
         [](Interpreter& interp, const Value& self, CallArgs& args) { return StrPad(interp, self, args, "ljust"); }},
        {"rjust",
         [](Interpreter& interp, const Value& self, CallArgs& args) { return StrPad(interp, self, args, "rjust"); }},
        {"zfill", StrZfill},
        {"partition",
         [](Interpreter&, const Value& self, CallArgs& args) { return StrPartition(self, args, false); }},
        {"rpartition", [](Interpreter&, const Value& self, CallArgs& args) { return StrPartition(self, args, true); }},
        {"removeprefix",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("removeprefix", args, 1, 1);
             const std::string& prefix = StrArg("removeprefix", args.positional[0]);
             const std::string& value = self.AsStr();
             return value.compare(0, prefix.size(), prefix) == 0 ? Value::Str(value.substr(prefix.size())) : self;
         }},
        {"removesuffix",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("removesuffix", args, 1, 1);
             const std::string& suffix = StrArg("removesuffix", args.positional[0]);
             const std::string& value = self.AsStr();
             if (!suffix.empty() && value.size() >= suffix.size() &&
                 value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0) {
                 return Value::Str(value.substr(0, value.size() - suffix.size()));
             }
             return self;
         }},
        {"format",
         [](Interpreter& interp, const Value& self, CallArgs& args) {
             Value out = Value::Str(StrFormat(self.AsStr(), args));
             interp.CheckSize(out.AsStr().size());
             return out;
         }},
    };
    return table;
}

// ---------------------------------------------------------------------------
// list / tuple

std::vector<Value>& ListItems(const Value& self) {
    return self.As<ListObject>().items;
}

Value SequenceIndexOf(Interpreter& interp, const Value& self, CallArgs& args) {
    ArgReader reader("index", args, {"value", "start", "stop"}, 1);
    const auto& items = Items(self);
    std::size_t begin = 0;
    std::size_t end = 0;
    ResolveRange(reader, 1, items.size(), begin, end);
    for (std::size_t i = begin; i < end; ++i) {
        interp.Step();
        if (Identical(items[i], reader.Get(0)) || Equals(items[i], reader.Get(0))) {
            return Value::Int(static_cast<long long>(i));
        }
    }
    if (self.Is(ValueKind::kTuple)) {
        throw ValueError("tuple.index(x): x not in tuple");
    }
    throw ValueError(Repr(reader.Get(0)) + " is not in list");
}

Value SequenceCount(Interpreter& interp, const Value& self, CallArgs& args) {
    ExpectCount("count", args, 1, 1);
    long long count = 0;
    for (const auto& item : Items(self)) {
        interp.Step();
        if (Identical(item, args.positional[0]) || Equals(item, args.positional[0])) {
            ++count;
        }
    }
    return Value::Int(count);
}

const MethodTable& ListMethods() {
    static const MethodTable table = {
        {"append",
         [](Interpreter& interp, const Value& self, CallArgs& args) {
             ExpectCount("append", args, 1, 1);
             auto& items = ListItems(self);
             interp.CheckSize(items.size() + 1);
             items.push_back(args.positional[0]);
             return Value();
         }},
        {"extend",
         [](Interpreter& interp, const Value& self, CallArgs& args) {
             ExpectCount("extend", args, 1, 1);
             std::vector<Value> extra = interp.Collect(args.positional[0]);
             auto& items = ListItems(self);
             interp.CheckSize(items.size() + extra.size());
             items.insert(items.end(), extra.begin(), extra.end());
             return Value();
         }},
        {"insert",
         [](Interpreter& interp, const Value& self, CallArgs& args) {
             ExpectCount("insert", args, 2, 2);
             auto& items = ListItems(self);
             interp.CheckSize(items.size() + 1);
             const auto size = static_cast<long long>(items.size());
             long long index = ToInt64(args.positional[0]);
             if (index < 0) {
                 index = std::max(0LL, index + size);
             }
             index = std::min(index, size);
             items.insert(items.begin() + index, args.positional[1]);
             return Value();
         }},
        {"pop",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("pop", args, 0, 1);
             auto& items = ListItems(self);
             if (items.empty()) {
                 throw IndexError("pop from empty list");
             }
             const auto size = static_cast<long long>(items.size());
             long long index = args.positional.empty() ? -1 : ToInt64(args.positional[0]);
             if (index < 0) {
                 index += size;
             }
             if (index < 0 || index >= size) {
                 throw IndexError("pop index out of range");
             }
             Value out = items[static_cast<std::size_t>(index)];
             items.erase(items.begin() + index);
             return out;
         }},
        {"remove",
         [](Interpreter& interp, const Value& self, CallArgs& args) {
             ExpectCount("remove", args, 1, 1);
             auto& items = ListItems(self);
             for (std::size_t i = 0; i < items.size(); ++i) {
                 interp.Step();
                 if (Identical(items[i], args.positional[0]) || Equals(items[i], args.positional[0])) {
                     items.erase(items.begin() + static_cast<std::ptrdiff_t>(i));
                     return Value();
                 }
             }
             throw ValueError("list.remove(x): x not in list");
         }},
        {"index", SequenceIndexOf},
        {"count", SequenceCount},
        {"sort",
         [](Interpreter& interp, const Value& self, CallArgs& args) {
             if (!args.positional.empty()) {
                 throw TypeError("sort() takes no positional arguments");
             }
             ArgReader reader("sort", args, {"key", "reverse"}, 0);
             std::vector<Value> items = ListItems(self);
             SortValues(interp, items, reader.Get(0, Value()), reader.Has(1) && Truthy(reader.Get(1)));
             ListItems(self) = std::move(items);
             return Value();
         }},
        {"reverse",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("reverse", args, 0, 0);
             auto& items = ListItems(self);
             std::reverse(items.begin(), items.end());
             return Value();
         }},
        {"copy",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("copy", args, 0, 0);
             return Value::List(ListItems(self));
         }},
        {"clear",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("clear", args, 0, 0);
             ListItems(self).clear();
             return Value();
         }},
    };
    return table;
}

const MethodTable& TupleMethods() {
    static const MethodTable table = {
        {"index", SequenceIndexOf},
        {"count", SequenceCount},
    };
    return table;
}

// ---------------------------------------------------------------------------
// dict

DictStorage& Entries(const Value& self) {
    return self.As<DictObject>().entries;
}

const MethodTable& DictMethods() {
    static const MethodTable table = {
        {"get",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("get", args, 1, 2);
             const Value* found = Entries(self).Find(args.positional[0]);
             if (found != nullptr) {
                 return *found;
             }
             return args.positional.size() > 1 ? args.positional[1] : Value();
         }},
        {"keys",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("keys", args, 0, 0);
             return Value::List(Entries(self).Keys());
         }},
        {"values",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("values", args, 0, 0);
             return Value::List(Entries(self).Values());
         }},
        {"items",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("items", args, 0, 0);
             std::vector<Value> out;
             for (const auto& [key, value] : Entries(self).Items()) {
                 out.push_back(Value::Tuple({key, value}));
             }
             return Value::List(std::move(out));
         }},
        {"pop",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("pop", args, 1, 2);
             auto& entries = Entries(self);
             const Value* found = entries.Find(args.positional[0]);
             if (found == nullptr) {
                 if (args.positional.size() > 1) {
                     return args.positional[1];
                 }
                 throw KeyError(Repr(args.positional[0]));
             }
             Value out = *found;
             entries.Erase(args.positional[0]);
             return out;
         }},
        {"popitem",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("popitem", args, 0, 0);
             Value key;
             Value value;
             if (!Entries(self).PopLast(key, value)) {
                 throw KeyError("'popitem(): dictionary is empty'");
             }
             return Value::Tuple({key, value});
         }},
        {"setdefault",
         [](Interpreter& interp, const Value& self, CallArgs& args) {
             ExpectCount("setdefault", args, 1, 2);
             auto& entries = Entries(self);
             const Value* found = entries.Find(args.positional[0]);
             if (found != nullptr) {
                 return *found;
             }
             const Value fallback = args.positional.size() > 1 ? args.positional[1] : Value();
             entries.Set(args.positional[0], fallback);
             interp.CheckSize(entries.size());
             return fallback;
         }},
        {"update",
         [](Interpreter& interp, const Value& self, CallArgs& args) {
             if (args.positional.size() > 1) {
                 throw TypeError("update expected at most 1 argument, got " + std::to_string(args.positional.size()));
             }
             CallArgs build;
             build.positional = args.positional;
             build.keywords = args.keywords;
             const Value merged = interp.Call(NativeBuiltins().at("dict"), std::move(build));
             auto& entries = Entries(self);
             for (const auto& [key, value] : Entries(merged).Items()) {
                 entries.Set(key, value);
             }
             interp.CheckSize(entries.size());
             return Value();
         }},
        {"copy",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("copy", args, 0, 0);
             Value out = Value::Dict();
             Entries(out) = Entries(self);
             return out;
         }},
        {"clear",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("clear", args, 0, 0);
             Entries(self).Clear();
             return Value();
         }},
    };
    return table;
}

// ---------------------------------------------------------------------------
// set / frozenset

DictStorage& SetEntries(const Value& self) {
    return self.As<SetObject>().entries;
}

DictStorage ToEntries(Interpreter& interp, const Value& iterable) {
    if (iterable.Is(ValueKind::kSet) || iterable.Is(ValueKind::kFrozenSet)) {
        return SetEntries(iterable);
    }
    DictStorage out;
    interp.ForEach(iterable, [&](const Value& item) {
        out.Set(item, Value());
        interp.CheckSize(out.size());
    });
    return out;
}

enum class SetOp { kUnion, kIntersection, kDifference, kSymmetric };

DictStorage Combine(const DictStorage& a, const DictStorage& b, SetOp op) {
    DictStorage out;
    switch (op) {
        case SetOp::kUnion:
            out = a;
            for (const auto& key : b.Keys()) {
                out.Set(key, Value());
            }
            break;
        case SetOp::kIntersection:
            for (const auto& key : a.Keys()) {
                if (b.Find(key) != nullptr) {
                    out.Set(key, Value());
                }
            }
            break;
        case SetOp::kDifference:
            for (const auto& key : a.Keys()) {
                if (b.Find(key) == nullptr) {
                    out.Set(key, Value());
                }
            }
            break;
        case SetOp::kSymmetric:
            out = Combine(a, b, SetOp::kDifference);
            for (const auto& key : b.Keys()) {
                if (a.Find(key) == nullptr) {
                    out.Set(key, Value());
                }
            }
            break;
    }
    return out;
}

// union(*others) and friends return a new set of the receiver's kind.
Value SetCombine(Interpreter& interp, const Value& self, CallArgs& args, const std::string& method, SetOp op) {
    NoKeywords(method, args);
    if (op == SetOp::kSymmetric && args.positional.size() != 1) {
        ExpectCount(method, args, 1, 1);
    }
    DictStorage result = SetEntries(self);
    for (const auto& other : args.positional) {
        result = Combine(result, ToEntries(interp, other), op);
    }
    interp.CheckSize(result.size());
    Value out = Value::Set(self.kind());
    SetEntries(out) = std::move(result);
    return out;
}

// The *_update forms mutate the receiver.
Value SetUpdate(Interpreter& interp, const Value& self, CallArgs& args, const std::string& method, SetOp op) {
    Value combined = SetCombine(interp, self, args, method, op);
    SetEntries(self) = std::move(SetEntries(combined));
    return Value();
}

Value SetRelation(Interpreter& interp, const Value& self, CallArgs& args, const std::string& method) {
    ExpectCount(method, args, 1, 1);
    const DictStorage other = ToEntries(interp, args.positional[0]);
    const DictStorage& mine = SetEntries(self);
    const DictStorage& small = method == "issuperset" ? other : mine;
    const DictStorage& large = method == "issuperset" ? mine : other;
    for (const auto& key : small.Keys()) {
        const bool present = large.Find(key) != nullptr;
        if (method == "isdisjoint" ? present : !present) {
            return Value::Bool(false);
        }
    }
    return Value::Bool(true);
}

const MethodTable& FrozenSetMethods() {
    static const MethodTable table = {
        {"union",
         [](Interpreter& interp, const Value& self, CallArgs& args) {
             return SetCombine(interp, self, args, "union", SetOp::kUnion);
         }},
        {"intersection",
         [](Interpreter& interp, const Value& self, CallArgs& args) {
             return SetCombine(interp, self, args, "intersection", SetOp::kIntersection);
         }},
        {"difference",
         [](Interpreter& interp, const Value& self, CallArgs& args) {
             return SetCombine(interp, self, args, "difference", SetOp::kDifference);
         }},
        {"symmetric_difference",
         [](Interpreter& interp, const Value& self, CallArgs& args) {
             return SetCombine(interp, self, args, "symmetric_difference", SetOp::kSymmetric);
         }},
        {"issubset",
         [](Interpreter& interp, const Value& self, CallArgs& args) {
             return SetRelation(interp, self, args, "issubset");
         }},
        {"issuperset",
         [](Interpreter& interp, const Value& self, CallArgs& args) {
             return SetRelation(interp, self, args, "issuperset");
         }},
        {"isdisjoint",
         [](Interpreter& interp, const Value& self, CallArgs& args) {
             return SetRelation(interp, self, args, "isdisjoint");
         }},
        {"copy",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("copy", args, 0, 0);
             Value out = Value::Set(self.kind());
             SetEntries(out) = SetEntries(self);
             return out;
         }},
    };
    return table;
}

const MethodTable& SetMethods() {
    static const MethodTable table = [] {
        MethodTable methods = FrozenSetMethods();
        methods["add"] = [](Interpreter& interp, const Value& self, CallArgs& args) {
            ExpectCount("add", args, 1, 1);
            auto& entries = SetEntries(self);
            entries.Set(args.positional[0], Value());
            interp.CheckSize(entries.size());
            return Value();
        };
        methods["remove"] = [](Interpreter&, const Value& self, CallArgs& args) {
            ExpectCount("remove", args, 1, 1);
            if (!SetEntries(self).Erase(args.positional[0])) {
                throw KeyError(Repr(args.positional[0]));
            }
            return Value();
        };
        methods["discard"] = [](Interpreter&, const Value& self, CallArgs& args) {
            ExpectCount("discard", args, 1, 1);
            SetEntries(self).Erase(args.positional[0]);
            return Value();
        };
        methods["pop"] = [](Interpreter&, const Value& self, CallArgs& args) {
            ExpectCount("pop", args, 0, 0);
            auto& entries = SetEntries(self);
            const std::vector<Value> keys = entries.Keys();
            if (keys.empty()) {
                throw KeyError("'pop from an empty set'");
            }
            entries.Erase(keys.front());
            return keys.front();
        };
        methods["clear"] = [](Interpreter&, const Value& self, CallArgs& args) {
            ExpectCount("clear", args, 0, 0);
            SetEntries(self).Clear();
            return Value();
        };
        methods["update"] = [](Interpreter& interp, const Value& self, CallArgs& args) {
            return SetUpdate(interp, self, args, "update", SetOp::kUnion);
        };
        methods["intersection_update"] = [](Interpreter& interp, const Value& self, CallArgs& args) {
            return SetUpdate(interp, self, args, "intersection_update", SetOp::kIntersection);
        };
        methods["difference_update"] = [](Interpreter& interp, const Value& self, CallArgs& args) {
            return SetUpdate(interp, self, args, "difference_update", SetOp::kDifference);
        };
        methods["symmetric_difference_update"] = [](Interpreter& interp, const Value& self, CallArgs& args) {
            return SetUpdate(interp, self, args, "symmetric_difference_update", SetOp::kSymmetric);
        };
        return methods;
    }();
    return table;
}

// ---------------------------------------------------------------------------
// numbers

Value BitCount(const BigInt& value) {
    const BigInt magnitude = value < 0 ? BigInt(-value) : value;
    const std::string hex = magnitude.str(0, std::ios_base::hex);
    long long count = 0;
    for (char c : hex) {
        int digit = c >= 'a' ? c - 'a' + 10 : (c >= 'A' ? c - 'A' + 10 : c - '0');
        while (digit != 0) {
            count += digit & 1;
            digit >>= 1;
        }
    }
    return Value::Int(count);
}

const MethodTable& IntMethods() {
    static const MethodTable table = {
        {"bit_length",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("bit_length", args, 0, 0);
             const BigInt value = ToBigInt(self);
             if (value == 0) {
                 return Value::Int(0LL);
             }
             const BigInt magnitude = value < 0 ? BigInt(-value) : value;
             return Value::Int(static_cast<long long>(boost::multiprecision::msb(magnitude)) + 1);
         }},
        {"bit_count",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("bit_count", args, 0, 0);
             return BitCount(ToBigInt(self));
         }},
        {"conjugate",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("conjugate", args, 0, 0);
             return Value::Int(ToBigInt(self));
         }},
        {"as_integer_ratio",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("as_integer_ratio", args, 0, 0);
             return Value::Tuple({Value::Int(ToBigInt(self)), Value::Int(1LL)});
         }},
        {"is_integer",
         [](Interpreter&, const Value&, CallArgs& args) {
             ExpectCount("is_integer", args, 0, 0);
             return Value::Bool(true);
         }},
    };
    return table;
}

Value RatioTuple(const Rational& value) {
    return Value::Tuple({Value::Int(BigInt(numerator(value))), Value::Int(BigInt(denominator(value)))});
}

const MethodTable& FloatMethods() {
    static const MethodTable table = {
        {"is_integer",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("is_integer", args, 0, 0);
             const double value = self.AsFloat();
             return Value::Bool(std::isfinite(value) && std::floor(value) == value);
         }},
        {"as_integer_ratio",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("as_integer_ratio", args, 0, 0);
             const double value = self.AsFloat();
             if (std::isnan(value)) {
                 throw ValueError("cannot convert NaN to integer ratio");
             }
             if (std::isinf(value)) {
                 throw OverflowError("cannot convert Infinity to integer ratio");
             }
             return RatioTuple(RationalFromDouble(value));
         }},
        {"conjugate",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("conjugate", args, 0, 0);
             return self;
         }},
    };
    return table;
}

const MethodTable& ComplexMethods() {
    static const MethodTable table = {
        {"conjugate",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("conjugate", args, 0, 0);
             return Value::Complex(std::conj(self.AsComplex()));
         }},
    };
    return table;
}

Value LimitDenominator(const Rational& value, const BigInt& max_denominator) {
    if (max_denominator < 1) {
        throw ValueError("max_denominator should be at least 1");
    }
    if (denominator(value) <= max_denominator) {
        return Value::Fraction(value);
    }
    BigInt p0 = 0;
    BigInt q0 = 1;
    BigInt p1 = 1;
    BigInt q1 = 0;
    BigInt n = numerator(value);
    BigInt d = denominator(value);
    while (true) {
        const BigInt a = FloorDiv(n, d);
        const BigInt q2 = q0 + a * q1;
        if (q2 > max_denominator) {
            break;
        }
        BigInt next_p = p0 + a * p1;
        p0 = p1;
        q0 = q1;
        p1 = std::move(next_p);
        q1 = q2;
        BigInt next_d = n - a * d;
        n = d;
        d = std::move(next_d);
    }
    const BigInt k = FloorDiv(max_denominator - q0, q1);
    const Rational bound1(BigInt(p0 + k * p1), BigInt(q0 + k * q1));
    const Rational bound2(p1, q1);
    const Rational distance1 = abs(Rational(bound1 - value));
    const Rational distance2 = abs(Rational(bound2 - value));
    return Value::Fraction(distance2 <= distance1 ? bound2 : bound1);
}

const MethodTable& FractionMethods() {
    static const MethodTable table = {
        {"limit_denominator",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ArgReader reader("limit_denominator", args, {"max_denominator"}, 0);
             const BigInt limit = reader.Has(0) ? ToBigInt(reader.Get(0)) : BigInt(1000000);
             return LimitDenominator(self.As<FractionObject>().value, limit);
         }},
        {"as_integer_ratio",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("as_integer_ratio", args, 0, 0);
             return RatioTuple(self.As<FractionObject>().value);
         }},
        {"is_integer",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("is_integer", args, 0, 0);
             return Value::Bool(denominator(self.As<FractionObject>().value) == 1);
         }},
        {"conjugate",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("conjugate", args, 0, 0);
             return self;
         }},
    };
    return table;
}

const runtime::Decimal& DecimalOf(const Value& self) {
    return self.As<DecimalObject>().value;
}

Rounding RoundingArg(const ArgReader& reader, std::size_t index, Rounding fallback) {
    if (!reader.HasValue(index)) {
        return fallback;
    }
    const Value& value = reader.Get(index);
    Rounding rounding = fallback;
    if (!value.Is(ValueKind::kStr) || !ParseRounding(value.AsStr(), rounding)) {
        throw TypeError("invalid rounding mode " + Repr(value));
    }
    return rounding;
}

runtime::Decimal DecimalOperand(const Value& value) {
    if (value.Is(ValueKind::kDecimal)) {
        return DecimalOf(value);
    }
    if (IsIntegral(value)) {
        return runtime::Decimal::FromInt(ToBigInt(value));
    }
    throw TypeError("conversion from " + TypeName(value) + " to Decimal is not supported");
}

using DecimalUnary = runtime::Decimal (runtime::Decimal::*)(const DecimalContext&) const;

template <DecimalUnary Operation>
Value DecimalFunction(Interpreter&, const Value& self, CallArgs& args) {
    ArgReader reader("decimal", args, {"context"}, 0);
    return Value::Decimal((DecimalOf(self).*Operation)(DecimalContext{}));
}

const MethodTable& DecimalMethods() {
    static const MethodTable table = {
        {"sqrt", DecimalFunction<&runtime::Decimal::Sqrt>},
        {"exp", DecimalFunction<&runtime::Decimal::Exp>},
        {"ln", DecimalFunction<&runtime::Decimal::Ln>},
        {"log10", DecimalFunction<&runtime::Decimal::Log10>},
        {"quantize",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ArgReader reader("quantize", args, {"exp", "rounding", "context"}, 1);
             const Rounding rounding = RoundingArg(reader, 1, DecimalContext{}.rounding);
             return Value::Decimal(DecimalOf(self).Quantize(DecimalOperand(reader.Get(0)), rounding, DecimalContext{}));
         }},
        {"to_integral_value",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ArgReader reader("to_integral_value", args, {"rounding", "context"}, 0);
             return Value::Decimal(DecimalOf(self).ToIntegral(RoundingArg(reader, 0, DecimalContext{}.rounding)));
         }},
        {"to_integral",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ArgReader reader("to_integral", args, {"rounding", "context"}, 0);
             return Value::Decimal(DecimalOf(self).ToIntegral(RoundingArg(reader, 0, DecimalContext{}.rounding)));
         }},
        {"copy_abs",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("copy_abs", args, 0, 0);
             return Value::Decimal(DecimalOf(self).Abs());
         }},
        {"copy_negate",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("copy_negate", args, 0, 0);
             return Value::Decimal(DecimalOf(self).Negate());
         }},
        {"adjusted",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("adjusted", args, 0, 0);
             return Value::Int(DecimalOf(self).IsFinite() ? DecimalOf(self).Adjusted() : 0LL);
         }},
        {"is_nan",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("is_nan", args, 0, 0);
             return Value::Bool(DecimalOf(self).IsNaN());
         }},
        {"is_infinite",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("is_infinite", args, 0, 0);
             return Value::Bool(DecimalOf(self).IsInfinite());
         }},
        {"is_finite",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("is_finite", args, 0, 0);
             return Value::Bool(DecimalOf(self).IsFinite());
         }},
        {"is_zero",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("is_zero", args, 0, 0);
             return Value::Bool(DecimalOf(self).IsZero());
         }},
        {"is_signed",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("is_signed", args, 0, 0);
             return Value::Bool(DecimalOf(self).negative());
         }},
        {"as_integer_ratio",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("as_integer_ratio", args, 0, 0);
             BigInt n;
             BigInt d;
             DecimalOf(self).ToFraction(n, d);
             return RatioTuple(Rational(n, d));
         }},
        {"conjugate",
         [](Interpreter&, const Value& self, CallArgs& args) {
             ExpectCount("conjugate", args, 0, 0);
             return self;
         }},
    };
    return table;
}

const MethodTable& RangeMethods() {
    static const MethodTable table = {
        {"count",
         [](Interpreter& interp, const Value& self, CallArgs& args) {
             ExpectCount("count", args, 1, 1);
             return Value::Int(interp.Contains(self, args.positional[0]) ? 1LL : 0LL);
         }},
        {"index",
         [](Interpreter& interp, const Value& self, CallArgs& args) {
             ExpectCount("index", args, 1, 1);
             const Value& item = args.positional[0];
             if (!interp.Contains(self, item)) {
                 throw ValueError(Repr(item) + " is not in range");
             }
             const auto& range = self.As<RangeObject>();
             const Rational exact = ToRational(item);
             return Value::Int(BigInt((numerator(exact) - range.start) / range.step));
         }},
    };
    return table;
}

const MethodTable* MethodsFor(const Value& receiver) {
    switch (receiver.kind()) {
        case ValueKind::kStr: return &StrMethods();
        case ValueKind::kList: return &ListMethods();
        case ValueKind::kTuple: return &TupleMethods();
        case ValueKind::kDict: return &DictMethods();
        case ValueKind::kSet: return &SetMethods();
        case ValueKind::kFrozenSet: return &FrozenSetMethods();
        case ValueKind::kBool:
        case ValueKind::kInt: return &IntMethods();
        case ValueKind::kFloat: return &FloatMethods();
        case ValueKind::kComplex: return &ComplexMethods();
        case ValueKind::kFraction: return &FractionMethods();
        case ValueKind::kDecimal: return &DecimalMethods();
        case ValueKind::kRange: return &RangeMethods();
        default: return nullptr;
    }
}

// Plain data attributes: int.real, Fraction.numerator, range.start, ...
bool LookupDataAttribute(const Value& receiver, const std::string& name, Value& out) {
    switch (receiver.kind()) {
        case ValueKind::kBool:
        case ValueKind::kInt:
            if (name == "real" || name == "numerator") {
                out = Value::Int(ToBigInt(receiver));
                return true;
            }
            if (name == "imag") {
                out = Value::Int(0LL);
                return true;
            }
            if (name == "denominator") {
                out = Value::Int(1LL);
                return true;
            }
            return false;
        case ValueKind::kFloat:
            if (name == "real" || name == "imag") {
                out = Value::Float(name == "real" ? receiver.AsFloat() : 0.0);
                return true;
            }
            return false;
        case ValueKind::kComplex:
            if (name == "real" || name == "imag") {
                const auto value = receiver.AsComplex();
                out = Value::Float(name == "real" ? value.real() : value.imag());
                return true;
            }
            return false;
        case ValueKind::kFraction: {
            const Rational& value = receiver.As<FractionObject>().value;
            if (name == "numerator" || name == "denominator") {
                out = Value::Int(BigInt(name == "numerator" ? numerator(value) : denominator(value)));
                return true;
            }
            if (name == "real") {
                out = receiver;
                return true;
            }
            if (name == "imag") {
                out = Value::Int(0LL);
                return true;
            }
            return false;
        }
        case ValueKind::kDecimal:
            if (name == "real") {
                out = receiver;
                return true;
            }
            if (name == "imag") {
                out = Value::Decimal(runtime::Decimal());
                return true;
            }
            return false;
        case ValueKind::kRange: {
            const auto& range = receiver.As<RangeObject>();
            if (name == "start" || name == "stop" || name == "step") {
                out = Value::Int(name == "start" ? range.start : (name == "stop" ? range.stop : range.step));
                return true;
            }
            return false;
        }
        default:
            return false;
    }
}

}  // namespace

bool LookupMethod(const Value& receiver, const std::string& name, Value& out) {
    if (LookupDataAttribute(receiver, name, out)) {
        return true;
    }
    const MethodTable* methods = MethodsFor(receiver);
    if (methods == nullptr) {
        return false;
    }
    auto it = methods->find(name);
    if (it == methods->end()) {
        return false;
    }
    const Method method = it->second;
    const Value self = receiver;
    out = MakeBuiltin(name, [method, self](Interpreter& interp, CallArgs& args) { return method(interp, self, args); },
                      TypeName(receiver));
    return true;
}

}  // namespace mathguard::runtime
