#pragma once

#include <stdexcept>
#include <string>

namespace mathguard::lang {

enum class TokenKind {
    kName,
    kNumber,
    kString,
    kFString,
    kOp,
    kNewline,
    kIndent,
    kDedent,
    kEnd
};

const char* ToString(TokenKind kind);

struct SourceLocation {
    int line = 0;
    int column = 0;
};

struct Token {
    TokenKind kind = TokenKind::kEnd;
    // kString: decoded value. kFString: undecoded body between the quotes.
    // kNumber: literal text as written. Otherwise the token's spelling.
    std::string text;
    bool raw = false;
    SourceLocation loc;
};

class SyntaxError : public std::runtime_error {
public:
    SyntaxError(const std::string& message, SourceLocation loc)
        : std::runtime_error(message + " (line " + std::to_string(loc.line) +
                             ", column " + std::to_string(loc.column) + ")"),
          message_(message),
          loc_(loc) {}

    const std::string& message() const { return message_; }
    SourceLocation location() const { return loc_; }

private:
    std::string message_;
    SourceLocation loc_;
};

}  // namespace mathguard::lang
