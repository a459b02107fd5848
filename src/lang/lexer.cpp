#include "lang/lexer.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace mathguard::lang {
namespace {

bool IsNameStart(char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || u >= 0x80;
}

bool IsNameChar(char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || u >= 0x80;
}

bool IsStringPrefix(const std::string& word) {
    std::string lowered = word;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    static const std::array<const char*, 10> kPrefixes = {
        "r", "u", "f", "b", "rb", "br", "fr", "rf", "ur", "ru"};
    return std::find_if(kPrefixes.begin(), kPrefixes.end(), [&lowered](const char* prefix) {
        return lowered == prefix;
    }) != kPrefixes.end();
}

void AppendUtf8(std::string& out, unsigned long code_point, SourceLocation loc) {
    if (code_point < 0x80) {
        out.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else if (code_point < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else if (code_point <= 0x10FFFF) {
        out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else {
        throw SyntaxError("escape sequence out of range", loc);
    }
}

unsigned long ReadHex(const std::string& body, std::size_t& i, std::size_t digits, SourceLocation loc) {
    if (i + digits > body.size()) {
        throw SyntaxError("truncated escape sequence", loc);
    }
    unsigned long value = 0;
    for (std::size_t k = 0; k < digits; ++k) {
        const char c = body[i + k];
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            throw SyntaxError("truncated escape sequence", loc);
        }
        value = value * 16 + static_cast<unsigned long>(
            std::isdigit(static_cast<unsigned char>(c)) ? c - '0' : std::tolower(c) - 'a' + 10);
    }
    i += digits;
    return value;
}

}  // namespace

const char* ToString(TokenKind kind) {
    switch (kind) {
        case TokenKind::kName: return "name";
        case TokenKind::kNumber: return "number";
        case TokenKind::kString: return "string";
        case TokenKind::kFString: return "f-string";
        case TokenKind::kOp: return "operator";
        case TokenKind::kNewline: return "newline";
        case TokenKind::kIndent: return "indent";
        case TokenKind::kDedent: return "dedent";
        case TokenKind::kEnd: return "end of input";
    }
    return "token";
}

std::string DecodeEscapes(const std::string& body, SourceLocation loc) {
    std::string out;
    out.reserve(body.size());
    std::size_t i = 0;
    while (i < body.size()) {
        const char c = body[i];
        if (c != '\\' || i + 1 >= body.size()) {
            out.push_back(c);
            ++i;
            continue;
        }
        const char next = body[i + 1];
        i += 2;
        switch (next) {
            case '\n': break;
            case '\\': out.push_back('\\'); break;
            case '\'': out.push_back('\''); break;
            case '"': out.push_back('"'); break;
            case 'a': out.push_back('\a'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'v': out.push_back('\v'); break;
            case 'x': AppendUtf8(out, ReadHex(body, i, 2, loc), loc); break;
            case 'u': AppendUtf8(out, ReadHex(body, i, 4, loc), loc); break;
            case 'U': AppendUtf8(out, ReadHex(body, i, 8, loc), loc); break;
            case 'N': throw SyntaxError("named unicode escapes are not supported", loc);
            default:
                if (next >= '0' && next <= '7') {
                    unsigned long value = static_cast<unsigned long>(next - '0');
                    for (int k = 0; k < 2 && i < body.size() && body[i] >= '0' && body[i] <= '7'; ++k) {
                        value = value * 8 + static_cast<unsigned long>(body[i] - '0');
                        ++i;
                    }
                    AppendUtf8(out, value, loc);
                } else {
                    out.push_back('\\');
                    out.push_back(next);
                }
                break;
        }
    }
    return out;
}

Lexer::Lexer(std::string source, SourceLocation origin)
    : source_(std::move(source)), line_(origin.line), column_(origin.column) {}

char Lexer::Peek(std::size_t ahead) const {
    const auto index = pos_ + ahead;
    return index < source_.size() ? source_[index] : '\0';
}

char Lexer::Advance() {
    const char c = source_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 0;
    } else {
        ++column_;
    }
    return c;
}

std::vector<Token> Lexer::Tokenize() {
    std::vector<Token> tokens;
    auto push_newline = [&tokens](SourceLocation loc) {
        if (!tokens.empty() && tokens.back().kind != TokenKind::kNewline) {
            tokens.push_back(Token{TokenKind::kNewline, "", false, loc});
        }
    };

    while (true) {
        if (at_line_start_ && open_brackets_.empty()) {
            ReadIndentation(tokens);
        }
        if (AtEnd()) {
            break;
        }
        const char c = Peek();
        if (c == ' ' || c == '\t' || c == '\f' || c == '\r') {
            Advance();
            continue;
        }
        if (c == '#') {
            while (!AtEnd() && Peek() != '\n') {
                Advance();
            }
            continue;
        }
        if (c == '\\') {
            if (Peek(1) == '\n') {
                Advance();
                Advance();
                continue;
            }
            if (Peek(1) == '\r' && Peek(2) == '\n') {
                Advance();
                Advance();
                Advance();
                continue;
            }
            throw SyntaxError("unexpected character after line continuation character", Here());
        }
        if (c == '\n') {
            const auto loc = Here();
            Advance();
            if (open_brackets_.empty()) {
                push_newline(loc);
                at_line_start_ = true;
            }
            continue;
        }
        if (IsNameStart(c)) {
            ReadName(tokens);
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && std::isdigit(static_cast<unsigned char>(Peek(1))))) {
            ReadNumber(tokens);
            continue;
        }
        if (c == '"' || c == '\'') {
            ReadString(tokens, "", Here());
            continue;
        }
        ReadOperator(tokens);
    }

    if (!open_brackets_.empty()) {
        const auto& [bracket, loc] = open_brackets_.back();
        throw SyntaxError(std::string("'") + bracket + "' was never closed", loc);
    }
    push_newline(Here());
    while (indents_.size() > 1) {
        indents_.pop_back();
        tokens.push_back(Token{TokenKind::kDedent, "", false, Here()});
    }
    tokens.push_back(Token{TokenKind::kEnd, "", false, Here()});
    return tokens;
}

void Lexer::ReadIndentation(std::vector<Token>& tokens) {
    int width = 0;
    while (!AtEnd()) {
        const char c = Peek();
        if (c == ' ') {
            ++width;
        } else if (c == '\t') {
            width = (width / 8 + 1) * 8;
        } else if (c == '\f') {
            width = 0;
        } else {
            break;
        }
        Advance();
    }
    at_line_start_ = false;
    if (AtEnd() || Peek() == '#' || Peek() == '\n' || Peek() == '\r') {
        return;
    }
    const auto loc = Here();
    if (width > indents_.back()) {
        indents_.push_back(width);
        tokens.push_back(Token{TokenKind::kIndent, "", false, loc});
        return;
    }
    while (width < indents_.back()) {
        indents_.pop_back();
        tokens.push_back(Token{TokenKind::kDedent, "", false, loc});
    }
    if (width != indents_.back()) {
        throw SyntaxError("unindent does not match any outer indentation level", loc);
    }
}

void Lexer::ReadName(std::vector<Token>& tokens) {
    const auto start = Here();
    std::string word;
    while (!AtEnd() && IsNameChar(Peek())) {
        word.push_back(Advance());
    }
    if ((Peek() == '"' || Peek() == '\'') && IsStringPrefix(word)) {
        ReadString(tokens, word, start);
        return;
    }
    tokens.push_back(Token{TokenKind::kName, word, false, start});
}

void Lexer::ReadNumber(std::vector<Token>& tokens) {
    const auto start = Here();
    std::string text;
    auto take_digits = [this, &text](auto predicate) {
        while (!AtEnd() && (predicate(Peek()) || Peek() == '_')) {
            text.push_back(Advance());
        }
    };
    auto is_digit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };

    const char second = static_cast<char>(std::tolower(static_cast<unsigned char>(Peek(1))));
    if (Peek() == '0' && (second == 'x' || second == 'o' || second == 'b')) {
        text.push_back(Advance());
        text.push_back(Advance());
        take_digits([](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
    } else {
        take_digits(is_digit);
        if (Peek() == '.') {
            text.push_back(Advance());
            take_digits(is_digit);
        }
        if ((Peek() == 'e' || Peek() == 'E') &&
            (is_digit(Peek(1)) || ((Peek(1) == '+' || Peek(1) == '-') && is_digit(Peek(2))))) {
            text.push_back(Advance());
            if (Peek() == '+' || Peek() == '-') {
                text.push_back(Advance());
            }
            take_digits(is_digit);
        }
        if (Peek() == 'j' || Peek() == 'J') {
            text.push_back(Advance());
        }
    }
    if (!AtEnd() && IsNameChar(Peek())) {
        throw SyntaxError("invalid decimal literal", start);
    }
    tokens.push_back(Token{TokenKind::kNumber, text, false, start});
}

void Lexer::ReadString(std::vector<Token>& tokens, const std::string& prefix, SourceLocation start) {
    std::string lowered = prefix;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered.find('b') != std::string::npos) {
        throw SyntaxError("bytes literals are not supported", start);
    }
    const bool raw = lowered.find('r') != std::string::npos;
    const bool formatted = lowered.find('f') != std::string::npos;

    const char quote = Advance();
    const bool triple = Peek() == quote && Peek(1) == quote;
    if (triple) {
        Advance();
        Advance();
    }

    std::string body;
    while (true) {
        if (AtEnd()) {
            throw SyntaxError(triple ? "unterminated triple-quoted string literal"
                                     : "unterminated string literal", start);
        }
        const char c = Peek();
        if (c == '\\') {
            body.push_back(Advance());
            if (!AtEnd()) {
                body.push_back(Advance());
            }
            continue;
        }
        if (triple) {
            if (c == quote && Peek(1) == quote && Peek(2) == quote) {
                Advance();
                Advance();
                Advance();
                break;
            }
        } else {
            if (c == quote) {
                Advance();
                break;
            }
            if (c == '\n') {
                throw SyntaxError("unterminated string literal", start);
            }
        }
        body.push_back(Advance());
    }

    if (formatted) {
        tokens.push_back(Token{TokenKind::kFString, body, raw, start});
        return;
    }
    tokens.push_back(Token{TokenKind::kString, raw ? body : DecodeEscapes(body, start), raw, start});
}

void Lexer::ReadOperator(std::vector<Token>& tokens) {
    static const std::array<const char*, 24> kMultiChar = {
        "**=", "//=", ">>=", "<<=", "...",
        "->", ":=", "**", "//", "<<", ">>", "<=", ">=", "==", "!=",
        "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@="};
    static const std::string kSingle = "+-*/%@&|^~<>()[]{},:.;=";

    const auto start = Here();
    for (const char* op : kMultiChar) {
        const std::string candidate(op);
        if (source_.compare(pos_, candidate.size(), candidate) == 0) {
            for (std::size_t i = 0; i < candidate.size(); ++i) {
                Advance();
            }
            tokens.push_back(Token{TokenKind::kOp, candidate, false, start});
            return;
        }
    }

    const char c = Peek();
    if (kSingle.find(c) == std::string::npos) {
        throw SyntaxError(std::string("invalid character '") + c + "'", start);
    }
    Advance();
    if (c == '(' || c == '[' || c == '{') {
        open_brackets_.emplace_back(c, start);
    } else if (c == ')' || c == ']' || c == '}') {
        if (open_brackets_.empty()) {
            throw SyntaxError(std::string("unmatched '") + c + "'", start);
        }
        const char opening = open_brackets_.back().first;
        const char expected = opening == '(' ? ')' : (opening == '[' ? ']' : '}');
        if (c != expected) {
            throw SyntaxError(std::string("closing parenthesis '") + c +
                                  "' does not match opening parenthesis '" + opening + "'",
                              start);
        }
        open_brackets_.pop_back();
    }
    tokens.push_back(Token{TokenKind::kOp, std::string(1, c), false, start});
}

}  // namespace mathguard::lang
