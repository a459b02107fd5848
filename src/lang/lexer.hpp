#pragma once

#include <string>
#include <utility>
#include <vector>

#include "lang/token.hpp"

namespace mathguard::lang {

// Splits a submission into tokens, synthesizing NEWLINE/INDENT/DEDENT from the
// layout the way the indentation-based grammar expects. Throws SyntaxError.
class Lexer {
public:
    explicit Lexer(std::string source, SourceLocation origin = {1, 0});

    std::vector<Token> Tokenize();

private:
    char Peek(std::size_t ahead = 0) const;
    char Advance();
    bool AtEnd() const { return pos_ >= source_.size(); }
    SourceLocation Here() const { return {line_, column_}; }

    void ReadIndentation(std::vector<Token>& tokens);
    void ReadName(std::vector<Token>& tokens);
    void ReadNumber(std::vector<Token>& tokens);
    void ReadString(std::vector<Token>& tokens, const std::string& prefix, SourceLocation start);
    void ReadOperator(std::vector<Token>& tokens);

    std::string source_;
    std::size_t pos_ = 0;
    int line_ = 1;
    int column_ = 0;
    // Opening brackets not yet closed, innermost last.
    std::vector<std::pair<char, SourceLocation>> open_brackets_;
    bool at_line_start_ = true;
    std::vector<int> indents_{0};
};

// Processes backslash escapes of a non-raw string body.
std::string DecodeEscapes(const std::string& body, SourceLocation loc);

}  // namespace mathguard::lang
