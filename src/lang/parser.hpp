#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "lang/ast.hpp"
#include "lang/token.hpp"

namespace mathguard::lang {

struct ParserOptions {
    // Upper bound on nested expressions and blocks. Keeps the recursive descent
    // (and every later AST walk) well inside the native stack.
    int max_depth = 200;
};

class Parser {
public:
    explicit Parser(std::vector<Token> tokens, ParserOptions options = {});

    Module ParseModule();
    // A single expression followed by end of input (f-string replacement fields).
    ExprPtr ParseStandaloneExpression();

private:
    const Token& Current() const { return tokens_[pos_]; }
    const Token& Lookahead(std::size_t ahead) const;
    bool CheckOp(const char* op) const;
    bool CheckKeyword(const char* keyword) const;
    bool MatchOp(const char* op);
    bool MatchKeyword(const char* keyword);
    void ExpectOp(const char* op);
    void ExpectKeyword(const char* keyword);
    std::string ExpectName();
    void ExpectNewline();
    [[noreturn]] void Fail(const std::string& message) const;
    bool StartsExpression() const;
    bool AtStatementEnd() const;

    void ParseStatement(Block& out);
    void ParseSimpleStatements(Block& out);
    Block ParseBlock();
    StmtPtr ParseSmallStatement();
    StmtPtr ParseExpressionStatement();
    StmtPtr ParseImport();
    StmtPtr ParseImportFrom();
    std::string ParseDottedName();
    StmtPtr ParseIf();
    StmtPtr ParseWhile();
    StmtPtr ParseFor(bool is_async, SourceLocation loc);
    StmtPtr ParseTry();
    StmtPtr ParseWith(bool is_async, SourceLocation loc);
    StmtPtr ParseFunctionDef(std::vector<ExprPtr> decorators, bool is_async, SourceLocation loc);
    StmtPtr ParseClassDef(std::vector<ExprPtr> decorators);
    StmtPtr ParseDecorated();
    void ParseParameters(Arguments& args, const char* terminator, bool annotations);
    Parameter ParseParameter(bool annotations);

    ExprPtr ParseStarExpressions();
    ExprPtr ParseStarOrExpression();
    ExprPtr ParseTargetList();
    ExprPtr ParseNamedExpression();
    ExprPtr ParseExpression();
    ExprPtr ParseLambda();
    ExprPtr ParseYield();
    ExprPtr ParseDisjunction();
    ExprPtr ParseConjunction();
    ExprPtr ParseInversion();
    ExprPtr ParseComparison();
    ExprPtr ParseBinaryLevel(int level);
    ExprPtr ParseFactor();
    ExprPtr ParsePower();
    ExprPtr ParsePrimary();
    ExprPtr ParseAtom();
    ExprPtr ParseNumber(const Token& token);
    ExprPtr ParseStrings();
    void ParseFStringBody(const std::string& body, bool raw, SourceLocation loc, std::vector<ExprPtr>& parts);
    ExprPtr ParseSubExpression(const std::string& text, SourceLocation loc);
    ExprPtr ParseParenthesized();
    ExprPtr ParseListDisplay();
    ExprPtr ParseBraceDisplay();
    ExprPtr ParseComprehension(ExprKind kind, ExprPtr element, ExprPtr value, SourceLocation loc);
    void ParseCallArguments(std::vector<ExprPtr>& args, std::vector<Keyword>& keywords);
    ExprPtr ParseSlices();
    ExprPtr ParseSliceItem();

    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
    ParserOptions options_;
    int depth_ = 0;
};

// Tokenizes and parses a whole submission. Throws SyntaxError.
Module Parse(const std::string& source, ParserOptions options = {});

// Marks an assignment target (and its nested elements) as a store. Throws
// SyntaxError for expressions that cannot be assigned to.
void SetStoreContext(Expr& target);

bool IsKeyword(const std::string& word);

}  // namespace mathguard::lang
