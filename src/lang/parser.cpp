#include "lang/parser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <set>
#include <utility>

#include "lang/lexer.hpp"

namespace mathguard::lang {
namespace {

class DepthGuard {
public:
    DepthGuard(int& depth, int max_depth, SourceLocation loc) : depth_(depth) {
        if (++depth_ > max_depth) {
            --depth_;
            throw SyntaxError("too many nested expressions or blocks", loc);
        }
    }
    ~DepthGuard() { --depth_; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    int& depth_;
};

// Charges one level per node a left-associative loop wraps around its
// operand, so flat chains (`1+1+...`, `f()()...`) are bounded like nesting.
class ChainDepth {
public:
    ChainDepth(int& depth, int max_depth) : depth_(depth), max_depth_(max_depth) {}
    ~ChainDepth() { depth_ -= added_; }

    ChainDepth(const ChainDepth&) = delete;
    ChainDepth& operator=(const ChainDepth&) = delete;

    void Add(SourceLocation loc) {
        if (depth_ + 1 > max_depth_) {
            throw SyntaxError("too many nested expressions or blocks", loc);
        }
        ++depth_;
        ++added_;
    }

private:
    int& depth_;
    int max_depth_;
    int added_ = 0;
};

struct BinaryLevel {
    std::array<const char*, 5> ops;
};

// Loosest binding first; ParseBinaryLevel(kBinaryLevels.size()) is a factor.
const std::array<BinaryLevel, 6> kBinaryLevels = {{
    {{"|", nullptr, nullptr, nullptr, nullptr}},
    {{"^", nullptr, nullptr, nullptr, nullptr}},
    {{"&", nullptr, nullptr, nullptr, nullptr}},
    {{"<<", ">>", nullptr, nullptr, nullptr}},
    {{"+", "-", nullptr, nullptr, nullptr}},
    {{"*", "/", "//", "%", "@"}},
}};

BinaryOperator BinaryFromText(const std::string& text) {
    if (text == "+") return BinaryOperator::kAdd;
    if (text == "-") return BinaryOperator::kSub;
    if (text == "*") return BinaryOperator::kMult;
    if (text == "@") return BinaryOperator::kMatMult;
    if (text == "/") return BinaryOperator::kDiv;
    if (text == "%") return BinaryOperator::kMod;
    if (text == "**") return BinaryOperator::kPow;
    if (text == "<<") return BinaryOperator::kLShift;
    if (text == ">>") return BinaryOperator::kRShift;
    if (text == "|") return BinaryOperator::kBitOr;
    if (text == "^") return BinaryOperator::kBitXor;
    if (text == "&") return BinaryOperator::kBitAnd;
    return BinaryOperator::kFloorDiv;
}

bool IsAugmentedAssign(const Token& token) {
    static const std::set<std::string> kAugmented = {
        "+=", "-=", "*=", "/=", "//=", "%=", "**=", ">>=", "<<=", "&=", "|=", "^=", "@="};
    return token.kind == TokenKind::kOp && kAugmented.count(token.text) > 0;
}

std::string StripUnderscores(const std::string& text, SourceLocation loc) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '_') {
            out.push_back(text[i]);
            continue;
        }
        const bool valid = i > 0 && i + 1 < text.size() &&
            std::isalnum(static_cast<unsigned char>(text[i - 1])) &&
            std::isalnum(static_cast<unsigned char>(text[i + 1]));
        if (!valid) {
            throw SyntaxError("invalid decimal literal", loc);
        }
    }
    return out;
}

void AppendLiteral(std::vector<ExprPtr>& parts, const std::string& text, SourceLocation loc) {
    if (text.empty()) {
        return;
    }
    if (!parts.empty() && parts.back()->kind == ExprKind::kConstant) {
        static_cast<ConstantExpr&>(*parts.back()).text += text;
        return;
    }
    parts.push_back(std::make_unique<ConstantExpr>(loc, ConstantKind::kString, text));
}

}  // namespace

bool IsKeyword(const std::string& word) {
    static const std::set<std::string> kKeywords = {
        "False", "None", "True", "and", "as", "assert", "async", "await",
        "break", "class", "continue", "def", "del", "elif", "else", "except",
        "finally", "for", "from", "global", "if", "import", "in", "is",
        "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
        "while", "with", "yield"};
    return kKeywords.count(word) > 0;
}

void SetStoreContext(Expr& target) {
    switch (target.kind) {
        case ExprKind::kName:
            static_cast<NameExpr&>(target).ctx = ExprContext::kStore;
            return;
        case ExprKind::kAttribute:
            static_cast<AttributeExpr&>(target).ctx = ExprContext::kStore;
            return;
        case ExprKind::kSubscript:
            static_cast<SubscriptExpr&>(target).ctx = ExprContext::kStore;
            return;
        case ExprKind::kStarred: {
            auto& starred = static_cast<StarredExpr&>(target);
            starred.ctx = ExprContext::kStore;
            SetStoreContext(*starred.value);
            return;
        }
        case ExprKind::kTuple:
        case ExprKind::kList: {
            auto& sequence = static_cast<SequenceExpr&>(target);
            sequence.ctx = ExprContext::kStore;
            for (auto& element : sequence.elts) {
                SetStoreContext(*element);
            }
            return;
        }
        default:
            throw SyntaxError(std::string("cannot assign to ") + ToString(target.kind), target.loc);
    }
}

Module Parse(const std::string& source, ParserOptions options) {
    Lexer lexer(source);
    Parser parser(lexer.Tokenize(), options);
    return parser.ParseModule();
}

Parser::Parser(std::vector<Token> tokens, ParserOptions options)
    : tokens_(std::move(tokens)), options_(options) {
    if (tokens_.empty() || tokens_.back().kind != TokenKind::kEnd) {
        const SourceLocation loc = tokens_.empty() ? SourceLocation{1, 0} : tokens_.back().loc;
        tokens_.push_back(Token{TokenKind::kEnd, "", false, loc});
    }
}

const Token& Parser::Lookahead(std::size_t ahead) const {
    return tokens_[std::min(pos_ + ahead, tokens_.size() - 1)];
}

bool Parser::CheckOp(const char* op) const {
    return Current().kind == TokenKind::kOp && Current().text == op;
}

bool Parser::CheckKeyword(const char* keyword) const {
    return Current().kind == TokenKind::kName && Current().text == keyword;
}

bool Parser::MatchOp(const char* op) {
    if (!CheckOp(op)) {
        return false;
    }
    ++pos_;
    return true;
}

bool Parser::MatchKeyword(const char* keyword) {
    if (!CheckKeyword(keyword)) {
        return false;
    }
    ++pos_;
    return true;
}

void Parser::ExpectOp(const char* op) {
    if (!MatchOp(op)) {
        Fail(std::string("expected '") + op + "'");
    }
}

void Parser::ExpectKeyword(const char* keyword) {
    if (!MatchKeyword(keyword)) {
        Fail(std::string("expected '") + keyword + "'");
    }
}

std::string Parser::ExpectName() {
    const Token& token = Current();
    if (token.kind != TokenKind::kName || IsKeyword(token.text)) {
        Fail("expected a name");
    }
    ++pos_;
    return token.text;
}

void Parser::ExpectNewline() {
    if (Current().kind == TokenKind::kNewline) {
        ++pos_;
        return;
    }
    if (Current().kind == TokenKind::kEnd || Current().kind == TokenKind::kDedent) {
        return;
    }
    Fail("invalid syntax");
}

void Parser::Fail(const std::string& message) const {
    const Token& token = Current();
    switch (token.kind) {
        case TokenKind::kEnd:
            throw SyntaxError(message + " at end of input", token.loc);
        case TokenKind::kNewline:
            throw SyntaxError(message + " at end of line", token.loc);
        case TokenKind::kIndent:
            throw SyntaxError("unexpected indent", token.loc);
        case TokenKind::kDedent:
            throw SyntaxError(message + " before dedent", token.loc);
        case TokenKind::kString:
        case TokenKind::kFString:
            throw SyntaxError(message + " near string literal", token.loc);
        default:
            throw SyntaxError(message + " near '" + token.text + "'", token.loc);
    }
}

bool Parser::StartsExpression() const {
    const Token& token = Current();
    switch (token.kind) {
        case TokenKind::kNumber:
        case TokenKind::kString:
        case TokenKind::kFString:
            return true;
        case TokenKind::kName:
            return !IsKeyword(token.text) || token.text == "True" || token.text == "False" ||
                token.text == "None" || token.text == "not" || token.text == "lambda" ||
                token.text == "await";
        case TokenKind::kOp:
            return token.text == "(" || token.text == "[" || token.text == "{" ||
                token.text == "-" || token.text == "+" || token.text == "~" ||
                token.text == "..." || token.text == "*";
        default:
            return false;
    }
}

bool Parser::AtStatementEnd() const {
    const auto kind = Current().kind;
    return kind == TokenKind::kNewline || kind == TokenKind::kEnd || CheckOp(";");
}

Module Parser::ParseModule() {
    Module module;
    while (Current().kind != TokenKind::kEnd) {
        if (Current().kind == TokenKind::kNewline) {
            ++pos_;
            continue;
        }
        ParseStatement(module.body);
    }
    return module;
}

ExprPtr Parser::ParseStandaloneExpression() {
    auto expr = ParseStarExpressions();
    if (Current().kind == TokenKind::kNewline) {
        ++pos_;
    }
    if (Current().kind != TokenKind::kEnd) {
        Fail("invalid syntax");
    }
    return expr;
}

void Parser::ParseStatement(Block& out) {
    const Token& token = Current();
    if (token.kind == TokenKind::kIndent) {
        throw SyntaxError("unexpected indent", token.loc);
    }
    if (token.kind == TokenKind::kDedent) {
        throw SyntaxError("unindent does not match any outer indentation level", token.loc);
    }
    if (CheckOp("@")) {
        out.push_back(ParseDecorated());
        return;
    }
    if (token.kind == TokenKind::kName) {
        const SourceLocation loc = token.loc;
        if (token.text == "def") {
            out.push_back(ParseFunctionDef({}, false, loc));
            return;
        }
        if (token.text == "class") {
            out.push_back(ParseClassDef({}));
            return;
        }
        if (token.text == "if") {
            out.push_back(ParseIf());
            return;
        }
        if (token.text == "while") {
            out.push_back(ParseWhile());
            return;
        }
        if (token.text == "for") {
            out.push_back(ParseFor(false, loc));
            return;
        }
        if (token.text == "try") {
            out.push_back(ParseTry());
            return;
        }
        if (token.text == "with") {
            out.push_back(ParseWith(false, loc));
            return;
        }
        if (token.text == "async") {
            ++pos_;
            if (CheckKeyword("def")) {
                out.push_back(ParseFunctionDef({}, true, loc));
            } else if (CheckKeyword("for")) {
                out.push_back(ParseFor(true, loc));
            } else if (CheckKeyword("with")) {
                out.push_back(ParseWith(true, loc));
            } else {
                Fail("invalid syntax");
            }
            return;
        }
    }
    ParseSimpleStatements(out);
}

void Parser::ParseSimpleStatements(Block& out) {
    while (true) {
        out.push_back(ParseSmallStatement());
        if (!MatchOp(";")) {
            break;
        }
        if (Current().kind == TokenKind::kNewline || Current().kind == TokenKind::kEnd) {
            break;
        }
    }
    ExpectNewline();
}

Block Parser::ParseBlock() {
    ExpectOp(":");
    DepthGuard guard(depth_, options_.max_depth, Current().loc);
    Block body;
    if (Current().kind != TokenKind::kNewline) {
        ParseSimpleStatements(body);
        return body;
    }
    ++pos_;
    if (Current().kind != TokenKind::kIndent) {
        throw SyntaxError("expected an indented block", Current().loc);
    }
    ++pos_;
    while (Current().kind != TokenKind::kDedent && Current().kind != TokenKind::kEnd) {
        if (Current().kind == TokenKind::kNewline) {
            ++pos_;
            continue;
        }
        ParseStatement(body);
    }
    if (Current().kind == TokenKind::kDedent) {
        ++pos_;
    }
    return body;
}

StmtPtr Parser::ParseSmallStatement() {
    const Token& token = Current();
    const SourceLocation loc = token.loc;
    if (token.kind == TokenKind::kName) {
        if (token.text == "pass") {
            ++pos_;
            return std::make_unique<Stmt>(StmtKind::kPass, loc);
        }
        if (token.text == "break") {
            ++pos_;
            return std::make_unique<Stmt>(StmtKind::kBreak, loc);
        }
        if (token.text == "continue") {
            ++pos_;
            return std::make_unique<Stmt>(StmtKind::kContinue, loc);
        }
        if (token.text == "return") {
            ++pos_;
            auto stmt = std::make_unique<ReturnStmt>(loc);
            if (!AtStatementEnd()) {
                stmt->value = ParseStarExpressions();
            }
            return stmt;
        }
        if (token.text == "import") {
            return ParseImport();
        }
        if (token.text == "from") {
            return ParseImportFrom();
        }
        if (token.text == "global" || token.text == "nonlocal") {
            auto stmt = std::make_unique<ScopeStmt>(
                token.text == "global" ? StmtKind::kGlobal : StmtKind::kNonlocal, loc);
            ++pos_;
            do {
                stmt->names.push_back(ExpectName());
            } while (MatchOp(","));
            return stmt;
        }
        if (token.text == "del") {
            ++pos_;
            auto stmt = std::make_unique<DeleteStmt>(loc);
            do {
                auto target = ParseBinaryLevel(0);
                SetStoreContext(*target);
                stmt->targets.push_back(std::move(target));
            } while (MatchOp(",") && !AtStatementEnd());
            return stmt;
        }
        if (token.text == "assert") {
            ++pos_;
            auto stmt = std::make_unique<AssertStmt>(loc, ParseExpression());
            if (MatchOp(",")) {
                stmt->msg = ParseExpression();
            }
            return stmt;
        }
        if (token.text == "raise") {
            ++pos_;
            auto stmt = std::make_unique<RaiseStmt>(loc);
            if (!AtStatementEnd()) {
                stmt->exc = ParseExpression();
                if (MatchKeyword("from")) {
                    stmt->cause = ParseExpression();
                }
            }
            return stmt;
        }
    }
    return ParseExpressionStatement();
}

StmtPtr Parser::ParseExpressionStatement() {
    const SourceLocation loc = Current().loc;
    auto parse_value = [this]() { return CheckKeyword("yield") ? ParseYield() : ParseStarExpressions(); };

    ExprPtr first = parse_value();
    if (MatchOp(":")) {
        if (first->kind != ExprKind::kName && first->kind != ExprKind::kAttribute &&
            first->kind != ExprKind::kSubscript) {
            throw SyntaxError("illegal target for annotation", first->loc);
        }
        SetStoreContext(*first);
        auto stmt = std::make_unique<AnnAssignStmt>(loc, std::move(first), ParseExpression());
        if (MatchOp("=")) {
            stmt->value = parse_value();
        }
        return stmt;
    }
    if (IsAugmentedAssign(Current())) {
        std::string text = Current().text;
        text.pop_back();
        ++pos_;
        if (first->kind != ExprKind::kName && first->kind != ExprKind::kAttribute &&
            first->kind != ExprKind::kSubscript) {
            throw SyntaxError("illegal expression for augmented assignment", first->loc);
        }
        SetStoreContext(*first);
        return std::make_unique<AugAssignStmt>(loc, std::move(first), BinaryFromText(text), parse_value());
    }
    if (CheckOp("=")) {
        auto stmt = std::make_unique<AssignStmt>(loc);
        ExprPtr current = std::move(first);
        while (MatchOp("=")) {
            SetStoreContext(*current);
            stmt->targets.push_back(std::move(current));
            current = parse_value();
        }
        stmt->value = std::move(current);
        return stmt;
    }
    return std::make_unique<ExprStmt>(loc, std::move(first));
}

std::string Parser::ParseDottedName() {
    std::string name = ExpectName();
    while (MatchOp(".")) {
        name += "." + ExpectName();
    }
    return name;
}

StmtPtr Parser::ParseImport() {
    auto stmt = std::make_unique<ImportStmt>(Current().loc);
    ++pos_;
    do {
        Alias alias;
        alias.loc = Current().loc;
        alias.name = ParseDottedName();
        if (MatchKeyword("as")) {
            alias.asname = ExpectName();
        }
        stmt->names.push_back(std::move(alias));
    } while (MatchOp(","));
    return stmt;
}

StmtPtr Parser::ParseImportFrom() {
    auto stmt = std::make_unique<ImportFromStmt>(Current().loc);
    ++pos_;
    while (CheckOp(".") || CheckOp("...")) {
        stmt->level += static_cast<int>(Current().text.size());
        ++pos_;
    }
    if (!CheckKeyword("import")) {
        stmt->module = ParseDottedName();
    } else if (stmt->level == 0) {
        Fail("expected a module name");
    }
    ExpectKeyword("import");
    if (CheckOp("*")) {
        Alias alias;
        alias.name = "*";
        alias.loc = Current().loc;
        ++pos_;
        stmt->names.push_back(std::move(alias));
        return stmt;
    }
    const bool parenthesized = MatchOp("(");
    do {
        if (parenthesized && CheckOp(")")) {
            break;
        }
        Alias alias;
        alias.loc = Current().loc;
        alias.name = ExpectName();
        if (MatchKeyword("as")) {
            alias.asname = ExpectName();
        }
        stmt->names.push_back(std::move(alias));
    } while (MatchOp(","));
    if (parenthesized) {
        ExpectOp(")");
    }
    if (stmt->names.empty()) {
        Fail("expected a name to import");
    }
    return stmt;
}

StmtPtr Parser::ParseIf() {
    const SourceLocation loc = Current().loc;
    ++pos_;
    auto stmt = std::make_unique<IfStmt>(loc, ParseNamedExpression());
    stmt->body = ParseBlock();
    if (CheckKeyword("elif")) {
        stmt->orelse.push_back(ParseIf());
    } else if (MatchKeyword("else")) {
        stmt->orelse = ParseBlock();
    }
    return stmt;
}

StmtPtr Parser::ParseWhile() {
    const SourceLocation loc = Current().loc;
    ++pos_;
    auto stmt = std::make_unique<WhileStmt>(loc, ParseNamedExpression());
    stmt->body = ParseBlock();
    if (MatchKeyword("else")) {
        stmt->orelse = ParseBlock();
    }
    return stmt;
}

StmtPtr Parser::ParseFor(bool is_async, SourceLocation loc) {
    ExpectKeyword("for");
    auto target = ParseTargetList();
    ExpectKeyword("in");
    auto stmt = std::make_unique<ForStmt>(loc, std::move(target), ParseStarExpressions());
    stmt->is_async = is_async;
    stmt->body = ParseBlock();
    if (MatchKeyword("else")) {
        stmt->orelse = ParseBlock();
    }
    return stmt;
}

StmtPtr Parser::ParseTry() {
    auto stmt = std::make_unique<TryStmt>(Current().loc);
    ++pos_;
    stmt->body = ParseBlock();
    while (CheckKeyword("except")) {
        ExceptHandler handler;
        handler.loc = Current().loc;
        ++pos_;
        if (!CheckOp(":")) {
            handler.type = ParseExpression();
            if (MatchKeyword("as")) {
                handler.name = ExpectName();
            }
        }
        handler.body = ParseBlock();
        stmt->handlers.push_back(std::move(handler));
    }
    if (MatchKeyword("else")) {
        if (stmt->handlers.empty()) {
            Fail("invalid syntax");
        }
        stmt->orelse = ParseBlock();
    }
    if (MatchKeyword("finally")) {
        stmt->finalbody = ParseBlock();
    }
    if (stmt->handlers.empty() && stmt->finalbody.empty()) {
        Fail("expected 'except' or 'finally' block");
    }
    return stmt;
}

StmtPtr Parser::ParseWith(bool is_async, SourceLocation loc) {
    ExpectKeyword("with");
    auto stmt = std::make_unique<WithStmt>(loc);
    stmt->is_async = is_async;
    do {
        WithItem item;
        item.context_expr = ParseExpression();
        if (MatchKeyword("as")) {
            item.optional_vars = ParseTargetList();
        }
        stmt->items.push_back(std::move(item));
    } while (MatchOp(","));
    stmt->body = ParseBlock();
    return stmt;
}

StmtPtr Parser::ParseFunctionDef(std::vector<ExprPtr> decorators, bool is_async, SourceLocation loc) {
    ExpectKeyword("def");
    auto stmt = std::make_unique<FunctionDefStmt>(loc, ExpectName());
    stmt->decorators = std::move(decorators);
    stmt->is_async = is_async;
    ExpectOp("(");
    ParseParameters(stmt->args, ")", true);
    ExpectOp(")");
    if (MatchOp("->")) {
        stmt->returns = ParseExpression();
    }
    stmt->body = ParseBlock();
    return stmt;
}

StmtPtr Parser::ParseClassDef(std::vector<ExprPtr> decorators) {
    const SourceLocation loc = Current().loc;
    ++pos_;
    auto stmt = std::make_unique<ClassDefStmt>(loc, ExpectName());
    stmt->decorators = std::move(decorators);
    if (MatchOp("(")) {
        ParseCallArguments(stmt->bases, stmt->keywords);
        ExpectOp(")");
    }
    stmt->body = ParseBlock();
    return stmt;
}

StmtPtr Parser::ParseDecorated() {
    std::vector<ExprPtr> decorators;
    while (MatchOp("@")) {
        decorators.push_back(ParseNamedExpression());
        ExpectNewline();
    }
    const SourceLocation loc = Current().loc;
    if (CheckKeyword("def")) {
        return ParseFunctionDef(std::move(decorators), false, loc);
    }
    if (CheckKeyword("async")) {
        ++pos_;
        return ParseFunctionDef(std::move(decorators), true, loc);
    }
    if (CheckKeyword("class")) {
        return ParseClassDef(std::move(decorators));
    }
    Fail("expected a function or class definition after decorator");
}

Parameter Parser::ParseParameter(bool annotations) {
    Parameter parameter;
    parameter.loc = Current().loc;
    parameter.name = ExpectName();
    if (annotations && MatchOp(":")) {
        parameter.annotation = ParseExpression();
    }
    return parameter;
}

void Parser::ParseParameters(Arguments& args, const char* terminator, bool annotations) {
    std::set<std::string> seen;
    auto remember = [&seen](const Parameter& parameter) {
        if (!seen.insert(parameter.name).second) {
            throw SyntaxError("duplicate argument '" + parameter.name + "' in function definition",
                              parameter.loc);
        }
    };

    bool keyword_only = false;
    bool seen_default = false;
    while (!CheckOp(terminator)) {
        if (MatchOp("/")) {
            if (keyword_only || args.positional.empty()) {
                Fail("invalid syntax");
            }
        } else if (MatchOp("**")) {
            args.kwarg = ParseParameter(annotations);
            remember(*args.kwarg);
            MatchOp(",");
            break;
        } else if (MatchOp("*")) {
            if (keyword_only) {
                Fail("'*' argument may appear only once");
            }
            keyword_only = true;
            if (Current().kind == TokenKind::kName) {
                args.vararg = ParseParameter(annotations);
                remember(*args.vararg);
            }
        } else {
            auto parameter = ParseParameter(annotations);
            remember(parameter);
            ExprPtr default_value;
            if (MatchOp("=")) {
                default_value = ParseExpression();
            }
            if (keyword_only) {
                args.kwonly.push_back(std::move(parameter));
                args.kw_defaults.push_back(std::move(default_value));
            } else {
                if (default_value) {
                    seen_default = true;
                    args.defaults.push_back(std::move(default_value));
                } else if (seen_default) {
                    throw SyntaxError("non-default argument follows default argument", parameter.loc);
                }
                args.positional.push_back(std::move(parameter));
            }
        }
        if (!MatchOp(",")) {
            break;
        }
    }
}

ExprPtr Parser::ParseStarExpressions() {
    const SourceLocation loc = Current().loc;
    auto first = ParseStarOrExpression();
    if (!CheckOp(",")) {
        return first;
    }
    auto tuple = std::make_unique<SequenceExpr>(ExprKind::kTuple, loc);
    tuple->elts.push_back(std::move(first));
    while (MatchOp(",")) {
        if (!StartsExpression()) {
            break;
        }
        tuple->elts.push_back(ParseStarOrExpression());
    }
    return tuple;
}

ExprPtr Parser::ParseStarOrExpression() {
    if (CheckOp("*")) {
        const SourceLocation loc = Current().loc;
        ++pos_;
        return std::make_unique<StarredExpr>(loc, ParseBinaryLevel(0));
    }
    return ParseExpression();
}

ExprPtr Parser::ParseTargetList() {
    const SourceLocation loc = Current().loc;
    auto parse_one = [this]() -> ExprPtr {
        if (CheckOp("*")) {
            const SourceLocation star = Current().loc;
            ++pos_;
            return std::make_unique<StarredExpr>(star, ParseBinaryLevel(0));
        }
        return ParseBinaryLevel(0);
    };
    ExprPtr target = parse_one();
    if (CheckOp(",")) {
        auto tuple = std::make_unique<SequenceExpr>(ExprKind::kTuple, loc);
        tuple->elts.push_back(std::move(target));
        while (MatchOp(",")) {
            if (CheckKeyword("in") || CheckOp("=") || !StartsExpression()) {
                break;
            }
            tuple->elts.push_back(parse_one());
        }
        target = std::move(tuple);
    }
    SetStoreContext(*target);
    return target;
}

ExprPtr Parser::ParseNamedExpression() {
    if (Current().kind == TokenKind::kName && !IsKeyword(Current().text) &&
        Lookahead(1).kind == TokenKind::kOp && Lookahead(1).text == ":=") {
        const SourceLocation loc = Current().loc;
        auto target = std::make_unique<NameExpr>(loc, Current().text);
        target->ctx = ExprContext::kStore;
        pos_ += 2;
        return std::make_unique<NamedExpr>(loc, std::move(target), ParseExpression());
    }
    return ParseExpression();
}

ExprPtr Parser::ParseExpression() {
    DepthGuard guard(depth_, options_.max_depth, Current().loc);
    if (CheckKeyword("lambda")) {
        return ParseLambda();
    }
    auto body = ParseDisjunction();
    if (!CheckKeyword("if")) {
        return body;
    }
    ++pos_;
    auto test = ParseDisjunction();
    ExpectKeyword("else");
    const SourceLocation loc = body->loc;
    return std::make_unique<IfExpExpr>(loc, std::move(test), std::move(body), ParseExpression());
}

ExprPtr Parser::ParseLambda() {
    auto lambda = std::make_unique<LambdaExpr>(Current().loc);
    ++pos_;
    ParseParameters(lambda->args, ":", false);
    ExpectOp(":");
    lambda->body = ParseExpression();
    return lambda;
}

ExprPtr Parser::ParseYield() {
    const SourceLocation loc = Current().loc;
    ++pos_;
    if (MatchKeyword("from")) {
        return std::make_unique<WrapperExpr>(ExprKind::kYieldFrom, loc, ParseExpression());
    }
    if (!StartsExpression()) {
        return std::make_unique<WrapperExpr>(ExprKind::kYield, loc, nullptr);
    }
    return std::make_unique<WrapperExpr>(ExprKind::kYield, loc, ParseStarExpressions());
}

ExprPtr Parser::ParseDisjunction() {
    auto first = ParseConjunction();
    if (!CheckKeyword("or")) {
        return first;
    }
    auto node = std::make_unique<BoolOpExpr>(first->loc, BoolOperator::kOr);
    node->values.push_back(std::move(first));
    while (MatchKeyword("or")) {
        node->values.push_back(ParseConjunction());
    }
    return node;
}

ExprPtr Parser::ParseConjunction() {
    auto first = ParseInversion();
    if (!CheckKeyword("and")) {
        return first;
    }
    auto node = std::make_unique<BoolOpExpr>(first->loc, BoolOperator::kAnd);
    node->values.push_back(std::move(first));
    while (MatchKeyword("and")) {
        node->values.push_back(ParseInversion());
    }
    return node;
}

ExprPtr Parser::ParseInversion() {
    if (CheckKeyword("not")) {
        const SourceLocation loc = Current().loc;
        DepthGuard guard(depth_, options_.max_depth, loc);
        ++pos_;
        return std::make_unique<UnaryOpExpr>(loc, UnaryOperator::kNot, ParseInversion());
    }
    return ParseComparison();
}

ExprPtr Parser::ParseComparison() {
    auto left = ParseBinaryLevel(0);
    std::unique_ptr<CompareExpr> compare;
    while (true) {
        CompareOperator op;
        const Token& token = Current();
        if (token.kind == TokenKind::kOp && token.text == "==") {
            op = CompareOperator::kEq;
        } else if (token.kind == TokenKind::kOp && token.text == "!=") {
            op = CompareOperator::kNotEq;
        } else if (token.kind == TokenKind::kOp && token.text == "<") {
            op = CompareOperator::kLt;
        } else if (token.kind == TokenKind::kOp && token.text == "<=") {
            op = CompareOperator::kLtE;
        } else if (token.kind == TokenKind::kOp && token.text == ">") {
            op = CompareOperator::kGt;
        } else if (token.kind == TokenKind::kOp && token.text == ">=") {
            op = CompareOperator::kGtE;
        } else if (CheckKeyword("in")) {
            op = CompareOperator::kIn;
        } else if (CheckKeyword("not") && Lookahead(1).kind == TokenKind::kName &&
                   Lookahead(1).text == "in") {
            op = CompareOperator::kNotIn;
            ++pos_;
        } else if (CheckKeyword("is")) {
            op = CompareOperator::kIs;
            if (Lookahead(1).kind == TokenKind::kName && Lookahead(1).text == "not") {
                op = CompareOperator::kIsNot;
                ++pos_;
            }
        } else {
            break;
        }
        ++pos_;
        if (!compare) {
            const SourceLocation loc = left->loc;
            compare = std::make_unique<CompareExpr>(loc, std::move(left));
        }
        compare->ops.push_back(op);
        compare->comparators.push_back(ParseBinaryLevel(0));
    }
    if (compare) {
        return compare;
    }
    return left;
}

ExprPtr Parser::ParseBinaryLevel(int level) {
    if (level >= static_cast<int>(kBinaryLevels.size())) {
        return ParseFactor();
    }
    auto left = ParseBinaryLevel(level + 1);
    const auto& ops = kBinaryLevels[static_cast<std::size_t>(level)].ops;
    ChainDepth chain(depth_, options_.max_depth);
    while (Current().kind == TokenKind::kOp) {
        const std::string& text = Current().text;
        const bool matches = std::any_of(ops.begin(), ops.end(), [&text](const char* op) {
            return op != nullptr && text == op;
        });
        if (!matches) {
            break;
        }
        const auto op = BinaryFromText(text);
        chain.Add(Current().loc);
        ++pos_;
        auto right = ParseBinaryLevel(level + 1);
        const SourceLocation loc = left->loc;
        left = std::make_unique<BinOpExpr>(loc, op, std::move(left), std::move(right));
    }
    return left;
}

ExprPtr Parser::ParseFactor() {
    const Token& token = Current();
    if (token.kind == TokenKind::kOp && (token.text == "-" || token.text == "+" || token.text == "~")) {
        const SourceLocation loc = token.loc;
        DepthGuard guard(depth_, options_.max_depth, loc);
        const auto op = token.text == "-" ? UnaryOperator::kUSub
            : token.text == "+" ? UnaryOperator::kUAdd : UnaryOperator::kInvert;
        ++pos_;
        return std::make_unique<UnaryOpExpr>(loc, op, ParseFactor());
    }
    return ParsePower();
}

ExprPtr Parser::ParsePower() {
    ExprPtr base;
    if (CheckKeyword("await")) {
        const SourceLocation loc = Current().loc;
        ++pos_;
        base = std::make_unique<WrapperExpr>(ExprKind::kAwait, loc, ParsePrimary());
    } else {
        base = ParsePrimary();
    }
    if (!CheckOp("**")) {
        return base;
    }
    DepthGuard guard(depth_, options_.max_depth, Current().loc);
    ++pos_;
    const SourceLocation loc = base->loc;
    return std::make_unique<BinOpExpr>(loc, BinaryOperator::kPow, std::move(base), ParseFactor());
}

ExprPtr Parser::ParsePrimary() {
    auto expr = ParseAtom();
    ChainDepth chain(depth_, options_.max_depth);
    while (true) {
        if (CheckOp(".") || CheckOp("(") || CheckOp("[")) {
            chain.Add(Current().loc);
        }
        if (MatchOp(".")) {
            const SourceLocation loc = expr->loc;
            expr = std::make_unique<AttributeExpr>(loc, std::move(expr), ExpectName());
        } else if (MatchOp("(")) {
            const SourceLocation loc = expr->loc;
            auto call = std::make_unique<CallExpr>(loc, std::move(expr));
            ParseCallArguments(call->args, call->keywords);
            ExpectOp(")");
            expr = std::move(call);
        } else if (MatchOp("[")) {
            const SourceLocation loc = expr->loc;
            auto slice = ParseSlices();
            ExpectOp("]");
            expr = std::make_unique<SubscriptExpr>(loc, std::move(expr), std::move(slice));
        } else {
            return expr;
        }
    }
}

ExprPtr Parser::ParseAtom() {
    const Token& token = Current();
    switch (token.kind) {
        case TokenKind::kNumber: {
            ++pos_;
            return ParseNumber(token);
        }
        case TokenKind::kString:
        case TokenKind::kFString:
            return ParseStrings();
        case TokenKind::kName: {
            const SourceLocation loc = token.loc;
            if (token.text == "True") {
                ++pos_;
                return std::make_unique<ConstantExpr>(loc, ConstantKind::kTrue);
            }
            if (token.text == "False") {
                ++pos_;
                return std::make_unique<ConstantExpr>(loc, ConstantKind::kFalse);
            }
            if (token.text == "None") {
                ++pos_;
                return std::make_unique<ConstantExpr>(loc, ConstantKind::kNone);
            }
            if (IsKeyword(token.text)) {
                Fail("invalid syntax");
            }
            ++pos_;
            return std::make_unique<NameExpr>(loc, token.text);
        }
        case TokenKind::kOp:
            if (token.text == "(") {
                return ParseParenthesized();
            }
            if (token.text == "[") {
                return ParseListDisplay();
            }
            if (token.text == "{") {
                return ParseBraceDisplay();
            }
            if (token.text == "...") {
                ++pos_;
                return std::make_unique<ConstantExpr>(token.loc, ConstantKind::kEllipsis);
            }
            break;
        default:
            break;
    }
    Fail("invalid syntax");
}

ExprPtr Parser::ParseNumber(const Token& token) {
    const std::string text = StripUnderscores(token.text, token.loc);
    const char last = text.empty() ? '\0' : text.back();
    if (text.size() > 1 && text[0] == '0' && std::strchr("xXoObB", text[1]) != nullptr) {
        const char marker = static_cast<char>(std::tolower(static_cast<unsigned char>(text[1])));
        const int base = marker == 'x' ? 16 : marker == 'o' ? 8 : 2;
        const std::string digits = text.substr(2);
        if (digits.empty()) {
            throw SyntaxError("invalid literal", token.loc);
        }
        for (const char c : digits) {
            const int value = std::isdigit(static_cast<unsigned char>(c))
                ? c - '0'
                : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
            if (value >= base) {
                throw SyntaxError("invalid digit '" + std::string(1, c) + "' in literal", token.loc);
            }
        }
        auto constant = std::make_unique<ConstantExpr>(token.loc, ConstantKind::kInt, digits);
        constant->base = base;
        return constant;
    }
    if (last == 'j' || last == 'J') {
        return std::make_unique<ConstantExpr>(token.loc, ConstantKind::kImaginary,
                                              text.substr(0, text.size() - 1));
    }
    if (text.find_first_of(".eE") != std::string::npos) {
        return std::make_unique<ConstantExpr>(token.loc, ConstantKind::kFloat, text);
    }
    if (text.size() > 1 && text[0] == '0' && text.find_first_not_of('0') != std::string::npos) {
        throw SyntaxError("leading zeros in decimal integer literals are not permitted", token.loc);
    }
    return std::make_unique<ConstantExpr>(token.loc, ConstantKind::kInt, text);
}

ExprPtr Parser::ParseStrings() {
    const SourceLocation loc = Current().loc;
    bool formatted = false;
    std::vector<ExprPtr> parts;
    std::string plain;
    while (Current().kind == TokenKind::kString || Current().kind == TokenKind::kFString) {
        const Token& token = Current();
        if (token.kind == TokenKind::kFString) {
            formatted = true;
            ParseFStringBody(token.text, token.raw, token.loc, parts);
        } else {
            plain += token.text;
            AppendLiteral(parts, token.text, token.loc);
        }
        ++pos_;
    }
    if (!formatted) {
        return std::make_unique<ConstantExpr>(loc, ConstantKind::kString, plain);
    }
    auto joined = std::make_unique<JoinedStrExpr>(loc);
    joined->values = std::move(parts);
    return joined;
}

void Parser::ParseFStringBody(const std::string& body, bool raw, SourceLocation loc,
                              std::vector<ExprPtr>& parts) {
    std::string literal;
    auto flush = [&]() {
        AppendLiteral(parts, raw ? literal : DecodeEscapes(literal, loc), loc);
        literal.clear();
    };

    std::size_t i = 0;
    while (i < body.size()) {
        const char c = body[i];
        if (c == '{' && i + 1 < body.size() && body[i + 1] == '{') {
            literal.push_back('{');
            i += 2;
            continue;
        }
        if (c == '}') {
            if (i + 1 < body.size() && body[i + 1] == '}') {
                literal.push_back('}');
                i += 2;
                continue;
            }
            throw SyntaxError("f-string: single '}' is not allowed", loc);
        }
        if (c == '\\' && !raw && i + 1 < body.size()) {
            literal.push_back(c);
            literal.push_back(body[i + 1]);
            i += 2;
            continue;
        }
        if (c != '{') {
            literal.push_back(c);
            ++i;
            continue;
        }

        flush();
        ++i;
        const std::size_t start = i;
        int depth = 0;
        char quote = 0;
        bool self_documenting = false;
        for (; i < body.size(); ++i) {
            const char ch = body[i];
            if (quote != 0) {
                if (ch == quote) {
                    quote = 0;
                }
                continue;
            }
            if (ch == '\'' || ch == '"') {
                quote = ch;
                continue;
            }
            if (ch == '(' || ch == '[' || ch == '{') {
                ++depth;
                continue;
            }
            if (ch == ')' || ch == ']' || ch == '}') {
                if (depth == 0) {
                    if (ch == '}') {
                        break;
                    }
                    throw SyntaxError(std::string("f-string: unmatched '") + ch + "'", loc);
                }
                --depth;
                continue;
            }
            if (depth > 0) {
                continue;
            }
            if (ch == '!' && i + 1 < body.size() && body[i + 1] != '=') {
                break;
            }
            if (ch == ':') {
                break;
            }
            if (ch == '=' && i + 1 < body.size() && std::strchr("}!:", body[i + 1]) != nullptr &&
                i > start && std::strchr("=!<>", body[i - 1]) == nullptr) {
                self_documenting = true;
                break;
            }
        }
        if (i >= body.size()) {
            throw SyntaxError("f-string: expecting '}'", loc);
        }
        const std::string expression = body.substr(start, i - start);
        if (expression.find_first_not_of(" \t\r\n") == std::string::npos) {
            throw SyntaxError("f-string: empty expression not allowed", loc);
        }
        if (self_documenting) {
            AppendLiteral(parts, expression + "=", loc);
            ++i;
        }

        auto field = std::make_unique<FormattedValueExpr>(loc, ParseSubExpression(expression, loc));
        if (i < body.size() && body[i] == '!') {
            if (i + 1 >= body.size() || std::strchr("rsa", body[i + 1]) == nullptr) {
                throw SyntaxError("f-string: invalid conversion character", loc);
            }
            field->conversion = body[i + 1];
            i += 2;
        }
        if (i < body.size() && body[i] == ':') {
            ++i;
            const std::size_t spec_start = i;
            int braces = 0;
            while (i < body.size()) {
                if (body[i] == '{') {
                    ++braces;
                } else if (body[i] == '}') {
                    if (braces == 0) {
                        break;
                    }
                    --braces;
                }
                ++i;
            }
            auto spec = std::make_unique<JoinedStrExpr>(loc);
            DepthGuard guard(depth_, options_.max_depth, loc);
            ParseFStringBody(body.substr(spec_start, i - spec_start), raw, loc, spec->values);
            field->format_spec = std::move(spec);
        }
        if (i >= body.size() || body[i] != '}') {
            throw SyntaxError("f-string: expecting '}'", loc);
        }
        ++i;
        if (self_documenting && field->conversion == 0 && !field->format_spec) {
            field->conversion = 'r';
        }
        parts.push_back(std::move(field));
    }
    flush();
}

ExprPtr Parser::ParseSubExpression(const std::string& text, SourceLocation loc) {
    Lexer lexer("(" + text + ")", loc);
    ParserOptions nested = options_;
    nested.max_depth = options_.max_depth - depth_;
    Parser parser(lexer.Tokenize(), nested);
    return parser.ParseStandaloneExpression();
}

ExprPtr Parser::ParseParenthesized() {
    const SourceLocation loc = Current().loc;
    DepthGuard guard(depth_, options_.max_depth, loc);
    ++pos_;
    if (MatchOp(")")) {
        return std::make_unique<SequenceExpr>(ExprKind::kTuple, loc);
    }
    if (CheckKeyword("yield")) {
        auto yield = ParseYield();
        ExpectOp(")");
        return yield;
    }
    auto first = CheckOp("*") ? ParseStarOrExpression() : ParseNamedExpression();
    if (CheckKeyword("for") || CheckKeyword("async")) {
        auto generator = ParseComprehension(ExprKind::kGeneratorExp, std::move(first), nullptr, loc);
        ExpectOp(")");
        return generator;
    }
    if (MatchOp(")")) {
        if (first->kind == ExprKind::kStarred) {
            throw SyntaxError("cannot use starred expression here", first->loc);
        }
        return first;
    }
    if (!MatchOp(",")) {
        Fail("expected ')'");
    }
    auto tuple = std::make_unique<SequenceExpr>(ExprKind::kTuple, loc);
    tuple->elts.push_back(std::move(first));
    while (!CheckOp(")")) {
        tuple->elts.push_back(CheckOp("*") ? ParseStarOrExpression() : ParseNamedExpression());
        if (!MatchOp(",")) {
            break;
        }
    }
    ExpectOp(")");
    return tuple;
}

ExprPtr Parser::ParseListDisplay() {
    const SourceLocation loc = Current().loc;
    DepthGuard guard(depth_, options_.max_depth, loc);
    ++pos_;
    auto list = std::make_unique<SequenceExpr>(ExprKind::kList, loc);
    if (MatchOp("]")) {
        return list;
    }
    auto first = CheckOp("*") ? ParseStarOrExpression() : ParseNamedExpression();
    if (CheckKeyword("for") || CheckKeyword("async")) {
        auto comprehension = ParseComprehension(ExprKind::kListComp, std::move(first), nullptr, loc);
        ExpectOp("]");
        return comprehension;
    }
    list->elts.push_back(std::move(first));
    while (MatchOp(",")) {
        if (CheckOp("]")) {
            break;
        }
        list->elts.push_back(CheckOp("*") ? ParseStarOrExpression() : ParseNamedExpression());
    }
    ExpectOp("]");
    return list;
}

ExprPtr Parser::ParseBraceDisplay() {
    const SourceLocation loc = Current().loc;
    DepthGuard guard(depth_, options_.max_depth, loc);
    ++pos_;
    if (MatchOp("}")) {
        return std::make_unique<DictExpr>(loc);
    }

    auto parse_dict_rest = [this](std::unique_ptr<DictExpr> dict) -> ExprPtr {
        while (MatchOp(",")) {
            if (CheckOp("}")) {
                break;
            }
            if (MatchOp("**")) {
                dict->keys.push_back(nullptr);
                dict->values.push_back(ParseBinaryLevel(0));
                continue;
            }
            dict->keys.push_back(ParseExpression());
            ExpectOp(":");
            dict->values.push_back(ParseExpression());
        }
        ExpectOp("}");
        return dict;
    };

    if (MatchOp("**")) {
        auto dict = std::make_unique<DictExpr>(loc);
        dict->keys.push_back(nullptr);
        dict->values.push_back(ParseBinaryLevel(0));
        return parse_dict_rest(std::move(dict));
    }

    auto first = CheckOp("*") ? ParseStarOrExpression() : ParseNamedExpression();
    if (MatchOp(":")) {
        auto value = ParseExpression();
        if (CheckKeyword("for") || CheckKeyword("async")) {
            auto comprehension = ParseComprehension(ExprKind::kDictComp, std::move(first),
                                                    std::move(value), loc);
            ExpectOp("}");
            return comprehension;
        }
        auto dict = std::make_unique<DictExpr>(loc);
        dict->keys.push_back(std::move(first));
        dict->values.push_back(std::move(value));
        return parse_dict_rest(std::move(dict));
    }

    if (CheckKeyword("for") || CheckKeyword("async")) {
        auto comprehension = ParseComprehension(ExprKind::kSetComp, std::move(first), nullptr, loc);
        ExpectOp("}");
        return comprehension;
    }
    auto set = std::make_unique<SequenceExpr>(ExprKind::kSet, loc);
    set->elts.push_back(std::move(first));
    while (MatchOp(",")) {
        if (CheckOp("}")) {
            break;
        }
        set->elts.push_back(CheckOp("*") ? ParseStarOrExpression() : ParseNamedExpression());
    }
    ExpectOp("}");
    return set;
}

ExprPtr Parser::ParseComprehension(ExprKind kind, ExprPtr element, ExprPtr value, SourceLocation loc) {
    if (element->kind == ExprKind::kStarred) {
        throw SyntaxError("iterable unpacking cannot be used in comprehension", element->loc);
    }
    auto comprehension = std::make_unique<ComprehensionExpr>(kind, loc);
    comprehension->element = std::move(element);
    comprehension->value = std::move(value);
    while (CheckKeyword("for") || CheckKeyword("async")) {
        Comprehension generator;
        if (MatchKeyword("async")) {
            generator.is_async = true;
        }
        ExpectKeyword("for");
        generator.target = ParseTargetList();
        ExpectKeyword("in");
        generator.iter = ParseDisjunction();
        while (MatchKeyword("if")) {
            generator.ifs.push_back(ParseDisjunction());
        }
        comprehension->generators.push_back(std::move(generator));
    }
    return comprehension;
}

void Parser::ParseCallArguments(std::vector<ExprPtr>& args, std::vector<Keyword>& keywords) {
    bool seen_keyword = false;
    while (!CheckOp(")")) {
        const SourceLocation loc = Current().loc;
        if (MatchOp("*")) {
            args.push_back(std::make_unique<StarredExpr>(loc, ParseExpression()));
        } else if (MatchOp("**")) {
            keywords.push_back(Keyword{"", ParseExpression(), loc});
            seen_keyword = true;
        } else if (Current().kind == TokenKind::kName && !IsKeyword(Current().text) &&
                   Lookahead(1).kind == TokenKind::kOp && Lookahead(1).text == "=") {
            std::string name = Current().text;
            pos_ += 2;
            keywords.push_back(Keyword{std::move(name), ParseExpression(), loc});
            seen_keyword = true;
        } else {
            if (seen_keyword) {
                throw SyntaxError("positional argument follows keyword argument", loc);
            }
            auto value = ParseNamedExpression();
            if (CheckKeyword("for") || CheckKeyword("async")) {
                value = ParseComprehension(ExprKind::kGeneratorExp, std::move(value), nullptr, loc);
            }
            args.push_back(std::move(value));
        }
        if (!MatchOp(",")) {
            break;
        }
    }
}

ExprPtr Parser::ParseSlices() {
    const SourceLocation loc = Current().loc;
    auto first = ParseSliceItem();
    if (!CheckOp(",")) {
        return first;
    }
    auto tuple = std::make_unique<SequenceExpr>(ExprKind::kTuple, loc);
    tuple->elts.push_back(std::move(first));
    while (MatchOp(",")) {
        if (CheckOp("]")) {
            break;
        }
        tuple->elts.push_back(ParseSliceItem());
    }
    return tuple;
}

ExprPtr Parser::ParseSliceItem() {
    const SourceLocation loc = Current().loc;
    ExprPtr lower;
    if (!CheckOp(":")) {
        lower = CheckOp("*") ? ParseStarOrExpression() : ParseNamedExpression();
        if (!CheckOp(":")) {
            return lower;
        }
    }
    ++pos_;
    auto slice = std::make_unique<SliceExpr>(loc);
    slice->lower = std::move(lower);
    if (!CheckOp(":") && !CheckOp("]") && !CheckOp(",")) {
        slice->upper = ParseExpression();
    }
    if (MatchOp(":") && !CheckOp("]") && !CheckOp(",")) {
        slice->step = ParseExpression();
    }
    return slice;
}

}  // namespace mathguard::lang
