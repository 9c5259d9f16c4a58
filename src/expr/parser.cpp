//! # Mapping Expression Parser
//!
//! Recursive descent with precedence climbing for binary operators. The
//! parser stops at the first error; there is no recovery since a failed
//! parse only downgrades the expression to opaque.

#include "maplint/expr/parser.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace maplint::expr {

namespace {

const std::unordered_set<std::string_view>& keyword_types() {
    static const std::unordered_set<std::string_view> types = {
        "bool",  "byte",  "sbyte", "short",   "ushort", "int",    "uint", "long",
        "ulong", "float", "double", "decimal", "char",  "string", "object",
    };
    return types;
}

auto is_reserved(std::string_view name) -> bool {
    static const std::unordered_set<std::string_view> reserved = {
        "new", "return", "is", "as", "true", "false", "null", "typeof", "default", "var",
    };
    return reserved.contains(name);
}

auto starts_operand(const Token& tok) -> bool {
    switch (tok.kind) {
    case TokenKind::Ident:
        return tok.lexeme != "is" && tok.lexeme != "as";
    case TokenKind::IntLiteral:
    case TokenKind::FloatLiteral:
    case TokenKind::StringLiteral:
    case TokenKind::InterpStringLiteral:
    case TokenKind::CharLiteral:
        return true;
    case TokenKind::Punct:
        return tok.lexeme == "(" || tok.lexeme == "!" || tok.lexeme == "~";
    default:
        return false;
    }
}

} // namespace

auto binary_precedence(std::string_view op) -> int {
    static const std::unordered_map<std::string_view, int> table = {
        {"??", 3}, {"||", 4}, {"&&", 5}, {"|", 6},  {"^", 7},  {"&", 8},   {"==", 9},
        {"!=", 9}, {"<", 10}, {">", 10}, {"<=", 10}, {">=", 10}, {"is", 10}, {"as", 10},
        {"+", 11}, {"-", 11}, {"*", 12}, {"/", 12},  {"%", 12},
    };
    auto it = table.find(op);
    return it == table.end() ? 0 : it->second;
}

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || !tokens_.back().is(TokenKind::Eof)) {
        size_t end = tokens_.empty() ? 0 : tokens_.back().offset + tokens_.back().lexeme.size();
        tokens_.push_back(Token{TokenKind::Eof, "", end});
    }
}

// ============================================================================
// Token Access
// ============================================================================

auto Parser::peek(size_t ahead) const -> const Token& {
    size_t i = std::min(pos_ + ahead, tokens_.size() - 1);
    return tokens_[i];
}

auto Parser::advance() -> const Token& {
    const Token& tok = tokens_[pos_];
    if (pos_ + 1 < tokens_.size()) {
        ++pos_;
    }
    return tok;
}

auto Parser::match_punct(std::string_view p) -> bool {
    if (peek().is_punct(p)) {
        advance();
        return true;
    }
    return false;
}

auto Parser::expect_punct(std::string_view p) -> bool {
    if (match_punct(p)) {
        return true;
    }
    fail("expected '" + std::string(p) + "'");
    return false;
}

void Parser::fail(const std::string& message) {
    if (!error_) {
        const Token& tok = peek();
        std::string found = tok.is(TokenKind::Eof) ? "end of input" : "'" + tok.lexeme + "'";
        error_ = ParseError{message + ", found " + found, tok.offset};
    }
}

auto Parser::span_from(size_t start) const -> Span {
    size_t end = start;
    if (pos_ > 0) {
        const Token& last = tokens_[pos_ - 1];
        end = last.offset + last.lexeme.size();
    }
    return Span{start, std::max(start, end)};
}

// ============================================================================
// Lookahead
// ============================================================================

auto Parser::scan_type_args(size_t& index) const -> bool {
    if (index >= tokens_.size() || !tokens_[index].is_punct("<")) {
        return false;
    }
    ++index;
    while (true) {
        if (!scan_type_name(index)) {
            return false;
        }
        if (index < tokens_.size() && tokens_[index].is_punct(",")) {
            ++index;
            continue;
        }
        break;
    }
    if (index >= tokens_.size() || !tokens_[index].is_punct(">")) {
        return false;
    }
    ++index;
    return true;
}

auto Parser::scan_type_name(size_t& index) const -> bool {
    if (index >= tokens_.size() || !tokens_[index].is(TokenKind::Ident)) {
        return false;
    }
    ++index;
    while (index + 1 < tokens_.size() &&
           (tokens_[index].is_punct(".") || tokens_[index].is_punct("::")) &&
           tokens_[index + 1].is(TokenKind::Ident)) {
        index += 2;
    }
    if (index < tokens_.size() && tokens_[index].is_punct("<")) {
        size_t save = index;
        if (!scan_type_args(index)) {
            index = save;
            return false;
        }
    }
    while (index < tokens_.size()) {
        if (tokens_[index].is_punct("?") &&
            (index + 1 >= tokens_.size() || !starts_operand(tokens_[index + 1]))) {
            ++index;
        } else if (index + 1 < tokens_.size() && tokens_[index].is_punct("[") &&
                   tokens_[index + 1].is_punct("]")) {
            index += 2;
        } else {
            break;
        }
    }
    return true;
}

auto Parser::parse_type_name() -> std::string {
    size_t end = pos_;
    if (!scan_type_name(end)) {
        fail("expected type name");
        return {};
    }
    std::string name;
    while (pos_ < end) {
        const Token& tok = advance();
        name += tok.lexeme;
        if (tok.is_punct(",")) {
            name += ' ';
        }
    }
    return name;
}

auto Parser::parse_type_args() -> std::vector<std::string> {
    std::vector<std::string> args;
    if (!expect_punct("<")) {
        return args;
    }
    do {
        args.push_back(parse_type_name());
        if (failed()) {
            return args;
        }
    } while (match_punct(","));
    expect_punct(">");
    return args;
}

auto Parser::at_lambda() const -> bool {
    const Token& first = peek();
    if (first.is(TokenKind::Ident) && !is_reserved(first.lexeme)) {
        return peek(1).is_punct("=>");
    }
    if (!first.is_punct("(")) {
        return false;
    }

    // `( [Type] name {, [Type] name} ) =>`
    size_t i = pos_ + 1;
    if (tokens_[i].is_punct(")")) {
        return i + 1 < tokens_.size() && tokens_[i + 1].is_punct("=>");
    }
    while (i < tokens_.size()) {
        if (!scan_type_name(i)) {
            return false;
        }
        if (i < tokens_.size() && tokens_[i].is(TokenKind::Ident)) {
            ++i; // typed parameter
        }
        if (i < tokens_.size() && tokens_[i].is_punct(",")) {
            ++i;
            continue;
        }
        break;
    }
    return i + 1 < tokens_.size() && tokens_[i].is_punct(")") && tokens_[i + 1].is_punct("=>");
}

auto Parser::at_cast() const -> bool {
    if (!peek().is_punct("(")) {
        return false;
    }
    size_t i = pos_ + 1;
    size_t type_start = i;
    if (!scan_type_name(i) || i >= tokens_.size() || !tokens_[i].is_punct(")")) {
        return false;
    }
    if (i + 1 >= tokens_.size()) {
        return false;
    }
    const Token& next = tokens_[i + 1];
    bool keyword_type = keyword_types().contains(tokens_[type_start].lexeme);
    if (keyword_type && (next.is_punct("-") || next.is_punct("+"))) {
        return true;
    }
    return starts_operand(next);
}

// ============================================================================
// Grammar
// ============================================================================

auto Parser::parse() -> Result<ExprPtr, ParseError> {
    auto expr = parse_expression();
    if (!failed() && !peek().is(TokenKind::Eof)) {
        fail("unexpected trailing input");
    }
    if (failed()) {
        return *error_;
    }
    return expr;
}

auto Parser::parse_expression() -> ExprPtr {
    if (failed()) {
        return nullptr;
    }
    if (at_lambda()) {
        return parse_lambda();
    }
    return parse_ternary();
}

auto Parser::parse_lambda() -> ExprPtr {
    size_t start = peek().offset;
    LambdaExpr lambda;

    if (peek().is(TokenKind::Ident)) {
        lambda.params.push_back(advance().lexeme);
    } else {
        advance(); // '('
        lambda.parenthesized = true;
        while (!peek().is_punct(")") && !failed()) {
            // Skip an explicit parameter type when a name follows it.
            size_t type_end = pos_;
            if (scan_type_name(type_end) && type_end < tokens_.size() &&
                tokens_[type_end].is(TokenKind::Ident)) {
                pos_ = type_end;
            }
            if (!peek().is(TokenKind::Ident)) {
                fail("expected lambda parameter");
                return nullptr;
            }
            lambda.params.push_back(advance().lexeme);
            if (!match_punct(",")) {
                break;
            }
        }
        if (!expect_punct(")")) {
            return nullptr;
        }
    }

    if (!expect_punct("=>")) {
        return nullptr;
    }

    if (peek().is_punct("{")) {
        if (!parse_lambda_block(lambda)) {
            return nullptr;
        }
    } else {
        lambda.body = parse_expression();
        if (failed()) {
            return nullptr;
        }
    }
    return make_expr(std::move(lambda), span_from(start));
}

auto Parser::parse_lambda_block(LambdaExpr& lambda) -> bool {
    advance(); // '{'
    lambda.block_body = true;

    while (!failed()) {
        if (peek().is_ident("return")) {
            advance();
            lambda.body = parse_expression();
            if (failed() || !expect_punct(";")) {
                return false;
            }
            return expect_punct("}");
        }

        LocalDecl local;
        if (peek().is_ident("var")) {
            local.type_name = advance().lexeme;
        } else {
            size_t type_end = pos_;
            if (!scan_type_name(type_end) || type_end + 1 >= tokens_.size() ||
                !tokens_[type_end].is(TokenKind::Ident) || !tokens_[type_end + 1].is_punct("=")) {
                fail("unsupported statement in lambda block");
                return false;
            }
            local.type_name = parse_type_name();
        }

        if (!peek().is(TokenKind::Ident)) {
            fail("expected local variable name");
            return false;
        }
        local.name = advance().lexeme;
        if (!expect_punct("=")) {
            return false;
        }
        local.init = parse_expression();
        if (failed() || !expect_punct(";")) {
            return false;
        }
        lambda.locals.push_back(std::move(local));
    }
    return false;
}

auto Parser::parse_ternary() -> ExprPtr {
    size_t start = peek().offset;
    auto condition = parse_binary(binary_precedence("??"));
    if (failed() || !peek().is_punct("?")) {
        return condition;
    }
    advance();
    auto then_expr = parse_expression();
    if (failed() || !expect_punct(":")) {
        return nullptr;
    }
    auto else_expr = parse_expression();
    if (failed()) {
        return nullptr;
    }
    return make_expr(
        TernaryExpr{std::move(condition), std::move(then_expr), std::move(else_expr)},
        span_from(start));
}

auto Parser::parse_binary(int min_prec) -> ExprPtr {
    size_t start = peek().offset;
    auto left = parse_unary();

    while (!failed()) {
        const Token& tok = peek();
        std::string op;
        if (tok.is(TokenKind::Punct) || tok.is_ident("is") || tok.is_ident("as")) {
            op = tok.lexeme;
        }
        int prec = binary_precedence(op);
        if (prec == 0 || prec < min_prec) {
            break;
        }
        advance();

        ExprPtr right;
        if (op == "is" || op == "as") {
            if (op == "is" && peek().is_ident("not")) {
                advance();
                op = "is not";
            }
            if (peek().is(TokenKind::Ident) && !peek().is_ident("null") &&
                !peek().is_ident("true") && !peek().is_ident("false")) {
                size_t type_start = peek().offset;
                std::string type_name = parse_type_name();
                right = make_expr(IdentExpr{std::move(type_name), {}}, span_from(type_start));
            } else {
                right = parse_primary();
            }
        } else {
            // `??` is right-associative.
            right = parse_binary(op == "??" ? prec : prec + 1);
        }
        if (failed()) {
            return nullptr;
        }
        left = make_expr(BinaryExpr{std::move(op), std::move(left), std::move(right)},
                         span_from(start));
    }
    return left;
}

auto Parser::parse_unary() -> ExprPtr {
    if (failed()) {
        return nullptr;
    }
    size_t start = peek().offset;
    const Token& tok = peek();

    if (tok.is_punct("!") || tok.is_punct("-") || tok.is_punct("+") || tok.is_punct("~") ||
        tok.is_punct("++") || tok.is_punct("--") || tok.is_ident("await")) {
        std::string op = advance().lexeme;
        auto operand = parse_unary();
        if (failed()) {
            return nullptr;
        }
        return make_expr(UnaryExpr{std::move(op), std::move(operand)}, span_from(start));
    }

    if (at_cast()) {
        advance(); // '('
        std::string type_name = parse_type_name();
        if (failed() || !expect_punct(")")) {
            return nullptr;
        }
        auto operand = parse_unary();
        if (failed()) {
            return nullptr;
        }
        return make_expr(CastExpr{std::move(type_name), std::move(operand)}, span_from(start));
    }

    return parse_postfix(parse_primary());
}

auto Parser::parse_postfix(ExprPtr expr) -> ExprPtr {
    size_t start = expr ? expr->span.start : peek().offset;

    while (!failed()) {
        const Token& tok = peek();

        if (tok.is_punct(".") || tok.is_punct("?.")) {
            bool conditional = tok.lexeme == "?.";
            advance();
            if (!peek().is(TokenKind::Ident)) {
                fail("expected member name");
                return nullptr;
            }
            MemberExpr member{std::move(expr), advance().lexeme, {}, conditional};
            size_t after = pos_;
            if (peek().is_punct("<") && scan_type_args(after) && after < tokens_.size() &&
                tokens_[after].is_punct("(")) {
                member.type_args = parse_type_args();
            }
            expr = make_expr(std::move(member), span_from(start));
        } else if (tok.is_punct("(")) {
            auto args = parse_arguments(")");
            if (failed()) {
                return nullptr;
            }
            expr = make_expr(CallExpr{std::move(expr), std::move(args)}, span_from(start));
        } else if (tok.is_punct("[") || tok.is_punct("?[")) {
            bool conditional = tok.lexeme == "?[";
            auto indices = parse_arguments("]");
            if (failed()) {
                return nullptr;
            }
            expr = make_expr(IndexExpr{std::move(expr), std::move(indices), conditional},
                             span_from(start));
        } else if (tok.is_punct("!")) {
            // Null-forgiving operator; it has no runtime effect.
            const Token& next = peek(1);
            if (next.is_punct(".") || next.is_punct("?.") || next.is_punct(")") ||
                next.is_punct(",") || next.is_punct("]") || next.is_punct(";") ||
                next.is_punct("}") || next.is_punct("??") || next.is(TokenKind::Eof)) {
                advance();
            } else {
                break;
            }
        } else {
            break;
        }
    }
    return expr;
}

auto Parser::parse_primary() -> ExprPtr {
    if (failed()) {
        return nullptr;
    }
    size_t start = peek().offset;
    const Token& tok = peek();

    switch (tok.kind) {
    case TokenKind::IntLiteral:
        return make_expr(LiteralExpr{LiteralKind::Int, advance().lexeme}, span_from(start));
    case TokenKind::FloatLiteral:
        return make_expr(LiteralExpr{LiteralKind::Float, advance().lexeme}, span_from(start));
    case TokenKind::StringLiteral:
        return make_expr(LiteralExpr{LiteralKind::String, advance().lexeme}, span_from(start));
    case TokenKind::CharLiteral:
        return make_expr(LiteralExpr{LiteralKind::Char, advance().lexeme}, span_from(start));
    case TokenKind::InterpStringLiteral: {
        Token copy = advance();
        return parse_interpolated(copy);
    }
    case TokenKind::Ident:
        break;
    case TokenKind::Punct:
        if (tok.is_punct("(")) {
            advance();
            auto inner = parse_expression();
            if (failed() || !expect_punct(")")) {
                return nullptr;
            }
            return inner;
        }
        fail("expected expression");
        return nullptr;
    default:
        fail("expected expression");
        return nullptr;
    }

    const std::string& name = tok.lexeme;
    if (name == "true" || name == "false") {
        return make_expr(LiteralExpr{LiteralKind::Bool, advance().lexeme}, span_from(start));
    }
    if (name == "null") {
        return make_expr(LiteralExpr{LiteralKind::Null, advance().lexeme}, span_from(start));
    }
    if (name == "new") {
        return parse_new();
    }
    if ((name == "default" || name == "typeof" || name == "nameof" || name == "sizeof") &&
        peek(1).is_punct("(")) {
        std::string callee = advance().lexeme;
        advance(); // '('
        size_t arg_start = peek().offset;
        std::string type_name = parse_type_name();
        if (failed() || !expect_punct(")")) {
            return nullptr;
        }
        std::vector<ExprPtr> args;
        args.push_back(make_expr(IdentExpr{std::move(type_name), {}}, span_from(arg_start)));
        auto callee_expr = make_expr(IdentExpr{std::move(callee), {}}, Span{start, start});
        return make_expr(CallExpr{std::move(callee_expr), std::move(args)}, span_from(start));
    }
    if (name == "default") {
        return make_expr(LiteralExpr{LiteralKind::Default, advance().lexeme}, span_from(start));
    }

    IdentExpr ident{advance().lexeme, {}};
    size_t after = pos_;
    if (peek().is_punct("<") && scan_type_args(after) && after < tokens_.size() &&
        tokens_[after].is_punct("(")) {
        ident.type_args = parse_type_args();
    }
    return make_expr(std::move(ident), span_from(start));
}

auto Parser::parse_new() -> ExprPtr {
    size_t start = peek().offset;
    advance(); // 'new'

    NewExpr node;
    if (peek().is_punct("[")) {
        advance();
        if (!expect_punct("]")) {
            return nullptr;
        }
        node.type_name = "[]";
    } else if (!peek().is_punct("{")) {
        node.type_name = parse_type_name();
        if (failed()) {
            return nullptr;
        }
    }

    if (peek().is_punct("(")) {
        node.args = parse_arguments(")");
        node.has_args = true;
    }
    if (!failed() && peek().is_punct("{")) {
        advance();
        node.has_initializer = true;
        while (!failed() && !peek().is_punct("}")) {
            node.initializers.push_back(parse_initializer_entry());
            if (!match_punct(",")) {
                break;
            }
        }
        expect_punct("}");
    }
    if (failed()) {
        return nullptr;
    }
    if (!node.has_args && !node.has_initializer) {
        fail("expected '(' or '{' after type in new expression");
        return nullptr;
    }
    return make_expr(std::move(node), span_from(start));
}

auto Parser::parse_initializer_entry() -> ExprPtr {
    size_t start = peek().offset;
    if (peek().is(TokenKind::Ident) && peek(1).is_punct("=")) {
        std::string member = advance().lexeme;
        advance(); // '='
        auto value = parse_expression();
        if (failed()) {
            return nullptr;
        }
        auto target = make_expr(IdentExpr{std::move(member), {}}, Span{start, start});
        return make_expr(BinaryExpr{"=", std::move(target), std::move(value)}, span_from(start));
    }
    return parse_expression();
}

auto Parser::parse_arguments(std::string_view close) -> std::vector<ExprPtr> {
    std::vector<ExprPtr> args;
    advance(); // '(' / '[' / '?['
    if (match_punct(close)) {
        return args;
    }
    while (!failed()) {
        // Named arguments and ref/out modifiers carry no meaning for analysis.
        if (peek().is(TokenKind::Ident) && peek(1).is_punct(":")) {
            advance();
            advance();
        }
        if (peek().is_ident("out") || peek().is_ident("ref") || peek().is_ident("in")) {
            if (peek(1).is(TokenKind::Ident)) {
                advance();
            }
        }
        args.push_back(parse_expression());
        if (!match_punct(",")) {
            break;
        }
    }
    expect_punct(close);
    return args;
}

auto Parser::parse_interpolated(const Token& tok) -> ExprPtr {
    const std::string& text = tok.lexeme;
    size_t quote = text.find('"');
    InterpolatedStringExpr node;
    node.prefix = text.substr(0, quote);
    bool verbatim = node.prefix.find('@') != std::string::npos;

    std::string body = text.substr(quote + 1, text.size() - quote - 2);
    std::string piece;
    size_t i = 0;
    while (i < body.size()) {
        char c = body[i];
        if ((c == '{' || c == '}') && i + 1 < body.size() && body[i + 1] == c) {
            piece += c;
            piece += c;
            i += 2;
            continue;
        }
        if (!verbatim && c == '\\' && i + 1 < body.size()) {
            piece += body.substr(i, 2);
            i += 2;
            continue;
        }
        if (c != '{') {
            piece += c;
            ++i;
            continue;
        }

        // Hole: find its end and the start of an optional format/alignment suffix.
        size_t hole_start = i + 1;
        size_t j = hole_start;
        int depth = 0;
        size_t format_at = std::string::npos;
        while (j < body.size()) {
            char h = body[j];
            if (h == '"' || h == '\'') {
                char q = h;
                ++j;
                while (j < body.size() && body[j] != q) {
                    j += body[j] == '\\' ? 2 : 1;
                }
            } else if (h == '(' || h == '[' || h == '{') {
                ++depth;
            } else if ((h == ')' || h == ']') && depth > 0) {
                --depth;
            } else if (h == '}') {
                if (depth == 0) {
                    break;
                }
                --depth;
            } else if ((h == ':' || h == ',') && depth == 0 && format_at == std::string::npos) {
                format_at = j;
            }
            ++j;
        }
        if (j >= body.size()) {
            fail("unterminated interpolation hole");
            return nullptr;
        }

        size_t expr_end = format_at == std::string::npos ? j : format_at;
        auto hole = maplint::expr::parse_expression(body.substr(hole_start, expr_end - hole_start));
        if (is_err(hole)) {
            error_ = ParseError{"in interpolation hole: " + unwrap_err(hole).message,
                                tok.offset + quote + 1 + hole_start + unwrap_err(hole).offset};
            return nullptr;
        }

        node.pieces.push_back(std::move(piece));
        piece.clear();
        node.holes.push_back(std::move(unwrap(hole)));
        node.formats.push_back(format_at == std::string::npos ? ""
                                                               : body.substr(format_at, j - format_at));
        i = j + 1;
    }
    node.pieces.push_back(std::move(piece));

    return make_expr(std::move(node), Span{tok.offset, tok.offset + text.size()});
}

auto parse_expression(std::string_view text) -> Result<ExprPtr, ParseError> {
    Lexer lexer(text);
    auto tokens = lexer.tokenize();
    if (lexer.has_errors()) {
        const auto& err = lexer.errors().front();
        return ParseError{err.message, err.offset};
    }
    Parser parser(std::move(tokens));
    return parser.parse();
}

} // namespace maplint::expr
