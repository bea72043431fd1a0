#include "ExpressionEngine.hpp"
#include "ExprLexer.hpp"
#include "StringUtils.hpp"
#include "WorkflowErrors.hpp"
#include <cstdlib>
#include <fmt/format.h>
#include <stdexcept>
#include <vector>

struct ExprNode {
    enum class Type {
        Literal,
        Path,
        Call,
        Not,
        Binary
    };

    struct Segment {
        std::string name;
        std::shared_ptr<const ExprNode> index;  // ['name'] access
        bool wildcard = false;                  // .*
    };

    Type type = Type::Literal;
    ExprValue literal;
    std::vector<Segment> segments;
    std::string function;
    std::vector<std::shared_ptr<const ExprNode>> children;
    TokenType op = TokenType::End;
};

using NodePtr = std::shared_ptr<const ExprNode>;

namespace {

// --------------------------
// Span scanning
// --------------------------
struct ExprSpan {
    size_t start;   // offset of "${{"
    size_t end;     // offset just past "}}"
    std::string body;
};

std::vector<ExprSpan> find_spans(const std::string& text) {
    std::vector<ExprSpan> spans;
    size_t pos = 0;
    while ((pos = text.find("${{", pos)) != std::string::npos) {
        size_t i = pos + 3;
        bool in_string = false;
        size_t close = std::string::npos;
        while (i < text.size()) {
            char c = text[i];
            if (in_string) {
                if (c == '\'') {
                    if (i + 1 < text.size() && text[i + 1] == '\'') {
                        i += 2;
                        continue;
                    }
                    in_string = false;
                }
            } else if (c == '\'') {
                in_string = true;
            } else if (c == '}' && i + 1 < text.size() && text[i + 1] == '}') {
                close = i;
                break;
            }
            ++i;
        }
        if (close == std::string::npos) {
            throw EvalError(fmt::format("Unterminated expression starting at position {} in '{}'", pos, text));
        }
        spans.push_back({pos, close + 2, text.substr(pos + 3, close - pos - 3)});
        pos = close + 2;
    }
    return spans;
}

// --------------------------
// Parser
// --------------------------
class ExprParser {
public:
    explicit ExprParser(const std::string& expression)
        : expression_(expression), tokens_(ExprLexer(expression).tokenize()) {}

    NodePtr parse() {
        if (tokens_.back().type == TokenType::Error) {
            const Token& err = tokens_.back();
            throw EvalError(fmt::format("{} at position {} in expression '{}'", err.text, err.offset, expression_));
        }
        if (peek().type == TokenType::End) {
            throw EvalError("Empty expression");
        }
        NodePtr root = parse_or();
        if (peek().type != TokenType::End) {
            fail("Unexpected " + std::string(to_string(peek().type)));
        }
        return root;
    }

private:
    const Token& peek() const { return tokens_[pos_]; }

    const Token& advance() {
        const Token& tok = tokens_[pos_];
        if (pos_ + 1 < tokens_.size()) ++pos_;
        return tok;
    }

    bool match(TokenType type) {
        if (peek().type == type) {
            advance();
            return true;
        }
        return false;
    }

    void expect(TokenType type) {
        if (!match(type)) {
            fail(fmt::format("Expected {} but found {}", to_string(type), to_string(peek().type)));
        }
    }

    [[noreturn]] void fail(const std::string& message) const {
        throw EvalError(fmt::format("{} at position {} in expression '{}'", message, peek().offset, expression_));
    }

    static NodePtr make_binary(TokenType op, NodePtr lhs, NodePtr rhs) {
        auto node = std::make_shared<ExprNode>();
        node->type = ExprNode::Type::Binary;
        node->op = op;
        node->children = {std::move(lhs), std::move(rhs)};
        return node;
    }

    NodePtr parse_or() {
        NodePtr lhs = parse_and();
        while (peek().type == TokenType::Or) {
            advance();
            lhs = make_binary(TokenType::Or, lhs, parse_and());
        }
        return lhs;
    }

    NodePtr parse_and() {
        NodePtr lhs = parse_equality();
        while (peek().type == TokenType::And) {
            advance();
            lhs = make_binary(TokenType::And, lhs, parse_equality());
        }
        return lhs;
    }

    NodePtr parse_equality() {
        NodePtr lhs = parse_comparison();
        while (peek().type == TokenType::Eq || peek().type == TokenType::Ne) {
            TokenType op = advance().type;
            lhs = make_binary(op, lhs, parse_comparison());
        }
        return lhs;
    }

    NodePtr parse_comparison() {
        NodePtr lhs = parse_unary();
        while (peek().type == TokenType::Lt || peek().type == TokenType::Le ||
               peek().type == TokenType::Gt || peek().type == TokenType::Ge) {
            TokenType op = advance().type;
            lhs = make_binary(op, lhs, parse_unary());
        }
        return lhs;
    }

    NodePtr parse_unary() {
        if (match(TokenType::Not)) {
            auto node = std::make_shared<ExprNode>();
            node->type = ExprNode::Type::Not;
            node->children = {parse_unary()};
            return node;
        }
        return parse_primary();
    }

    NodePtr parse_primary() {
        const Token& tok = peek();
        switch (tok.type) {
            case TokenType::LParen: {
                advance();
                NodePtr inner = parse_or();
                expect(TokenType::RParen);
                return inner;
            }
            case TokenType::String: {
                auto node = std::make_shared<ExprNode>();
                node->literal = ExprValue(advance().text);
                return node;
            }
            case TokenType::Number: {
                auto node = std::make_shared<ExprNode>();
                node->literal = ExprValue(parse_number(advance().text));
                return node;
            }
            case TokenType::Identifier:
                return parse_identifier();
            default:
                fail("Unexpected " + std::string(to_string(tok.type)));
        }
    }

    double parse_number(const std::string& text) const {
        std::string digits = text;
        bool negative = false;
        if (!digits.empty() && (digits[0] == '-' || digits[0] == '+')) {
            negative = digits[0] == '-';
            digits = digits.substr(1);
        }
        if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
            double value = static_cast<double>(std::strtoull(digits.c_str() + 2, nullptr, 16));
            return negative ? -value : value;
        }
        return std::strtod(text.c_str(), nullptr);
    }

    NodePtr parse_identifier() {
        const Token& ident = advance();

        if (ident.text == "true" || ident.text == "false") {
            auto node = std::make_shared<ExprNode>();
            node->literal = ExprValue(ident.text == "true");
            return node;
        }
        if (ident.text == "null") {
            return std::make_shared<ExprNode>();
        }

        if (match(TokenType::LParen)) {
            auto node = std::make_shared<ExprNode>();
            node->type = ExprNode::Type::Call;
            node->function = StringUtils::to_lower(ident.text);
            if (!match(TokenType::RParen)) {
                do {
                    node->children.push_back(parse_or());
                } while (match(TokenType::Comma));
                expect(TokenType::RParen);
            }
            return node;
        }

        auto node = std::make_shared<ExprNode>();
        node->type = ExprNode::Type::Path;
        node->segments.push_back({ident.text, nullptr, false});
        while (true) {
            if (match(TokenType::Dot)) {
                if (match(TokenType::Star)) {
                    node->segments.push_back({"*", nullptr, true});
                } else if (peek().type == TokenType::Identifier || peek().type == TokenType::Number) {
                    node->segments.push_back({advance().text, nullptr, false});
                } else {
                    fail("Expected property name after '.'");
                }
            } else if (match(TokenType::LBracket)) {
                if (match(TokenType::Star)) {
                    node->segments.push_back({"*", nullptr, true});
                } else {
                    node->segments.push_back({"", parse_or(), false});
                }
                expect(TokenType::RBracket);
            } else {
                break;
            }
        }
        return node;
    }

    std::string expression_;
    std::vector<Token> tokens_;
    size_t pos_ = 0;
};

// --------------------------
// Evaluator
// --------------------------
ExprValue eval_node(const ExprNode& node, const ExprContext& ctx);

std::vector<std::string> resolve_path(const ExprNode& node, const ExprContext& ctx) {
    std::vector<std::string> path;
    path.reserve(node.segments.size());
    for (const auto& seg : node.segments) {
        if (seg.index) {
            path.push_back(eval_node(*seg.index, ctx).to_string());
        } else {
            path.push_back(seg.name);
        }
    }
    return path;
}

bool has_wildcard(const ExprNode& node) {
    for (const auto& seg : node.segments) {
        if (seg.wildcard) return true;
    }
    return false;
}

// Collection value of a path argument, if the argument is a path naming one
std::optional<std::vector<ExprValue>> collection_arg(const ExprNode& node, const ExprContext& ctx) {
    if (node.type != ExprNode::Type::Path) return std::nullopt;
    return ctx.lookup_collection(resolve_path(node, ctx));
}

void expect_args(const ExprNode& node, size_t min, size_t max) {
    const size_t n = node.children.size();
    if (n < min || n > max) {
        if (min == max) {
            throw EvalError(fmt::format("Function {}() expects {} argument(s), got {}", node.function, min, n));
        }
        throw EvalError(fmt::format("Function {}() expects {} to {} arguments, got {}", node.function, min, max, n));
    }
}

std::string apply_format(const std::string& pattern, const std::vector<std::string>& args) {
    std::string out;
    size_t i = 0;
    while (i < pattern.size()) {
        char c = pattern[i];
        if (c == '{') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '{') {
                out.push_back('{');
                i += 2;
                continue;
            }
            size_t close = pattern.find('}', i);
            if (close == std::string::npos) {
                throw EvalError("format(): unclosed '{' in '" + pattern + "'");
            }
            std::string index_text = pattern.substr(i + 1, close - i - 1);
            if (index_text.empty() || index_text.find_first_not_of("0123456789") != std::string::npos) {
                throw EvalError("format(): invalid placeholder '{" + index_text + "}'");
            }
            size_t index = std::stoul(index_text);
            if (index >= args.size()) {
                throw EvalError(fmt::format("format(): placeholder {{{}}} has no argument", index));
            }
            out += args[index];
            i = close + 1;
        } else if (c == '}') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '}') {
                out.push_back('}');
                i += 2;
                continue;
            }
            throw EvalError("format(): unmatched '}' in '" + pattern + "'");
        } else {
            out.push_back(c);
            ++i;
        }
    }
    return out;
}

ExprValue call_function(const ExprNode& node, const ExprContext& ctx) {
    const std::string& name = node.function;

    if (name == "success") {
        expect_args(node, 0, 0);
        return ExprValue(ctx.status_success());
    }
    if (name == "failure") {
        expect_args(node, 0, 0);
        return ExprValue(ctx.status_failure());
    }
    if (name == "always") {
        expect_args(node, 0, 0);
        return ExprValue(true);
    }
    if (name == "cancelled") {
        expect_args(node, 0, 0);
        return ExprValue(ctx.status_cancelled());
    }
    if (name == "contains") {
        expect_args(node, 2, 2);
        ExprValue item = eval_node(*node.children[1], ctx);
        if (auto items = collection_arg(*node.children[0], ctx)) {
            for (const auto& candidate : *items) {
                if (candidate.loosely_equals(item)) return ExprValue(true);
            }
            return ExprValue(false);
        }
        ExprValue search = eval_node(*node.children[0], ctx);
        return ExprValue(StringUtils::icontains(search.to_string(), item.to_string()));
    }
    if (name == "startswith") {
        expect_args(node, 2, 2);
        return ExprValue(StringUtils::istarts_with(eval_node(*node.children[0], ctx).to_string(),
                                                   eval_node(*node.children[1], ctx).to_string()));
    }
    if (name == "endswith") {
        expect_args(node, 2, 2);
        return ExprValue(StringUtils::iends_with(eval_node(*node.children[0], ctx).to_string(),
                                                 eval_node(*node.children[1], ctx).to_string()));
    }
    if (name == "join") {
        expect_args(node, 1, 2);
        std::string separator = node.children.size() > 1 ? eval_node(*node.children[1], ctx).to_string() : ",";
        if (auto items = collection_arg(*node.children[0], ctx)) {
            std::vector<std::string> parts;
            for (const auto& item : *items) parts.push_back(item.to_string());
            return ExprValue(StringUtils::join(parts, separator));
        }
        return ExprValue(eval_node(*node.children[0], ctx).to_string());
    }
    if (name == "format") {
        if (node.children.empty()) {
            throw EvalError("Function format() expects at least 1 argument, got 0");
        }
        std::string pattern = eval_node(*node.children[0], ctx).to_string();
        std::vector<std::string> args;
        for (size_t i = 1; i < node.children.size(); ++i) {
            args.push_back(eval_node(*node.children[i], ctx).to_string());
        }
        return ExprValue(apply_format(pattern, args));
    }

    throw EvalError("Unknown function: " + name + "()");
}

ExprValue eval_binary(const ExprNode& node, const ExprContext& ctx) {
    const ExprNode& lhs_node = *node.children[0];
    const ExprNode& rhs_node = *node.children[1];

    if (node.op == TokenType::And) {
        ExprValue lhs = eval_node(lhs_node, ctx);
        if (!lhs.truthy()) return lhs;
        return eval_node(rhs_node, ctx);
    }
    if (node.op == TokenType::Or) {
        ExprValue lhs = eval_node(lhs_node, ctx);
        if (lhs.truthy()) return lhs;
        return eval_node(rhs_node, ctx);
    }

    ExprValue lhs = eval_node(lhs_node, ctx);
    ExprValue rhs = eval_node(rhs_node, ctx);

    switch (node.op) {
        case TokenType::Eq: return ExprValue(lhs.loosely_equals(rhs));
        case TokenType::Ne: return ExprValue(!lhs.loosely_equals(rhs));
        default: break;
    }

    std::optional<int> cmp = lhs.compare(rhs);
    if (!cmp) return ExprValue(false);

    switch (node.op) {
        case TokenType::Lt: return ExprValue(*cmp < 0);
        case TokenType::Le: return ExprValue(*cmp <= 0);
        case TokenType::Gt: return ExprValue(*cmp > 0);
        case TokenType::Ge: return ExprValue(*cmp >= 0);
        default: break;
    }
    throw EvalError(std::string("Unsupported operator ") + to_string(node.op));
}

ExprValue eval_node(const ExprNode& node, const ExprContext& ctx) {
    switch (node.type) {
        case ExprNode::Type::Literal:
            return node.literal;
        case ExprNode::Type::Path: {
            if (has_wildcard(node)) {
                // A filtered collection is only meaningful as a function argument
                auto items = ctx.lookup_collection(resolve_path(node, ctx));
                if (!items) return ExprValue("");
                std::vector<std::string> parts;
                for (const auto& item : *items) parts.push_back(item.to_string());
                return ExprValue(StringUtils::join(parts, ","));
            }
            auto value = ctx.lookup(resolve_path(node, ctx));
            return value ? *value : ExprValue("");
        }
        case ExprNode::Type::Call:
            return call_function(node, ctx);
        case ExprNode::Type::Not:
            return ExprValue(!eval_node(*node.children[0], ctx).truthy());
        case ExprNode::Type::Binary:
            return eval_binary(node, ctx);
    }
    throw EvalError("Malformed expression tree");
}

bool node_uses_status(const ExprNode& node) {
    if (node.type == ExprNode::Type::Call) {
        const std::string& fn = node.function;
        if (fn == "success" || fn == "failure" || fn == "always" || fn == "cancelled") {
            return true;
        }
    }
    for (const auto& child : node.children) {
        if (child && node_uses_status(*child)) return true;
    }
    for (const auto& seg : node.segments) {
        if (seg.index && node_uses_status(*seg.index)) return true;
    }
    return false;
}

} // namespace

// --------------------------
// ExpressionEngine
// --------------------------
ExpressionEngine::ExpressionEngine(const std::string& expression)
    : expression_(StringUtils::trimmed(expression)),
      root_(ExprParser(StringUtils::trimmed(expression)).parse()) {
}

ExpressionEngine::Result ExpressionEngine::evaluate(const ExprContext& context) const {
    return eval_node(*root_, context);
}

bool ExpressionEngine::uses_status_function() const {
    return node_uses_status(*root_);
}

bool ExpressionEngine::contains_expression(const std::string& text) {
    return text.find("${{") != std::string::npos;
}

void ExpressionEngine::validate_template(const std::string& text) {
    for (const auto& span : find_spans(text)) {
        ExpressionEngine engine(span.body);
        (void)engine;
    }
}

void ExpressionEngine::validate_condition(const std::string& condition) {
    std::string trimmed = StringUtils::trimmed(condition);
    if (trimmed.empty()) return;
    if (contains_expression(trimmed)) {
        validate_template(trimmed);
    } else {
        ExpressionEngine engine(trimmed);
        (void)engine;
    }
}

std::string ExpressionEngine::interpolate(const std::string& text, const ExprContext& context) {
    std::vector<ExprSpan> spans = find_spans(text);
    if (spans.empty()) return text;

    std::string out;
    size_t pos = 0;
    for (const auto& span : spans) {
        out.append(text, pos, span.start - pos);
        out += ExpressionEngine(span.body).evaluate(context).to_string();
        pos = span.end;
    }
    out.append(text, pos, std::string::npos);
    return out;
}

bool ExpressionEngine::evaluate_condition(const std::string& condition, const ExprContext& context) {
    std::string trimmed = StringUtils::trimmed(condition);
    if (trimmed.empty()) {
        return context.status_success();
    }

    std::vector<ExprSpan> spans = find_spans(trimmed);
    std::string expression = trimmed;

    if (spans.size() == 1 && spans[0].start == 0 && spans[0].end == trimmed.size()) {
        expression = spans[0].body;
    } else if (!spans.empty()) {
        // Text mixed with expressions evaluates to a string
        bool explicit_status = false;
        for (const auto& span : spans) {
            if (ExpressionEngine(span.body).uses_status_function()) explicit_status = true;
        }
        if (!explicit_status && !context.status_success()) return false;
        return !interpolate(trimmed, context).empty();
    }

    ExpressionEngine engine(expression);
    if (!engine.uses_status_function() && !context.status_success()) {
        return false;
    }
    return engine.evaluate(context).truthy();
}

std::set<std::string> ExpressionEngine::referenced_names(const std::string& text, const std::string& root) {
    std::set<std::string> names;
    for (const auto& span : find_spans(text)) {
        std::vector<Token> tokens = ExprLexer(span.body).tokenize();
        for (size_t i = 0; i + 2 < tokens.size(); ++i) {
            if (tokens[i].type != TokenType::Identifier || !StringUtils::iequals(tokens[i].text, root)) {
                continue;
            }
            if (tokens[i + 1].type == TokenType::Dot && tokens[i + 2].type == TokenType::Identifier) {
                names.insert(tokens[i + 2].text);
            } else if (tokens[i + 1].type == TokenType::LBracket && tokens[i + 2].type == TokenType::String) {
                names.insert(tokens[i + 2].text);
            }
        }
    }
    return names;
}
