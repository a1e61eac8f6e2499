#include "formula.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace ecagent {

namespace {

// ============================================================================
// Expression tree
// ============================================================================

class LiteralNode : public FormulaNode {
public:
    explicit LiteralNode(double value) : value_(value) {}

    double evaluate(const FormulaBindings& /* bindings */) const override {
        return value_;
    }

    void collect_fields(std::vector<std::string>& /* out */) const override {}

private:
    double value_;
};

class FieldNode : public FormulaNode {
public:
    explicit FieldNode(std::string name) : name_(std::move(name)) {}

    double evaluate(const FormulaBindings& bindings) const override {
        auto it = bindings.find(name_);
        if (it == bindings.end()) {
            throw FormulaFieldError(name_);
        }
        return it->second;
    }

    void collect_fields(std::vector<std::string>& out) const override {
        out.push_back(name_);
    }

private:
    std::string name_;
};

class NegateNode : public FormulaNode {
public:
    explicit NegateNode(std::unique_ptr<FormulaNode> operand) : operand_(std::move(operand)) {}

    double evaluate(const FormulaBindings& bindings) const override {
        return -operand_->evaluate(bindings);
    }

    void collect_fields(std::vector<std::string>& out) const override {
        operand_->collect_fields(out);
    }

private:
    std::unique_ptr<FormulaNode> operand_;
};

class BinaryNode : public FormulaNode {
public:
    BinaryNode(char op, std::unique_ptr<FormulaNode> lhs, std::unique_ptr<FormulaNode> rhs)
        : op_(op), lhs_(std::move(lhs)), rhs_(std::move(rhs)) {}

    double evaluate(const FormulaBindings& bindings) const override {
        double lhs = lhs_->evaluate(bindings);
        double rhs = rhs_->evaluate(bindings);
        switch (op_) {
            case '+': return lhs + rhs;
            case '-': return lhs - rhs;
            case '*': return lhs * rhs;
            case '/':
                if (rhs == 0.0) {
                    throw FormulaEvaluationError("division by zero");
                }
                return lhs / rhs;
        }
        throw FormulaEvaluationError(std::string("unsupported operator '") + op_ + "'");
    }

    void collect_fields(std::vector<std::string>& out) const override {
        lhs_->collect_fields(out);
        rhs_->collect_fields(out);
    }

private:
    char op_;
    std::unique_ptr<FormulaNode> lhs_;
    std::unique_ptr<FormulaNode> rhs_;
};

// ============================================================================
// Lexer
// ============================================================================

enum class TokenKind { Number, Identifier, Plus, Minus, Star, Slash, LParen, RParen, End };

struct Token {
    TokenKind kind;
    std::string text;
    double number;
    size_t position;
};

std::vector<Token> tokenize(const std::string& formula) {
    std::vector<Token> tokens;
    size_t pos = 0;

    while (pos < formula.size()) {
        char c = formula[pos];

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++pos;
            continue;
        }

        size_t start = pos;

        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && pos + 1 < formula.size() &&
             std::isdigit(static_cast<unsigned char>(formula[pos + 1])))) {
            while (pos < formula.size() && std::isdigit(static_cast<unsigned char>(formula[pos]))) {
                ++pos;
            }
            if (pos < formula.size() && formula[pos] == '.') {
                ++pos;
                while (pos < formula.size() && std::isdigit(static_cast<unsigned char>(formula[pos]))) {
                    ++pos;
                }
            }
            if (pos < formula.size() && (formula[pos] == 'e' || formula[pos] == 'E')) {
                size_t exp_pos = pos + 1;
                if (exp_pos < formula.size() && (formula[exp_pos] == '+' || formula[exp_pos] == '-')) {
                    ++exp_pos;
                }
                if (exp_pos >= formula.size() || !std::isdigit(static_cast<unsigned char>(formula[exp_pos]))) {
                    throw FormulaSyntaxError("malformed exponent in number", pos);
                }
                pos = exp_pos;
                while (pos < formula.size() && std::isdigit(static_cast<unsigned char>(formula[pos]))) {
                    ++pos;
                }
            }

            std::string text = formula.substr(start, pos - start);
            tokens.push_back({TokenKind::Number, text, std::strtod(text.c_str(), nullptr), start});
            continue;
        }

        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            while (pos < formula.size() &&
                   (std::isalnum(static_cast<unsigned char>(formula[pos])) || formula[pos] == '_')) {
                ++pos;
            }
            tokens.push_back({TokenKind::Identifier, formula.substr(start, pos - start), 0.0, start});
            continue;
        }

        TokenKind kind;
        switch (c) {
            case '+': kind = TokenKind::Plus; break;
            case '-': kind = TokenKind::Minus; break;
            case '*': kind = TokenKind::Star; break;
            case '/': kind = TokenKind::Slash; break;
            case '(': kind = TokenKind::LParen; break;
            case ')': kind = TokenKind::RParen; break;
            default:
                throw FormulaSyntaxError(std::string("unexpected character '") + c + "'", pos);
        }
        tokens.push_back({kind, std::string(1, c), 0.0, pos});
        ++pos;
    }

    tokens.push_back({TokenKind::End, "", 0.0, formula.size()});
    return tokens;
}

// ============================================================================
// Parser
// ============================================================================

// Bounds both parser recursion and tree height, so evaluation and destruction
// of any accepted formula stay within a fixed stack depth
constexpr size_t MAX_NESTING_DEPTH = 256;

struct ParsedNode {
    std::unique_ptr<FormulaNode> node;
    size_t height;
};

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)), index_(0), depth_(0) {}

    std::unique_ptr<FormulaNode> parse() {
        if (peek().kind == TokenKind::End) {
            throw FormulaSyntaxError("empty formula", peek().position);
        }
        auto root = parse_expression();
        if (peek().kind == TokenKind::RParen) {
            throw FormulaSyntaxError("unbalanced ')'", peek().position);
        }
        if (peek().kind != TokenKind::End) {
            throw FormulaSyntaxError("unexpected token '" + peek().text + "'", peek().position);
        }
        return std::move(root.node);
    }

private:
    std::vector<Token> tokens_;
    size_t index_;
    size_t depth_;

    const Token& peek() const { return tokens_[index_]; }

    const Token& advance() { return tokens_[index_++]; }

    void check_height(size_t height, size_t position) const {
        if (height > MAX_NESTING_DEPTH) {
            throw FormulaSyntaxError("formula nested too deeply", position);
        }
    }

    // Tracks recursion through parentheses and unary signs
    void enter(size_t position) {
        if (++depth_ > MAX_NESTING_DEPTH) {
            throw FormulaSyntaxError("formula nested too deeply", position);
        }
    }

    void leave() { --depth_; }

    ParsedNode make_binary(char op, ParsedNode lhs, ParsedNode rhs, size_t position) {
        size_t height = std::max(lhs.height, rhs.height) + 1;
        check_height(height, position);
        return {std::make_unique<BinaryNode>(op, std::move(lhs.node), std::move(rhs.node)), height};
    }

    ParsedNode parse_expression() {
        auto node = parse_term();
        while (peek().kind == TokenKind::Plus || peek().kind == TokenKind::Minus) {
            const Token& op = advance();
            node = make_binary(op.text[0], std::move(node), parse_term(), op.position);
        }
        return node;
    }

    ParsedNode parse_term() {
        auto node = parse_unary();
        while (peek().kind == TokenKind::Star || peek().kind == TokenKind::Slash) {
            const Token& op = advance();
            node = make_binary(op.text[0], std::move(node), parse_unary(), op.position);
        }
        return node;
    }

    ParsedNode parse_unary() {
        if (peek().kind == TokenKind::Minus || peek().kind == TokenKind::Plus) {
            const Token& sign = advance();
            enter(sign.position);
            ParsedNode operand = parse_unary();
            leave();
            if (sign.kind == TokenKind::Plus) {
                return operand;
            }
            size_t height = operand.height + 1;
            check_height(height, sign.position);
            return {std::make_unique<NegateNode>(std::move(operand.node)), height};
        }
        return parse_primary();
    }

    ParsedNode parse_primary() {
        const Token& token = peek();
        switch (token.kind) {
            case TokenKind::Number:
                advance();
                return {std::make_unique<LiteralNode>(token.number), 1};
            case TokenKind::Identifier:
                if (!FormulaEvaluator::is_known_field(token.text)) {
                    throw FormulaFieldError(token.text);
                }
                advance();
                return {std::make_unique<FieldNode>(token.text), 1};
            case TokenKind::LParen: {
                advance();
                enter(token.position);
                ParsedNode inner = parse_expression();
                leave();
                if (peek().kind != TokenKind::RParen) {
                    throw FormulaSyntaxError("expected ')'", peek().position);
                }
                advance();
                return inner;
            }
            case TokenKind::End:
                throw FormulaSyntaxError("unexpected end of formula", token.position);
            default:
                throw FormulaSyntaxError("unexpected token '" + token.text + "'", token.position);
        }
    }
};

} // anonymous namespace

// ============================================================================
// Formula
// ============================================================================

Formula::Formula(std::string text, std::shared_ptr<const FormulaNode> root)
    : text_(std::move(text)), root_(std::move(root)) {}

double Formula::evaluate(const FormulaBindings& bindings) const {
    double result = root_->evaluate(bindings);
    if (!std::isfinite(result)) {
        throw FormulaEvaluationError("result is not a finite number");
    }
    return result;
}

double Formula::evaluate(const ProjectInput& project) const {
    return evaluate(FormulaEvaluator::bind(project));
}

std::vector<std::string> Formula::referenced_fields() const {
    std::vector<std::string> fields;
    root_->collect_fields(fields);
    return fields;
}

// ============================================================================
// FormulaEvaluator
// ============================================================================

const std::vector<std::string>& FormulaEvaluator::known_fields() {
    static const std::vector<std::string> fields = {
        "total_disturbed_acres",
        "average_slope_percent",
        "drainage_feature_count",
        "phase_count",
        "total_drainage_area_acres"
    };
    return fields;
}

bool FormulaEvaluator::is_known_field(const std::string& identifier) {
    const auto& fields = known_fields();
    return std::find(fields.begin(), fields.end(), identifier) != fields.end();
}

FormulaBindings FormulaEvaluator::bind(const ProjectInput& project) {
    FormulaBindings bindings;
    bindings["total_disturbed_acres"] = project.total_disturbed_acres;
    bindings["average_slope_percent"] = project.average_slope_percent;
    bindings["drainage_feature_count"] = static_cast<double>(project.drainage_feature_count());
    bindings["phase_count"] = static_cast<double>(project.phase_count());
    bindings["total_drainage_area_acres"] = project.total_drainage_area_acres();
    return bindings;
}

Formula FormulaEvaluator::parse(const std::string& formula) {
    Parser parser(tokenize(formula));
    std::shared_ptr<const FormulaNode> root = parser.parse();
    return Formula(formula, std::move(root));
}

double FormulaEvaluator::evaluate(const std::string& formula, const ProjectInput& project) {
    return parse(formula).evaluate(project);
}

} // namespace ecagent
