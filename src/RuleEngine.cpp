#include "RuleEngine.h"
#include "CommonUtils.h"
#include "FluxGuardExceptions.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <utility>

struct RuleNode {
    enum class Kind { Number, String, Bool, Name, Negate, Not, Arith, And, Or, Compare };

    Kind kind = Kind::Number;
    double number = 0.0;
    bool flag = false;
    std::string text;                 // literal, name, or arithmetic operator
    size_t height = 1;
    std::vector<std::string> compareOps;
    std::vector<std::unique_ptr<RuleNode>> children;
};

namespace {
using FluxGuard::EvaluationException;

constexpr size_t kMaxNesting = 200;
constexpr size_t kMaxTreeHeight = 1000;
constexpr size_t kMaxRepeatLength = size_t(1) << 20;

enum class TokenType { Number, String, Name, Op, End };

struct Token {
    TokenType type = TokenType::End;
    std::string text;
    double number = 0.0;
    size_t pos = 0;
};

const std::unordered_set<std::string> kReservedWords = {
    "and", "as", "assert", "async", "await", "break", "class", "continue", "def", "del",
    "elif", "else", "except", "finally", "for", "from", "global", "if", "import", "in",
    "is", "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try", "while",
    "with", "yield", "True", "False", "None"};

[[noreturn]] void disallowed(const std::string& construct) {
    throw EvaluationException("disallowed construct: " + construct);
}

[[noreturn]] void syntaxError(const std::string& detail, size_t pos) {
    throw EvaluationException("syntax error at offset " + std::to_string(pos) + ": " + detail);
}

bool isNameStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

class Tokenizer {
public:
    explicit Tokenizer(const std::string& src) : src_(src) {}

    std::vector<Token> run() {
        std::vector<Token> out;
        while (true) {
            skipSpace();
            if (i_ >= src_.size()) break;
            const char c = src_[i_];
            if (std::isdigit(static_cast<unsigned char>(c)) ||
                (c == '.' && i_ + 1 < src_.size() && std::isdigit(static_cast<unsigned char>(src_[i_ + 1])))) {
                out.push_back(number());
            } else if (isNameStart(c)) {
                out.push_back(name());
            } else if (c == '\'' || c == '"') {
                out.push_back(stringLiteral());
            } else {
                out.push_back(op());
            }
        }
        Token end;
        end.type = TokenType::End;
        end.pos = src_.size();
        out.push_back(end);
        return out;
    }

private:
    const std::string& src_;
    size_t i_ = 0;

    void skipSpace() {
        while (i_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[i_]))) ++i_;
    }

    Token number() {
        Token t;
        t.type = TokenType::Number;
        t.pos = i_;
        const size_t start = i_;
        if (src_[i_] == '0' && i_ + 1 < src_.size() && std::isalpha(static_cast<unsigned char>(src_[i_ + 1])) &&
            src_[i_ + 1] != 'e' && src_[i_ + 1] != 'E') {
            disallowed("non-decimal integer literal");
        }
        while (i_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[i_]))) ++i_;
        if (i_ < src_.size() && src_[i_] == '.') {
            ++i_;
            while (i_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[i_]))) ++i_;
        }
        if (i_ < src_.size() && (src_[i_] == 'e' || src_[i_] == 'E')) {
            size_t j = i_ + 1;
            if (j < src_.size() && (src_[j] == '+' || src_[j] == '-')) ++j;
            if (j >= src_.size() || !std::isdigit(static_cast<unsigned char>(src_[j]))) {
                syntaxError("invalid number literal", start);
            }
            i_ = j;
            while (i_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[i_]))) ++i_;
        }
        if (i_ < src_.size() && (src_[i_] == 'j' || src_[i_] == 'J')) disallowed("complex literal");
        if (i_ < src_.size() && isNameChar(src_[i_])) syntaxError("invalid number literal", start);

        t.text = src_.substr(start, i_ - start);
        const char* first = t.text.data();
        const char* last = first + t.text.size();
        const auto res = std::from_chars(first, last, t.number);
        if (res.ec != std::errc() || res.ptr != last || !std::isfinite(t.number)) {
            syntaxError("invalid number literal", start);
        }
        return t;
    }

    Token name() {
        Token t;
        t.type = TokenType::Name;
        t.pos = i_;
        const size_t start = i_;
        while (i_ < src_.size() && isNameChar(src_[i_])) ++i_;
        t.text = src_.substr(start, i_ - start);
        if (i_ < src_.size() && (src_[i_] == '\'' || src_[i_] == '"') && t.text.size() <= 2) {
            const std::string prefix = CommonUtils::toLower(t.text);
            if (prefix.find('f') != std::string::npos) disallowed("f-string");
            if (prefix.find('b') != std::string::npos) disallowed("bytes literal");
            syntaxError("unsupported string prefix", start);
        }
        return t;
    }

    Token stringLiteral() {
        Token t;
        t.type = TokenType::String;
        t.pos = i_;
        const char quote = src_[i_++];
        if (i_ + 1 < src_.size() && src_[i_] == quote && src_[i_ + 1] == quote) {
            syntaxError("triple-quoted strings are not supported", t.pos);
        }
        while (true) {
            if (i_ >= src_.size()) syntaxError("unterminated string literal", t.pos);
            const char c = src_[i_++];
            if (c == quote) break;
            if (c == '\n') syntaxError("unterminated string literal", t.pos);
            if (c != '\\') {
                t.text.push_back(c);
                continue;
            }
            if (i_ >= src_.size()) syntaxError("unterminated string literal", t.pos);
            const char e = src_[i_++];
            switch (e) {
                case 'n': t.text.push_back('\n'); break;
                case 't': t.text.push_back('\t'); break;
                case 'r': t.text.push_back('\r'); break;
                case '0': t.text.push_back('\0'); break;
                case '\\': t.text.push_back('\\'); break;
                case '\'': t.text.push_back('\''); break;
                case '"': t.text.push_back('"'); break;
                default:
                    t.text.push_back('\\');
                    t.text.push_back(e);
                    break;
            }
        }
        return t;
    }

    Token op() {
        static const char* kTwoChar[] = {"**", "//", "==", "!=", "<=", ">=", "<<", ">>", ":=", "->"};
        Token t;
        t.type = TokenType::Op;
        t.pos = i_;
        if (i_ + 1 < src_.size()) {
            const std::string two = src_.substr(i_, 2);
            for (const char* candidate : kTwoChar) {
                if (two == candidate) {
                    t.text = two;
                    i_ += 2;
                    return t;
                }
            }
        }
        const char c = src_[i_];
        static const std::string kSingle = "()+-*/%<>[]{}.,:;=&|^~@";
        if (kSingle.find(c) == std::string::npos) {
            syntaxError(std::string("unexpected character '") + c + "'", i_);
        }
        t.text = std::string(1, c);
        ++i_;
        return t;
    }
};

void attach(RuleNode& parent, std::unique_ptr<RuleNode> child) {
    parent.height = std::max(parent.height, child->height + 1);
    if (parent.height > kMaxTreeHeight) throw EvaluationException("expression nested too deeply");
    parent.children.push_back(std::move(child));
}

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    std::unique_ptr<RuleNode> parseExpression() {
        std::unique_ptr<RuleNode> node = orExpr();
        trailingAfterExpression();
        if (peek().type != TokenType::End) unexpected(peek());
        return node;
    }

private:
    std::vector<Token> tokens_;
    size_t k_ = 0;
    size_t depth_ = 0;

    // Bounds recursion through parentheses, not and unary minus.
    class Nesting {
    public:
        explicit Nesting(size_t& depth) : depth_(depth) {
            if (depth_ >= kMaxNesting) throw EvaluationException("expression nested too deeply");
            ++depth_;
        }
        ~Nesting() { --depth_; }
        Nesting(const Nesting&) = delete;
        Nesting& operator=(const Nesting&) = delete;

    private:
        size_t& depth_;
    };

    const Token& peek(size_t ahead = 0) const {
        const size_t idx = std::min(k_ + ahead, tokens_.size() - 1);
        return tokens_[idx];
    }

    Token take() {
        Token t = peek();
        if (k_ < tokens_.size() - 1) ++k_;
        return t;
    }

    bool isOp(const std::string& text, size_t ahead = 0) const {
        const Token& t = peek(ahead);
        return t.type == TokenType::Op && t.text == text;
    }

    bool isWord(const std::string& text, size_t ahead = 0) const {
        const Token& t = peek(ahead);
        return t.type == TokenType::Name && t.text == text;
    }

    [[noreturn]] void unexpected(const Token& t) const {
        if (t.type == TokenType::End) syntaxError("unexpected end of expression", t.pos);
        syntaxError("unexpected '" + t.text + "'", t.pos);
    }

    // Constructs that may only follow a complete expression.
    void trailingAfterExpression() const {
        if (isWord("if")) disallowed("conditional expression");
        if (isWord("for") || isWord("async")) disallowed("comprehension");
        if (isOp(",")) disallowed("tuple display");
        if (isOp(":=")) disallowed("assignment expression");
        if (isOp("=")) disallowed("assignment");
    }

    std::unique_ptr<RuleNode> orExpr() {
        Nesting guard(depth_);
        std::unique_ptr<RuleNode> left = andExpr();
        if (!isWord("or")) return left;
        auto node = std::make_unique<RuleNode>();
        node->kind = RuleNode::Kind::Or;
        attach(*node, std::move(left));
        while (isWord("or")) {
            take();
            attach(*node, andExpr());
        }
        return node;
    }

    std::unique_ptr<RuleNode> andExpr() {
        std::unique_ptr<RuleNode> left = notExpr();
        if (!isWord("and")) return left;
        auto node = std::make_unique<RuleNode>();
        node->kind = RuleNode::Kind::And;
        attach(*node, std::move(left));
        while (isWord("and")) {
            take();
            attach(*node, notExpr());
        }
        return node;
    }

    std::unique_ptr<RuleNode> notExpr() {
        if (isWord("not")) {
            Nesting guard(depth_);
            take();
            auto node = std::make_unique<RuleNode>();
            node->kind = RuleNode::Kind::Not;
            attach(*node, notExpr());
            return node;
        }
        return comparison();
    }

    bool atCompareOp() const {
        static const char* kOps[] = {"==", "!=", "<", "<=", ">", ">="};
        for (const char* op : kOps) {
            if (isOp(op)) return true;
        }
        return false;
    }

    std::unique_ptr<RuleNode> comparison() {
        std::unique_ptr<RuleNode> left = arith();
        auto checkMembership = [this]() {
            if (isWord("in") || (isWord("not") && isWord("in", 1))) disallowed("membership test");
            if (isWord("is")) disallowed("identity test");
        };
        checkMembership();
        if (!atCompareOp()) return left;

        auto node = std::make_unique<RuleNode>();
        node->kind = RuleNode::Kind::Compare;
        attach(*node, std::move(left));
        while (atCompareOp()) {
            node->compareOps.push_back(take().text);
            attach(*node, arith());
            checkMembership();
        }
        return node;
    }

    void rejectBitwise() const {
        if (isOp("&") || isOp("|") || isOp("^") || isOp("<<") || isOp(">>")) disallowed("bitwise operator");
    }

    std::unique_ptr<RuleNode> arith() {
        rejectBitwise();
        std::unique_ptr<RuleNode> left = term();
        rejectBitwise();
        while (isOp("+") || isOp("-")) {
            auto node = std::make_unique<RuleNode>();
            node->kind = RuleNode::Kind::Arith;
            node->text = take().text;
            attach(*node, std::move(left));
            attach(*node, term());
            left = std::move(node);
            rejectBitwise();
        }
        return left;
    }

    std::unique_ptr<RuleNode> term() {
        std::unique_ptr<RuleNode> left = factor();
        while (true) {
            if (isOp("//")) disallowed("floor division");
            if (isOp("@")) disallowed("matrix multiplication");
            if (!(isOp("*") || isOp("/") || isOp("%"))) break;
            auto node = std::make_unique<RuleNode>();
            node->kind = RuleNode::Kind::Arith;
            node->text = take().text;
            attach(*node, std::move(left));
            attach(*node, factor());
            left = std::move(node);
        }
        return left;
    }

    std::unique_ptr<RuleNode> factor() {
        if (isOp("+")) disallowed("unary plus");
        if (isOp("~")) disallowed("bitwise operator");
        if (isOp("-")) {
            Nesting guard(depth_);
            take();
            auto node = std::make_unique<RuleNode>();
            node->kind = RuleNode::Kind::Negate;
            attach(*node, factor());
            return node;
        }
        std::unique_ptr<RuleNode> node = atom();
        if (isOp("**")) disallowed("power");
        if (isOp("(")) disallowed("call");
        if (isOp(".")) disallowed("attribute access");
        if (isOp("[")) disallowed("subscript");
        return node;
    }

    std::unique_ptr<RuleNode> atom() {
        const Token t = take();
        auto node = std::make_unique<RuleNode>();
        switch (t.type) {
            case TokenType::Number:
                node->kind = RuleNode::Kind::Number;
                node->number = t.number;
                return node;
            case TokenType::String:
                node->kind = RuleNode::Kind::String;
                node->text = t.text;
                // Adjacent literals concatenate.
                while (peek().type == TokenType::String) node->text += take().text;
                return node;
            case TokenType::Name:
                if (t.text == "True" || t.text == "False") {
                    node->kind = RuleNode::Kind::Bool;
                    node->flag = (t.text == "True");
                    return node;
                }
                if (t.text == "None") disallowed("None constant");
                if (t.text == "lambda") disallowed("lambda");
                if (t.text == "await") disallowed("await");
                if (t.text == "yield") disallowed("yield");
                if (kReservedWords.count(t.text)) unexpected(t);
                node->kind = RuleNode::Kind::Name;
                node->text = t.text;
                return node;
            case TokenType::Op:
                if (t.text == "(") {
                    if (isOp(")")) disallowed("tuple display");
                    std::unique_ptr<RuleNode> inner = orExpr();
                    trailingAfterExpression();
                    if (!isOp(")")) unexpected(peek());
                    take();
                    return inner;
                }
                if (t.text == "[") disallowed("list display");
                if (t.text == "{") disallowed("dict or set display");
                if (t.text == "*") disallowed("starred expression");
                unexpected(t);
            case TokenType::End:
                break;
        }
        unexpected(t);
    }
};

void collectNames(const RuleNode& node, std::set<std::string>& out) {
    if (node.kind == RuleNode::Kind::Name) out.insert(node.text);
    for (const auto& child : node.children) collectNames(*child, out);
}

const char* typeName(const RuleValue& v) {
    if (std::holds_alternative<double>(v)) return "number";
    if (std::holds_alternative<bool>(v)) return "bool";
    return "str";
}

bool isNumeric(const RuleValue& v) {
    return !std::holds_alternative<std::string>(v);
}

double asNumber(const RuleValue& v) {
    if (const double* d = std::get_if<double>(&v)) return *d;
    return std::get<bool>(v) ? 1.0 : 0.0;
}

bool truthy(const RuleValue& v) {
    if (const double* d = std::get_if<double>(&v)) return *d != 0.0;
    if (const bool* b = std::get_if<bool>(&v)) return *b;
    return !std::get<std::string>(v).empty();
}

[[noreturn]] void operandError(const std::string& op, const RuleValue& a, const RuleValue& b) {
    throw EvaluationException("unsupported operand types for " + op + ": '" + typeName(a) + "' and '" +
                              typeName(b) + "'");
}

std::string repeatString(const std::string& s, double times) {
    std::string out;
    if (times <= 0.0 || s.empty()) return out;
    if (times > static_cast<double>(kMaxRepeatLength / s.size())) {
        throw EvaluationException("string repetition too large");
    }
    const size_t n = static_cast<size_t>(times);
    out.reserve(s.size() * n);
    for (size_t i = 0; i < n; ++i) out += s;
    return out;
}

RuleValue applyArith(const std::string& op, const RuleValue& a, const RuleValue& b) {
    if (isNumeric(a) && isNumeric(b)) {
        const double x = asNumber(a);
        const double y = asNumber(b);
        if (op == "+") return x + y;
        if (op == "-") return x - y;
        if (op == "*") return x * y;
        if (op == "/") {
            if (y == 0.0) throw EvaluationException("division by zero");
            return x / y;
        }
        if (y == 0.0) throw EvaluationException("modulo by zero");
        // Result takes the sign of the divisor.
        double r = std::fmod(x, y);
        if (r != 0.0 && ((r < 0.0) != (y < 0.0))) r += y;
        if (r == 0.0) r = std::copysign(0.0, y);
        return r;
    }

    const auto* sa = std::get_if<std::string>(&a);
    const auto* sb = std::get_if<std::string>(&b);
    if (op == "+" && sa && sb) return *sa + *sb;
    if (op == "*") {
        if (sa && isNumeric(b) && std::floor(asNumber(b)) == asNumber(b)) return repeatString(*sa, asNumber(b));
        if (sb && isNumeric(a) && std::floor(asNumber(a)) == asNumber(a)) return repeatString(*sb, asNumber(a));
    }
    operandError(op, a, b);
}

bool applyCompare(const std::string& op, const RuleValue& a, const RuleValue& b) {
    if (isNumeric(a) && isNumeric(b)) {
        const double x = asNumber(a);
        const double y = asNumber(b);
        if (op == "==") return x == y;
        if (op == "!=") return x != y;
        if (op == "<") return x < y;
        if (op == "<=") return x <= y;
        if (op == ">") return x > y;
        return x >= y;
    }
    const auto* sa = std::get_if<std::string>(&a);
    const auto* sb = std::get_if<std::string>(&b);
    if (sa && sb) {
        if (op == "==") return *sa == *sb;
        if (op == "!=") return *sa != *sb;
        if (op == "<") return *sa < *sb;
        if (op == "<=") return *sa <= *sb;
        if (op == ">") return *sa > *sb;
        return *sa >= *sb;
    }
    if (op == "==") return false;
    if (op == "!=") return true;
    throw EvaluationException("'" + op + "' not supported between '" + typeName(a) + "' and '" + typeName(b) + "'");
}

RuleValue evalNode(const RuleNode& node, const RuleEnvironment& env) {
    switch (node.kind) {
        case RuleNode::Kind::Number:
            return node.number;
        case RuleNode::Kind::String:
            return node.text;
        case RuleNode::Kind::Bool:
            return node.flag;
        case RuleNode::Kind::Name: {
            const auto it = env.find(node.text);
            if (it == env.end()) throw EvaluationException("unknown variable: " + node.text);
            return it->second;
        }
        case RuleNode::Kind::Negate: {
            const RuleValue v = evalNode(*node.children[0], env);
            if (!isNumeric(v)) throw EvaluationException("bad operand type for unary -: 'str'");
            return -asNumber(v);
        }
        case RuleNode::Kind::Not:
            return !truthy(evalNode(*node.children[0], env));
        case RuleNode::Kind::Arith:
            return applyArith(node.text, evalNode(*node.children[0], env), evalNode(*node.children[1], env));
        case RuleNode::Kind::And: {
            RuleValue v;
            for (const auto& child : node.children) {
                v = evalNode(*child, env);
                if (!truthy(v)) return v;
            }
            return v;
        }
        case RuleNode::Kind::Or: {
            RuleValue v;
            for (const auto& child : node.children) {
                v = evalNode(*child, env);
                if (truthy(v)) return v;
            }
            return v;
        }
        case RuleNode::Kind::Compare: {
            RuleValue left = evalNode(*node.children[0], env);
            for (size_t i = 0; i < node.compareOps.size(); ++i) {
                RuleValue right = evalNode(*node.children[i + 1], env);
                if (!applyCompare(node.compareOps[i], left, right)) return false;
                left = std::move(right);
            }
            return true;
        }
    }
    throw EvaluationException("unsupported expression node");
}
} // namespace

RuleExpression RuleExpression::compile(const std::string& text) {
    Tokenizer tokenizer(text);
    Parser parser(tokenizer.run());

    RuleExpression expr;
    std::unique_ptr<RuleNode> root = parser.parseExpression();
    collectNames(*root, expr.names_);
    expr.root_ = std::shared_ptr<const RuleNode>(std::move(root));
    return expr;
}

bool RuleExpression::evaluate(const RuleEnvironment& env) const {
    for (const std::string& name : names_) {
        if (env.find(name) == env.end()) throw EvaluationException("unknown variable: " + name);
    }
    return truthy(evalNode(*root_, env));
}

std::vector<Rule> RuleEngine::parseRules(const std::string& text) {
    std::vector<Rule> rules;
    std::map<std::string, size_t> position;

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        const std::string s = CommonUtils::trim(line);
        if (s.empty() || s[0] == '#') continue;
        const size_t colon = s.find(':');
        if (colon == std::string::npos) continue;

        const std::string name = CommonUtils::trim(s.substr(0, colon));
        const std::string expr = CommonUtils::trim(s.substr(colon + 1));
        if (name.empty() || expr.empty()) continue;

        const auto it = position.find(name);
        if (it != position.end()) {
            rules[it->second].expression = expr;
        } else {
            position[name] = rules.size();
            rules.push_back({name, expr});
        }
    }
    return rules;
}

std::vector<Rule> RuleEngine::loadRules(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return {};

    std::ifstream in(path);
    if (!in) throw FluxGuard::IOException("Could not open rules file: " + path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) throw FluxGuard::IOException("Failed while reading rules file: " + path);
    return parseRules(buffer.str());
}

bool RuleEngine::evaluate(const std::string& expression, const RuleEnvironment& env) {
    return RuleExpression::compile(expression).evaluate(env);
}

std::vector<RuleViolation> RuleEngine::evaluateRules(const std::vector<Rule>& rules, const RuleEnvironment& env) {
    std::vector<RuleViolation> violations;
    for (const Rule& rule : rules) {
        RuleViolation v;
        v.rule = rule.name;
        v.expression = rule.expression;
        try {
            if (evaluate(rule.expression, env)) continue;
            v.result = false;
        } catch (const std::exception& e) {
            v.error = e.what();
        }
        violations.push_back(std::move(v));
    }
    return violations;
}

RuleEnvironment RuleEngine::environmentFromStatistics(size_t count,
                                                      double missingRate,
                                                      const std::map<std::string, double>& stats) {
    RuleEnvironment env;
    env["count"] = static_cast<double>(count);
    env["missing_rate"] = missingRate;
    for (const auto& [key, value] : stats) env[key] = value;
    return env;
}

RuleEnvironment RuleEngine::environmentFromFingerprint(const Fingerprint& fp) {
    std::map<std::string, double> stats;
    for (const auto& [name, col] : fp.columns) {
        stats["mean_" + name] = col.mean;
        stats["std_" + name] = col.stddev;
        stats["min_" + name] = col.min;
        stats["max_" + name] = col.max;
        stats["median_" + name] = col.median;
        stats["q05_" + name] = col.q05;
        stats["q95_" + name] = col.q95;
        stats["mad_" + name] = col.mad;
    }
    return environmentFromStatistics(fp.rows, fp.missingRate, stats);
}
