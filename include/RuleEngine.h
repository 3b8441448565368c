#pragma once

#include "Fingerprint.h"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

using RuleValue = std::variant<double, bool, std::string>;
using RuleEnvironment = std::map<std::string, RuleValue>;

struct Rule {
    std::string name;
    std::string expression;
};

// Exactly one of error / result is set.
struct RuleViolation {
    std::string rule;
    std::string expression;
    std::optional<std::string> error;
    std::optional<bool> result;
};

struct RuleNode;

/**
 * @brief A parsed rule expression.
 * @details Accepted forms: and, or, not, chained comparisons (== != < <= > >=), + - * / %,
 *          unary minus, numeric and string literals, True/False, bare names, parentheses.
 *          Every other construct is rejected by compile() before anything is evaluated.
 */
class RuleExpression {
public:
    /**
     * @throws FluxGuard::EvaluationException naming the first disallowed construct, or on a syntax error.
     */
    static RuleExpression compile(const std::string& text);

    // Names referenced by the expression, in ascending order.
    const std::set<std::string>& names() const noexcept { return names_; }

    /**
     * @brief Evaluates against env and coerces the result to bool.
     * @throws FluxGuard::EvaluationException for an unknown name (checked before evaluation),
     *         division or modulo by zero, or incompatible operand types.
     */
    bool evaluate(const RuleEnvironment& env) const;

private:
    std::shared_ptr<const RuleNode> root_;
    std::set<std::string> names_;
};

class RuleEngine {
public:
    /**
     * @brief Parses "name: expression" lines.
     * @details Blank lines, '#' comments and lines without ':' are skipped. A repeated name keeps
     *          its first position and takes the later expression.
     */
    static std::vector<Rule> parseRules(const std::string& text);

    /**
     * @brief Reads and parses a rules file. A path that does not exist yields no rules.
     * @throws FluxGuard::IOException when an existing file cannot be read.
     */
    static std::vector<Rule> loadRules(const std::string& path);

    static bool evaluate(const std::string& expression, const RuleEnvironment& env);

    // Every failing or erroring rule, in rule order. Evaluation continues past errors.
    static std::vector<RuleViolation> evaluateRules(const std::vector<Rule>& rules, const RuleEnvironment& env);

    // {count, missing_rate} plus every "<stat>_<column>" entry of stats.
    static RuleEnvironment environmentFromStatistics(size_t count,
                                                     double missingRate,
                                                     const std::map<std::string, double>& stats);

    // count = rows, missing_rate, and mean_/std_/min_/max_/median_/q05_/q95_/mad_<column>.
    static RuleEnvironment environmentFromFingerprint(const Fingerprint& fp);
};
