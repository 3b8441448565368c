#include "FluxGuardExceptions.h"
#include "RuleEngine.h"
#include "TestHarness.h"

#include <string>
#include <utility>
#include <vector>

namespace {
std::string compileError(const std::string& expr) {
    try {
        RuleExpression::compile(expr);
    } catch (const FluxGuard::EvaluationException& e) {
        return e.what();
    }
    return "";
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

void testDisallowedConstructs() {
    const std::vector<std::pair<std::string, std::string>> cases = {
        {"abs(x)", "call"},
        {"x.real", "attribute access"},
        {"x[0]", "subscript"},
        {"2 ** 3", "power"},
        {"7 // 2", "floor division"},
        {"+x", "unary plus"},
        {"1 & 2", "bitwise operator"},
        {"~1", "bitwise operator"},
        {"[1, 2]", "list display"},
        {"{1: 2}", "dict or set display"},
        {"(1, 2)", "tuple display"},
        {"1 if x else 2", "conditional expression"},
        {"lambda: 1", "lambda"},
        {"x in y", "membership test"},
        {"x not in y", "membership test"},
        {"x is y", "identity test"},
        {"x == None", "None constant"},
        {"f'{x}'", "f-string"},
    };
    for (const auto& [expr, construct] : cases) {
        const std::string err = compileError(expr);
        if (!contains(err, "disallowed construct: " + construct)) {
            TestHarness::fail(__FILE__, __LINE__, "'" + expr + "' gave '" + err + "'");
        }
    }
}

void testSyntaxErrors() {
    CHECK(contains(compileError("1 +"), "syntax error"));
    CHECK(contains(compileError("(1 < 2"), "syntax error"));
    CHECK(contains(compileError("x $ y"), "syntax error"));
    CHECK(contains(compileError(""), "syntax error"));
}

void testArithmeticAndComparison() {
    RuleEnvironment env;
    env["x"] = 5.0;
    env["name"] = std::string("sensor");
    env["ok"] = true;

    CHECK(RuleEngine::evaluate("x > 3 and x < 10", env));
    CHECK(RuleEngine::evaluate("1 < x < 10", env));
    CHECK(!RuleEngine::evaluate("1 < x < 4", env));
    CHECK(RuleEngine::evaluate("3 < x > 4", env));
    CHECK(RuleEngine::evaluate("x * 2 - 1 == 9", env));
    CHECK(RuleEngine::evaluate("x / 2 == 2.5", env));
    CHECK(RuleEngine::evaluate("-x == -5", env));
    CHECK(RuleEngine::evaluate("not x == 4", env));
    CHECK(RuleEngine::evaluate("ok == True", env));
    CHECK(RuleEngine::evaluate("True + 1 == 2", env));
    CHECK(RuleEngine::evaluate("1e-3 < 0.01", env));
}

void testModuloFollowsDivisorSign() {
    const RuleEnvironment env;
    CHECK(RuleEngine::evaluate("7 % 3 == 1", env));
    CHECK(RuleEngine::evaluate("-7 % 3 == 2", env));
    CHECK(RuleEngine::evaluate("7 % -3 == -2", env));
}

void testStringsAndShortCircuit() {
    RuleEnvironment env;
    env["name"] = std::string("sensor");
    env["zero"] = 0.0;

    CHECK(RuleEngine::evaluate("name == 'sensor'", env));
    CHECK(RuleEngine::evaluate("name + '_1' == \"sensor_1\"", env));
    CHECK(RuleEngine::evaluate("'ab' * 2 == 'abab'", env));
    CHECK(RuleEngine::evaluate("'a' < 'b'", env));
    CHECK(RuleEngine::evaluate("name != 3", env));
    CHECK(RuleEngine::evaluate("zero or 5", env));
    CHECK(!RuleEngine::evaluate("zero and 1 / zero", env));
    CHECK(!RuleEngine::evaluate("''", env));
}

void testEvaluationErrors() {
    RuleEnvironment env;
    env["x"] = 1.0;
    env["s"] = std::string("text");

    CHECK_THROWS(RuleEngine::evaluate("y > 0", env), FluxGuard::EvaluationException);
    // Unknown names are rejected even on a branch that would never run.
    CHECK_THROWS(RuleEngine::evaluate("False and y > 0", env), FluxGuard::EvaluationException);
    CHECK_THROWS(RuleEngine::evaluate("x / 0 > 1", env), FluxGuard::EvaluationException);
    CHECK_THROWS(RuleEngine::evaluate("x % 0 > 1", env), FluxGuard::EvaluationException);
    CHECK_THROWS(RuleEngine::evaluate("s < 1", env), FluxGuard::EvaluationException);
    CHECK_THROWS(RuleEngine::evaluate("s - 1", env), FluxGuard::EvaluationException);

    try {
        RuleEngine::evaluate("missing_col > 0", env);
    } catch (const FluxGuard::EvaluationException& e) {
        CHECK(contains(e.what(), "unknown variable: missing_col"));
    }
}

void testExpressionNames() {
    const RuleExpression expr = RuleExpression::compile("mean_a > 0 and (std_b < 1 or mean_a < count)");
    CHECK(expr.names().size() == 3);
    CHECK(expr.names().count("mean_a") == 1);
    CHECK(expr.names().count("count") == 1);
}

void testParseRules() {
    const std::string text =
        "# comment line\n"
        "\n"
        "positive: mean_x > 0\n"
        "no colon here\n"
        "bounded: max_x < 100\n"
        "positive: mean_x >= 1\n";
    const std::vector<Rule> rules = RuleEngine::parseRules(text);
    CHECK(rules.size() == 2);
    if (rules.size() == 2) {
        CHECK(rules[0].name == "positive");
        CHECK(rules[0].expression == "mean_x >= 1");
        CHECK(rules[1].name == "bounded");
    }
}

void testLoadRules(const TestHarness::TempDir& dir) {
    CHECK(RuleEngine::loadRules(dir.file("none.txt")).empty());
    TestHarness::writeText(dir.file("rules.txt"), "r1: count > 1\n");
    CHECK(RuleEngine::loadRules(dir.file("rules.txt")).size() == 1);
}

void testEvaluateRulesCollectsFailuresAndErrors() {
    Fingerprint fp;
    fp.rows = 10;
    fp.missingRate = 0.0;
    ColumnFingerprint col;
    col.count = 10;
    col.mean = 2.0;
    col.q95 = 9.0;
    fp.columns["v"] = col;

    const RuleEnvironment env = RuleEngine::environmentFromFingerprint(fp);
    CHECK(env.count("q95_v") == 1);
    CHECK(env.count("count") == 1);

    const std::vector<Rule> rules = {
        {"passes", "mean_v > 1"},
        {"fails", "mean_v > 5"},
        {"errors", "mean_w > 0"},
        {"blocked", "len(v) > 0"},
    };
    const std::vector<RuleViolation> violations = RuleEngine::evaluateRules(rules, env);
    CHECK(violations.size() == 3);
    if (violations.size() == 3) {
        CHECK(violations[0].rule == "fails");
        CHECK(violations[0].result.has_value() && !*violations[0].result);
        CHECK(!violations[0].error.has_value());
        CHECK(violations[1].rule == "errors");
        CHECK(violations[1].error.has_value());
        CHECK(!violations[1].result.has_value());
        CHECK(violations[2].error.has_value() && contains(*violations[2].error, "disallowed construct"));
    }
}

void testRepetitionIsBounded() {
    RuleEnvironment env;
    env["count"] = 10.0;
    CHECK(RuleEngine::evaluate("'' * 1e300 == ''", env));
    CHECK(RuleEngine::evaluate("3 * 'xy' == 'xyxyxy'", env));
    try {
        RuleEngine::evaluate("'ab' * 1e12 == ''", env);
        CHECK(false);
    } catch (const FluxGuard::EvaluationException& e) {
        CHECK(contains(e.what(), "string repetition too large"));
    }
    CHECK_THROWS(RuleEngine::evaluate("'ab' * 1e300 == ''", env), FluxGuard::EvaluationException);

    const std::vector<Rule> rules = {{"huge", "'ab' * 1e12 == ''"}, {"after", "count > 100"}};
    const std::vector<RuleViolation> violations = RuleEngine::evaluateRules(rules, env);
    CHECK(violations.size() == 2);
    if (violations.size() == 2) {
        CHECK(violations[0].error.has_value() && contains(*violations[0].error, "too large"));
        CHECK(violations[1].rule == "after");
        CHECK(violations[1].result.has_value() && !*violations[1].result);
    }
}

void testNestingIsBounded() {
    RuleEnvironment env;
    env["x"] = 2.0;
    CHECK(RuleEngine::evaluate(std::string(50, '(') + "x" + std::string(50, ')') + " == 2", env));
    CHECK(RuleEngine::evaluate("not not not not x == 2", env));
    CHECK(RuleEngine::evaluate("- - - - x == 2", env));

    CHECK(contains(compileError(std::string(200000, '(') + "1" + std::string(200000, ')')), "nested too deeply"));
    std::string nots;
    for (int i = 0; i < 5000; ++i) nots += "not ";
    CHECK(contains(compileError(nots + "x"), "nested too deeply"));
    CHECK(contains(compileError(std::string(5000, '-') + "x"), "nested too deeply"));
    std::string sum = "x";
    for (int i = 0; i < 5000; ++i) sum += " + x";
    CHECK(contains(compileError(sum), "nested too deeply"));

    const std::vector<Rule> rules = {{"deep", std::string(100000, '(') + "1" + std::string(100000, ')')},
                                     {"after", "x > 5"}};
    const std::vector<RuleViolation> violations = RuleEngine::evaluateRules(rules, env);
    CHECK(violations.size() == 2);
    if (violations.size() == 2) {
        CHECK(violations[0].error.has_value());
        CHECK(violations[1].result.has_value() && !*violations[1].result);
    }
}
} // namespace

int main() {
    TestHarness::TempDir dir("rules");
    testDisallowedConstructs();
    testSyntaxErrors();
    testArithmeticAndComparison();
    testModuloFollowsDivisorSign();
    testStringsAndShortCircuit();
    testEvaluationErrors();
    testExpressionNames();
    testParseRules();
    testLoadRules(dir);
    testEvaluateRulesCollectsFailuresAndErrors();
    testRepetitionIsBounded();
    testNestingIsBounded();
    return TestHarness::finish("rule_engine");
}
