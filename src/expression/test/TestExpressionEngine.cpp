#include "ExpressionEngine.hpp"
#include "WorkflowErrors.hpp"
#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

MapExprContext make_context() {
    MapExprContext ctx;
    ctx.set("env", "GREETING", ExprValue("hello"));
    ctx.set("matrix", "os", ExprValue("linux"));
    ctx.set("matrix", "version", ExprValue(18));
    ctx.set("steps", "build.outputs.version", ExprValue("1.2.3"));
    ctx.set("steps", "build.outcome", ExprValue("success"));
    ctx.set("needs", "lint.result", ExprValue("success"));
    ctx.set("needs", "test.result", ExprValue("failure"));
    ctx.set("needs", "lint.outputs.report", ExprValue("clean"));
    return ctx;
}

bool throws_eval_error(const std::string& expression) {
    try {
        ExpressionEngine engine(expression);
        (void)engine;
    } catch (const EvalError&) {
        return true;
    }
    return false;
}

} // namespace

void test_literals() {
    MapExprContext ctx;
    assert(ExpressionEngine("true").evaluate(ctx) == ExprValue(true));
    assert(ExpressionEngine("false").evaluate(ctx) == ExprValue(false));
    assert(ExpressionEngine("null").evaluate(ctx).is_null());
    assert(ExpressionEngine("42").evaluate(ctx) == ExprValue(42));
    assert(ExpressionEngine("-2.5").evaluate(ctx) == ExprValue(-2.5));
    assert(ExpressionEngine("0xff").evaluate(ctx) == ExprValue(255));
    assert(ExpressionEngine("1e3").evaluate(ctx) == ExprValue(1000));
    assert(ExpressionEngine("'it''s'").evaluate(ctx) == ExprValue("it's"));
    std::cout << "test_literals passed.\n";
}

void test_property_access() {
    MapExprContext ctx = make_context();
    assert(ExpressionEngine("env.GREETING").evaluate(ctx) == ExprValue("hello"));
    assert(ExpressionEngine("steps.build.outputs.version").evaluate(ctx) == ExprValue("1.2.3"));
    assert(ExpressionEngine("steps.build.outputs['version']").evaluate(ctx) == ExprValue("1.2.3"));
    assert(ExpressionEngine("needs['lint'].outputs.report").evaluate(ctx) == ExprValue("clean"));

    // Undefined references resolve to an empty string
    assert(ExpressionEngine("env.MISSING").evaluate(ctx) == ExprValue(""));
    assert(ExpressionEngine("secrets.token").evaluate(ctx) == ExprValue(""));
    std::cout << "test_property_access passed.\n";
}

void test_operators() {
    MapExprContext ctx = make_context();
    assert(ExpressionEngine("matrix.os == 'Linux'").evaluate(ctx) == ExprValue(true));
    assert(ExpressionEngine("matrix.os != 'linux'").evaluate(ctx) == ExprValue(false));
    assert(ExpressionEngine("matrix.version == '18'").evaluate(ctx) == ExprValue(true));
    assert(ExpressionEngine("matrix.version >= 16").evaluate(ctx) == ExprValue(true));
    assert(ExpressionEngine("matrix.version < 16").evaluate(ctx) == ExprValue(false));
    assert(ExpressionEngine("'abc' < 'ABD'").evaluate(ctx) == ExprValue(true));
    assert(ExpressionEngine("1 < 'a'").evaluate(ctx) == ExprValue(false));
    assert(ExpressionEngine("true == 1").evaluate(ctx) == ExprValue(false));
    assert(ExpressionEngine("!env.MISSING").evaluate(ctx) == ExprValue(true));
    assert(ExpressionEngine("!(1 == 1)").evaluate(ctx) == ExprValue(false));

    // && and || yield one of their operands
    assert(ExpressionEngine("env.GREETING && 'x'").evaluate(ctx) == ExprValue("x"));
    assert(ExpressionEngine("env.MISSING || 'fallback'").evaluate(ctx) == ExprValue("fallback"));
    assert(ExpressionEngine("'' && 'never'").evaluate(ctx) == ExprValue(""));

    // Precedence: == binds tighter than &&, && tighter than ||
    assert(ExpressionEngine("false && false || true").evaluate(ctx) == ExprValue(true));
    assert(ExpressionEngine("1 == 1 && 2 == 3").evaluate(ctx) == ExprValue(false));
    std::cout << "test_operators passed.\n";
}

void test_functions() {
    MapExprContext ctx = make_context();
    assert(ExpressionEngine("contains('Hello World', 'world')").evaluate(ctx) == ExprValue(true));
    assert(ExpressionEngine("contains(needs.*.result, 'failure')").evaluate(ctx) == ExprValue(true));
    assert(ExpressionEngine("contains(needs.*.result, 'cancelled')").evaluate(ctx) == ExprValue(false));
    assert(ExpressionEngine("startsWith(env.GREETING, 'HE')").evaluate(ctx) == ExprValue(true));
    assert(ExpressionEngine("endswith(env.GREETING, 'lo')").evaluate(ctx) == ExprValue(true));
    assert(ExpressionEngine("join(needs.*.result, '+')").evaluate(ctx) == ExprValue("success+failure"));
    assert(ExpressionEngine("join('single')").evaluate(ctx) == ExprValue("single"));
    assert(ExpressionEngine("format('{0}-{1} {{x}}', matrix.os, matrix.version)").evaluate(ctx) ==
           ExprValue("linux-18 {x}"));
    assert(ExpressionEngine("always()").evaluate(ctx) == ExprValue(true));

    bool threw = false;
    try {
        ExpressionEngine("nosuch(1)").evaluate(ctx);
    } catch (const EvalError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        ExpressionEngine("contains('a')").evaluate(ctx);
    } catch (const EvalError&) {
        threw = true;
    }
    assert(threw);
    (void)threw;
    std::cout << "test_functions passed.\n";
}

void test_status_functions() {
    MapExprContext ctx = make_context();
    ctx.set_status(false, true, false);
    assert(ExpressionEngine("success()").evaluate(ctx) == ExprValue(false));
    assert(ExpressionEngine("failure()").evaluate(ctx) == ExprValue(true));
    assert(ExpressionEngine("cancelled()").evaluate(ctx) == ExprValue(false));

    assert(ExpressionEngine("failure() && env.GREETING == 'hello'").uses_status_function());
    assert(!ExpressionEngine("env.GREETING == 'hello'").uses_status_function());
    std::cout << "test_status_functions passed.\n";
}

void test_syntax_errors() {
    assert(throws_eval_error(""));
    assert(throws_eval_error("1 +"));
    assert(throws_eval_error("a = b"));
    assert(throws_eval_error("'unterminated"));
    assert(throws_eval_error("(1 == 1"));
    assert(throws_eval_error("env."));
    assert(throws_eval_error("1 2"));
    std::cout << "test_syntax_errors passed.\n";
}

void test_interpolate() {
    MapExprContext ctx = make_context();
    assert(ExpressionEngine::interpolate("plain text", ctx) == "plain text");
    assert(ExpressionEngine::interpolate("${{ env.GREETING }} world", ctx) == "hello world");
    assert(ExpressionEngine::interpolate("v${{ steps.build.outputs.version }}-${{ matrix.os }}", ctx) ==
           "v1.2.3-linux");
    assert(ExpressionEngine::interpolate("${{ 'a}}b' }}", ctx) == "a}}b");
    assert(ExpressionEngine::interpolate("n=${{ matrix.version }}", ctx) == "n=18");

    bool threw = false;
    try {
        ExpressionEngine::interpolate("${{ env.GREETING", ctx);
    } catch (const EvalError&) {
        threw = true;
    }
    assert(threw);
    (void)threw;

    assert(ExpressionEngine::contains_expression("x ${{ y }}"));
    assert(!ExpressionEngine::contains_expression("x { y }"));
    std::cout << "test_interpolate passed.\n";
}

void test_evaluate_condition() {
    MapExprContext ctx = make_context();
    assert(ExpressionEngine::evaluate_condition("", ctx));
    assert(ExpressionEngine::evaluate_condition("matrix.os == 'linux'", ctx));
    assert(ExpressionEngine::evaluate_condition("${{ matrix.os == 'linux' }}", ctx));
    assert(!ExpressionEngine::evaluate_condition("${{ matrix.os == 'windows' }}", ctx));

    // A failed upstream suppresses conditions that do not name a status function
    ctx.set_status(false, true, false);
    assert(!ExpressionEngine::evaluate_condition("", ctx));
    assert(!ExpressionEngine::evaluate_condition("matrix.os == 'linux'", ctx));
    assert(ExpressionEngine::evaluate_condition("always()", ctx));
    assert(ExpressionEngine::evaluate_condition("failure() && matrix.os == 'linux'", ctx));
    assert(!ExpressionEngine::evaluate_condition("success()", ctx));
    std::cout << "test_evaluate_condition passed.\n";
}

// Evaluation reads the context and never writes it
void test_repeated_evaluation() {
    MapExprContext ctx = make_context();
    const std::vector<std::string> expressions = {
        "needs.lint.outputs.report",
        "join(needs.*.result, ',')",
        "steps.build.outputs.version",
        "format('{0}/{1}', matrix.os, steps.build.outcome)",
        "contains(needs.*.result, 'failure') && env.MISSING || 'none'",
    };

    for (const auto& expression : expressions) {
        ExpressionEngine engine(expression);
        ExprValue first = engine.evaluate(ctx);
        ExprValue second = engine.evaluate(ctx);
        assert(first == second);
        assert(ExpressionEngine(expression).evaluate(ctx) == first);
    }
    assert(ExpressionEngine::interpolate("v${{ steps.build.outputs.version }}", ctx) ==
           ExpressionEngine::interpolate("v${{ steps.build.outputs.version }}", ctx));

    // Reading an undefined name does not define it
    assert(!ctx.lookup({"env", "MISSING"}).has_value());
    assert(ctx.lookup({"needs", "lint", "outputs", "report"}) == std::optional<ExprValue>(ExprValue("clean")));
    assert(ctx.lookup_collection({"needs", "*", "result"})->size() == 2);
    assert(ctx.status_success());
    std::cout << "test_repeated_evaluation passed.\n";
}

void test_referenced_names() {
    auto names = ExpressionEngine::referenced_names(
        "${{ secrets.TOKEN }} and ${{ secrets['API_KEY'] }} but not ${{ env.OTHER }}", "secrets");
    assert(names.size() == 2);
    assert(names.count("TOKEN") == 1);
    assert(names.count("API_KEY") == 1);
    assert(ExpressionEngine::referenced_names("no expressions", "secrets").empty());
    (void)names;
    std::cout << "test_referenced_names passed.\n";
}

int main() {
    test_literals();
    test_property_access();
    test_operators();
    test_functions();
    test_status_functions();
    test_syntax_errors();
    test_interpolate();
    test_evaluate_condition();
    test_repeated_evaluation();
    test_referenced_names();
    std::cout << "All ExpressionEngine tests passed.\n";
    return 0;
}
