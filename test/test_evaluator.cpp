#include <catch2/catch.hpp>

#include <nebula/template.hpp>
#include <nebula/exceptions.hpp>

#include "test_util.hpp"

using namespace nebula ;

static Context make_context() {
    Context ctx ;
    ctx.setInput(Value::Object{
                     { "name", "Alice" },
                     { "n", 5 },
                     { "ratio", 0.5 },
                     { "list", Value::Array{ "a", "b", "c" } },
                     { "empty", "" },
                     { "flag", true }
                 }) ;
    ctx.addNodeOutput("fetch", Value::Object{ { "status", 200 } }) ;
    ctx.setEnv("MODE", "test") ;
    return ctx ;
}

static Value eval(const std::string &expr, const Context &ctx = make_context()) {
    Template t = Template::parse("{{ " + expr + " }}") ;
    return t.expressions()[0].evaluate(ctx, t.registry()) ;
}

TEST_CASE("evaluating literals and data access", "[evaluator]")
{
    REQUIRE(eval("'text'") == Value("text"));
    REQUIRE(eval("$input.name") == Value("Alice"));
    REQUIRE(eval("$input.list.1") == Value("b"));
    REQUIRE(eval("$node('fetch').status") == Value(200));
    REQUIRE(eval("$env.MODE") == Value("test"));
    REQUIRE(eval("$system.datetime").isObject());
    REQUIRE_THROWS_AS(eval("$input.missing"), DataNotFound);
}

TEST_CASE("arithmetic", "[evaluator]")
{
    SECTION("integer operands give floats")
    {
        REQUIRE(eval("1 + 2") == Value(3.0));
        REQUIRE(eval("1 + 2").isFloat());
        REQUIRE(eval("5 - 7") == Value(-2.0));
        REQUIRE(eval("3 * 4") == Value(12.0));
        REQUIRE(eval("$input.n * 2 + 1") == Value(11.0));
        REQUIRE(eval("(1 + 2) == 3.0") == Value(true));
        REQUIRE(eval("(1 + 2) == 3") == Value(false));
    }
    SECTION("mixed operands give floats")
    {
        REQUIRE(eval("1 + 2.5") == Value(3.5));
        REQUIRE(eval("$input.ratio * 4") == Value(2.0));
        REQUIRE(eval("true + 1") == Value("true1"));
        REQUIRE(eval("'3' - 1") == Value(2.0));
    }
    SECTION("division always gives a float")
    {
        REQUIRE(eval("7 / 2") == Value(3.5));
        REQUIRE(eval("4 / 2") == Value(2.0));

        MathError e = expect_throw<MathError>([]{ eval("1 / 0"); });
        REQUIRE(e.message() == "Division by zero");
        REQUIRE_THROWS_AS(eval("1 / 0.0"), MathError);
    }
    SECTION("large integers do not overflow")
    {
        Value sum = eval("9223372036854775807 + 1");
        REQUIRE(sum.isFloat());
        REQUIRE(sum == Value(9223372036854775808.0));
        REQUIRE(eval("4611686018427387904 * 4") == Value(18446744073709551616.0));
        REQUIRE(eval("-9223372036854775807 - 2").isFloat());
    }
    SECTION("string concatenation")
    {
        REQUIRE(eval("'Hello ' + $input.name") == Value("Hello Alice"));
        REQUIRE(eval("'n=' + $input.n") == Value("n=5"));
        REQUIRE(eval("'x' + null") == Value("xnull"));
        REQUIRE_THROWS_AS(eval("'x' + $input.list"), TypeError);
    }
    SECTION("non numeric operands")
    {
        REQUIRE_THROWS_AS(eval("'abc' * 2"), TypeError);
        REQUIRE_THROWS_AS(eval("null - 1"), TypeError);
    }
    SECTION("negation")
    {
        REQUIRE(eval("-$input.n") == Value(-5.0));
        REQUIRE(eval("-$input.ratio") == Value(-0.5));
        REQUIRE(eval("--5") == Value(5.0));
        REQUIRE(eval("-(5) == -5.0") == Value(true));
    }
}

TEST_CASE("comparison and logic", "[evaluator]")
{
    REQUIRE(eval("1 == 1") == Value(true));
    REQUIRE(eval("1 == 1.0") == Value(false));
    REQUIRE(eval("$input.name != 'Bob'") == Value(true));
    REQUIRE(eval("1 < 2") == Value(true));
    REQUIRE(eval("2.5 < 2") == Value(false));
    REQUIRE(eval("'1' < 2") == Value(true));
    REQUIRE(eval("true && $input.flag") == Value(true));
    REQUIRE(eval("$input.empty || 0") == Value(false));
    REQUIRE(eval("!$input.empty") == Value(true));
    REQUIRE(eval("!$input.list") == Value(false));
}

TEST_CASE("operators without evaluation", "[evaluator]")
{
    EvaluationError e = expect_throw<EvaluationError>([]{ eval("7 % 2"); });
    REQUIRE(e.message() == "Operator Modulo not implemented");
    REQUIRE(e.context() == "(7 % 2)");

    const char *names[] = { "LessEqual", "GreaterThan", "GreaterEqual", "Contains", "StartsWith", "EndsWith" };
    const char *exprs[] = { "1 <= 2", "1 > 2", "1 >= 2", "'ab' contains 'a'", "'ab' startsWith 'a'", "'ab' endsWith 'b'" };

    for( int i = 0 ; i < 6 ; i++ ) {
        EvaluationError err = expect_throw<EvaluationError>([&]{ eval(exprs[i]); });
        REQUIRE(err.message() == std::string("Operator ") + names[i] + " not implemented");
    }
}

TEST_CASE("conditionals", "[evaluator]")
{
    REQUIRE(eval("$input.flag ? 'on' : 'off'") == Value("on"));
    REQUIRE(eval("$input.empty ? 'on' : 'off'") == Value("off"));
    REQUIRE(eval("if($input.n, 'yes', 'no')") == Value("yes"));
    REQUIRE(eval("if(0, 'yes', 'no')") == Value("no"));
    REQUIRE(eval("if(false, 'yes')").isNull());

    SECTION("the branch not taken is not evaluated")
    {
        REQUIRE(eval("true ? 1 : $input.missing") == Value(1));
        REQUIRE(eval("if(false, 1 / 0, 2)") == Value(2));
    }
}

TEST_CASE("function calls and pipelines", "[evaluator]")
{
    REQUIRE(eval("upper($input.name)") == Value("ALICE"));
    REQUIRE(eval("$input.name | upper") == Value("ALICE"));
    REQUIRE(eval("$input.list | join(', ')") == Value("a, b, c"));
    REQUIRE(eval("$input.empty | default('none') | upper") == Value("NONE"));
    REQUIRE(eval("length($input.list) + 1") == Value(4.0));
    REQUIRE(eval("($input.n + 1) | json") == Value("6.0"));

    SECTION("unknown function")
    {
        FunctionError e = expect_throw<FunctionError>([]{ eval("missing(1)"); });
        REQUIRE(e.function() == "missing");
        REQUIRE(e.message() == "Function not found");

        FunctionError stage = expect_throw<FunctionError>([]{ eval("1 | nope"); });
        REQUIRE(stage.function() == "nope");
    }
    SECTION("wrong arguments")
    {
        REQUIRE_THROWS_AS(eval("upper()"), SignatureError);
        REQUIRE_THROWS_AS(eval("'a' | default"), SignatureError);
    }
}

TEST_CASE("evaluation order", "[evaluator]")
{
    std::vector<Value> calls ;

    auto registry = std::make_shared<FunctionRegistry>() ;
    registry->registerFunction("rec", [&calls](const Value::Array &args) -> Value {
        calls.push_back(args.at(0)) ;
        return args.at(0) ;
    });

    Context ctx = make_context() ;

    SECTION("operands and arguments left to right")
    {
        Template t = Template::parseWithFunctions("{{ rec(1) + rec(2) }}{{ rec(rec(3)) }}", registry);
        REQUIRE(t.render(ctx) == "33");
        REQUIRE(calls == std::vector<Value>{ 1, 2, 3, 3 });
    }
    SECTION("logical operators evaluate both sides")
    {
        Template t = Template::parseWithFunctions("{{ false && rec(1) }}{{ true || rec(2) }}", registry);
        REQUIRE(t.render(ctx) == "falsetrue");
        REQUIRE(calls == std::vector<Value>{ 1, 2 });
    }
    SECTION("pipeline stages receive the current value first")
    {
        registry->registerFunction("pair", [](const Value::Array &args) -> Value {
            return Value::Array{ args.at(0), args.at(1) } ;
        });
        Template t = Template::parseWithFunctions("{{ 'x' | pair(rec('y')) | json }}", registry);
        REQUIRE_THROWS_AS(t.render(ctx), FunctionError);

        registry->registerFunction("json", [](const Value::Array &args) -> Value {
            return args.at(0).toJSON() ;
        });
        REQUIRE(t.render(ctx) == "[\"x\",\"y\"]");
    }
}
