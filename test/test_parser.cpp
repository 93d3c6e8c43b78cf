#include <catch2/catch.hpp>

#include <nebula/template.hpp>
#include <nebula/exceptions.hpp>

#include "test_util.hpp"

using namespace nebula ;

static ExpressionPtr parse_expr(const std::string &src) {
    Template t = Template::parse("{{ " + src + " }}") ;
    REQUIRE(t.expressionCount() == 1) ;
    return t.expressions()[0].ast() ;
}

static ParseError parse_error(const std::string &src) {
    return expect_throw<ParseError>([&]{ Template::parse(src); }) ;
}

TEST_CASE("splitting text and expressions", "[parser]")
{
    SECTION("plain text")
    {
        Template t = Template::parse("no expressions here");
        REQUIRE(t.elements().size() == 1);
        REQUIRE(t.elements()[0].isText());
        REQUIRE(t.elements()[0].text() == "no expressions here");
    }
    SECTION("empty source")
    {
        REQUIRE(Template::parse("").elements().empty());
    }
    SECTION("text around an expression")
    {
        Template t = Template::parse("Hello {{ $input.name }}!");
        REQUIRE(t.elements().size() == 3);
        REQUIRE(t.elements()[0].text() == "Hello ");
        REQUIRE(t.elements()[1].type() == TemplateElement::Type::Expression);
        REQUIRE(t.elements()[1].expression().source() == "$input.name");
        REQUIRE(t.elements()[1].expression().position() == 6);
        REQUIRE(t.elements()[2].text() == "!");
    }
    SECTION("adjacent expressions")
    {
        Template t = Template::parse("{{ 1 }}{{ 2 }}");
        REQUIRE(t.elements().size() == 2);
        REQUIRE(t.expressionCount() == 2);
    }
    SECTION("escaped opening delimiter")
    {
        Template t = Template::parse("a \\{{ b }} {{ 1 }}");
        REQUIRE(t.elements().size() == 2);
        REQUIRE(t.elements()[0].text() == "a {{ b }} ");
        REQUIRE(t.expressionCount() == 1);
    }
    SECTION("escaped backslash before an expression")
    {
        Template t = Template::parse("C:\\\\{{ 'dir' }}");
        REQUIRE(t.elements().size() == 2);
        REQUIRE(t.elements()[0].text() == "C:\\");
        REQUIRE(t.expressionCount() == 1);
        REQUIRE(t.expressions()[0].ast()->value() == Value("dir"));

        Template u = Template::parse("\\\\{{ 1 }} \\{{ 2 }}");
        REQUIRE(u.expressionCount() == 1);
        REQUIRE(u.elements()[0].text() == "\\");
        REQUIRE(u.elements()[2].text() == " {{ 2 }}");
    }
    SECTION("closing delimiter inside a string literal")
    {
        Template t = Template::parse("{{ 'a}}b' }}tail");
        REQUIRE(t.elements().size() == 2);
        REQUIRE(t.expressions()[0].ast()->value() == Value("a}}b"));
        REQUIRE(t.elements()[1].text() == "tail");
    }
}

TEST_CASE("parsing literals", "[parser]")
{
    REQUIRE(parse_expr("null")->value().isNull());
    REQUIRE(parse_expr("true")->value() == Value(true));
    REQUIRE(parse_expr("false")->value() == Value(false));
    REQUIRE(parse_expr("42")->value() == Value(42));
    REQUIRE(parse_expr("2.5")->value() == Value(2.5));
    REQUIRE(parse_expr("1e3")->value() == Value(1000.0));
    REQUIRE(parse_expr("'single'")->value() == Value("single"));
    REQUIRE(parse_expr("\"double\"")->value() == Value("double"));
    REQUIRE(parse_expr("'it\\'s'")->value() == Value("it's"));
    REQUIRE(parse_expr("'a | b ? c : d'")->value() == Value("a | b ? c : d"));

    SECTION("minus before a number folds into the literal")
    {
        ExpressionPtr e = parse_expr("-5");
        REQUIRE(e->type() == ExpressionAst::Type::Literal);
        REQUIRE(e->value() == Value(-5));

        REQUIRE(parse_expr("-0.5")->value() == Value(-0.5));
    }
}

TEST_CASE("parsing data access", "[parser]")
{
    SECTION("input")
    {
        ExpressionPtr e = parse_expr("$input.items.0.first-name");
        REQUIRE(e->type() == ExpressionAst::Type::DataAccess);
        REQUIRE(e->source() == DataSource::input());
        REQUIRE(e->path() == "items.0.first-name");

        REQUIRE(parse_expr("$input")->path().empty());
    }
    SECTION("node")
    {
        ExpressionPtr e = parse_expr("$node('fetch').json.body.title");
        REQUIRE(e->source() == DataSource::node("fetch"));
        REQUIRE(e->path() == "body.title");

        REQUIRE(parse_expr("$node(\"fetch\").status")->path() == "status");
        REQUIRE(parse_expr("$node('fetch')")->path().empty());
    }
    SECTION("other sources")
    {
        REQUIRE(parse_expr("$env.API_KEY")->source() == DataSource::environment());
        REQUIRE(parse_expr("$env.API_KEY")->path() == "API_KEY");
        REQUIRE(parse_expr("$system.datetime.iso")->source() == DataSource::system());
        REQUIRE(parse_expr("$execution.id")->source() == DataSource::execution());
        REQUIRE(parse_expr("$workflow")->source() == DataSource::workflow());
    }
}

TEST_CASE("operator precedence", "[parser]")
{
    REQUIRE(parse_expr("1 + 2 * 3")->toString() == "(1 + (2 * 3))");
    REQUIRE(parse_expr("(1 + 2) * 3")->toString() == "((1 + 2) * 3)");
    REQUIRE(parse_expr("1 - 2 - 3")->toString() == "((1 - 2) - 3)");
    REQUIRE(parse_expr("a() || b() && c()")->toString() == "(a() || (b() && c()))");
    REQUIRE(parse_expr("1 < 2 == true")->toString() == "((1 < 2) == true)");
    REQUIRE(parse_expr("1 + 1 >= 2")->toString() == "((1 + 1) >= 2)");
    REQUIRE(parse_expr("!true && false")->toString() == "(!true && false)");
    REQUIRE(parse_expr("-$input.n * 2")->toString() == "(-$input.n * 2)");
    REQUIRE(parse_expr("$input.s contains 'x'")->toString() == "($input.s contains \"x\")");
    REQUIRE(parse_expr("$input.s startsWith 'x' || $input.s endsWith 'y'")->toString()
            == "(($input.s startsWith \"x\") || ($input.s endsWith \"y\"))");

    ExpressionPtr e = parse_expr("7 % 2");
    REQUIRE(e->type() == ExpressionAst::Type::BinaryOp);
    REQUIRE(e->binaryOperator() == BinaryOperator::Modulo);
}

TEST_CASE("parsing conditionals", "[parser]")
{
    SECTION("ternary")
    {
        ExpressionPtr e = parse_expr("$input.ok ? 'yes' : 'no'");
        REQUIRE(e->type() == ExpressionAst::Type::Ternary);
        REQUIRE(e->condition()->type() == ExpressionAst::Type::DataAccess);
        REQUIRE(e->thenBranch()->value() == Value("yes"));
        REQUIRE(e->elseBranch()->value() == Value("no"));

        REQUIRE(parse_expr("a() ? 1 : b() ? 2 : 3")->toString() == "(a() ? 1 : (b() ? 2 : 3))");
    }
    SECTION("if function")
    {
        ExpressionPtr e = parse_expr("if($input.ok, 'yes', 'no')");
        REQUIRE(e->type() == ExpressionAst::Type::IfFunction);
        REQUIRE(e->elseBranch() != nullptr);

        ExpressionPtr short_form = parse_expr("if($input.ok, 'yes')");
        REQUIRE(short_form->elseBranch() == nullptr);
        REQUIRE(short_form->toString() == "if($input.ok, \"yes\")");
    }
}

TEST_CASE("parsing function calls and pipelines", "[parser]")
{
    SECTION("function call")
    {
        ExpressionPtr e = parse_expr("join($input.list, ', ')");
        REQUIRE(e->type() == ExpressionAst::Type::FunctionCall);
        REQUIRE(e->name() == "join");
        REQUIRE(e->args().size() == 2);
        REQUIRE(parse_expr("now()")->args().empty());
    }
    SECTION("pipeline")
    {
        ExpressionPtr e = parse_expr("$input.name | trim | default('anonymous') | upper()");
        REQUIRE(e->type() == ExpressionAst::Type::Pipeline);
        REQUIRE(e->input()->type() == ExpressionAst::Type::DataAccess);
        REQUIRE(e->stages().size() == 3);
        REQUIRE(e->stages()[0].name == "trim");
        REQUIRE(e->stages()[0].args.empty());
        REQUIRE(e->stages()[1].name == "default");
        REQUIRE(e->stages()[1].args.size() == 1);
        REQUIRE(e->stages()[2].name == "upper");
    }
    SECTION("pipe binds looser than operators")
    {
        ExpressionPtr e = parse_expr("$input.a + 1 | json");
        REQUIRE(e->type() == ExpressionAst::Type::Pipeline);
        REQUIRE(e->input()->type() == ExpressionAst::Type::BinaryOp);
    }
}

TEST_CASE("syntax errors", "[parser]")
{
    SECTION("unclosed expression")
    {
        ParseError e = parse_error("abc {{ unclosed expression");
        REQUIRE(e.message() == "Unclosed expression");
        REQUIRE(e.position() == 4);
        REQUIRE(e.templateSource() == "abc {{ unclosed expression");
        REQUIRE(std::string(e.what()) == "Parse error at position 4: Unclosed expression");
    }
    SECTION("empty expression")
    {
        ParseError e = parse_error("x {{   }}");
        REQUIRE(e.message() == "Empty expression");
        REQUIRE(e.position() == 2);
    }
    SECTION("unknown data source")
    {
        ParseError e = parse_error("{{ $nodes('a') }}");
        REQUIRE(e.message() == "Unknown data source");
        REQUIRE(e.position() == 3);
    }
    SECTION("if arity")
    {
        ParseError e = parse_error("ab {{ if(true) }}");
        REQUIRE(e.message() == "If function requires 2 or 3 arguments");
        REQUIRE(e.position() == 6);
        REQUIRE_THROWS_AS(Template::parse("{{ if(1, 2, 3, 4) }}"), ParseError);
    }
    SECTION("bare identifier")
    {
        ParseError e = parse_error("{{ name }}");
        REQUIRE(e.message() == "Unknown literal type");
        REQUIRE(e.position() == 3);
    }
    SECTION("trailing tokens")
    {
        ParseError e = parse_error("{{ 1 2 }}");
        REQUIRE(e.position() == 5);
    }
    SECTION("position is relative to the whole template")
    {
        ParseError e = parse_error("{{ 1 }} and {{ 1 + }}");
        REQUIRE(e.position() == 19);
    }
    SECTION("other malformed expressions")
    {
        REQUIRE_THROWS_AS(Template::parse("{{ 'unterminated }}"), ParseError);
        REQUIRE_THROWS_AS(Template::parse("{{ (1 + 2 }}"), ParseError);
        REQUIRE_THROWS_AS(Template::parse("{{ $input. }}"), ParseError);
        REQUIRE_THROWS_AS(Template::parse("{{ $env }}"), ParseError);
        REQUIRE_THROWS_AS(Template::parse("{{ $node(1) }}"), ParseError);
        REQUIRE_THROWS_AS(Template::parse("{{ 1 | }}"), ParseError);
        REQUIRE_THROWS_AS(Template::parse("{{ true ? 1 }}"), ParseError);
        REQUIRE_THROWS_AS(Template::parse("{{ 1 = 2 }}"), ParseError);
        REQUIRE_THROWS_AS(Template::parse("{{ 12abc }}"), ParseError);
        REQUIRE_THROWS_AS(Template::parse("{{ f(1,) }}"), ParseError);
    }
}
