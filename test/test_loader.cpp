#include <catch2/catch.hpp>

#include <nebula/loader.hpp>
#include <nebula/template.hpp>
#include <nebula/exceptions.hpp>

#include "test_util.hpp"

using namespace nebula ;

static const std::string templates_dir = NEBULA_TEST_DATA_DIR "/templates" ;
static const std::string alt_dir = NEBULA_TEST_DATA_DIR "/alt" ;

TEST_CASE("loading templates from the file system", "[loader]")
{
    FileSystemTemplateLoader loader({ templates_dir });

    REQUIRE(loader.suffix() == ".tpl");
    REQUIRE(loader.load("greeting") == "Hello {{ $input.name }}!");
    REQUIRE(loader.load("greeting.tpl") == "Hello {{ $input.name }}!");

    SECTION("loaded source parses and renders")
    {
        Context ctx;
        ctx.setInput(Value::Object{ { "name", "Alice" } });
        REQUIRE(Template::parse(loader.load("greeting")).render(ctx) == "Hello Alice!");
    }
    SECTION("missing template")
    {
        IoError e = expect_throw<IoError>([&]{ loader.load("nope"); });
        REQUIRE(e.message() == "Cannot find template: nope");
    }
}

TEST_CASE("root folders are searched in order", "[loader]")
{
    FileSystemTemplateLoader alt_first({ alt_dir, templates_dir });
    REQUIRE(alt_first.load("greeting") == "alt {{ $env.MODE }}");
    REQUIRE(alt_first.load("other") == "only in alt");

    FileSystemTemplateLoader templates_first({ templates_dir, alt_dir });
    REQUIRE(templates_first.load("greeting") == "Hello {{ $input.name }}!");
    REQUIRE(templates_first.load("other") == "only in alt");

    FileSystemTemplateLoader no_alt({ templates_dir });
    REQUIRE_THROWS_AS(no_alt.load("other"), IoError);
}

TEST_CASE("custom suffix", "[loader]")
{
    FileSystemTemplateLoader loader({ NEBULA_TEST_DATA_DIR }, ".json");
    REQUIRE_NOTHROW(Value::fromJSONString(loader.load("context")));
    REQUIRE_THROWS_AS(loader.load("templates/greeting"), IoError);
}
