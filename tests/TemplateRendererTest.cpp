#include <catch2/catch_test_macros.hpp>
#include "workflow/ExecutionContext.hpp"
#include "workflow/TemplateRenderer.hpp"
#include "workflow/WorkflowError.hpp"

using namespace sysflow::workflow;

namespace {

ExecutionContext makeContext() {
    ExecutionContext ctx({{"HOME", "/home/tester"}, {"SHELL_ONLY", "env"}}, "/tmp");
    ctx.setVariable("name", "World");
    ctx.setVariable("padded", "  spaced  ");
    return ctx;
}

} // namespace

// =============================================================================
// Substitution
// =============================================================================

TEST_CASE("Render substitutes variables", "[TemplateRenderer]") {
    auto ctx = makeContext();
    REQUIRE(TemplateRenderer::render("echo Hello ${name}", ctx) == "echo Hello World");
    REQUIRE(TemplateRenderer::render("${name}${name}", ctx) == "WorldWorld");
}

TEST_CASE("Render falls back to environment then empty", "[TemplateRenderer]") {
    auto ctx = makeContext();
    REQUIRE(TemplateRenderer::render("${SHELL_ONLY}", ctx) == "env");
    REQUIRE(TemplateRenderer::render("[${missing}]", ctx) == "[]");
}

TEST_CASE("Variables shadow environment", "[TemplateRenderer]") {
    auto ctx = makeContext();
    ctx.setVariable("HOME", "/override");
    REQUIRE(TemplateRenderer::render("${HOME}", ctx) == "/override");
}

TEST_CASE("Text without placeholders is unchanged", "[TemplateRenderer]") {
    auto ctx = makeContext();
    REQUIRE(TemplateRenderer::render("ls -la", ctx) == "ls -la");
    REQUIRE(TemplateRenderer::render("", ctx) == "");
}

TEST_CASE("Shell dollar syntax is left alone", "[TemplateRenderer]") {
    auto ctx = makeContext();
    REQUIRE(TemplateRenderer::render("echo $HOME $(date) $1", ctx) == "echo $HOME $(date) $1");
    REQUIRE(TemplateRenderer::render("cost: 5$", ctx) == "cost: 5$");
}

TEST_CASE("Substituted values are not rescanned", "[TemplateRenderer]") {
    auto ctx = makeContext();
    ctx.setVariable("tricky", "${name}");
    REQUIRE(TemplateRenderer::render("${tricky}", ctx) == "${name}");
}

TEST_CASE("Whitespace inside braces is ignored", "[TemplateRenderer]") {
    auto ctx = makeContext();
    REQUIRE(TemplateRenderer::render("${ name }", ctx) == "World");
}

// =============================================================================
// Filters
// =============================================================================

TEST_CASE("Filters transform values", "[TemplateRenderer][Filters]") {
    auto ctx = makeContext();
    REQUIRE(TemplateRenderer::render("${name | upper}", ctx) == "WORLD");
    REQUIRE(TemplateRenderer::render("${name|lower}", ctx) == "world");
    REQUIRE(TemplateRenderer::render("[${padded | trim}]", ctx) == "[spaced]");
    REQUIRE(TemplateRenderer::render("${name | length}", ctx) == "5");
    REQUIRE(TemplateRenderer::render("${missing | length}", ctx) == "0");
}

TEST_CASE("Unknown filter is rejected", "[TemplateRenderer][Filters]") {
    auto ctx = makeContext();
    REQUIRE_THROWS_AS(TemplateRenderer::render("${name | reverse}", ctx), TemplateError);
    REQUIRE_FALSE(TemplateRenderer::isKnownFilter("reverse"));
}

TEST_CASE("Count is an alias of length", "[TemplateRenderer][Filters]") {
    auto ctx = makeContext();
    ctx.setVariable("accented", "caf\xC3\xA9");
    REQUIRE(TemplateRenderer::render("${name | count}", ctx) == "5");
    REQUIRE(TemplateRenderer::render("${accented | length}", ctx) == "4");
}

TEST_CASE("List values are counted by element", "[TemplateRenderer][Filters]") {
    auto ctx = makeContext();
    ctx.setVariable("items", R"(["a", "b", "c"])");
    REQUIRE(TemplateRenderer::render("${items | length}", ctx) == "3");
    REQUIRE(TemplateRenderer::render("${items | count}", ctx) == "3");
}

TEST_CASE("First and last of a string", "[TemplateRenderer][Filters]") {
    auto ctx = makeContext();
    ctx.setVariable("accented", "\xC3\xA9t\xC3\xA9");
    REQUIRE(TemplateRenderer::render("${name | first}", ctx) == "W");
    REQUIRE(TemplateRenderer::render("${name | last}", ctx) == "d");
    REQUIRE(TemplateRenderer::render("${accented | first}", ctx) == "\xC3\xA9");
    REQUIRE(TemplateRenderer::render("${accented | last}", ctx) == "\xC3\xA9");
    REQUIRE(TemplateRenderer::render("[${missing | first}]", ctx) == "[]");
}

TEST_CASE("First and last of a list", "[TemplateRenderer][Filters]") {
    auto ctx = makeContext();
    ctx.setVariable("hosts", R"(["web1", "web2", 3])");
    ctx.setVariable("none", "[]");
    REQUIRE(TemplateRenderer::render("${hosts | first}", ctx) == "web1");
    REQUIRE(TemplateRenderer::render("${hosts | last}", ctx) == "3");
    REQUIRE(TemplateRenderer::render("[${none | first}]", ctx) == "[]");
}

TEST_CASE("Json pretty-prints documents", "[TemplateRenderer][Filters]") {
    auto ctx = makeContext();
    ctx.setVariable("config", R"({"port":8080})");
    REQUIRE(TemplateRenderer::render("${config | json}", ctx) == "{\n  \"port\": 8080\n}");
    REQUIRE(TemplateRenderer::render("${name | json}", ctx) == "World");
}

// =============================================================================
// Malformed placeholders
// =============================================================================

TEST_CASE("Malformed placeholders throw TemplateError", "[TemplateRenderer]") {
    REQUIRE_THROWS_AS(TemplateRenderer::scan("echo ${name"), TemplateError);
    REQUIRE_THROWS_AS(TemplateRenderer::scan("echo ${}"), TemplateError);
    REQUIRE_THROWS_AS(TemplateRenderer::scan("echo ${1abc}"), TemplateError);
    REQUIRE_THROWS_AS(TemplateRenderer::scan("echo ${a-b}"), TemplateError);
    REQUIRE_THROWS_AS(TemplateRenderer::scan("echo ${a${b}}"), TemplateError);
}

TEST_CASE("TemplateError carries offending text", "[TemplateRenderer]") {
    try {
        TemplateRenderer::scan("run ${bad name}");
        FAIL("expected TemplateError");
    } catch (const TemplateError& e) {
        REQUIRE(e.text() == "${bad name}");
        REQUIRE(e.detail().find("invalid variable name") != std::string::npos);
    }
}

// =============================================================================
// Scanning
// =============================================================================

TEST_CASE("Scan reports placeholder positions", "[TemplateRenderer]") {
    auto placeholders = TemplateRenderer::scan("a ${x} b ${y | upper}");
    REQUIRE(placeholders.size() == 2);
    REQUIRE(placeholders[0].name == "x");
    REQUIRE(placeholders[0].filter.empty());
    REQUIRE(placeholders[0].begin == 2);
    REQUIRE(placeholders[0].end == 6);
    REQUIRE(placeholders[1].name == "y");
    REQUIRE(placeholders[1].filter == "upper");
}

TEST_CASE("References are distinct and ordered", "[TemplateRenderer]") {
    auto names = TemplateRenderer::references("${b} ${a} ${b | upper} $c");
    REQUIRE(names == std::vector<std::string>{"b", "a"});
}

TEST_CASE("Variable name rules", "[TemplateRenderer]") {
    REQUIRE(TemplateRenderer::isValidName("greeting"));
    REQUIRE(TemplateRenderer::isValidName("_private"));
    REQUIRE(TemplateRenderer::isValidName("HOME2"));
    REQUIRE_FALSE(TemplateRenderer::isValidName(""));
    REQUIRE_FALSE(TemplateRenderer::isValidName("2fast"));
    REQUIRE_FALSE(TemplateRenderer::isValidName("my-var"));
    REQUIRE_FALSE(TemplateRenderer::isValidName("my var"));
}

TEST_CASE("Render with custom resolver", "[TemplateRenderer]") {
    auto result = TemplateRenderer::render("${a}-${b}", [](const std::string& name) {
        return name == "a" ? std::string("1") : std::string("2");
    });
    REQUIRE(result == "1-2");
}
