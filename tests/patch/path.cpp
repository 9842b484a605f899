#include <splice/patch/path.h>

#include <sstream>

#include <splice/core/testing.h>
#include <splice/patch/errors.h>
#include <splice/utilities/errors.h>
#include <splice/utilities/text.h>

using namespace splicer;

static path_part
part(string field, match_type type = match_type::NONE, string value = "")
{
    path_part p;
    p.field = field;
    p.type = type;
    p.match_value = value;
    return p;
}

TEST_CASE("plain path parsing", "[patch][path]")
{
    REQUIRE(
        parse_patch_path("metadata.labels.app")
        == (std::vector<path_part>{
            part("metadata"), part("labels"), part("app")}));
    REQUIRE(
        parse_patch_path("replicas")
        == (std::vector<path_part>{part("replicas")}));
}

TEST_CASE("selector path parsing", "[patch][path]")
{
    auto expected = std::vector<path_part>{
        part("spec"),
        part("containers", match_type::KEY, "name=main"),
        part("image")};
    REQUIRE(parse_patch_path("spec.containers[name=main].image") == expected);

    // The slash-delimited form is equivalent.
    REQUIRE(parse_patch_path("spec/containers[name=main]/image") == expected);

    REQUIRE(
        parse_patch_path("items[-1]")
        == (std::vector<path_part>{part("items", match_type::INDEX, "-1")}));
    REQUIRE(
        parse_patch_path("spec.ports[0].port")
        == (std::vector<path_part>{
            part("spec"),
            part("ports", match_type::INDEX, "0"),
            part("port")}));
}

TEST_CASE("operator path parsing", "[patch][path]")
{
    REQUIRE(
        parse_patch_path("spec.containers[-]").back()
        == part("containers", match_type::APPEND));
    REQUIRE(
        parse_patch_path("items[-=0]").back()
        == part("items", match_type::INSERT_BEFORE, "0"));
    REQUIRE(
        parse_patch_path("items[-=name=b]").back()
        == part("items", match_type::INSERT_BEFORE, "name=b"));
    REQUIRE(
        parse_patch_path("items[+=-1]").back()
        == part("items", match_type::INSERT_AFTER, "-1"));
    REQUIRE(
        parse_patch_path("items[+=name=b]").back()
        == part("items", match_type::INSERT_AFTER, "name=b"));
    REQUIRE(
        parse_patch_path("metadata.annotations[delete]").back()
        == part("annotations", match_type::DELETE));
    REQUIRE(
        parse_patch_path("items[delete=name=b]").back()
        == part("items", match_type::DELETE, "name=b"));
    REQUIRE(
        parse_patch_path("items[delete=2]").back()
        == part("items", match_type::DELETE, "2"));
}

TEST_CASE("path segment counts", "[patch][path]")
{
    REQUIRE(parse_patch_path("a").size() == 1);
    REQUIRE(parse_patch_path("a.b[0].c[k=v].d").size() == 4);
    REQUIRE(parse_patch_path("a/b[0]/c[k=v]/d[-]").size() == 4);
    // A selector without a field addresses the current list.
    REQUIRE(
        parse_patch_path("spec.ports.[0].port")
        == (std::vector<path_part>{
            part("spec"),
            part("ports"),
            part("", match_type::INDEX, "0"),
            part("port")}));
}

TEST_CASE("path delimiter trimming", "[patch][path]")
{
    REQUIRE(parse_patch_path(".data.foo.") == parse_patch_path("data.foo"));
    REQUIRE(parse_patch_path("/data/foo") == parse_patch_path("data.foo"));
}

TEST_CASE("bracket contents are opaque", "[patch][path]")
{
    REQUIRE(
        parse_patch_path("env[name=app.version].value")
        == (std::vector<path_part>{
            part("env", match_type::KEY, "name=app.version"),
            part("value")}));
    // Dots inside brackets don't count as mixing delimiters.
    REQUIRE(
        parse_patch_path("env[name=app.version]/value")
        == parse_patch_path("env[name=app.version].value"));
    REQUIRE(
        parse_patch_path("volumes[path=/var/log].name")
        == (std::vector<path_part>{
            part("volumes", match_type::KEY, "path=/var/log"),
            part("name")}));
}

static string
parse_error_for(string const& path)
{
    try
    {
        parse_patch_path(path);
    }
    catch (patch_parse_error& e)
    {
        REQUIRE(get_required_error_info<patch_path_info>(e) == path);
        return get_required_error_info<parsing_error_info>(e);
    }
    FAIL("no exception thrown for " << path);
    return string();
}

TEST_CASE("path parse errors", "[patch][path]")
{
    REQUIRE(parse_error_for("") == "empty path");
    REQUIRE(parse_error_for("...") == "empty path");
    REQUIRE(parse_error_for("a..b") == "empty segment");
    REQUIRE(parse_error_for("items[0") == "unterminated bracket");
    REQUIRE(parse_error_for("items]") == "unmatched ']'");
    REQUIRE(parse_error_for("a[b[0]]") == "nested brackets are not supported");
    REQUIRE(parse_error_for("items[]") == "empty selector");
    REQUIRE(parse_error_for("a.b/c") == "mixed '.' and '/' delimiters");
    REQUIRE(
        parse_error_for("items[main]")
        == "unrecognized selector '[main]'");
    REQUIRE(
        parse_error_for("items[=x]") == "unrecognized selector '[=x]'");
    REQUIRE(
        parse_error_for("items[0]x")
        == "unexpected text after selector in segment 'items[0]x'");
    REQUIRE(
        parse_error_for("items[0][1]")
        == "unexpected text after selector in segment 'items[0][1]'");
    REQUIRE(parse_error_for("items[-=]") == "invalid selector ''");
    REQUIRE(parse_error_for("items[+=main]") == "invalid selector 'main'");
    REQUIRE(parse_error_for("[delete]") == "[delete] needs a field to remove");
}

TEST_CASE("path formatting", "[patch][path]")
{
    for (string path :
         {"spec.containers[name=main].image",
          "items[-1]",
          "items[-]",
          "items[-=0]",
          "items[+=name=b]",
          "metadata.labels[delete]",
          "items[delete=name=b]"})
    {
        REQUIRE(format_patch_path(parse_patch_path(path)) == path);
    }
    REQUIRE(
        format_patch_path(parse_patch_path("spec/ports[0]/port"))
        == "spec.ports[0].port");
    REQUIRE(lexical_cast<string>(part("a", match_type::KEY, "k=v")) == "a[k=v]");
}

TEST_CASE("list selector parsing", "[patch][path]")
{
    auto index = parse_list_selector("-2");
    REQUIRE(index.index == some(integer(-2)));

    auto key = parse_list_selector("name=a=b");
    REQUIRE(!key.index);
    REQUIRE(key.key == "name");
    REQUIRE(key.value == "a=b");

    auto empty_value = parse_list_selector("name=");
    REQUIRE(empty_value.key == "name");
    REQUIRE(empty_value.value == "");

    REQUIRE_THROWS_AS(parse_list_selector("main"), patch_parse_error);
    REQUIRE_THROWS_AS(parse_list_selector("=main"), patch_parse_error);
}

TEST_CASE("match_type streaming", "[patch][path]")
{
    REQUIRE(lexical_cast<string>(match_type::NONE) == "none");
    REQUIRE(lexical_cast<string>(match_type::INSERT_AFTER) == "insert-after");
    std::ostringstream s;
    REQUIRE_THROWS_AS(s << match_type(-1), invalid_enum_value);
}
