#include <splice/patch/op.h>

#include <splice/core/testing.h>
#include <splice/patch/errors.h>

using namespace splicer;

TEST_CASE("operation derivation", "[patch][op]")
{
    struct case_
    {
        string path;
        patch_operation op;
    };
    std::vector<case_> cases = {
        {"data.foo", patch_operation::REPLACE},
        {"items[0]", patch_operation::REPLACE},
        {"items[-1]", patch_operation::REPLACE},
        {"items[name=a]", patch_operation::REPLACE},
        {"items[-]", patch_operation::APPEND},
        {"items[-=0]", patch_operation::INSERT_BEFORE},
        {"items[+=name=a]", patch_operation::INSERT_AFTER},
        {"data[delete]", patch_operation::DELETE},
        {"items[delete=name=a]", patch_operation::DELETE},
        {"items[delete=0]", patch_operation::DELETE},
    };
    for (auto const& c : cases)
    {
        INFO(c.path);
        REQUIRE(make_patch_op(c.path, 1).op == c.op);
    }
}

TEST_CASE("normalized patch fields", "[patch][op]")
{
    auto op = make_patch_op(
        "spec.containers[name=main].image", "nginx", string("deploy"));
    REQUIRE(op.path == "spec.containers[name=main].image");
    REQUIRE(op.parsed_path.size() == 3);
    REQUIRE(op.parsed_path[1].type == match_type::KEY);
    REQUIRE(op.value == dynamic("nginx"));
    REQUIRE(op.target == some(string("deploy")));
    REQUIRE(op.op == patch_operation::REPLACE);
}

TEST_CASE("delete payloads are cleared", "[patch][op]")
{
    auto op = make_patch_op("items[delete=0]", "ignored");
    REQUIRE(op.op == patch_operation::DELETE);
    REQUIRE(op.value == dynamic(nil));
}

TEST_CASE("operators in intermediate segments", "[patch][op]")
{
    for (string path :
         {"items[-].name",
          "a.items[-=0].name",
          "items[+=0].name",
          "items[delete].name",
          "items[delete=name=x].name"})
    {
        try
        {
            make_patch_op(path, 1);
            FAIL("no exception thrown for " << path);
        }
        catch (patch_parse_error& e)
        {
            REQUIRE(get_required_error_info<patch_path_info>(e) == path);
            REQUIRE(
                get_required_error_info<path_segment_index_info>(e)
                == (path[0] == 'a' ? 1u : 0u));
        }
    }

    // Index and key selectors are fine along the way.
    REQUIRE(
        make_patch_op("spec.ports[0].port", 80).op
        == patch_operation::REPLACE);
    REQUIRE(
        make_patch_op("items[name=a].tags[-]", "x").op
        == patch_operation::APPEND);
}

TEST_CASE("requested deletes", "[patch][op]")
{
    auto field = make_patch_op("metadata.labels", nil, none, true);
    REQUIRE(field.op == patch_operation::DELETE);
    REQUIRE(field.parsed_path.back().type == match_type::DELETE);
    REQUIRE(field.parsed_path.back().match_value == "");

    auto element = make_patch_op("items[1]", nil, none, true);
    REQUIRE(element.op == patch_operation::DELETE);
    REQUIRE(element.parsed_path.back().match_value == "1");

    auto keyed = make_patch_op("items[name=b]", nil, none, true);
    REQUIRE(keyed.op == patch_operation::DELETE);
    REQUIRE(keyed.parsed_path.back().match_value == "name=b");

    auto explicit_delete = make_patch_op("items[delete=0]", nil, none, true);
    REQUIRE(explicit_delete.op == patch_operation::DELETE);

    REQUIRE_THROWS_AS(
        make_patch_op("items[-]", nil, none, true), patch_parse_error);
    REQUIRE_THROWS_AS(
        make_patch_op("items[+=0]", nil, none, true), patch_parse_error);
}

TEST_CASE("invalid paths in patches", "[patch][op]")
{
    REQUIRE_THROWS_AS(make_patch_op("a.b/c", 1), patch_parse_error);
    REQUIRE_THROWS_AS(make_patch_op("", 1), patch_parse_error);
}

TEST_CASE("patch_op to_dynamic", "[patch][op]")
{
    REQUIRE(
        to_dynamic(make_patch_op("items[-]", 3, string("cfg")))
        == dynamic(dynamic_map{
            {"path", "items[-]"},
            {"op", "append"},
            {"value", 3},
            {"target", "cfg"}}));
    REQUIRE(
        to_dynamic(make_patch_op("data[delete]", nil))
        == dynamic(dynamic_map{{"path", "data[delete]"}, {"op", "delete"}}));
}
