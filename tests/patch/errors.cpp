#include <splice/patch/errors.h>

#include <splice/core/testing.h>

using namespace splicer;

TEST_CASE("patch failure formatting", "[patch][errors]")
{
    REQUIRE(
        lexical_cast<string>(patch_failure{2, "data.foo", "bad"})
        == "#2 (data.foo): bad");
    REQUIRE(
        lexical_cast<string>(patch_failure{0, "", "invalid YAML"})
        == "#0: invalid YAML");

    std::vector<patch_failure> failures{
        {0, "a", "x"}, {3, "b", "y"}};
    REQUIRE(
        lexical_cast<string>(failures) == "\n#0 (a): x\n#3 (b): y");
}

TEST_CASE("patch error messages", "[patch][errors]")
{
    try
    {
        SPLICE_THROW(
            path_not_found() << patch_path_info("a.b")
                             << patch_error_message_info("field 'a' not found"));
    }
    catch (patch_apply_error& e)
    {
        REQUIRE(get_patch_error_message(e) == "field 'a' not found");
    }

    // Without a message, the full diagnostics are used.
    try
    {
        SPLICE_THROW(selector_not_found() << path_selector_info("name=x"));
    }
    catch (patch_apply_error& e)
    {
        REQUIRE(get_patch_error_message(e).find("name=x") != string::npos);
    }
}
