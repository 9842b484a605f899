#include <splice/encodings/yaml.h>

#include <splice/core/testing.h>
#include <splice/utilities/text.h>

using namespace splicer;

TEST_CASE("YAML scalar inference", "[encodings][yaml]")
{
    REQUIRE(parse_yaml_value("true") == dynamic(true));
    REQUIRE(parse_yaml_value("false") == dynamic(false));
    REQUIRE(parse_yaml_value("42") == dynamic(integer(42)));
    REQUIRE(parse_yaml_value("-7") == dynamic(integer(-7)));
    REQUIRE(parse_yaml_value("0x10") == dynamic(integer(16)));
    REQUIRE(parse_yaml_value("0o17") == dynamic(integer(15)));
    REQUIRE(parse_yaml_value("2.5") == dynamic(2.5));
    REQUIRE(parse_yaml_value("~") == dynamic(nil));
    REQUIRE(parse_yaml_value("null") == dynamic(nil));
    REQUIRE(parse_yaml_value("") == dynamic(nil));
    REQUIRE(parse_yaml_value("nginx:1.25") == dynamic("nginx:1.25"));
    REQUIRE(parse_yaml_value("inf") == dynamic("inf"));

    // Quoted values are always strings.
    REQUIRE(parse_yaml_value("'42'") == dynamic("42"));
    REQUIRE(parse_yaml_value("\"true\"") == dynamic("true"));
}

TEST_CASE("YAML plain scalar text", "[encodings][yaml]")
{
    REQUIRE(parse_yaml_scalar("8080") == dynamic(integer(8080)));
    REQUIRE(parse_yaml_scalar("true") == dynamic(true));
    REQUIRE(parse_yaml_scalar("1.5") == dynamic(1.5));
    REQUIRE(parse_yaml_scalar("null") == dynamic(nil));
    REQUIRE(parse_yaml_scalar("") == dynamic(nil));
    REQUIRE(parse_yaml_scalar("main") == dynamic("main"));
    REQUIRE(parse_yaml_scalar("v1.2.3") == dynamic("v1.2.3"));
}

TEST_CASE("YAML map field order", "[encodings][yaml]")
{
    auto value = parse_yaml_value("zeta: 1\nalpha: 2\nmu: 3\n");
    std::vector<string> keys;
    for (auto const& field : cast<dynamic_map>(value))
        keys.push_back(field.first);
    REQUIRE(keys == std::vector<string>{"zeta", "alpha", "mu"});

    // Writing it back out keeps the order.
    REQUIRE(value_to_yaml(value) == "zeta: 1\nalpha: 2\nmu: 3");
}

TEST_CASE("YAML structures", "[encodings][yaml]")
{
    auto value = parse_yaml_value(
        "name: demo\n"
        "spec:\n"
        "  ports:\n"
        "    - name: http\n"
        "      port: 80\n"
        "  enabled: true\n");
    REQUIRE(
        value
        == (dynamic{
            {"name", "demo"},
            {"spec",
             {{"ports", dynamic_array{{{"name", "http"}, {"port", 80}}}},
              {"enabled", true}}}}));
}

TEST_CASE("YAML round trip", "[encodings][yaml]")
{
    dynamic value{
        {"replicas", 3},
        {"ratio", 1.},
        {"port", "8080"},
        {"flag", "false"},
        {"empty", ""},
        {"none", nil},
        {"items", dynamic{"a", "b"}}};
    REQUIRE(parse_yaml_value(value_to_yaml(value)) == value);

    // Strings that look like other scalars are quoted.
    REQUIRE(value_to_yaml(dynamic("42")) == "\"42\"");
    REQUIRE(value_to_yaml(dynamic("main")) == "main");
}

TEST_CASE("YAML document streams", "[encodings][yaml]")
{
    auto documents = parse_yaml_documents(
        "kind: ConfigMap\n"
        "---\n"
        "---\n"
        "kind: Service\n");
    REQUIRE(documents.size() == 2);
    REQUIRE(documents[0] == (dynamic{{"kind", "ConfigMap"}}));
    REQUIRE(documents[1] == (dynamic{{"kind", "Service"}}));

    REQUIRE(parse_yaml_documents("").empty());

    REQUIRE(
        parse_yaml_documents(value_to_yaml_documents(documents)) == documents);
}

TEST_CASE("YAML parse errors", "[encodings][yaml]")
{
    try
    {
        parse_yaml_value("a: [1, 2");
        FAIL("no exception thrown");
    }
    catch (parsing_error& e)
    {
        REQUIRE(get_required_error_info<expected_format_info>(e) == "YAML");
        REQUIRE(get_required_error_info<parsed_text_info>(e) == "a: [1, 2");
    }
}

TEST_CASE("diagnostic YAML", "[encodings][yaml]")
{
    dynamic_array big;
    for (int i = 0; i != 100; ++i)
        big.push_back(i);
    REQUIRE(
        value_to_diagnostic_yaml(big).find("<array - size: 100>")
        != string::npos);
    REQUIRE(
        value_to_diagnostic_yaml(dynamic{{"a", 1}})
        == value_to_yaml(dynamic{{"a", 1}}));
}
