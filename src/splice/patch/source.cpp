#include <splice/patch/source.h>

#include <sstream>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/regex.hpp>

#include <splice/encodings/yaml.h>
#include <splice/fs/file_io.h>
#include <splice/patch/errors.h>
#include <splice/utilities/logging.h>

namespace splicer {

// VARIABLES

static optional<dynamic>
look_up_value(dynamic_map const& values, string const& key)
{
    dynamic const* value;
    if (get_field(&value, values, key))
        return *value;

    // Try treating the key as a path through nested maps.
    dynamic const* current = nullptr;
    dynamic_map const* map = &values;
    std::istringstream segments(key);
    string segment;
    while (std::getline(segments, segment, '.'))
    {
        if (!map || !get_field(&current, *map, segment))
            return none;
        map = current->type() == value_type::MAP
                  ? &cast<dynamic_map>(*current)
                  : nullptr;
    }
    if (!current)
        return none;
    return *current;
}

static optional<dynamic>
look_up_variable(
    string const& scope, string const& key, variable_context const& variables)
{
    if (scope == "features")
    {
        auto feature = variables.features.find(key);
        if (feature == variables.features.end())
            return none;
        return dynamic(feature->second);
    }
    return look_up_value(variables.values, key);
}

static dynamic
substitute_in_string(string const& text, variable_context const& variables)
{
    static boost::regex const reference(R"(\$\{(values|features)\.([^}]+)\})");

    // A lone reference takes on the referenced value.
    boost::smatch match;
    if (boost::regex_match(text, match, reference))
    {
        auto value = look_up_variable(match[1], match[2], variables);
        return value ? *value : dynamic(text);
    }

    string result;
    bool substituted = false;
    auto last = text.cbegin();
    boost::sregex_iterator end;
    for (boost::sregex_iterator i(text.begin(), text.end(), reference);
         i != end;
         ++i)
    {
        auto const& m = *i;
        result.append(last, m[0].first);
        last = m[0].second;
        auto value = look_up_variable(m[1], m[2], variables);
        if (!value)
        {
            result.append(m[0].first, m[0].second);
            continue;
        }
        auto value_text = scalar_to_string(*value);
        if (!value_text)
        {
            SPLICE_THROW(
                patch_parse_error()
                << parsing_error_info("structured value in text")
                << patch_error_message_info(
                       "'" + m.str() + "' refers to a "
                       + lexical_cast<string>(value->type())
                       + ", which can't be embedded in text"));
        }
        result += *value_text;
        substituted = true;
    }
    if (!substituted)
        return text;
    result.append(last, text.cend());
    return parse_yaml_scalar(result);
}

dynamic
substitute_variables(dynamic const& value, variable_context const& variables)
{
    switch (value.type())
    {
        case value_type::STRING:
            return substitute_in_string(cast<string>(value), variables);
        case value_type::ARRAY: {
            dynamic_array array;
            array.reserve(cast<dynamic_array>(value).size());
            for (auto const& item : cast<dynamic_array>(value))
                array.push_back(substitute_variables(item, variables));
            return array;
        }
        case value_type::MAP: {
            dynamic_map map;
            for (auto const& field : cast<dynamic_map>(value))
            {
                map.insert_or_assign(
                    field.first, substitute_variables(field.second, variables));
            }
            return map;
        }
        default:
            return value;
    }
}

// SOURCES

namespace {

// Accumulates the instructions (and failures) from a patch source.
struct source_parser
{
    variable_context const& variables;
    std::vector<patch_op> patches;
    std::vector<patch_failure> failures;
    size_t instruction_count = 0;

    void
    add(string const& path,
        dynamic const& value,
        optional<string> const& target,
        bool deletion,
        string const& location = string())
    {
        size_t index = instruction_count++;
        try
        {
            auto op = make_patch_op(
                path,
                deletion ? dynamic() : substitute_variables(value, variables),
                target,
                deletion);
            get_logger()->debug(
                "loaded patch {}: {} {} (target: {})",
                index,
                lexical_cast<string>(op.op),
                op.path,
                op.target ? *op.target : string("<implicit>"));
            patches.push_back(std::move(op));
        }
        catch (patch_parse_error& e)
        {
            failures.push_back(patch_failure{
                index, path, location + get_patch_error_message(e)});
        }
    }

    void
    fail(string const& path, string const& message)
    {
        failures.push_back(patch_failure{instruction_count++, path, message});
    }
};

} // namespace

static void
parse_flat_map(source_parser& parser, dynamic_map const& map)
{
    for (auto const& entry : map)
        parser.add(entry.first, entry.second, none, false);
}

static optional<targeted_patch_record>
read_targeted_record(
    source_parser& parser, dynamic const& item, size_t record_index)
{
    string location = "record " + lexical_cast<string>(record_index) + ": ";
    if (item.type() != value_type::MAP)
    {
        parser.fail("", location + "expected a map");
        return none;
    }
    targeted_patch_record record;
    bool has_target = false;
    for (auto const& field : cast<dynamic_map>(item))
    {
        if (field.first == "target" && field.second.type() == value_type::STRING)
        {
            record.target = cast<string>(field.second);
            has_target = !record.target.empty();
        }
        else if (
            field.first == "patch" && field.second.type() == value_type::MAP)
        {
            record.patches = cast<dynamic_map>(field.second);
        }
        else if (
            field.first == "delete"
            && field.second.type() == value_type::ARRAY)
        {
            for (auto const& path : cast<dynamic_array>(field.second))
            {
                if (path.type() != value_type::STRING)
                {
                    parser.fail("", location + "'delete' must list paths");
                    return none;
                }
                record.deletions.push_back(cast<string>(path));
            }
        }
        else
        {
            parser.fail(
                "", location + "unexpected or malformed '" + field.first + "'");
            return none;
        }
    }
    if (!has_target)
    {
        parser.fail("", location + "missing 'target'");
        return none;
    }
    return record;
}

static void
parse_targeted_list(source_parser& parser, dynamic_array const& records)
{
    for (size_t i = 0; i != records.size(); ++i)
    {
        auto record = read_targeted_record(parser, records[i], i);
        if (!record)
            continue;
        for (auto const& entry : record->patches)
            parser.add(entry.first, entry.second, some(record->target), false);
        for (auto const& path : record->deletions)
            parser.add(path, nil, some(record->target), true);
    }
}

// HEADER FORM

bool
is_header_format(string const& text)
{
    std::istringstream lines(text);
    string line;
    while (std::getline(lines, line))
    {
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        if (line[0] == '[' && line.find(']') != string::npos)
            return true;
        if (line[0] == '-' || line.find(':') != string::npos)
            return false;
    }
    return false;
}

namespace {

struct header_context
{
    string target;
    // the path of the section that the header addresses (possibly empty)
    string prefix;
};

} // namespace

static bool
is_header_selector(string const& section)
{
    integer index;
    if (parse_integer(&index, section))
        return true;
    auto equals = section.find('=');
    return equals != string::npos && equals != 0;
}

// Attach a selector to the last segment of :segments.
static void
attach_selector(
    std::vector<string>& segments,
    string const& selector,
    string const& header)
{
    if (segments.empty())
    {
        segments.push_back("[" + selector + "]");
        return;
    }
    if (boost::ends_with(segments.back(), "]"))
    {
        SPLICE_THROW(
            patch_parse_error()
            << parsing_error_info("consecutive selectors")
            << patch_error_message_info(
                   "header " + header + " has consecutive selectors"));
    }
    segments.back() += "[" + selector + "]";
}

[[noreturn]] static void
throw_header_error(string const& header, string const& message)
{
    SPLICE_THROW(
        patch_parse_error()
        << parsing_error_info(message)
        << patch_error_message_info("header " + header + ": " + message));
}

static header_context
parse_header(string const& header)
{
    auto content = trim(header.substr(1, header.length() - 2));
    if (content.empty())
        throw_header_error(header, "empty header");

    // A trailing bracket is passed through as a selector.
    string bracketed;
    auto open = content.find('[');
    if (open != string::npos)
    {
        if (content.back() != ']')
            throw_header_error(header, "unterminated selector");
        bracketed = content.substr(open + 1, content.length() - open - 2);
        if (bracketed.empty())
            throw_header_error(header, "empty selector");
        content = content.substr(0, open);
    }

    std::vector<string> sections;
    std::istringstream parts(content);
    string part;
    while (std::getline(parts, part, '.'))
    {
        if (part.empty())
            throw_header_error(header, "empty section");
        sections.push_back(part);
    }
    if (content.empty() || content.back() == '.')
        throw_header_error(header, "empty section");
    if (sections.size() < 2)
        throw_header_error(header, "expected at least <kind>.<name>");

    header_context context;
    context.target = sections[0] + "." + sections[1];
    std::vector<string> segments;
    for (size_t i = 2; i != sections.size(); ++i)
    {
        if (is_header_selector(sections[i]))
            attach_selector(segments, sections[i], header);
        else
            segments.push_back(sections[i]);
    }
    if (!bracketed.empty())
        attach_selector(segments, bracketed, header);

    for (auto const& segment : segments)
    {
        if (!context.prefix.empty())
            context.prefix += ".";
        context.prefix += segment;
    }
    return context;
}

static void
parse_header_format(source_parser& parser, string const& text)
{
    optional<header_context> context;
    // set while skipping the body of a header that failed to parse
    bool skipping = false;

    std::istringstream lines(text);
    string line;
    size_t line_number = 0;
    while (std::getline(lines, line))
    {
        ++line_number;
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        string location = "line " + lexical_cast<string>(line_number) + ": ";

        if (line.front() == '[' && line.back() == ']')
        {
            try
            {
                context = parse_header(line);
                skipping = false;
            }
            catch (patch_parse_error& e)
            {
                parser.fail("", location + get_patch_error_message(e));
                context = none;
                skipping = true;
            }
            continue;
        }
        if (skipping)
            continue;
        if (!context)
        {
            parser.fail("", location + "patch value without a header");
            continue;
        }

        auto colon = line.find(':');
        if (colon == string::npos)
        {
            parser.fail("", location + "expected 'key: value'");
            continue;
        }
        auto key = trim(line.substr(0, colon));
        auto path = context->prefix.empty() ? key : context->prefix + "." + key;
        dynamic value;
        try
        {
            value = parse_yaml_value(trim(line.substr(colon + 1)));
        }
        catch (parsing_error& e)
        {
            auto message = get_error_info<parsing_error_info>(e);
            parser.fail(
                path,
                location + "invalid value"
                    + (message ? ": " + *message : string()));
            continue;
        }
        parser.add(path, value, some(context->target), false, location);
    }
}

// ENTRY POINTS

[[noreturn]] static void
throw_aggregate(std::vector<patch_failure> const& failures)
{
    SPLICE_THROW(
        aggregate_parse_error()
        << patch_parse_failures_info(failures)
        << patch_error_message_info(
               lexical_cast<string>(failures.size())
               + " invalid patch instruction(s)"));
}

std::vector<patch_op>
parse_patch_source(string const& text, variable_context const& variables)
{
    source_parser parser{variables};

    if (is_header_format(text))
    {
        parse_header_format(parser, text);
    }
    else
    {
        dynamic parsed;
        try
        {
            parsed = parse_yaml_value(text);
        }
        catch (parsing_error& e)
        {
            auto message = get_error_info<parsing_error_info>(e);
            throw_aggregate({patch_failure{
                0,
                "",
                "invalid YAML" + (message ? ": " + *message : string())}});
        }
        switch (parsed.type())
        {
            case value_type::NIL:
                break;
            case value_type::MAP:
                parse_flat_map(parser, cast<dynamic_map>(parsed));
                break;
            case value_type::ARRAY:
                parse_targeted_list(parser, cast<dynamic_array>(parsed));
                break;
            default:
                parser.fail(
                    "",
                    "unrecognized patch format (expected a map of paths or a "
                    "list of targeted records)");
                break;
        }
    }

    if (!parser.failures.empty())
        throw_aggregate(parser.failures);
    return std::move(parser.patches);
}

std::vector<patch_op>
parse_patch_source(std::istream& reader, variable_context const& variables)
{
    std::ostringstream contents;
    contents << reader.rdbuf();
    return parse_patch_source(contents.str(), variables);
}

std::vector<patch_op>
read_patch_file(file_path const& path, variable_context const& variables)
{
    return parse_patch_source(read_file_contents(path), variables);
}

} // namespace splicer
