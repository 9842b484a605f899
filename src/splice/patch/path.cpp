#include <splice/patch/path.h>

#include <boost/algorithm/string/predicate.hpp>

#include <splice/patch/errors.h>
#include <splice/utilities/errors.h>

namespace splicer {

std::ostream&
operator<<(std::ostream& s, match_type t)
{
    switch (t)
    {
        case match_type::NONE:
            s << "none";
            break;
        case match_type::INDEX:
            s << "index";
            break;
        case match_type::KEY:
            s << "key";
            break;
        case match_type::APPEND:
            s << "append";
            break;
        case match_type::INSERT_BEFORE:
            s << "insert-before";
            break;
        case match_type::INSERT_AFTER:
            s << "insert-after";
            break;
        case match_type::DELETE:
            s << "delete";
            break;
        default:
            SPLICE_THROW(
                invalid_enum_value()
                << enum_id_info("match_type") << enum_value_info(int(t)));
    }
    return s;
}

bool
operator==(path_part const& a, path_part const& b)
{
    return a.field == b.field && a.type == b.type
           && a.match_value == b.match_value;
}
bool
operator!=(path_part const& a, path_part const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, path_part const& p)
{
    s << format_path_part(p);
    return s;
}

[[noreturn]] static void
throw_path_error(string const& path, string const& message)
{
    SPLICE_THROW(
        patch_parse_error()
        << patch_path_info(path) << parsing_error_info(message)
        << patch_error_message_info(
               "invalid path '" + path + "': " + message));
}

list_selector
parse_list_selector(string const& operand)
{
    list_selector selector;
    integer index;
    if (parse_integer(&index, operand))
    {
        selector.index = index;
        return selector;
    }
    auto equals = operand.find('=');
    if (equals == string::npos || equals == 0)
    {
        SPLICE_THROW(
            patch_parse_error()
            << parsing_error_info("invalid selector '" + operand + "'")
            << path_selector_info(operand)
            << patch_error_message_info(
                   "selector '" + operand
                   + "' is neither an index nor a key=value match"));
    }
    selector.key = operand.substr(0, equals);
    selector.value = operand.substr(equals + 1);
    return selector;
}

// Check that :operand is a valid selector operand, reporting errors against
// :path.
static void
check_operand(string const& path, string const& operand)
{
    try
    {
        parse_list_selector(operand);
    }
    catch (patch_parse_error&)
    {
        throw_path_error(path, "invalid selector '" + operand + "'");
    }
}

// Classify the contents of a bracket.
static void
classify_bracket(path_part& part, string const& path, string const& body)
{
    if (body.empty())
        throw_path_error(path, "empty selector");

    if (body == "-")
    {
        part.type = match_type::APPEND;
        return;
    }
    if (boost::starts_with(body, "-="))
    {
        part.type = match_type::INSERT_BEFORE;
        part.match_value = body.substr(2);
        check_operand(path, part.match_value);
        return;
    }
    if (boost::starts_with(body, "+="))
    {
        part.type = match_type::INSERT_AFTER;
        part.match_value = body.substr(2);
        check_operand(path, part.match_value);
        return;
    }
    if (body == "delete")
    {
        if (part.field.empty())
            throw_path_error(path, "[delete] needs a field to remove");
        part.type = match_type::DELETE;
        return;
    }
    if (boost::starts_with(body, "delete="))
    {
        part.type = match_type::DELETE;
        part.match_value = body.substr(7);
        check_operand(path, part.match_value);
        return;
    }

    integer index;
    if (parse_integer(&index, body))
    {
        part.type = match_type::INDEX;
        part.match_value = body;
        return;
    }
    auto equals = body.find('=');
    if (equals != string::npos && equals != 0)
    {
        part.type = match_type::KEY;
        part.match_value = body;
        return;
    }

    throw_path_error(path, "unrecognized selector '[" + body + "]'");
}

static path_part
parse_segment(string const& path, string const& segment)
{
    path_part part;
    auto open = segment.find('[');
    if (open == string::npos)
    {
        part.field = segment;
        return part;
    }
    // The tokenizer guarantees that brackets are balanced and unnested, so
    // the first ']' after :open closes it.
    auto close = segment.find(']', open);
    if (close + 1 != segment.length())
    {
        throw_path_error(
            path,
            "unexpected text after selector in segment '" + segment + "'");
    }
    part.field = segment.substr(0, open);
    classify_bracket(part, path, segment.substr(open + 1, close - open - 1));
    return part;
}

std::vector<path_part>
parse_patch_path(string const& path)
{
    // Determine the delimiter and check the bracket structure.
    bool has_dot = false, has_slash = false;
    bool in_bracket = false;
    for (char c : path)
    {
        if (in_bracket)
        {
            if (c == '[')
                throw_path_error(path, "nested brackets are not supported");
            if (c == ']')
                in_bracket = false;
            continue;
        }
        switch (c)
        {
            case '[':
                in_bracket = true;
                break;
            case ']':
                throw_path_error(path, "unmatched ']'");
            case '.':
                has_dot = true;
                break;
            case '/':
                has_slash = true;
                break;
        }
    }
    if (in_bracket)
        throw_path_error(path, "unterminated bracket");
    if (has_dot && has_slash)
        throw_path_error(path, "mixed '.' and '/' delimiters");
    char delimiter = has_slash ? '/' : '.';

    // Trim leading and trailing delimiters.
    auto begin = path.find_first_not_of(delimiter);
    if (begin == string::npos)
        throw_path_error(path, "empty path");
    auto end = path.find_last_not_of(delimiter) + 1;

    // Split into segments, treating bracket contents as opaque.
    std::vector<path_part> parts;
    string segment;
    in_bracket = false;
    for (auto i = begin; i != end; ++i)
    {
        char c = path[i];
        if (c == '[')
            in_bracket = true;
        else if (c == ']')
            in_bracket = false;
        else if (c == delimiter && !in_bracket)
        {
            if (segment.empty())
                throw_path_error(path, "empty segment");
            parts.push_back(parse_segment(path, segment));
            segment.clear();
            continue;
        }
        segment.push_back(c);
    }
    parts.push_back(parse_segment(path, segment));
    return parts;
}

string
format_path_part(path_part const& part)
{
    switch (part.type)
    {
        case match_type::NONE:
        default:
            return part.field;
        case match_type::INDEX:
        case match_type::KEY:
            return part.field + "[" + part.match_value + "]";
        case match_type::APPEND:
            return part.field + "[-]";
        case match_type::INSERT_BEFORE:
            return part.field + "[-=" + part.match_value + "]";
        case match_type::INSERT_AFTER:
            return part.field + "[+=" + part.match_value + "]";
        case match_type::DELETE:
            return part.match_value.empty()
                       ? part.field + "[delete]"
                       : part.field + "[delete=" + part.match_value + "]";
    }
}

string
format_patch_path(std::vector<path_part> const& parts)
{
    string path;
    for (auto const& part : parts)
    {
        if (!path.empty())
            path += ".";
        path += format_path_part(part);
    }
    return path;
}

} // namespace splicer
