#include <splice/patch/target.h>

#include <splice/patch/apply.h>
#include <splice/patch/errors.h>
#include <splice/utilities/logging.h>

namespace splicer {

static string
get_string_field(dynamic const& map, string const& field)
{
    if (map.type() != value_type::MAP)
        return string();
    dynamic const* value;
    if (!get_field(&value, cast<dynamic_map>(map), field)
        || value->type() != value_type::STRING)
    {
        return string();
    }
    return cast<string>(*value);
}

named_document
make_named_document(dynamic content)
{
    named_document document;
    document.kind = get_string_field(content, "kind");
    if (content.type() == value_type::MAP)
    {
        dynamic const* metadata;
        if (get_field(&metadata, cast<dynamic_map>(content), "metadata"))
            document.name = get_string_field(*metadata, "name");
    }
    if (document.name.empty())
        document.name = get_string_field(content, "name");
    document.content = std::move(content);
    return document;
}

string
get_qualified_name(named_document const& document)
{
    return document.kind + "." + document.name;
}

// Check if the leading segments of :path name one of the candidates.
// If so, return the candidate's index and set *consumed to the number of
// segments that named it.
static optional<size_t>
match_leading_segments(
    std::vector<path_part> const& path,
    std::vector<named_document> const& candidates,
    size_t* consumed)
{
    // Only plain segments can name a document, and at least one segment has
    // to remain to address something within it.
    if (path.size() < 2 || path[0].type != match_type::NONE)
        return none;
    auto const& first = path[0].field;

    // "<kind>.<name>" always spans two segments, whichever delimiter the
    // path uses.
    optional<string> pair;
    if (path.size() > 2 && path[1].type == match_type::NONE)
        pair = first + "." + path[1].field;

    for (size_t i = 0; i != candidates.size(); ++i)
    {
        auto const& candidate = candidates[i];
        if (pair && !candidate.kind.empty()
            && iequals(*pair, get_qualified_name(candidate)))
        {
            *consumed = 2;
            return i;
        }
        if (!candidate.name.empty() && iequals(first, candidate.name))
        {
            *consumed = 1;
            return i;
        }
    }
    return none;
}

size_t
resolve_target(string const& path, std::vector<named_document> const& candidates)
{
    size_t consumed;
    auto match
        = match_leading_segments(parse_patch_path(path), candidates, &consumed);
    if (!match)
    {
        SPLICE_THROW(
            target_resolution_error()
            << patch_path_info(path)
            << patch_error_message_info(
                   "no document matches the path '" + path + "'"));
    }
    return *match;
}

size_t
resolve_explicit_target(
    string const& target, std::vector<named_document> const& candidates)
{
    for (size_t i = 0; i != candidates.size(); ++i)
    {
        auto const& candidate = candidates[i];
        if ((!candidate.name.empty() && candidate.name == target)
            || (!candidate.kind.empty()
                && iequals(target, get_qualified_name(candidate))))
        {
            return i;
        }
    }
    SPLICE_THROW(
        target_resolution_error()
        << patch_target_info(target)
        << patch_error_message_info(
               "explicit target '" + target + "' not found"));
}

bool
contains_path(dynamic const& document, std::vector<path_part> const& path)
{
    if (path.empty())
        return false;
    dynamic const* current = &document;
    for (size_t i = 0; i != path.size(); ++i)
    {
        auto const& part = path[i];
        // A final plain field (or field removal) only needs its map.
        if (i + 1 == path.size()
            && (part.type == match_type::NONE
                || (part.type == match_type::DELETE
                    && part.match_value.empty())))
        {
            return current->type() == value_type::MAP;
        }
        if (!part.field.empty())
        {
            if (current->type() != value_type::MAP
                || !get_field(&current, cast<dynamic_map>(*current), part.field))
            {
                return false;
            }
        }
        if (part.type == match_type::NONE)
            continue;
        if (current->type() != value_type::ARRAY)
            return false;
        if (part.type == match_type::APPEND)
            return true;
        auto const& array = cast<dynamic_array>(*current);
        auto index
            = find_list_element(array, parse_list_selector(part.match_value));
        if (!index)
            return false;
        current = &array[*index];
    }
    return true;
}

resolved_patch
resolve_patch_target(
    patch_op const& op, std::vector<named_document> const& candidates)
{
    resolved_patch resolved;
    resolved.op = op;

    if (op.target)
    {
        resolved.document_index = resolve_explicit_target(*op.target, candidates);
        get_logger()->debug(
            "patch '{}' targets {} (explicit)",
            op.path,
            get_qualified_name(candidates[resolved.document_index]));
        return resolved;
    }

    size_t consumed;
    auto match
        = match_leading_segments(op.parsed_path, candidates, &consumed);
    if (match)
    {
        resolved.document_index = *match;
        resolved.op.parsed_path.erase(
            resolved.op.parsed_path.begin(),
            resolved.op.parsed_path.begin() + consumed);
        resolved.op.path = format_patch_path(resolved.op.parsed_path);
        get_logger()->debug(
            "patch '{}' targets {} (by name)",
            op.path,
            get_qualified_name(candidates[*match]));
        return resolved;
    }

    // Fall back to the one document that already has what the path addresses.
    std::vector<size_t> containing;
    for (size_t i = 0; i != candidates.size(); ++i)
    {
        if (contains_path(candidates[i].content, op.parsed_path))
            containing.push_back(i);
    }
    if (containing.size() == 1)
    {
        resolved.document_index = containing.front();
        get_logger()->debug(
            "patch '{}' targets {} (by content)",
            op.path,
            get_qualified_name(candidates[containing.front()]));
        return resolved;
    }

    SPLICE_THROW(
        target_resolution_error()
        << patch_path_info(op.path)
        << patch_error_message_info(
               containing.empty()
                   ? "could not determine the target document for '" + op.path
                         + "'"
                   : "'" + op.path + "' could target "
                         + lexical_cast<string>(containing.size())
                         + " documents; give an explicit target"));
}

} // namespace splicer
