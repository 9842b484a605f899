#ifndef SPLICE_PATCH_PATH_H
#define SPLICE_PATCH_PATH_H

#include <ostream>
#include <vector>

#include <splice/core.h>

// PATCH PATHS - A patch path addresses a location within a document, e.g.,
//
//   spec.containers[name=main].image
//   spec/containers[name=main]/image
//
// Segments are separated by '.' or '/' (but not both in the same path). Each
// segment names a map field and may carry one bracketed selector that picks
// an element out of the list stored in that field (or, if the field name is
// empty, out of the current list itself).

namespace splicer {

enum class match_type
{
    // pure map-field descent
    NONE,
    // [N] - the element at index N (negative counts from the end)
    INDEX,
    // [k=v] - the first element whose field k has the textual value v
    KEY,
    // [-] - a new element at the end
    APPEND,
    // [-=N], [-=k=v] - a new element before the selected one
    INSERT_BEFORE,
    // [+=N], [+=k=v] - a new element after the selected one
    INSERT_AFTER,
    // [delete], [delete=N], [delete=k=v] - removal of the field (if there's
    // no operand) or of the selected element
    DELETE,
};

std::ostream&
operator<<(std::ostream& s, match_type t);

struct path_part
{
    string field;
    match_type type = match_type::NONE;
    // The selector operand: an integer index or a "key=value" expression.
    // This is empty for NONE, APPEND and a field-level DELETE.
    string match_value;
};

bool
operator==(path_part const& a, path_part const& b);
bool
operator!=(path_part const& a, path_part const& b);

std::ostream&
operator<<(std::ostream& s, path_part const& p);

// Parse a patch path into its segments.
// Leading and trailing delimiters are ignored.
// Throws patch_parse_error if the path is malformed.
std::vector<path_part>
parse_patch_path(string const& path);

// Write parsed segments back out in dot-delimited form.
string
format_patch_path(std::vector<path_part> const& parts);

// Format a single segment (e.g., "containers[name=main]").
string
format_path_part(path_part const& part);

// A selector operand that picks an element out of a list.
struct list_selector
{
    // If this is set, the selector is an index. Otherwise, it's a key match.
    optional<integer> index;
    string key;
    string value;
};

// Interpret the operand of an INDEX, KEY, INSERT_* or DELETE segment.
// Throws patch_parse_error if it's neither an integer nor a "key=value"
// expression with a nonempty key.
list_selector
parse_list_selector(string const& operand);

} // namespace splicer

#endif
