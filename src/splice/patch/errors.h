#ifndef SPLICE_PATCH_ERRORS_H
#define SPLICE_PATCH_ERRORS_H

#include <ostream>
#include <vector>

#include <splice/core/dynamic.h>
#include <splice/utilities/text.h>

// Exceptions thrown while parsing, resolving and applying patches.
//
// Every patch exception carries a patch_error_message_info with a short,
// human-readable description of the problem, and (where there is one) the
// text of the offending patch path.

namespace splicer {

SPLICE_DEFINE_ERROR_INFO(string, patch_error_message)
SPLICE_DEFINE_ERROR_INFO(string, patch_path)
SPLICE_DEFINE_ERROR_INFO(string, patch_target)
// the zero-based index of the path segment at which an error occurred
SPLICE_DEFINE_ERROR_INFO(size_t, path_segment_index)
SPLICE_DEFINE_ERROR_INFO(string, path_selector)

// The path (or the patch source) is malformed. This also uses
// parsing_error_info to describe the specific grammar violation.
SPLICE_DEFINE_EXCEPTION(patch_parse_error)

// No document matches the patch, or an explicit target names a document that
// doesn't exist.
SPLICE_DEFINE_EXCEPTION(target_resolution_error)

// The patch couldn't be applied to the document it was resolved to.
SPLICE_DEFINE_EXCEPTION(patch_apply_error)
// A Field was navigated through something other than a map, or a selector
// through something other than a list. This also uses the
// expected_value_type and actual_value_type infos.
SPLICE_DEFINE_DERIVED_EXCEPTION(patch_type_mismatch, patch_apply_error)
// An Index or Key selector matched no element.
SPLICE_DEFINE_DERIVED_EXCEPTION(selector_not_found, patch_apply_error)
// A map field that the path needs to pass through (or a list that the
// operation needs) doesn't exist.
SPLICE_DEFINE_DERIVED_EXCEPTION(path_not_found, patch_apply_error)

// A single failure within a batch of patches.
struct patch_failure
{
    // the position of the instruction within its batch
    size_t index;
    string path;
    string message;
};

bool
operator==(patch_failure const& a, patch_failure const& b);
bool
operator!=(patch_failure const& a, patch_failure const& b);

std::ostream&
operator<<(std::ostream& s, patch_failure const& f);

std::ostream&
operator<<(std::ostream& s, std::vector<patch_failure> const& failures);

// Thrown when parsing a patch source produced one or more errors. All of the
// source's instructions are checked before this is thrown.
SPLICE_DEFINE_EXCEPTION(aggregate_parse_error)
SPLICE_DEFINE_ERROR_INFO(std::vector<patch_failure>, patch_parse_failures)

// Thrown (on request) when a graceful batch application had failures.
SPLICE_DEFINE_EXCEPTION(aggregate_apply_error)
SPLICE_DEFINE_ERROR_INFO(std::vector<patch_failure>, patch_apply_failures)

// Get the human-readable message for a patch exception, falling back to its
// full diagnostic information if it doesn't have one.
string
get_patch_error_message(boost::exception const& e);

} // namespace splicer

#endif
