#ifndef SPLICE_PATCH_OP_H
#define SPLICE_PATCH_OP_H

#include <ostream>
#include <vector>

#include <splice/core.h>
#include <splice/patch/path.h>

namespace splicer {

enum class patch_operation
{
    // Set a map field (creating it if necessary) or overwrite a list element.
    REPLACE,
    // Remove a map field or a list element.
    DELETE,
    // Add an element to the end of a list.
    APPEND,
    // Add an element before/after a selected list element.
    INSERT_BEFORE,
    INSERT_AFTER,
};

std::ostream&
operator<<(std::ostream& s, patch_operation op);

// A single patch instruction.
struct patch_op
{
    // the original path text (retained for diagnostics)
    string path;
    // the parsed path - This is filled in by normalize_path() and always has
    // at least one element once that has succeeded.
    std::vector<path_part> parsed_path;
    // the payload to write (nil for deletes)
    dynamic value;
    // derived from the last segment of parsed_path by normalize_path()
    patch_operation op = patch_operation::REPLACE;
    // an explicit target document - If this is omitted, the target is
    // resolved from the path.
    optional<string> target;
    // This marks the instruction as a removal even though its path has no
    // delete selector (e.g., it was listed under a record's 'delete' key).
    bool delete_requested = false;
};

// Parse :op.path, fill in parsed_path and derive the operation from the final
// segment. Throws patch_parse_error if the path is invalid or an operator
// appears in a non-final segment.
patch_op
normalize_path(patch_op op);

// Construct and normalize a patch instruction.
patch_op
make_patch_op(
    string const& path,
    dynamic value,
    optional<string> const& target = none,
    bool delete_requested = false);

// Get the operation implied by a segment in final position.
patch_operation
operation_for_match_type(match_type type);

dynamic
to_dynamic(patch_op const& op);

} // namespace splicer

#endif
