#ifndef SPLICE_PATCH_TARGET_H
#define SPLICE_PATCH_TARGET_H

#include <vector>

#include <splice/core.h>
#include <splice/patch/op.h>

namespace splicer {

// A loaded document along with the identifiers used to target it.
struct named_document
{
    // from the document's 'kind' field (or empty)
    string kind;
    // from 'metadata.name', falling back to a top-level 'name' (or empty)
    string name;
    dynamic content;
};

// Wrap a document, extracting its kind and name.
named_document
make_named_document(dynamic content);

// Get the "<kind>.<name>" identifier for a document.
string
get_qualified_name(named_document const& document);

// Get the index of the document that :path targets, using the naming
// convention that the path's leading segments name the document. The first
// segment is compared (case-insensitively) against each candidate's name, and
// the first two segments are tried together against "<kind>.<name>" (e.g.,
// "deployment.app.spec.replicas" or "Deployment/app/spec/replicas"). The first
// match in load order wins.
//
// Throws target_resolution_error if nothing matches.
size_t
resolve_target(string const& path, std::vector<named_document> const& candidates);

// Get the index of the document named by an explicit target. The target
// matches a document's exact name, or its "<kind>.<name>" (ignoring case).
//
// Throws target_resolution_error if the target is unknown.
size_t
resolve_explicit_target(
    string const& target, std::vector<named_document> const& candidates);

struct resolved_patch
{
    size_t document_index;
    // the instruction, with any segments that named the document removed
    patch_op op;
};

// Resolve the document that a normalized patch instruction applies to.
// If the instruction has an explicit target, that's used. Otherwise, the path
// is checked against the naming convention (see resolve_target()). If that
// fails and exactly one document already contains the location that the path
// addresses, that document is used.
resolved_patch
resolve_patch_target(
    patch_op const& op, std::vector<named_document> const& candidates);

// Does :document already contain the location that :path addresses? (For
// list operations, this checks the list itself.)
bool
contains_path(dynamic const& document, std::vector<path_part> const& path);

} // namespace splicer

#endif
