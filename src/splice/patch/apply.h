#ifndef SPLICE_PATCH_APPLY_H
#define SPLICE_PATCH_APPLY_H

#include <vector>

#include <splice/core.h>
#include <splice/patch/errors.h>
#include <splice/patch/op.h>
#include <splice/patch/target.h>

namespace splicer {

// Find the list element that :selector picks out. Negative indices count from
// the end. Key selectors pick the first element that's a map and has a field
// whose textual value matches.
optional<size_t>
find_list_element(dynamic_array const& list, list_selector const& selector);

// Apply a normalized patch instruction to :document, in place.
//
// Intermediate segments never create structure: a missing map field along the
// way is a path_not_found error (or a no-op for deletes). Deleting something
// that isn't there is also a no-op. Any other failure throws one of the
// patch_apply_error exceptions, in which case :document is left unmodified.
//
// The return value is a reference to :document.
dynamic&
apply_patch(dynamic& document, patch_op const& op);

struct apply_options
{
    // If this is set, failures are recorded in the report and the remaining
    // patches are still applied. Otherwise, the first failure is rethrown and
    // no document is modified.
    bool graceful = false;
};

struct apply_report
{
    size_t applied_count = 0;
    std::vector<patch_failure> failures;
};

inline bool
succeeded(apply_report const& report)
{
    return report.failures.empty();
}

// Apply a batch of patches to a set of documents. All targets are resolved
// before anything is applied, and patches are applied in order.
apply_report
apply_patches(
    std::vector<named_document>& documents,
    std::vector<patch_op> const& patches,
    apply_options const& options = apply_options());

// Check what would happen if :patches were applied gracefully to :documents,
// without modifying them.
apply_report
validate_patches(
    std::vector<named_document> const& documents,
    std::vector<patch_op> const& patches);

// Throw an aggregate_apply_error if :report has any failures.
void
check_apply_report(apply_report const& report);

} // namespace splicer

#endif
