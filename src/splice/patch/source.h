#ifndef SPLICE_PATCH_SOURCE_H
#define SPLICE_PATCH_SOURCE_H

#include <istream>
#include <map>
#include <vector>

#include <splice/core.h>
#include <splice/fs/types.h>
#include <splice/patch/op.h>

// PATCH SOURCES - Patch files come in three forms:
//
// A flat map from path to value, with targets resolved from the paths:
//
//   deployment.app.spec.replicas: 3
//   app.spec.template.spec.containers[-]: {name: sidecar}
//
// A list of targeted records:
//
//   - target: app
//     patch:
//       spec.replicas: 3
//     delete:
//       - metadata.annotations
//
// And a header form, where each [<kind>.<name>.<sections>...] header gives the
// target and a path prefix for the 'key: value' lines that follow it:
//
//   [deployment.app.spec.template.spec.containers.name=main]
//   image: nginx:1.25
//
// String values in all forms may reference ${values.<key>} and
// ${features.<flag>}.

namespace splicer {

struct variable_context
{
    dynamic_map values;
    std::map<string, bool> features;
};

// Replace ${values.<key>} and ${features.<flag>} references in the strings
// within :value. References to unknown variables are left as they are.
//
// A string that consists of exactly one reference takes on the referenced
// value itself (including its type). Otherwise, if anything was substituted,
// the resulting text is interpreted as a YAML scalar (so "${values.port}"
// embedded in "80${values.suffix}" can still yield an integer).
dynamic
substitute_variables(dynamic const& value, variable_context const& variables);

// Does :text look like the header form?
// (Its first significant line is a [...] header.)
bool
is_header_format(string const& text);

// A record in the targeted-list form.
struct targeted_patch_record
{
    string target;
    // path -> value
    dynamic_map patches;
    // paths to remove
    std::vector<string> deletions;
};

// Parse the text of a patch file, in any of the forms, into normalized patch
// instructions (in source order).
//
// Every instruction is checked before returning. If any of them are invalid,
// this throws an aggregate_parse_error that lists all of the failures.
std::vector<patch_op>
parse_patch_source(
    string const& text,
    variable_context const& variables = variable_context());

// Same, but reads the text from a stream.
std::vector<patch_op>
parse_patch_source(
    std::istream& reader,
    variable_context const& variables = variable_context());

// Same, but reads the text from a file.
std::vector<patch_op>
read_patch_file(
    file_path const& path,
    variable_context const& variables = variable_context());

} // namespace splicer

#endif
