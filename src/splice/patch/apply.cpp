#include <splice/patch/apply.h>

#include <algorithm>
#include <sstream>

#include <splice/utilities/logging.h>

namespace splicer {

optional<size_t>
find_list_element(dynamic_array const& list, list_selector const& selector)
{
    if (selector.index)
    {
        integer index = *selector.index;
        integer size = integer(list.size());
        if (index < 0)
            index += size;
        if (index < 0 || index >= size)
            return none;
        return size_t(index);
    }
    for (size_t i = 0; i != list.size(); ++i)
    {
        auto const& item = list[i];
        if (item.type() != value_type::MAP)
            continue;
        dynamic const* field;
        if (!get_field(&field, cast<dynamic_map>(item), selector.key))
            continue;
        auto text = scalar_to_string(*field);
        if (text && *text == selector.value)
            return i;
    }
    return none;
}

namespace {

// Walks a document along a patch's path, reporting failures against the
// patch.
struct path_walker
{
    patch_op const& op;
    size_t segment = 0;

    [[noreturn]] void
    type_mismatch(value_type expected, value_type actual, string const& what)
    {
        std::ostringstream message;
        message << "segment " << segment << " of '" << op.path << "': "
                << what << " needs a " << expected << " but found a "
                << actual;
        SPLICE_THROW(
            patch_type_mismatch()
            << patch_path_info(op.path) << path_segment_index_info(segment)
            << expected_value_type_info(expected)
            << actual_value_type_info(actual)
            << patch_error_message_info(message.str()));
    }

    [[noreturn]] void
    missing_field(string const& field)
    {
        SPLICE_THROW(
            path_not_found()
            << patch_path_info(op.path) << path_segment_index_info(segment)
            << field_name_info(field)
            << patch_error_message_info(
                   "segment " + lexical_cast<string>(segment) + " of '"
                   + op.path + "': field '" + field + "' not found"));
    }

    [[noreturn]] void
    no_match(string const& selector)
    {
        SPLICE_THROW(
            selector_not_found()
            << patch_path_info(op.path) << path_segment_index_info(segment)
            << path_selector_info(selector)
            << patch_error_message_info(
                   "segment " + lexical_cast<string>(segment) + " of '"
                   + op.path + "': no element matches [" + selector + "]"));
    }

    dynamic_map&
    expect_map(dynamic& v, string const& field)
    {
        if (v.type() != value_type::MAP)
            type_mismatch(value_type::MAP, v.type(), "field '" + field + "'");
        return cast<dynamic_map>(v);
    }

    dynamic_array&
    expect_list(dynamic& v, string const& selector)
    {
        if (v.type() != value_type::ARRAY)
        {
            type_mismatch(
                value_type::ARRAY, v.type(), "selector [" + selector + "]");
        }
        return cast<dynamic_array>(v);
    }

    // Descend into the field named by :part (if any). Returns nullptr if the
    // field doesn't exist and that's acceptable.
    dynamic*
    descend_field(dynamic& current, path_part const& part, bool missing_ok)
    {
        if (part.field.empty())
            return &current;
        auto& map = expect_map(current, part.field);
        dynamic* child;
        if (!get_field(&child, map, part.field))
        {
            if (missing_ok)
                return nullptr;
            missing_field(part.field);
        }
        return child;
    }

    optional<size_t>
    select(dynamic_array const& list, string const& selector, bool missing_ok)
    {
        auto index = find_list_element(list, parse_list_selector(selector));
        if (!index && !missing_ok)
            no_match(selector);
        return index;
    }
};

} // namespace

dynamic&
apply_patch(dynamic& document, patch_op const& op)
{
    SPLICE_LOG_CALL(<< SPLICE_LOG_ARG(op))

    if (op.parsed_path.empty())
    {
        SPLICE_THROW(
            patch_parse_error()
            << patch_path_info(op.path)
            << parsing_error_info("patch has not been normalized")
            << patch_error_message_info(
                   "patch '" + op.path + "' has not been normalized"));
    }

    bool is_delete = op.op == patch_operation::DELETE;
    path_walker walker{op};

    // Navigate to the container of the final segment.
    dynamic* current = &document;
    auto const last = op.parsed_path.size() - 1;
    for (; walker.segment != last; ++walker.segment)
    {
        auto const& part = op.parsed_path[walker.segment];
        current = walker.descend_field(*current, part, is_delete);
        if (!current)
            return document;
        if (part.type == match_type::INDEX || part.type == match_type::KEY)
        {
            auto& list = walker.expect_list(*current, part.match_value);
            auto index = walker.select(list, part.match_value, is_delete);
            if (!index)
                return document;
            current = &list[*index];
        }
    }

    auto const& part = op.parsed_path[last];
    switch (op.op)
    {
        case patch_operation::REPLACE: {
            if (part.type == match_type::NONE)
            {
                set_field(
                    walker.expect_map(*current, part.field),
                    part.field,
                    op.value);
                break;
            }
            auto& list = walker.expect_list(
                *walker.descend_field(*current, part, false),
                part.match_value);
            auto index = walker.select(list, part.match_value, false);
            list[*index] = op.value;
            break;
        }
        case patch_operation::DELETE: {
            if (part.match_value.empty())
            {
                remove_field(
                    walker.expect_map(*current, part.field), part.field);
                break;
            }
            auto* container = walker.descend_field(*current, part, true);
            if (!container)
                break;
            auto& list = walker.expect_list(*container, part.match_value);
            auto index = walker.select(list, part.match_value, true);
            if (index)
                remove_item(list, *index);
            break;
        }
        case patch_operation::APPEND: {
            auto& list = walker.expect_list(
                *walker.descend_field(*current, part, false), "-");
            list.push_back(op.value);
            break;
        }
        case patch_operation::INSERT_BEFORE:
        case patch_operation::INSERT_AFTER: {
            auto& list = walker.expect_list(
                *walker.descend_field(*current, part, false),
                part.match_value);
            auto index = *walker.select(list, part.match_value, false);
            if (op.op == patch_operation::INSERT_AFTER)
                ++index;
            insert_item(list, index, op.value);
            break;
        }
    }
    return document;
}

namespace {

struct resolution
{
    size_t patch_index;
    resolved_patch patch;
};

} // namespace

// Resolve the targets of all patches. In graceful mode, failures are recorded
// in :report. Otherwise, they're thrown.
static std::vector<resolution>
resolve_all(
    std::vector<named_document> const& documents,
    std::vector<patch_op> const& patches,
    bool graceful,
    apply_report& report)
{
    std::vector<resolution> resolutions;
    resolutions.reserve(patches.size());
    for (size_t i = 0; i != patches.size(); ++i)
    {
        try
        {
            resolutions.push_back(
                resolution{i, resolve_patch_target(patches[i], documents)});
        }
        catch (target_resolution_error& e)
        {
            if (!graceful)
                throw;
            get_logger()->warn(
                "skipping patch {}: {}", i, get_patch_error_message(e));
            report.failures.push_back(
                patch_failure{i, patches[i].path, get_patch_error_message(e)});
        }
    }
    return resolutions;
}

apply_report
apply_patches(
    std::vector<named_document>& documents,
    std::vector<patch_op> const& patches,
    apply_options const& options)
{
    apply_report report;
    auto resolutions
        = resolve_all(documents, patches, options.graceful, report);

    if (options.graceful)
    {
        // apply_patch() leaves a document untouched when it fails, so the
        // documents can be patched directly.
        for (auto const& r : resolutions)
        {
            try
            {
                apply_patch(
                    documents[r.patch.document_index].content, r.patch.op);
                ++report.applied_count;
            }
            catch (patch_apply_error& e)
            {
                get_logger()->warn(
                    "skipping patch {}: {}",
                    r.patch_index,
                    get_patch_error_message(e));
                report.failures.push_back(patch_failure{
                    r.patch_index,
                    patches[r.patch_index].path,
                    get_patch_error_message(e)});
            }
        }
        // Resolution failures were recorded first. Report in patch order.
        std::stable_sort(
            report.failures.begin(),
            report.failures.end(),
            [](patch_failure const& a, patch_failure const& b) {
                return a.index < b.index;
            });
        return report;
    }

    // Otherwise, work on copies so that a failure leaves everything as it was.
    std::vector<dynamic> working;
    working.reserve(documents.size());
    for (auto const& document : documents)
        working.push_back(document.content);
    for (auto const& r : resolutions)
    {
        apply_patch(working[r.patch.document_index], r.patch.op);
        ++report.applied_count;
    }
    for (size_t i = 0; i != documents.size(); ++i)
        swap(documents[i].content, working[i]);
    return report;
}

apply_report
validate_patches(
    std::vector<named_document> const& documents,
    std::vector<patch_op> const& patches)
{
    auto copies = documents;
    apply_options options;
    options.graceful = true;
    return apply_patches(copies, patches, options);
}

void
check_apply_report(apply_report const& report)
{
    if (!report.failures.empty())
    {
        SPLICE_THROW(
            aggregate_apply_error()
            << patch_apply_failures_info(report.failures)
            << patch_error_message_info(
                   lexical_cast<string>(report.failures.size())
                   + " patch(es) failed to apply"));
    }
}

} // namespace splicer
