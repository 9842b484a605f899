#include <splice/patch/op.h>

#include <sstream>

#include <splice/patch/errors.h>
#include <splice/utilities/errors.h>

namespace splicer {

std::ostream&
operator<<(std::ostream& s, patch_operation op)
{
    switch (op)
    {
        case patch_operation::REPLACE:
            s << "replace";
            break;
        case patch_operation::DELETE:
            s << "delete";
            break;
        case patch_operation::APPEND:
            s << "append";
            break;
        case patch_operation::INSERT_BEFORE:
            s << "insert-before";
            break;
        case patch_operation::INSERT_AFTER:
            s << "insert-after";
            break;
        default:
            SPLICE_THROW(
                invalid_enum_value() << enum_id_info("patch_operation")
                                     << enum_value_info(int(op)));
    }
    return s;
}

patch_operation
operation_for_match_type(match_type type)
{
    switch (type)
    {
        case match_type::NONE:
        case match_type::INDEX:
        case match_type::KEY:
            return patch_operation::REPLACE;
        case match_type::APPEND:
            return patch_operation::APPEND;
        case match_type::INSERT_BEFORE:
            return patch_operation::INSERT_BEFORE;
        case match_type::INSERT_AFTER:
            return patch_operation::INSERT_AFTER;
        case match_type::DELETE:
            return patch_operation::DELETE;
        default:
            SPLICE_THROW(
                invalid_enum_value()
                << enum_id_info("match_type") << enum_value_info(int(type)));
    }
}

[[noreturn]] static void
throw_normalization_error(patch_op const& op, string const& message)
{
    SPLICE_THROW(
        patch_parse_error()
        << patch_path_info(op.path) << parsing_error_info(message)
        << patch_error_message_info(
               "invalid patch '" + op.path + "': " + message));
}

patch_op
normalize_path(patch_op op)
{
    op.parsed_path = parse_patch_path(op.path);

    // Operators are only meaningful as the terminal action.
    for (size_t i = 0; i + 1 < op.parsed_path.size(); ++i)
    {
        auto const& part = op.parsed_path[i];
        if (part.type != match_type::NONE && part.type != match_type::INDEX
            && part.type != match_type::KEY)
        {
            std::ostringstream message;
            message << "'" << format_path_part(part) << "' uses the "
                    << part.type
                    << " operator, which is only allowed in the last segment";
            SPLICE_THROW(
                patch_parse_error()
                << patch_path_info(op.path) << path_segment_index_info(i)
                << parsing_error_info(message.str())
                << patch_error_message_info(
                       "invalid patch '" + op.path + "': " + message.str()));
        }
    }

    auto& last = op.parsed_path.back();
    if (op.delete_requested)
    {
        switch (last.type)
        {
            case match_type::NONE:
            case match_type::INDEX:
            case match_type::KEY:
                last.type = match_type::DELETE;
                break;
            case match_type::DELETE:
                break;
            default:
                throw_normalization_error(
                    op, "a delete can't be combined with an insert or append");
        }
    }

    op.op = operation_for_match_type(last.type);
    if (op.op == patch_operation::DELETE)
        op.value = nil;
    return op;
}

patch_op
make_patch_op(
    string const& path,
    dynamic value,
    optional<string> const& target,
    bool delete_requested)
{
    patch_op op;
    op.path = path;
    op.value = std::move(value);
    op.target = target;
    op.delete_requested = delete_requested;
    return normalize_path(std::move(op));
}

dynamic
to_dynamic(patch_op const& op)
{
    std::ostringstream operation;
    operation << op.op;
    dynamic_map map{{"path", op.path}, {"op", operation.str()}};
    if (op.op != patch_operation::DELETE)
        map["value"] = op.value;
    if (op.target)
        map["target"] = *op.target;
    return map;
}

} // namespace splicer
