#ifndef SPLICE_UTILITIES_ERRORS_H
#define SPLICE_UTILITIES_ERRORS_H

#include <splice/core/exception.h>

namespace splicer {

// If an error occurs internally within library that provides its own
// error messages, this is used to convey that message.
SPLICE_DEFINE_ERROR_INFO(string, internal_error_message)

// This can be used to flag errors that represent failed checks on conditions
// that should be guaranteed internally.
SPLICE_DEFINE_EXCEPTION(internal_check_failed)

// invalid_enum_value is thrown when an enum's raw (integer) value is invalid.
SPLICE_DEFINE_EXCEPTION(invalid_enum_value)
SPLICE_DEFINE_ERROR_INFO(string, enum_id)
SPLICE_DEFINE_ERROR_INFO(int, enum_value)

// invalid_enum_string is thrown when attempting to convert a string value to
// an enum and the string doesn't match any of the enum's cases.
SPLICE_DEFINE_EXCEPTION(invalid_enum_string)
// Note that this also uses the enum_id info declared above.
SPLICE_DEFINE_ERROR_INFO(string, enum_string)

} // namespace splicer

#endif
