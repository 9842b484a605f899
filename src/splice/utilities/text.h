#ifndef SPLICE_UTILITIES_TEXT_H
#define SPLICE_UTILITIES_TEXT_H

#include <boost/lexical_cast.hpp>

#include <splice/core/exception.h>

namespace splicer {

using boost::lexical_cast;

// If a simple parsing operation fails, this exception can be thrown.
SPLICE_DEFINE_EXCEPTION(parsing_error)
SPLICE_DEFINE_ERROR_INFO(string, expected_format)
SPLICE_DEFINE_ERROR_INFO(string, parsed_text)
SPLICE_DEFINE_ERROR_INFO(string, parsing_error)

// Do the two strings match, ignoring ASCII case?
bool
iequals(string const& a, string const& b);

// Get a copy of :s with all ASCII letters lowered.
string
to_lower(string const& s);

// Remove leading and trailing whitespace.
string
trim(string const& s);

// Does :s consist entirely of an optional '-' followed by decimal digits?
// If so, and the value fits in an integer, *value receives it.
bool
parse_integer(integer* value, string const& s);

} // namespace splicer

#endif
