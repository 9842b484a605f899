#ifndef SPLICE_ENCODINGS_JSON_H
#define SPLICE_ENCODINGS_JSON_H

#include <splice/core.h>

// JSON - conversion to and from JSON strings

namespace splicer {

// Parse some JSON text into a dynamic value.
dynamic
parse_json_value(char const* json, size_t length);

// Same as above, but accepts a string.
inline dynamic
parse_json_value(string const& json)
{
    return parse_json_value(json.c_str(), json.length());
}

// Write a value to a string in JSON format.
// Map fields are written in their stored order.
string
value_to_json(dynamic const& v);

} // namespace splicer

#endif
