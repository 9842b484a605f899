#ifndef SPLICE_ENCODINGS_YAML_H
#define SPLICE_ENCODINGS_YAML_H

#include <splice/core.h>

// YAML - conversion to and from YAML strings

namespace splicer {

// Parse some YAML text into a dynamic value.
// If the text contains more than one document, only the first is returned.
dynamic
parse_yaml_value(char const* yaml, size_t length);

// Same as above, but accepts a string.
inline dynamic
parse_yaml_value(string const& yaml)
{
    return parse_yaml_value(yaml.c_str(), yaml.length());
}

// Parse a YAML stream that may contain several documents separated by '---'.
// Empty documents are skipped.
dynamic_array
parse_yaml_documents(string const& yaml);

// Interpret a piece of unquoted text the way the YAML reader would interpret
// it as a plain scalar (e.g., "8080" becomes an integer, "true" a boolean,
// "null" and "" nil, and anything else stays a string).
dynamic
parse_yaml_scalar(string const& text);

// Write a value to a string in YAML format.
string
value_to_yaml(dynamic const& v);

// Write a list of values as a multi-document YAML stream.
string
value_to_yaml_documents(dynamic_array const& documents);

// Write a value to a diagnostic string in YAML format.
// This won't necessarily capture the entire contents of the value. In
// particular, it will elide the contents of large arrays and maps.
string
value_to_diagnostic_yaml(dynamic const& v);

} // namespace splicer

#endif
