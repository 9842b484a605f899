#include <splice/encodings/yaml.h>

#include <cctype>
#include <sstream>

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <yaml-cpp/yaml.h>
#pragma GCC diagnostic pop
#else
#include <yaml-cpp/yaml.h>
#endif

#include <splice/utilities/text.h>

namespace splicer {

// YAML I/O

static bool
looks_numeric(string const& s)
{
    if (s.empty())
        return false;
    char c = s[0];
    if (c == '-' || c == '+')
    {
        if (s.length() < 2)
            return false;
        c = s[1];
    }
    return std::isdigit(static_cast<unsigned char>(c)) || c == '.';
}

// Infer the type of a plain (unquoted) scalar.
static dynamic
infer_plain_scalar(string const& s)
{
    // Try to interpret it as a boolean.
    if (s == "true")
        return true;
    if (s == "false")
        return false;
    // Try to interpret it as a number.
    if (!s.compare(0, 2, "0x") && s.length() > 2)
    {
        std::istringstream stream(s.substr(2));
        integer i;
        stream >> std::hex >> i;
        if (!stream.fail() && stream.tellg() == std::streampos(-1))
        {
            return i;
        }
    }
    if (!s.compare(0, 2, "0o") && s.length() > 2)
    {
        std::istringstream stream(s.substr(2));
        integer i;
        stream >> std::oct >> i;
        if (!stream.fail() && stream.tellg() == std::streampos(-1))
        {
            return i;
        }
    }
    if (looks_numeric(s))
    {
        {
            integer i;
            if (boost::conversion::try_lexical_convert(s, i))
            {
                return i;
            }
        }
        {
            double d;
            if (boost::conversion::try_lexical_convert(s, d))
            {
                return d;
            }
        }
    }
    // If all else fails, it must just be a string.
    return s;
}

static bool
is_null_text(string const& s)
{
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

dynamic
parse_yaml_scalar(string const& text)
{
    if (is_null_text(text))
        return nil;
    return infer_plain_scalar(text);
}

// Read a YAML value into a dynamic.
static dynamic
read_yaml_value(YAML::Node const& yaml)
{
    switch (yaml.Type())
    {
        case YAML::NodeType::Null:
        default: // to avoid warnings
            return nil;
        case YAML::NodeType::Scalar: {
            // This case captures strings, booleans, integers, and doubles.
            // If the value was explicitly quoted, it's a string.
            if (yaml.Tag() == "!")
                return yaml.as<string>();
            return infer_plain_scalar(yaml.as<string>());
        }
        case YAML::NodeType::Sequence: {
            dynamic_array array;
            array.reserve(yaml.size());
            for (auto const& i : yaml)
            {
                array.push_back(read_yaml_value(i));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            dynamic_map map;
            for (YAML::Node::const_iterator i = yaml.begin(); i != yaml.end();
                 ++i)
            {
                if (!i->first.IsScalar())
                {
                    YAML::Emitter out;
                    out << i->first;
                    SPLICE_THROW(
                        parsing_error()
                        << expected_format_info("YAML")
                        << parsed_text_info(string(out.c_str(), out.size()))
                        << parsing_error_info("map keys must be scalars"));
                }
                map[i->first.as<string>()] = read_yaml_value(i->second);
            }
            return map;
        }
    }
}

static std::vector<YAML::Node>
load_yaml_stream(char const* yaml, size_t length)
{
    try
    {
        return YAML::LoadAll(string(yaml, yaml + length));
    }
    catch (YAML::Exception& e)
    {
        SPLICE_THROW(
            parsing_error() << expected_format_info("YAML")
                            << parsed_text_info(string(yaml, yaml + length))
                            << parsing_error_info(e.what()));
    }
}

dynamic
parse_yaml_value(char const* yaml, size_t length)
{
    auto documents = load_yaml_stream(yaml, length);
    if (documents.empty())
        return nil;
    return read_yaml_value(documents.front());
}

dynamic_array
parse_yaml_documents(string const& yaml)
{
    dynamic_array documents;
    for (auto const& node : load_yaml_stream(yaml.c_str(), yaml.length()))
    {
        if (node.IsNull())
            continue;
        documents.push_back(read_yaml_value(node));
    }
    return documents;
}

// Format a double so that reading it back yields a double again.
static string
format_double(double d)
{
    std::ostringstream stream;
    stream.precision(12);
    stream << d;
    string s = stream.str();
    if (infer_plain_scalar(s).type() != value_type::FLOAT)
        s += ".0";
    return s;
}

static void
emit_string(YAML::Emitter& out, string const& s)
{
    if (is_null_text(s) || infer_plain_scalar(s).type() != value_type::STRING)
    {
        // This happens to be a string that looks like some other scalar
        // type, so it should be explicitly quoted.
        out << YAML::DoubleQuoted << s;
    }
    else
    {
        out << s;
    }
}

static void
emit_yaml_value(YAML::Emitter& out, dynamic const& v, bool diagnostic)
{
    switch (v.type())
    {
        case value_type::NIL:
        default: // to avoid warnings
            out << YAML::Null;
            break;
        case value_type::BOOLEAN:
            out << cast<bool>(v);
            break;
        case value_type::INTEGER:
            out << cast<integer>(v);
            break;
        case value_type::FLOAT:
            out << format_double(cast<double>(v));
            break;
        case value_type::STRING:
            emit_string(out, cast<string>(v));
            break;
        case value_type::ARRAY: {
            dynamic_array const& array = cast<dynamic_array>(v);
            if (diagnostic && array.size() >= 64)
            {
                out << "<array - size: " + lexical_cast<string>(array.size())
                           + ">";
                break;
            }
            out << YAML::BeginSeq;
            for (auto const& i : array)
            {
                emit_yaml_value(out, i, diagnostic);
            }
            out << YAML::EndSeq;
            break;
        }
        case value_type::MAP: {
            dynamic_map const& x = cast<dynamic_map>(v);
            if (diagnostic && x.size() >= 64)
            {
                out << "<map - size: " + lexical_cast<string>(x.size()) + ">";
                break;
            }
            out << YAML::BeginMap;
            for (auto const& i : x)
            {
                out << YAML::Key;
                emit_string(out, i.first);
                out << YAML::Value;
                emit_yaml_value(out, i.second, diagnostic);
            }
            out << YAML::EndMap;
            break;
        }
    }
}

string
value_to_yaml(dynamic const& v)
{
    YAML::Emitter out;
    emit_yaml_value(out, v, false);
    return out.c_str();
}

string
value_to_yaml_documents(dynamic_array const& documents)
{
    string yaml;
    for (auto const& document : documents)
    {
        if (!yaml.empty())
            yaml += "---\n";
        yaml += value_to_yaml(document);
        yaml += "\n";
    }
    return yaml;
}

string
value_to_diagnostic_yaml(dynamic const& v)
{
    YAML::Emitter out;
    emit_yaml_value(out, v, true);
    return out.c_str();
}

} // namespace splicer
