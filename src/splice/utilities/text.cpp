#include <splice/utilities/text.h>

#include <cctype>

#include <boost/algorithm/string.hpp>

namespace splicer {

bool
iequals(string const& a, string const& b)
{
    return boost::algorithm::iequals(a, b);
}

string
to_lower(string const& s)
{
    return boost::algorithm::to_lower_copy(s);
}

string
trim(string const& s)
{
    return boost::algorithm::trim_copy(s);
}

bool
parse_integer(integer* value, string const& s)
{
    auto digits_start = (!s.empty() && s[0] == '-') ? 1 : 0;
    if (s.length() == size_t(digits_start))
        return false;
    for (size_t i = digits_start; i != s.length(); ++i)
    {
        if (!std::isdigit(static_cast<unsigned char>(s[i])))
            return false;
    }
    return boost::conversion::try_lexical_convert(s, *value);
}

} // namespace splicer
