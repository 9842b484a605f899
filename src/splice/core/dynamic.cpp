#include <splice/core/dynamic.h>

#include <algorithm>
#include <sstream>

#include <splice/encodings/yaml.h>
#include <splice/utilities/errors.h>
#include <splice/utilities/text.h>

namespace splicer {

std::ostream&
operator<<(std::ostream& s, value_type t)
{
    switch (t)
    {
        case value_type::NIL:
            s << "nil";
            break;
        case value_type::BOOLEAN:
            s << "boolean";
            break;
        case value_type::INTEGER:
            s << "integer";
            break;
        case value_type::FLOAT:
            s << "float";
            break;
        case value_type::STRING:
            s << "string";
            break;
        case value_type::ARRAY:
            s << "array";
            break;
        case value_type::MAP:
            s << "map";
            break;
        default:
            SPLICE_THROW(
                invalid_enum_value()
                << enum_id_info("value_type") << enum_value_info(int(t)));
    }
    return s;
}

void
check_type(value_type expected, value_type actual)
{
    if (expected != actual)
    {
        SPLICE_THROW(
            type_mismatch() << expected_value_type_info(expected)
                            << actual_value_type_info(actual));
    }
}

dynamic::dynamic(std::initializer_list<dynamic> list)
{
    // If this is a list of arrays, all of which are length two and have
    // strings as their first elements, treat it as a map.
    if (list.size() != 0
        && std::all_of(list.begin(), list.end(), [](dynamic const& v) {
               return v.type() == value_type::ARRAY
                      && cast<dynamic_array>(v).size() == 2
                      && cast<dynamic_array>(v)[0].type()
                             == value_type::STRING;
           }))
    {
        dynamic_map map;
        for (auto const& v : list)
        {
            auto const& array = cast<dynamic_array>(v);
            map.insert_or_assign(cast<string>(array[0]), array[1]);
        }
        *this = std::move(map);
    }
    else
    {
        *this = dynamic_array(list);
    }
}

void
dynamic::set(nil_t _)
{
    type_ = value_type::NIL;
    value_.reset();
}
void
dynamic::set(bool v)
{
    type_ = value_type::BOOLEAN;
    value_ = v;
}
void
dynamic::set(integer v)
{
    type_ = value_type::INTEGER;
    value_ = v;
}
void
dynamic::set(double v)
{
    type_ = value_type::FLOAT;
    value_ = v;
}
void
dynamic::set(string const& v)
{
    type_ = value_type::STRING;
    value_ = v;
}
void
dynamic::set(string&& v)
{
    type_ = value_type::STRING;
    value_ = std::move(v);
}
void
dynamic::set(dynamic_array const& v)
{
    type_ = value_type::ARRAY;
    value_ = v;
}
void
dynamic::set(dynamic_array&& v)
{
    type_ = value_type::ARRAY;
    value_ = std::move(v);
}
void
dynamic::set(dynamic_map const& v)
{
    type_ = value_type::MAP;
    value_ = v;
}
void
dynamic::set(dynamic_map&& v)
{
    type_ = value_type::MAP;
    value_ = std::move(v);
}

void
swap(dynamic& a, dynamic& b)
{
    using std::swap;
    swap(a.type_, b.type_);
    swap(a.value_, b.value_);
}

// MAPS

dynamic_map::dynamic_map(std::initializer_list<value_type> entries)
{
    for (auto const& entry : entries)
        insert_or_assign(entry.first, entry.second);
}

dynamic_map::iterator
dynamic_map::find(string const& key)
{
    return std::find_if(
        entries_.begin(), entries_.end(), [&](value_type const& entry) {
            return entry.first == key;
        });
}

dynamic_map::const_iterator
dynamic_map::find(string const& key) const
{
    return std::find_if(
        entries_.begin(), entries_.end(), [&](value_type const& entry) {
            return entry.first == key;
        });
}

dynamic&
dynamic_map::operator[](string const& key)
{
    auto i = find(key);
    if (i != entries_.end())
        return i->second;
    entries_.emplace_back(key, dynamic());
    return entries_.back().second;
}

std::pair<dynamic_map::iterator, bool>
dynamic_map::insert_or_assign(string const& key, dynamic value)
{
    auto i = find(key);
    if (i != entries_.end())
    {
        i->second = std::move(value);
        return std::make_pair(i, false);
    }
    entries_.emplace_back(key, std::move(value));
    return std::make_pair(entries_.end() - 1, true);
}

bool
dynamic_map::erase(string const& key)
{
    auto i = find(key);
    if (i == entries_.end())
        return false;
    entries_.erase(i);
    return true;
}

dynamic_map::iterator
dynamic_map::erase(const_iterator position)
{
    return entries_.erase(position);
}

bool
operator==(dynamic_map const& a, dynamic_map const& b)
{
    if (a.size() != b.size())
        return false;
    for (auto const& entry : a)
    {
        auto i = b.find(entry.first);
        if (i == b.end() || i->second != entry.second)
            return false;
    }
    return true;
}
bool
operator!=(dynamic_map const& a, dynamic_map const& b)
{
    return !(a == b);
}

dynamic const&
get_field(dynamic_map const& r, string const& field)
{
    dynamic const* v;
    if (!get_field(&v, r, field))
    {
        SPLICE_THROW(missing_field() << field_name_info(field));
    }
    return *v;
}

dynamic&
get_field(dynamic_map& r, string const& field)
{
    dynamic* v;
    if (!get_field(&v, r, field))
    {
        SPLICE_THROW(missing_field() << field_name_info(field));
    }
    return *v;
}

bool
get_field(dynamic const** v, dynamic_map const& r, string const& field)
{
    auto i = r.find(field);
    if (i == r.end())
        return false;
    *v = &i->second;
    return true;
}

bool
get_field(dynamic** v, dynamic_map& r, string const& field)
{
    auto i = r.find(field);
    if (i == r.end())
        return false;
    *v = &i->second;
    return true;
}

dynamic&
set_field(dynamic_map& r, string const& field, dynamic value)
{
    return r.insert_or_assign(field, std::move(value)).first->second;
}

bool
remove_field(dynamic_map& r, string const& field)
{
    return r.erase(field);
}

// ARRAYS

void
insert_item(dynamic_array& array, size_t index, dynamic value)
{
    if (index > array.size())
    {
        SPLICE_THROW(
            index_out_of_bounds() << index_value_info(index)
                                  << index_upper_bound_info(array.size() + 1));
    }
    array.insert(array.begin() + index, std::move(value));
}

void
remove_item(dynamic_array& array, size_t index)
{
    if (index >= array.size())
    {
        SPLICE_THROW(
            index_out_of_bounds() << index_value_info(index)
                                  << index_upper_bound_info(array.size()));
    }
    array.erase(array.begin() + index);
}

// VALUES

bool
is_scalar(dynamic const& v)
{
    return v.type() != value_type::ARRAY && v.type() != value_type::MAP;
}

optional<string>
scalar_to_string(dynamic const& v)
{
    switch (v.type())
    {
        case value_type::NIL:
            return some(string("null"));
        case value_type::BOOLEAN:
            return some(string(cast<bool>(v) ? "true" : "false"));
        case value_type::INTEGER:
            return some(lexical_cast<string>(cast<integer>(v)));
        case value_type::FLOAT: {
            std::ostringstream stream;
            stream << cast<double>(v);
            return some(stream.str());
        }
        case value_type::STRING:
            return some(cast<string>(v));
        case value_type::ARRAY:
        case value_type::MAP:
        default:
            return none;
    }
}

std::ostream&
operator<<(std::ostream& os, dynamic const& v)
{
    os << value_to_diagnostic_yaml(v);
    return os;
}

// COMPARISON OPERATORS

bool
operator==(dynamic const& a, dynamic const& b)
{
    if (a.type() != b.type())
        return false;
    return apply_to_dynamic_pair(
        [](auto const& x, auto const& y) { return x == y; }, a, b);
}
bool
operator!=(dynamic const& a, dynamic const& b)
{
    return !(a == b);
}

} // namespace splicer
