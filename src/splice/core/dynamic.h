#ifndef SPLICE_CORE_DYNAMIC_H
#define SPLICE_CORE_DYNAMIC_H

#include <initializer_list>
#include <ostream>

#include <splice/core/exception.h>
#include <splice/core/type_definitions.h>

namespace splicer {

// DYNAMIC VALUES - Dynamic values are values whose structure is determined at
// run-time rather than compile time. Configuration documents are loaded into
// trees of dynamic values and patched in place.

std::ostream&
operator<<(std::ostream& s, value_type t);

// Check that two value types match.
void
check_type(value_type expected, value_type actual);

// If the above check fails, it throws this exception.
SPLICE_DEFINE_EXCEPTION(type_mismatch)
SPLICE_DEFINE_ERROR_INFO(value_type, expected_value_type)
SPLICE_DEFINE_ERROR_INFO(value_type, actual_value_type)

// Get the value_type value for a C++ type.
template<class T>
struct value_type_of
{
};
template<>
struct value_type_of<nil_t>
{
    static value_type const value = value_type::NIL;
};
template<>
struct value_type_of<bool>
{
    static value_type const value = value_type::BOOLEAN;
};
template<>
struct value_type_of<integer>
{
    static value_type const value = value_type::INTEGER;
};
template<>
struct value_type_of<double>
{
    static value_type const value = value_type::FLOAT;
};
template<>
struct value_type_of<string>
{
    static value_type const value = value_type::STRING;
};
template<>
struct value_type_of<dynamic_array>
{
    static value_type const value = value_type::ARRAY;
};
template<>
struct value_type_of<dynamic_map>
{
    static value_type const value = value_type::MAP;
};

// MAPS

// dynamic_map is a string-keyed map that preserves the order in which keys
// were first inserted, so that documents keep their field order when they're
// patched and written back out. Keys are unique. Assigning to an existing key
// keeps that key's position.
class dynamic_map
{
 public:
    typedef std::pair<string, dynamic> value_type;
    typedef std::vector<value_type>::iterator iterator;
    typedef std::vector<value_type>::const_iterator const_iterator;

    dynamic_map()
    {
    }

    // Later duplicates of a key overwrite earlier ones.
    dynamic_map(std::initializer_list<value_type> entries);

    iterator
    begin()
    {
        return entries_.begin();
    }
    iterator
    end()
    {
        return entries_.end();
    }
    const_iterator
    begin() const
    {
        return entries_.begin();
    }
    const_iterator
    end() const
    {
        return entries_.end();
    }

    size_t
    size() const
    {
        return entries_.size();
    }
    bool
    empty() const
    {
        return entries_.empty();
    }

    iterator
    find(string const& key);
    const_iterator
    find(string const& key) const;

    bool
    contains(string const& key) const
    {
        return find(key) != end();
    }

    // Get the value associated with :key, appending a nil entry if there
    // isn't one yet.
    dynamic&
    operator[](string const& key);

    // Set the value for :key. The returned flag is true iff :key was new.
    std::pair<iterator, bool>
    insert_or_assign(string const& key, dynamic value);

    // Remove :key, returning whether it was present.
    bool
    erase(string const& key);

    iterator
    erase(const_iterator position);

    void
    clear()
    {
        entries_.clear();
    }

 private:
    std::vector<value_type> entries_;
};

// Maps are equal if they have the same keys with equal values, regardless of
// the order of those keys.
bool
operator==(dynamic_map const& a, dynamic_map const& b);
bool
operator!=(dynamic_map const& a, dynamic_map const& b);

// This queries a map for a field with a key matching the given string.
// If the field is not present in the map, an exception is thrown.
dynamic const&
get_field(dynamic_map const& r, string const& field);
// non-const version
dynamic&
get_field(dynamic_map& r, string const& field);

SPLICE_DEFINE_EXCEPTION(missing_field)
SPLICE_DEFINE_ERROR_INFO(string, field_name)

// This is the same as above, but its return value indicates whether or not
// the field is in the map.
bool
get_field(dynamic const** v, dynamic_map const& r, string const& field);
// non-const version
bool
get_field(dynamic** v, dynamic_map& r, string const& field);

// Set a field in a map, creating it (at the end) if it isn't already there.
// Returns a reference to the stored value.
dynamic&
set_field(dynamic_map& r, string const& field, dynamic value);

// Remove a field from a map. Returns false if the field wasn't there.
bool
remove_field(dynamic_map& r, string const& field);

// ARRAYS

// Insert :value into :array so that it ends up at :index.
// :index may be equal to the array size, which appends.
void
insert_item(dynamic_array& array, size_t index, dynamic value);

// Remove the item at :index.
void
remove_item(dynamic_array& array, size_t index);

// The above throw this if the index is out of range.
SPLICE_DEFINE_EXCEPTION(index_out_of_bounds)
SPLICE_DEFINE_ERROR_INFO(size_t, index_value)
SPLICE_DEFINE_ERROR_INFO(size_t, index_upper_bound)

// VALUES

// Cast a dynamic value to one of the base types.
template<class T>
T const&
cast(dynamic const& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::any_cast<T const&>(v.contents());
}
// Same, but with a non-const reference.
template<class T>
T&
cast(dynamic& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::any_cast<T&>(v.contents());
}
// Same, but with move semantics.
template<class T>
T&&
cast(dynamic&& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::any_cast<T&&>(std::move(v).contents());
}

// Is this a scalar (i.e., not an array or map)?
bool
is_scalar(dynamic const& v);

// Get the textual form of a scalar value, as it would be written in a patch
// selector (e.g., 80, true, main). Arrays and maps have no textual form, so
// for those this returns none.
optional<string>
scalar_to_string(dynamic const& v);

std::ostream&
operator<<(std::ostream& os, dynamic const& v);

void
swap(dynamic& a, dynamic& b);

// to_dynamic is the customization point for converting other types to dynamic
// values (e.g., for logging). Types that are already implicitly convertible
// use this.
inline dynamic
to_dynamic(dynamic const& v)
{
    return v;
}

inline bool
operator==(nil_t, nil_t)
{
    return true;
}
inline bool
operator!=(nil_t, nil_t)
{
    return false;
}

bool
operator==(dynamic const& a, dynamic const& b);
bool
operator!=(dynamic const& a, dynamic const& b);

// Apply the functor fn to two values of the same type.
// If a and b are not the same type, this throws a type_mismatch exception.
template<class Fn>
auto
apply_to_dynamic_pair(Fn&& fn, dynamic const& a, dynamic const& b)
{
    check_type(a.type(), b.type());
    switch (a.type())
    {
        case value_type::NIL:
        default: // All cases are covered, so this is just to avoid warnings.
            return fn(nil, nil);
        case value_type::BOOLEAN:
            return fn(cast<bool>(a), cast<bool>(b));
        case value_type::INTEGER:
            return fn(cast<integer>(a), cast<integer>(b));
        case value_type::FLOAT:
            return fn(cast<double>(a), cast<double>(b));
        case value_type::STRING:
            return fn(cast<string>(a), cast<string>(b));
        case value_type::ARRAY:
            return fn(cast<dynamic_array>(a), cast<dynamic_array>(b));
        case value_type::MAP:
            return fn(cast<dynamic_map>(a), cast<dynamic_map>(b));
    }
}

} // namespace splicer

#endif
