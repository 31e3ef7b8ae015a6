#pragma once
#include "sortedschema/types.hpp"

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sortedschema
{

class SortedDict;
class SortedList;
class SortedSet;
struct Value;

struct List
{
    std::vector<Value> items;
};

struct Tuple
{
    std::vector<Value> items;
};

/// Native set. Built through Value::set, which keeps items sorted and unique.
struct Set
{
    std::vector<Value> items;
};

/// Native mapping in insertion order with unique keys.
struct Dict
{
    std::vector<std::pair<Value, Value>> items;
};

enum class ValueType
{
    None,
    Bool,
    Int,
    Float,
    Str,
    List,
    Tuple,
    Set,
    Dict,
    SortedDict,
    SortedList,
    SortedSet
};

std::string to_string(ValueType type);

/// Dynamically typed native value passed through validation and serialization.
struct Value
{
    using variant_t =
        std::variant<std::nullptr_t, bool, int64_t, double, std::string, List, Tuple, Set, Dict,
                     std::shared_ptr<const SortedDict>, std::shared_ptr<const SortedList>,
                     std::shared_ptr<const SortedSet>>;

    variant_t value;

    Value() : value(nullptr) {}
    Value(std::nullptr_t v) : value(v) {}
    Value(bool v) : value(v) {}
    Value(int64_t v) : value(v) {}
    Value(int v) : value(static_cast<int64_t>(v)) {}
    Value(double v) : value(v) {}
    Value(const std::string& v) : value(v) {}
    Value(std::string&& v) : value(std::move(v)) {}
    Value(const char* v) : value(std::string(v)) {}
    Value(List v) : value(std::move(v)) {}
    Value(Tuple v) : value(std::move(v)) {}
    Value(Set v) : value(std::move(v)) {}
    Value(Dict v) : value(std::move(v)) {}
    Value(std::shared_ptr<const SortedDict> v) : value(std::move(v)) {}
    Value(std::shared_ptr<const SortedList> v) : value(std::move(v)) {}
    Value(std::shared_ptr<const SortedSet> v) : value(std::move(v)) {}

    static Value list(std::vector<Value> items);
    static Value list(std::initializer_list<Value> items);
    static Value tuple(std::vector<Value> items);
    static Value tuple(std::initializer_list<Value> items);
    static Value set(std::vector<Value> items);
    static Value set(std::initializer_list<Value> items);
    static Value dict(std::vector<std::pair<Value, Value>> items);

    ValueType type() const;

    template <typename T>
    bool holds() const
    {
        return std::holds_alternative<T>(value);
    }

    template <typename T>
    const T& get() const
    {
        return std::get<T>(value);
    }

    bool is_number() const
    {
        return holds<int64_t>() || holds<double>();
    }
};

bool operator==(const Value& a, const Value& b);
bool operator!=(const Value& a, const Value& b);
/// Total order: numbers compare numerically, other kinds order by type first.
bool operator<(const Value& a, const Value& b);

/// Short display form used in error messages and locations.
std::string repr(const Value& v);

/// Members of any iterable shape, in iteration order (Dict and SortedDict yield keys).
/// Returns false when `v` is not iterable.
bool iterate(const Value& v, std::vector<Value>& out);

Value from_json(const Json& j);
Json to_json(const Value& v);

} // namespace sortedschema
