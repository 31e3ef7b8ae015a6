#include "sortedschema/value.hpp"

#include "sortedschema/containers.hpp"
#include "sortedschema/exceptions.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <sstream>

namespace sortedschema
{
namespace
{

int rank(ValueType t)
{
    switch (t)
    {
    case ValueType::None:
        return 0;
    case ValueType::Bool:
        return 1;
    case ValueType::Int:
    case ValueType::Float:
        return 2;
    case ValueType::Str:
        return 3;
    case ValueType::Tuple:
        return 4;
    case ValueType::List:
        return 5;
    case ValueType::Set:
        return 6;
    case ValueType::Dict:
        return 7;
    case ValueType::SortedDict:
        return 8;
    case ValueType::SortedList:
        return 9;
    case ValueType::SortedSet:
        return 10;
    }
    return 0;
}

int compare(const Value& a, const Value& b);

template <typename T>
int compare_scalar(const T& a, const T& b)
{
    if (a < b)
        return -1;
    if (b < a)
        return 1;
    return 0;
}

template <typename P>
int compare_pair(const P& a, const P& b)
{
    int c = compare(a.first, b.first);
    return c != 0 ? c : compare(a.second, b.second);
}

template <typename It>
int compare_range(It a, It a_end, It b, It b_end)
{
    for (; a != a_end && b != b_end; ++a, ++b)
    {
        int c = compare(*a, *b);
        if (c != 0)
            return c;
    }
    if (a == a_end && b == b_end)
        return 0;
    return a == a_end ? -1 : 1;
}

template <typename It>
int compare_pairs(It a, It a_end, It b, It b_end)
{
    for (; a != a_end && b != b_end; ++a, ++b)
    {
        int c = compare_pair(*a, *b);
        if (c != 0)
            return c;
    }
    if (a == a_end && b == b_end)
        return 0;
    return a == a_end ? -1 : 1;
}

std::vector<std::pair<Value, Value>> sorted_items(const Dict& d)
{
    auto items = d.items;
    std::sort(items.begin(), items.end(),
              [](const std::pair<Value, Value>& x, const std::pair<Value, Value>& y)
              { return compare(x.first, y.first) < 0; });
    return items;
}

int compare(const Value& a, const Value& b)
{
    auto ta = a.type();
    auto tb = b.type();
    if (rank(ta) != rank(tb))
        return rank(ta) < rank(tb) ? -1 : 1;

    switch (ta)
    {
    case ValueType::None:
        return 0;
    case ValueType::Bool:
        return compare_scalar(a.get<bool>(), b.get<bool>());
    case ValueType::Int:
    case ValueType::Float:
        if (ta == ValueType::Int && tb == ValueType::Int)
            return compare_scalar(a.get<int64_t>(), b.get<int64_t>());
        {
            double x = ta == ValueType::Int ? static_cast<double>(a.get<int64_t>()) : a.get<double>();
            double y = tb == ValueType::Int ? static_cast<double>(b.get<int64_t>()) : b.get<double>();
            // NaN sorts after every other number and equals itself.
            if (std::isnan(x) || std::isnan(y))
                return compare_scalar(std::isnan(x), std::isnan(y));
            return compare_scalar(x, y);
        }
    case ValueType::Str:
        return compare_scalar(a.get<std::string>(), b.get<std::string>());
    case ValueType::List:
    {
        const auto& x = a.get<List>().items;
        const auto& y = b.get<List>().items;
        return compare_range(x.begin(), x.end(), y.begin(), y.end());
    }
    case ValueType::Tuple:
    {
        const auto& x = a.get<Tuple>().items;
        const auto& y = b.get<Tuple>().items;
        return compare_range(x.begin(), x.end(), y.begin(), y.end());
    }
    case ValueType::Set:
    {
        const auto& x = a.get<Set>().items;
        const auto& y = b.get<Set>().items;
        return compare_range(x.begin(), x.end(), y.begin(), y.end());
    }
    case ValueType::Dict:
    {
        auto x = sorted_items(a.get<Dict>());
        auto y = sorted_items(b.get<Dict>());
        return compare_pairs(x.begin(), x.end(), y.begin(), y.end());
    }
    case ValueType::SortedDict:
    {
        const auto& x = *a.get<std::shared_ptr<const SortedDict>>();
        const auto& y = *b.get<std::shared_ptr<const SortedDict>>();
        return compare_pairs(x.begin(), x.end(), y.begin(), y.end());
    }
    case ValueType::SortedList:
    {
        const auto& x = *a.get<std::shared_ptr<const SortedList>>();
        const auto& y = *b.get<std::shared_ptr<const SortedList>>();
        return compare_range(x.begin(), x.end(), y.begin(), y.end());
    }
    case ValueType::SortedSet:
    {
        const auto& x = *a.get<std::shared_ptr<const SortedSet>>();
        const auto& y = *b.get<std::shared_ptr<const SortedSet>>();
        return compare_range(x.begin(), x.end(), y.begin(), y.end());
    }
    }
    return 0;
}

void join(std::ostringstream& out, const std::vector<Value>& items)
{
    for (size_t i = 0; i < items.size(); ++i)
        out << (i ? ", " : "") << repr(items[i]);
}

template <typename It>
void join_pairs(std::ostringstream& out, It begin, It end)
{
    bool first = true;
    for (auto it = begin; it != end; ++it)
    {
        out << (first ? "" : ", ") << repr(it->first) << ": " << repr(it->second);
        first = false;
    }
}

std::string json_key(const Value& key)
{
    if (key.holds<std::string>())
        return key.get<std::string>();
    return to_json(key).dump();
}

Json json_object(const std::vector<std::pair<Value, Value>>& items)
{
    Json j = Json::object();
    for (const auto& [k, v] : items)
        j[json_key(k)] = to_json(v);
    return j;
}

Json json_array(const std::vector<Value>& items)
{
    Json j = Json::array();
    for (const auto& v : items)
        j.push_back(to_json(v));
    return j;
}

} // namespace

std::string to_string(ValueType type)
{
    switch (type)
    {
    case ValueType::None:
        return "None";
    case ValueType::Bool:
        return "bool";
    case ValueType::Int:
        return "int";
    case ValueType::Float:
        return "float";
    case ValueType::Str:
        return "str";
    case ValueType::List:
        return "list";
    case ValueType::Tuple:
        return "tuple";
    case ValueType::Set:
        return "set";
    case ValueType::Dict:
        return "dict";
    case ValueType::SortedDict:
        return "SortedDict";
    case ValueType::SortedList:
        return "SortedList";
    case ValueType::SortedSet:
        return "SortedSet";
    }
    return "None";
}

Value Value::list(std::vector<Value> items)
{
    return Value(List{std::move(items)});
}

Value Value::list(std::initializer_list<Value> items)
{
    return list(std::vector<Value>(items));
}

Value Value::tuple(std::vector<Value> items)
{
    return Value(Tuple{std::move(items)});
}

Value Value::tuple(std::initializer_list<Value> items)
{
    return tuple(std::vector<Value>(items));
}

Value Value::set(std::vector<Value> items)
{
    std::sort(items.begin(), items.end());
    items.erase(std::unique(items.begin(), items.end()), items.end());
    return Value(Set{std::move(items)});
}

Value Value::set(std::initializer_list<Value> items)
{
    return set(std::vector<Value>(items));
}

Value Value::dict(std::vector<std::pair<Value, Value>> items)
{
    Dict d;
    std::map<Value, size_t> index;
    for (auto& item : items)
    {
        auto it = index.find(item.first);
        if (it != index.end())
        {
            d.items[it->second].second = std::move(item.second);
            continue;
        }
        index.emplace(item.first, d.items.size());
        d.items.push_back(std::move(item));
    }
    return Value(std::move(d));
}

ValueType Value::type() const
{
    return static_cast<ValueType>(value.index());
}

bool operator==(const Value& a, const Value& b)
{
    return compare(a, b) == 0;
}

bool operator!=(const Value& a, const Value& b)
{
    return compare(a, b) != 0;
}

bool operator<(const Value& a, const Value& b)
{
    return compare(a, b) < 0;
}

std::string repr(const Value& v)
{
    std::ostringstream out;
    switch (v.type())
    {
    case ValueType::None:
        out << "None";
        break;
    case ValueType::Bool:
        out << (v.get<bool>() ? "True" : "False");
        break;
    case ValueType::Int:
        out << v.get<int64_t>();
        break;
    case ValueType::Float:
        out << v.get<double>();
        break;
    case ValueType::Str:
        out << "'" << v.get<std::string>() << "'";
        break;
    case ValueType::List:
        out << "[";
        join(out, v.get<List>().items);
        out << "]";
        break;
    case ValueType::Tuple:
        out << "(";
        join(out, v.get<Tuple>().items);
        out << (v.get<Tuple>().items.size() == 1 ? ",)" : ")");
        break;
    case ValueType::Set:
        if (v.get<Set>().items.empty())
            return "set()";
        out << "{";
        join(out, v.get<Set>().items);
        out << "}";
        break;
    case ValueType::Dict:
        out << "{";
        join_pairs(out, v.get<Dict>().items.begin(), v.get<Dict>().items.end());
        out << "}";
        break;
    case ValueType::SortedDict:
    {
        const auto& d = *v.get<std::shared_ptr<const SortedDict>>();
        out << "SortedDict({";
        join_pairs(out, d.begin(), d.end());
        out << "})";
        break;
    }
    case ValueType::SortedList:
        out << "SortedList([";
        join(out, v.get<std::shared_ptr<const SortedList>>()->to_list().items);
        out << "])";
        break;
    case ValueType::SortedSet:
        out << "SortedSet([";
        join(out, v.get<std::shared_ptr<const SortedSet>>()->to_list().items);
        out << "])";
        break;
    }
    return out.str();
}

bool iterate(const Value& v, std::vector<Value>& out)
{
    switch (v.type())
    {
    case ValueType::List:
        out = v.get<List>().items;
        return true;
    case ValueType::Tuple:
        out = v.get<Tuple>().items;
        return true;
    case ValueType::Set:
        out = v.get<Set>().items;
        return true;
    case ValueType::Dict:
        out.clear();
        for (const auto& item : v.get<Dict>().items)
            out.push_back(item.first);
        return true;
    case ValueType::SortedDict:
        out = v.get<std::shared_ptr<const SortedDict>>()->keys();
        return true;
    case ValueType::SortedList:
        out = v.get<std::shared_ptr<const SortedList>>()->to_list().items;
        return true;
    case ValueType::SortedSet:
        out = v.get<std::shared_ptr<const SortedSet>>()->to_list().items;
        return true;
    default:
        return false;
    }
}

Value from_json(const Json& j)
{
    switch (j.type())
    {
    case Json::value_t::null:
        return nullptr;
    case Json::value_t::boolean:
        return j.get<bool>();
    case Json::value_t::number_integer:
        return j.get<int64_t>();
    case Json::value_t::number_unsigned:
        if (j.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            return j.get<double>();
        return j.get<int64_t>();
    case Json::value_t::number_float:
        return j.get<double>();
    case Json::value_t::string:
        return j.get<std::string>();
    case Json::value_t::array:
    {
        List out;
        for (const auto& item : j)
            out.items.push_back(from_json(item));
        return Value(std::move(out));
    }
    case Json::value_t::object:
    {
        Dict out;
        for (const auto& [key, item] : j.items())
            out.items.emplace_back(Value(key), from_json(item));
        return Value(std::move(out));
    }
    default:
        throw Error("unsupported JSON value of type " + std::string(j.type_name()));
    }
}

Json to_json(const Value& v)
{
    switch (v.type())
    {
    case ValueType::None:
        return nullptr;
    case ValueType::Bool:
        return v.get<bool>();
    case ValueType::Int:
        return v.get<int64_t>();
    case ValueType::Float:
        return v.get<double>();
    case ValueType::Str:
        return v.get<std::string>();
    case ValueType::List:
        return json_array(v.get<List>().items);
    case ValueType::Tuple:
        return json_array(v.get<Tuple>().items);
    case ValueType::Set:
        return json_array(v.get<Set>().items);
    case ValueType::Dict:
        return json_object(v.get<Dict>().items);
    case ValueType::SortedDict:
        return json_object(v.get<std::shared_ptr<const SortedDict>>()->to_dict().items);
    case ValueType::SortedList:
        return json_array(v.get<std::shared_ptr<const SortedList>>()->to_list().items);
    case ValueType::SortedSet:
        return json_array(v.get<std::shared_ptr<const SortedSet>>()->to_list().items);
    }
    return nullptr;
}

} // namespace sortedschema
