#include "sortedschema/containers.hpp"
#include "sortedschema/value.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <utility>
#include <vector>

using namespace sortedschema;

void test_type_tags()
{
    std::cout << "test_type_tags...\n";
    assert(Value().type() == ValueType::None);
    assert(Value(true).type() == ValueType::Bool);
    assert(Value(3).type() == ValueType::Int);
    assert(Value(0.5).type() == ValueType::Float);
    assert(Value("s").type() == ValueType::Str);
    assert(Value::tuple({1}).type() == ValueType::Tuple);
    assert(make_value(SortedDict()).type() == ValueType::SortedDict);
    assert(to_string(ValueType::SortedSet) == "SortedSet");
    std::cout << "  [PASS]\n";
}

void test_ordering()
{
    std::cout << "test_ordering...\n";
    assert(Value(1) < Value(1.5));
    assert(Value(1) == Value(1.0));
    assert(Value(false) < Value(0));
    assert(Value(99) < Value("a"));
    assert(Value("a") < Value("b"));
    assert(Value::list({1, 2}) < Value::list({1, 3}));
    assert(Value::list({1}) < Value::list({1, 0}));
    assert(Value(nullptr) < Value(false));
    std::cout << "  [PASS]\n";
}

void test_set_factory_sorts_and_deduplicates()
{
    std::cout << "test_set_factory_sorts_and_deduplicates...\n";
    auto s = Value::set({3, 1, 3, 2});
    const auto& items = s.get<Set>().items;
    assert(items.size() == 3);
    assert(items[0] == Value(1));
    assert(items[2] == Value(3));
    std::cout << "  [PASS]\n";
}

void test_dict_factory_and_equality()
{
    std::cout << "test_dict_factory_and_equality...\n";
    auto d = Value::dict({{"b", 1}, {"a", 2}, {"b", 3}});
    const auto& items = d.get<Dict>().items;
    assert(items.size() == 2);
    assert(items[0].first == Value("b"));
    assert(items[0].second == Value(3));
    assert(d == Value::dict({{"a", 2}, {"b", 3}}));
    assert(d != Value::dict({{"a", 2}}));
    std::cout << "  [PASS]\n";
}

void test_repr()
{
    std::cout << "test_repr...\n";
    assert(repr(Value::list({1, "a"})) == "[1, 'a']");
    assert(repr(Value::tuple({1})) == "(1,)");
    assert(repr(Value::set({})) == "set()");
    assert(repr(Value::dict({{"k", true}})) == "{'k': True}");
    assert(repr(make_value(SortedList(std::vector<Value>{2, 1}))) == "SortedList([1, 2])");
    std::cout << "  [PASS]\n";
}

void test_iterate()
{
    std::cout << "test_iterate...\n";
    std::vector<Value> out;
    assert(iterate(Value::dict({{"x", 1}, {"y", 2}}), out));
    assert(out.size() == 2 && out[0] == Value("x"));
    assert(!iterate(Value("xy"), out));
    assert(!iterate(Value(1), out));
    std::cout << "  [PASS]\n";
}

void test_json_bridge()
{
    std::cout << "test_json_bridge...\n";
    auto v = from_json(Json::parse(R"({"a": [1, 2.5, "x", null, true]})"));
    assert(v.holds<Dict>());
    const auto& inner = v.get<Dict>().items[0].second;
    assert(inner == Value::list({1, 2.5, "x", nullptr, true}));

    auto tuple_keys = Value::dict({{1, Value::tuple({1, 2})}, {"s", Value::set({2, 1})}});
    auto j = to_json(tuple_keys);
    assert(j["1"] == Json::parse("[1, 2]"));
    assert(j["s"] == Json::parse("[1, 2]"));
    std::cout << "  [PASS]\n";
}

void test_nan_orders_after_numbers()
{
    std::cout << "test_nan_orders_after_numbers...\n";
    const double nan = std::numeric_limits<double>::quiet_NaN();
    assert(Value(nan) == Value(nan));
    assert(Value(1.0) < Value(nan));
    assert(Value(5) < Value(nan));
    assert(!(Value(nan) < Value(1.0)));
    assert(Value(nan) != Value(1.0));
    assert(Value(nan) < Value("a"));

    auto s = Value::set({2.0, nan, 1.0, nan});
    const auto& items = s.get<Set>().items;
    assert(items.size() == 3);
    assert(items[0] == Value(1.0));
    assert(items[1] == Value(2.0));
    assert(std::isnan(items[2].get<double>()));
    std::cout << "  [PASS]\n";
}

void test_dict_factory_many_keys()
{
    std::cout << "test_dict_factory_many_keys...\n";
    std::vector<std::pair<Value, Value>> items;
    for (int round = 0; round < 2; ++round)
        for (int i = 0; i < 2000; ++i)
            items.emplace_back("k" + std::to_string(i), round * 10000 + i);
    auto d = Value::dict(std::move(items));
    const auto& kept = d.get<Dict>().items;
    assert(kept.size() == 2000);
    assert(kept[0].first == Value("k0"));
    assert(kept[0].second == Value(10000));
    assert(kept[1999].first == Value("k1999"));
    assert(kept[1999].second == Value(11999));
    std::cout << "  [PASS]\n";
}

void test_json_unsigned_beyond_int64()
{
    std::cout << "test_json_unsigned_beyond_int64...\n";
    auto big = from_json(Json::parse("18446744073709551615"));
    assert(big.holds<double>());
    assert(big.get<double>() > 1.8e19);

    auto max = from_json(Json::parse("9223372036854775807"));
    assert(max.holds<int64_t>());
    assert(max.get<int64_t>() == std::numeric_limits<int64_t>::max());
    std::cout << "  [PASS]\n";
}

int main()
{
    test_type_tags();
    test_ordering();
    test_set_factory_sorts_and_deduplicates();
    test_dict_factory_and_equality();
    test_repr();
    test_iterate();
    test_json_bridge();
    test_nan_orders_after_numbers();
    test_dict_factory_many_keys();
    test_json_unsigned_beyond_int64();
    std::cout << "All value tests passed\n";
    return 0;
}
