#include "sortedschema/containers.hpp"
#include "sortedschema/core/type_adapter.hpp"
#include "test_helpers.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace sortedschema;
using sortedschema::test::expect_validation_error;
using sortedschema::test::has_branch;
using sortedschema::test::has_detail;

namespace
{

const SortedSet& as_sorted_set(const Value& v)
{
    assert(v.holds<std::shared_ptr<const SortedSet>>());
    return *v.get<std::shared_ptr<const SortedSet>>();
}

TypeAdapter int_set()
{
    return TypeAdapter(types::sorted_set(types::integer()));
}

} // namespace

void test_instance_passes_through_unchanged()
{
    std::cout << "test_instance_passes_through_unchanged...\n";
    auto adapter = int_set();
    auto original = make_value(SortedSet(std::vector<Value>{3, 1, 2}));
    auto validated = adapter.validate_python(original);
    assert(validated.get<std::shared_ptr<const SortedSet>>() ==
           original.get<std::shared_ptr<const SortedSet>>());
    std::cout << "  [PASS]\n";
}

void test_native_set_input()
{
    std::cout << "test_native_set_input...\n";
    auto adapter = int_set();
    auto v = adapter.validate_python(Value::set({3, 1, 2}));
    const auto& s = as_sorted_set(v);
    assert(s.size() == 3);
    assert(s.at(0) == Value(1));
    assert(s.at(2) == Value(3));
    std::cout << "  [PASS]\n";
}

void test_iterable_with_duplicates_is_deduplicated()
{
    std::cout << "test_iterable_with_duplicates_is_deduplicated...\n";
    auto adapter = int_set();
    auto v = adapter.validate_python(Value::list({1, 2, 2, 3}));
    const auto& s = as_sorted_set(v);
    assert(s.size() == 3);
    assert(s.contains(1) && s.contains(2) && s.contains(3));
    std::cout << "  [PASS]\n";
}

void test_json_duplicates_rejected()
{
    std::cout << "test_json_duplicates_rejected...\n";
    auto adapter = int_set();
    auto e = expect_validation_error([&] { adapter.validate_json("[1, 2, 2, 3]"); });
    assert(e.kind() == ErrorKind::ShapeMismatch);
    assert(!has_branch(e, "GenericIterable"));

    auto v = adapter.validate_json("[3, 1, 2]");
    assert(as_sorted_set(v).size() == 3);
    std::cout << "  [PASS]\n";
}

void test_coerced_duplicates_fall_back_to_iterable()
{
    std::cout << "test_coerced_duplicates_fall_back_to_iterable...\n";
    auto adapter = int_set();
    // {1, "1"} is a valid native set that collapses to one int.
    auto v = adapter.validate_python(Value::set({1, "1"}));
    assert(as_sorted_set(v).size() == 1);
    std::cout << "  [PASS]\n";
}

void test_serializes_to_plain_set()
{
    std::cout << "test_serializes_to_plain_set...\n";
    auto adapter = int_set();
    auto v = adapter.validate_python(Value::list({5, 3, 5}));
    auto plain = adapter.dump_python(v);
    assert(plain.holds<Set>());
    assert(plain == Value::set({3, 5}));
    assert(adapter.dump_json(v) == Json::parse("[3, 5]"));
    std::cout << "  [PASS]\n";
}

void test_element_error_attributed_to_member()
{
    std::cout << "test_element_error_attributed_to_member...\n";
    auto adapter = int_set();
    auto e = expect_validation_error([&] { adapter.validate_python(Value::list({1, "x"})); });
    assert(e.kind() == ErrorKind::ElementValidationError);
    assert(has_detail(e, ErrorKind::ElementValidationError, {"1"}, "GenericIterable"));
    assert(has_detail(e, ErrorKind::ShapeMismatch, {}, "Set"));

    auto s = expect_validation_error([&] { adapter.validate_python(Value::set({1, "x"})); });
    assert(s.kind() == ErrorKind::ElementValidationError);
    assert(has_detail(s, ErrorKind::ElementValidationError, {"1"}, "Set"));

    auto j = expect_validation_error([&] { adapter.validate_json(R"([1, "x"])"); });
    assert(j.kind() == ErrorKind::ElementValidationError);
    assert(has_detail(j, ErrorKind::ElementValidationError, {"1"}));
    std::cout << "  [PASS]\n";
}

void test_round_trip_preserves_membership()
{
    std::cout << "test_round_trip_preserves_membership...\n";
    TypeAdapter adapter(types::sorted_set(types::string()));
    auto first = adapter.validate_python(Value::list({"c", "a", "b", "a"}));
    auto second = adapter.validate_python(adapter.dump_python(first));
    assert(as_sorted_set(first) == as_sorted_set(second));
    auto third = adapter.validate_json_value(adapter.dump_json(first));
    assert(as_sorted_set(third) == as_sorted_set(first));
    std::cout << "  [PASS]\n";
}

void test_bare_type_is_unconstrained()
{
    std::cout << "test_bare_type_is_unconstrained...\n";
    TypeAdapter adapter(types::sorted_set());
    auto v = adapter.validate_python(Value::list({"x", 2, "x", 1.5}));
    const auto& s = as_sorted_set(v);
    assert(s.size() == 3);
    assert(s.at(0) == Value(1.5));
    auto j = adapter.validate_json(R"(["b", "a"])");
    assert(adapter.dump_python(j) == Value::set({"a", "b"}));
    std::cout << "  [PASS]\n";
}

void test_wrong_arity_fails_at_construction()
{
    std::cout << "test_wrong_arity_fails_at_construction...\n";
    bool threw = false;
    try
    {
        TypeAdapter adapter(types::generic("SortedSet", {types::integer(), types::integer()}));
    }
    catch (const UnsupportedParameterization&)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "  [PASS]\n";
}

void test_nan_member_kept()
{
    std::cout << "test_nan_member_kept...\n";
    TypeAdapter adapter(types::sorted_set(types::number()));
    const double nan = std::numeric_limits<double>::quiet_NaN();
    auto v = adapter.validate_python(Value::list({1.0, nan, 2.0, 3.0}));
    const auto& s = as_sorted_set(v);
    assert(s.size() == 4);
    assert(s.at(0) == Value(1.0));
    assert(std::isnan(s.at(3).get<double>()));

    auto j = adapter.validate_json(R"([1.0, "nan", 2.0])");
    const auto& sj = as_sorted_set(j);
    assert(sj.size() == 3);
    assert(std::isnan(sj.at(2).get<double>()));
    std::cout << "  [PASS]\n";
}

int main()
{
    test_instance_passes_through_unchanged();
    test_native_set_input();
    test_iterable_with_duplicates_is_deduplicated();
    test_json_duplicates_rejected();
    test_coerced_duplicates_fall_back_to_iterable();
    test_serializes_to_plain_set();
    test_element_error_attributed_to_member();
    test_round_trip_preserves_membership();
    test_bare_type_is_unconstrained();
    test_wrong_arity_fails_at_construction();
    test_nan_member_kept();
    std::cout << "All SortedSet schema tests passed\n";
    return 0;
}
