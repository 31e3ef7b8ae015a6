#include "sortedschema/containers.hpp"
#include "sortedschema/core/generator.hpp"
#include "sortedschema/sorted/shape_union.hpp"
#include "sortedschema/sorted/sorted_schemas.hpp"
#include "test_helpers.hpp"

#include <cassert>
#include <iostream>

using namespace sortedschema;
using sortedschema::test::expect_validation_error;
using sortedschema::test::has_branch;

void test_parameterization_bare()
{
    std::cout << "test_parameterization_bare...\n";
    auto p = Parameterization::of(types::sorted_list(), 1);
    assert(p.bare());
    assert(p.kind == Parameterization::Kind::Bare);
    assert(p.args.empty());
    std::cout << "  [PASS]\n";
}

void test_parameterization_with_args()
{
    std::cout << "test_parameterization_with_args...\n";
    auto p = Parameterization::of(types::sorted_dict(types::string(), types::integer()), 2);
    assert(!p.bare());
    assert(p.args.size() == 2);
    assert(p.args[0].name == "str");
    assert(p.args[1].name == "int");
    std::cout << "  [PASS]\n";
}

void test_parameterization_wrong_arity()
{
    std::cout << "test_parameterization_wrong_arity...\n";
    bool threw = false;
    try
    {
        Parameterization::of(types::sorted_list(types::integer()), 2);
    }
    catch (const UnsupportedParameterization& e)
    {
        threw = true;
        assert(std::string(e.what()).find("SortedList[int]") != std::string::npos);
    }
    assert(threw);
    std::cout << "  [PASS]\n";
}

void test_native_alternatives_keep_declared_order()
{
    std::cout << "test_native_alternatives_keep_declared_order...\n";
    Registry registry;
    register_sorted_containers(registry);
    SchemaGenerator generator(registry);

    auto dict_schema = generator.generate_schema(types::sorted_dict());
    assert(dict_schema->describe().find("python=union[AlreadyInstance, Mapping, IterableOfPairs]") !=
           std::string::npos);

    auto set_schema = generator.generate_schema(types::sorted_set());
    assert(set_schema->describe().find("python=union[AlreadyInstance, Set, GenericIterable]") !=
           std::string::npos);
    assert(set_schema->describe().find("json=function-after[set[any]]") != std::string::npos);

    auto list_schema = generator.generate_schema(types::sorted_list(types::integer()));
    assert(list_schema->describe().find("json=function-after[iterable[int]]") != std::string::npos);
    std::cout << "  [PASS]\n";
}

void test_first_matching_alternative_wins()
{
    std::cout << "test_first_matching_alternative_wins...\n";
    Registry registry;
    SchemaGenerator generator(registry);

    // Both shapes accept a list; only the first one may construct.
    ShapeUnionSpec spec;
    spec.kind_name = "Tagged";
    spec.instance_type = ValueType::SortedList;
    spec.shapes.push_back({InputShape::GenericIterable, types::iterable(types::integer())});
    spec.shapes.push_back({InputShape::Set, types::iterable(types::any())});
    spec.json_shape = InputShape::Set;
    int constructed = 0;
    spec.construct = [&constructed](const Value& v)
    {
        ++constructed;
        return make_value(SortedList::from_value(v));
    };
    spec.serialize = [](const Value& v) { return v; };

    auto schema = build_shape_union(spec, generator);
    schema->validate(Value::list({2, 1}), InputMode::Python);
    assert(constructed == 1);

    // Strings fail the first shape and fall through to the second.
    auto v = schema->validate(Value::list({"b", "a"}), InputMode::Python);
    assert(constructed == 2);
    assert(v.get<std::shared_ptr<const SortedList>>()->at(0) == Value("a"));
    std::cout << "  [PASS]\n";
}

void test_instance_check_skips_construction()
{
    std::cout << "test_instance_check_skips_construction...\n";
    Registry registry;
    SchemaGenerator generator(registry);

    ShapeUnionSpec spec;
    spec.kind_name = "Counted";
    spec.instance_type = ValueType::SortedSet;
    spec.shapes.push_back({InputShape::GenericIterable, types::iterable()});
    spec.json_shape = InputShape::GenericIterable;
    int constructed = 0;
    spec.construct = [&constructed](const Value& v)
    {
        ++constructed;
        return make_value(SortedSet::from_value(v));
    };
    spec.serialize = [](const Value& v) { return v; };

    auto schema = build_shape_union(spec, generator);
    auto instance = make_value(SortedSet(std::vector<Value>{1, 2}));
    schema->validate(instance, InputMode::Python);
    assert(constructed == 0);

    // The JSON path never takes the instance shortcut.
    auto e = expect_validation_error([&] { schema->validate(instance, InputMode::Json); });
    assert(e.kind() == ErrorKind::ShapeMismatch);
    assert(!has_branch(e, "AlreadyInstance"));
    std::cout << "  [PASS]\n";
}

void test_json_shape_must_be_native_shape()
{
    std::cout << "test_json_shape_must_be_native_shape...\n";
    Registry registry;
    SchemaGenerator generator(registry);

    ShapeUnionSpec spec;
    spec.kind_name = "Broken";
    spec.instance_type = ValueType::SortedList;
    spec.shapes.push_back({InputShape::GenericIterable, types::iterable()});
    spec.json_shape = InputShape::Mapping;
    spec.construct = [](const Value& v) { return v; };
    spec.serialize = [](const Value& v) { return v; };

    bool threw = false;
    try
    {
        build_shape_union(spec, generator);
    }
    catch (const SchemaError&)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "  [PASS]\n";
}

void test_input_shape_names()
{
    std::cout << "test_input_shape_names...\n";
    assert(to_string(InputShape::AlreadyInstance) == "AlreadyInstance");
    assert(to_string(InputShape::IterableOfPairs) == "IterableOfPairs");
    assert(to_string(InputShape::GenericIterable) == "GenericIterable");
    std::cout << "  [PASS]\n";
}

int main()
{
    test_parameterization_bare();
    test_parameterization_with_args();
    test_parameterization_wrong_arity();
    test_native_alternatives_keep_declared_order();
    test_first_matching_alternative_wins();
    test_instance_check_skips_construction();
    test_json_shape_must_be_native_shape();
    test_input_shape_names();
    std::cout << "All shape union tests passed\n";
    return 0;
}
