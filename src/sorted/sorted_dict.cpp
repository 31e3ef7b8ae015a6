#include "sortedschema/containers.hpp"
#include "sortedschema/sorted/shape_union.hpp"
#include "sortedschema/sorted/sorted_schemas.hpp"

namespace sortedschema
{
namespace
{

Value construct(const Value& validated)
{
    return make_value(SortedDict::from_value(validated));
}

Value as_dict(const Value& value)
{
    if (value.holds<std::shared_ptr<const SortedDict>>())
        return Value(value.get<std::shared_ptr<const SortedDict>>()->to_dict());
    if (value.holds<Dict>())
        return value;
    return Value(SortedDict::from_value(value).to_dict());
}

} // namespace

SchemaPtr build_sorted_dict_schema(const TypeExpr& source, SchemaGenerator& handler)
{
    auto params = Parameterization::of(source, 2);

    ShapeUnionSpec spec;
    spec.kind_name = "SortedDict";
    spec.instance_type = ValueType::SortedDict;
    if (params.bare())
    {
        spec.shapes.push_back({InputShape::Mapping, types::mapping()});
        spec.shapes.push_back(
            {InputShape::IterableOfPairs, types::iterable(types::tuple({types::any(), types::any()}))});
    }
    else
    {
        const auto& key = params.args[0];
        const auto& value = params.args[1];
        spec.shapes.push_back({InputShape::Mapping, types::mapping(key, value)});
        spec.shapes.push_back(
            {InputShape::IterableOfPairs, types::iterable(types::tuple({key, value}))});
    }
    spec.json_shape = InputShape::Mapping;
    spec.construct = construct;
    spec.serialize = as_dict;
    return build_shape_union(spec, handler);
}

} // namespace sortedschema
