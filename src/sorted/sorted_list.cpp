#include "sortedschema/containers.hpp"
#include "sortedschema/sorted/shape_union.hpp"
#include "sortedschema/sorted/sorted_schemas.hpp"

namespace sortedschema
{
namespace
{

Value construct(const Value& validated)
{
    return make_value(SortedList::from_value(validated));
}

Value as_list(const Value& value)
{
    if (value.holds<std::shared_ptr<const SortedList>>())
        return Value(value.get<std::shared_ptr<const SortedList>>()->to_list());
    std::vector<Value> members;
    if (!iterate(value, members))
        throw ContainerError("cannot serialize " + to_string(value.type()) + " as a list");
    return Value::list(std::move(members));
}

} // namespace

SchemaPtr build_sorted_list_schema(const TypeExpr& source, SchemaGenerator& handler)
{
    auto params = Parameterization::of(source, 1);

    ShapeUnionSpec spec;
    spec.kind_name = "SortedList";
    spec.instance_type = ValueType::SortedList;
    spec.shapes.push_back({InputShape::GenericIterable,
                           params.bare() ? types::iterable() : types::iterable(params.args[0])});
    spec.json_shape = InputShape::GenericIterable;
    spec.construct = construct;
    spec.serialize = as_list;
    return build_shape_union(spec, handler);
}

} // namespace sortedschema
