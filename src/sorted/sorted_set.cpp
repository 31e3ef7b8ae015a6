#include "sortedschema/containers.hpp"
#include "sortedschema/sorted/shape_union.hpp"
#include "sortedschema/sorted/sorted_schemas.hpp"

namespace sortedschema
{
namespace
{

Value construct(const Value& validated)
{
    return make_value(SortedSet::from_value(validated));
}

Value as_set(const Value& value)
{
    if (value.holds<std::shared_ptr<const SortedSet>>())
        return Value(value.get<std::shared_ptr<const SortedSet>>()->to_set());
    std::vector<Value> members;
    if (!iterate(value, members))
        throw ContainerError("cannot serialize " + to_string(value.type()) + " as a set");
    return Value::set(std::move(members));
}

} // namespace

SchemaPtr build_sorted_set_schema(const TypeExpr& source, SchemaGenerator& handler)
{
    auto params = Parameterization::of(source, 1);
    auto set_t = params.bare() ? types::set() : types::set(params.args[0]);
    auto iterable_t = params.bare() ? types::iterable() : types::iterable(params.args[0]);

    ShapeUnionSpec spec;
    spec.kind_name = "SortedSet";
    spec.instance_type = ValueType::SortedSet;
    // A value that is both a set and an iterable must take the set path.
    spec.shapes.push_back({InputShape::Set, set_t});
    spec.shapes.push_back({InputShape::GenericIterable, iterable_t});
    spec.json_shape = InputShape::Set;
    spec.construct = construct;
    spec.serialize = as_set;
    return build_shape_union(spec, handler);
}

} // namespace sortedschema
