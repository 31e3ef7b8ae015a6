#include "sortedschema/sorted/shape_union.hpp"

namespace sortedschema
{

std::string to_string(InputShape shape)
{
    switch (shape)
    {
    case InputShape::AlreadyInstance:
        return "AlreadyInstance";
    case InputShape::Mapping:
        return "Mapping";
    case InputShape::IterableOfPairs:
        return "IterableOfPairs";
    case InputShape::Set:
        return "Set";
    case InputShape::GenericIterable:
        return "GenericIterable";
    }
    return "AlreadyInstance";
}

Parameterization Parameterization::of(const TypeExpr& source, size_t arity)
{
    Parameterization p;
    if (!source.parameterized())
        return p;
    if (source.args.size() != arity)
        throw UnsupportedParameterization(source.name + " takes " + std::to_string(arity) +
                                          " type argument" + (arity == 1 ? "" : "s") + ", got " +
                                          std::to_string(source.args.size()) + " in " +
                                          source.to_string());
    p.kind = Kind::Parameterized;
    p.args = source.args;
    return p;
}

SchemaPtr build_shape_union(const ShapeUnionSpec& spec, SchemaGenerator& handler)
{
    if (!spec.construct || !spec.serialize)
        throw SchemaError(spec.kind_name + " shape union needs a constructor and a serializer");

    std::vector<UnionChoice> choices;
    choices.push_back(UnionChoice{to_string(InputShape::AlreadyInstance),
                                  core_schema::is_instance_schema(spec.instance_type)});

    SchemaPtr json_schema;
    for (const auto& alt : spec.shapes)
    {
        auto wrapped = core_schema::no_info_after_validator_function(
            spec.construct, handler.generate_schema(alt.intermediate));
        choices.push_back(UnionChoice{to_string(alt.shape), wrapped});
        if (alt.shape == spec.json_shape)
            json_schema = wrapped;
    }
    if (!json_schema)
        throw SchemaError(spec.kind_name + ": JSON shape " + to_string(spec.json_shape) +
                          " is not one of its native shapes");

    return core_schema::json_or_python_schema(
        json_schema, core_schema::union_schema(std::move(choices)), spec.serialize);
}

} // namespace sortedschema
