#include "sortedschema/core/generator.hpp"

#include <iostream>

namespace sortedschema
{
namespace
{

void require_arity(const TypeExpr& type, size_t min_args, size_t max_args)
{
    auto n = type.args.size();
    if (n < min_args || n > max_args)
        throw UnsupportedParameterization(type.name + " takes " +
                                          (min_args == max_args
                                               ? std::to_string(min_args)
                                               : std::to_string(min_args) + " or " +
                                                     std::to_string(max_args)) +
                                          " type arguments, got " + std::to_string(n) + " in " +
                                          type.to_string());
}

} // namespace

SchemaGenerator::SchemaGenerator(const Registry& registry, Settings settings)
    : registry_(registry), settings_(std::move(settings))
{
}

SchemaPtr SchemaGenerator::generate_schema(const TypeExpr& type)
{
    auto key = type.to_string();
    if (settings_.cache_schemas)
    {
        auto it = cache_.find(key);
        if (it != cache_.end())
        {
            if (settings_.debug())
                std::cerr << "[sortedschema] schema cache hit: " << key << std::endl;
            return it->second;
        }
    }

    auto schema = build(type);
    ++builds_;
    if (settings_.debug())
        std::cerr << "[sortedschema] built schema for " << key << ": " << schema->describe()
                  << std::endl;
    if (settings_.cache_schemas)
        cache_[key] = schema;
    return schema;
}

SchemaPtr SchemaGenerator::build(const TypeExpr& type)
{
    if (type.is_model)
        return build_model(type);

    const auto& name = type.name;
    if (name == "Any" || name == "int" || name == "float" || name == "str" || name == "bool" ||
        name == "None")
    {
        require_arity(type, 0, 0);
        if (name == "int")
            return core_schema::int_schema();
        if (name == "float")
            return core_schema::float_schema();
        if (name == "str")
            return core_schema::str_schema();
        if (name == "bool")
            return core_schema::bool_schema();
        if (name == "None")
            return core_schema::none_schema();
        return core_schema::any_schema();
    }
    if (name == "Mapping")
    {
        require_arity(type, 0, 2);
        if (type.args.size() == 1)
            throw UnsupportedParameterization("Mapping takes 0 or 2 type arguments, got 1 in " +
                                              type.to_string());
        if (!type.parameterized())
            return core_schema::dict_schema(core_schema::any_schema(), core_schema::any_schema());
        return core_schema::dict_schema(generate_schema(type.args[0]),
                                        generate_schema(type.args[1]));
    }
    if (name == "Iterable" || name == "Set")
    {
        require_arity(type, 0, 1);
        auto items =
            type.parameterized() ? generate_schema(type.args[0]) : core_schema::any_schema();
        return name == "Set" ? core_schema::set_schema(items) : core_schema::iterable_schema(items);
    }
    if (name == "Tuple")
    {
        if (!type.parameterized())
            throw UnsupportedParameterization("Tuple needs at least one item type");
        std::vector<SchemaPtr> items;
        items.reserve(type.args.size());
        for (const auto& arg : type.args)
            items.push_back(generate_schema(arg));
        return core_schema::tuple_schema(std::move(items));
    }

    if (const auto* builder = registry_.find(name))
        return (*builder)(type, *this);
    throw SchemaError("no schema available for type: " + type.to_string());
}

SchemaPtr SchemaGenerator::build_model(const TypeExpr& type)
{
    std::vector<std::pair<std::string, SchemaPtr>> fields;
    fields.reserve(type.fields.size());
    for (const auto& field : type.fields)
        fields.emplace_back(field.first, generate_schema(field.second));
    return core_schema::model_schema(type.name, std::move(fields));
}

} // namespace sortedschema
