#include "sortedschema/core/type_adapter.hpp"

namespace sortedschema
{

TypeAdapter::TypeAdapter(TypeExpr type, Settings settings)
    : TypeAdapter(std::move(type), default_registry(), std::move(settings))
{
}

TypeAdapter::TypeAdapter(TypeExpr type, const Registry& registry, Settings settings)
    : type_(std::move(type))
{
    SchemaGenerator generator(registry, std::move(settings));
    schema_ = generator.generate_schema(type_);
}

Value TypeAdapter::validate_python(const Value& input) const
{
    return schema_->validate(input, InputMode::Python);
}

Value TypeAdapter::validate_json(const std::string& text) const
{
    Json parsed;
    try
    {
        parsed = Json::parse(text);
    }
    catch (const Json::parse_error& e)
    {
        throw ValidationError(ErrorKind::ShapeMismatch, std::string("Invalid JSON: ") + e.what());
    }
    return validate_json_value(parsed);
}

Value TypeAdapter::validate_json_value(const Json& input) const
{
    return schema_->validate(from_json(input), InputMode::Json);
}

Value TypeAdapter::dump_python(const Value& value) const
{
    return schema_->serialize(value);
}

Json TypeAdapter::dump_json(const Value& value) const
{
    return to_json(schema_->serialize(value));
}

} // namespace sortedschema
