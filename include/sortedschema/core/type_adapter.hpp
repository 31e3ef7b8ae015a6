#pragma once
#include "sortedschema/core/generator.hpp"
#include "sortedschema/core/registry.hpp"
#include "sortedschema/core/schema.hpp"
#include "sortedschema/core/type_expr.hpp"
#include "sortedschema/settings.hpp"
#include "sortedschema/types.hpp"
#include "sortedschema/value.hpp"

#include <string>

namespace sortedschema
{

/// Validates and serializes values of one annotated type.
class TypeAdapter
{
  public:
    /// Uses default_registry().
    explicit TypeAdapter(TypeExpr type, Settings settings = Settings{});
    TypeAdapter(TypeExpr type, const Registry& registry, Settings settings = Settings{});

    /// Native path.
    Value validate_python(const Value& input) const;
    /// JSON path, from text. Malformed text is a ShapeMismatch ValidationError.
    Value validate_json(const std::string& text) const;
    /// JSON path, from an already parsed document.
    Value validate_json_value(const Json& input) const;

    /// Plain native form of `value`.
    Value dump_python(const Value& value) const;
    Json dump_json(const Value& value) const;

    const TypeExpr& type() const
    {
        return type_;
    }
    const SchemaPtr& core_schema() const
    {
        return schema_;
    }

  private:
    TypeExpr type_;
    SchemaPtr schema_;
};

} // namespace sortedschema
