#pragma once
#include "sortedschema/core/registry.hpp"
#include "sortedschema/core/schema.hpp"
#include "sortedschema/core/type_expr.hpp"
#include "sortedschema/settings.hpp"

#include <string>
#include <unordered_map>

namespace sortedschema
{

/// Nested-schema resolver handed to container schema builders.
///
/// Builtin types (Any, int, float, str, bool, None, Mapping, Iterable, Tuple,
/// Set, models) are built here; every other name is looked up in the
/// registry. Results are cached per canonical type spelling unless
/// Settings::cache_schemas is off. Not thread-safe; use one per thread.
class SchemaGenerator
{
  public:
    explicit SchemaGenerator(const Registry& registry, Settings settings = Settings{});

    /// Throws SchemaError for unknown types and UnsupportedParameterization
    /// for a wrong number of type arguments.
    SchemaPtr generate_schema(const TypeExpr& type);

    const Registry& registry() const
    {
        return registry_;
    }

    size_t cache_size() const
    {
        return cache_.size();
    }

    /// Number of schemas built so far, cache hits excluded.
    size_t builds() const
    {
        return builds_;
    }

  private:
    SchemaPtr build(const TypeExpr& type);
    SchemaPtr build_model(const TypeExpr& type);

    const Registry& registry_;
    Settings settings_;
    std::unordered_map<std::string, SchemaPtr> cache_;
    size_t builds_{0};
};

} // namespace sortedschema
