#pragma once
#include "sortedschema/core/schema.hpp"
#include "sortedschema/core/type_expr.hpp"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sortedschema
{

class SchemaGenerator;

/// Builds the schema for `source`, resolving nested types through `handler`.
using SchemaBuilder = std::function<SchemaPtr(const TypeExpr& source, SchemaGenerator& handler)>;

/// Maps a container-kind name (a TypeExpr name) to the builder for its schema.
class Registry
{
  public:
    /// Registers or replaces the builder for `kind`.
    void register_builder(const std::string& kind, SchemaBuilder builder);

    /// nullptr when nothing is registered for `kind`.
    const SchemaBuilder* find(const std::string& kind) const;

    bool contains(const std::string& kind) const
    {
        return find(kind) != nullptr;
    }

    /// Registered kind names, sorted.
    std::vector<std::string> kinds() const;

  private:
    std::unordered_map<std::string, SchemaBuilder> builders_;
};

/// Process-wide registry, populated with the built-in container kinds on
/// first use. Defined alongside those kinds' builders.
const Registry& default_registry();

} // namespace sortedschema
