#pragma once
#include "sortedschema/core/generator.hpp"
#include "sortedschema/core/registry.hpp"
#include "sortedschema/core/schema.hpp"
#include "sortedschema/core/type_expr.hpp"

namespace sortedschema
{

/// SortedDict[K, V]: accepts an instance, a mapping, or an iterable of (K, V)
/// pairs natively, a mapping only from JSON. Serializes to a plain mapping.
SchemaPtr build_sorted_dict_schema(const TypeExpr& source, SchemaGenerator& handler);

/// SortedList[T]: accepts an instance or any iterable of T natively, an array
/// from JSON. Serializes to a list in sorted order.
SchemaPtr build_sorted_list_schema(const TypeExpr& source, SchemaGenerator& handler);

/// SortedSet[T]: accepts an instance, a set of T, or an iterable of T
/// natively; from JSON only a set (an array without duplicates). Serializes
/// to a plain set.
SchemaPtr build_sorted_set_schema(const TypeExpr& source, SchemaGenerator& handler);

/// Registers the three builders under "SortedDict", "SortedList" and "SortedSet".
void register_sorted_containers(Registry& registry);

} // namespace sortedschema
