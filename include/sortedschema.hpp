#pragma once

/// @file sortedschema.hpp
/// @brief Main header for sortedschema - validation and serialization
/// schemas for SortedDict, SortedList and SortedSet
///
/// Usage:
/// @code
/// #include <sortedschema.hpp>
///
/// int main() {
///     using namespace sortedschema;
///     TypeAdapter adapter(types::sorted_dict(types::string(), types::integer()));
///
///     auto d = adapter.validate_json(R"({"b": 2, "a": 1})");
///     auto j = adapter.dump_json(d); // {"a":1,"b":2}
/// }
/// @endcode

// Core types and exceptions
#include "sortedschema/exceptions.hpp"
#include "sortedschema/settings.hpp"
#include "sortedschema/types.hpp"
#include "sortedschema/value.hpp"

// Ordered collections
#include "sortedschema/containers.hpp"

// Schema framework
#include "sortedschema/core/generator.hpp"
#include "sortedschema/core/registry.hpp"
#include "sortedschema/core/schema.hpp"
#include "sortedschema/core/type_adapter.hpp"
#include "sortedschema/core/type_expr.hpp"

// Sorted container schemas
#include "sortedschema/sorted/shape_union.hpp"
#include "sortedschema/sorted/sorted_schemas.hpp"
