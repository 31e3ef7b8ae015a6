#pragma once
#include "sortedschema/exceptions.hpp"
#include "sortedschema/value.hpp"

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sortedschema
{

/// Which path an input arrives on: an in-process native value or parsed JSON text.
enum class InputMode
{
    Python,
    Json
};

/// Immutable validation + serialization procedure for one type.
class Schema
{
  public:
    virtual ~Schema() = default;

    /// Returns the validated value or throws ValidationError.
    virtual Value validate(const Value& input, InputMode mode) const = 0;

    /// Plain form of a value this schema produced.
    virtual Value serialize(const Value& value) const
    {
        return value;
    }

    virtual std::string describe() const = 0;
};

using SchemaPtr = std::shared_ptr<const Schema>;
using ValidatorFn = std::function<Value(const Value&)>;
using SerializerFn = std::function<Value(const Value&)>;

struct UnionChoice
{
    std::string tag;
    SchemaPtr schema;
};

namespace core_schema
{

SchemaPtr any_schema();
SchemaPtr int_schema();
SchemaPtr float_schema();
SchemaPtr str_schema();
SchemaPtr bool_schema();
SchemaPtr none_schema();

/// Accepts only values whose runtime tag is `type`, returned unchanged.
SchemaPtr is_instance_schema(ValueType type);

/// Mapping of keys to values. Produces a Dict.
SchemaPtr dict_schema(SchemaPtr keys, SchemaPtr values);
/// Any iterable on the native path, arrays only on the JSON path. Produces a List.
SchemaPtr iterable_schema(SchemaPtr items);
/// Fixed-length positional items. Produces a Tuple.
SchemaPtr tuple_schema(std::vector<SchemaPtr> items);
/// Native sets, or JSON arrays; duplicate members are rejected. Produces a Set.
SchemaPtr set_schema(SchemaPtr items);

/// Validates with `schema`, then feeds the result to `function`.
SchemaPtr no_info_after_validator_function(ValidatorFn function, SchemaPtr schema);

/// Ordered alternatives; the first one that validates wins.
SchemaPtr union_schema(std::vector<UnionChoice> choices);
SchemaPtr union_schema(const std::vector<SchemaPtr>& choices);

/// Separate validators for the JSON and native paths, sharing one serializer.
SchemaPtr json_or_python_schema(SchemaPtr json_schema, SchemaPtr python_schema,
                                SerializerFn serialization = nullptr);

/// Named record of fields, read from a mapping.
SchemaPtr model_schema(std::string name, std::vector<std::pair<std::string, SchemaPtr>> fields);

} // namespace core_schema

} // namespace sortedschema
