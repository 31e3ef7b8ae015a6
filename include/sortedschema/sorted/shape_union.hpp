#pragma once
#include "sortedschema/core/generator.hpp"
#include "sortedschema/core/schema.hpp"
#include "sortedschema/core/type_expr.hpp"
#include "sortedschema/value.hpp"

#include <string>
#include <vector>

namespace sortedschema
{

/// Form a candidate value takes before it becomes a container instance.
enum class InputShape
{
    AlreadyInstance,
    Mapping,
    IterableOfPairs,
    Set,
    GenericIterable
};

std::string to_string(InputShape shape);

/// Type arguments of an annotated container type, resolved once at build time.
struct Parameterization
{
    enum class Kind
    {
        Bare,         ///< No type arguments; element schemas are unconstrained
        Parameterized ///< Exactly the kind's arity of type arguments
    };

    Kind kind{Kind::Bare};
    std::vector<TypeExpr> args;

    bool bare() const
    {
        return kind == Kind::Bare;
    }

    /// Throws UnsupportedParameterization when `source` has type arguments but
    /// not exactly `arity` of them.
    static Parameterization of(const TypeExpr& source, size_t arity);
};

/// One legal native input shape and the generic type its input is validated as.
struct ShapeAlternative
{
    InputShape shape;
    TypeExpr intermediate;
};

struct ShapeUnionSpec
{
    std::string kind_name;
    ValueType instance_type;
    /// Tried in this order after the instance check.
    std::vector<ShapeAlternative> shapes;
    /// The only shape attempted on the JSON path; must be one of `shapes`.
    InputShape json_shape;
    /// Builds a container instance from a validated intermediate value.
    ValidatorFn construct;
    /// Converts an instance to its plain form.
    SerializerFn serialize;
};

/// Native path: union of [instance check, each shape in order], first success wins.
/// JSON path: the `json_shape` alternative alone. Serialization: `spec.serialize`.
SchemaPtr build_shape_union(const ShapeUnionSpec& spec, SchemaGenerator& handler);

} // namespace sortedschema
