#pragma once
#include <string>
#include <utility>
#include <vector>

namespace sortedschema
{

/// A (possibly generic) type annotation such as `SortedDict[str, int]`.
struct TypeExpr
{
    std::string name;
    std::vector<TypeExpr> args;
    /// Named fields of a model expression.
    std::vector<std::pair<std::string, TypeExpr>> fields;
    bool is_model{false};

    bool parameterized() const
    {
        return !args.empty();
    }

    /// Canonical spelling, e.g. `Mapping[str, int]`.
    std::string to_string() const;
};

namespace types
{

TypeExpr generic(std::string name, std::vector<TypeExpr> args = {});

TypeExpr any();
TypeExpr integer();
TypeExpr number();
TypeExpr string();
TypeExpr boolean();
TypeExpr none();

TypeExpr mapping();
TypeExpr mapping(TypeExpr key, TypeExpr value);
TypeExpr iterable();
TypeExpr iterable(TypeExpr item);
TypeExpr tuple(std::vector<TypeExpr> items);
TypeExpr set();
TypeExpr set(TypeExpr item);

TypeExpr sorted_dict();
TypeExpr sorted_dict(TypeExpr key, TypeExpr value);
TypeExpr sorted_list();
TypeExpr sorted_list(TypeExpr item);
TypeExpr sorted_set();
TypeExpr sorted_set(TypeExpr item);

TypeExpr model(std::string name, std::vector<std::pair<std::string, TypeExpr>> fields);

} // namespace types

} // namespace sortedschema
