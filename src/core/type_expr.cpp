#include "sortedschema/core/type_expr.hpp"

namespace sortedschema
{

std::string TypeExpr::to_string() const
{
    std::string out = name;
    if (!args.empty())
    {
        out += "[";
        for (size_t i = 0; i < args.size(); ++i)
            out += (i ? ", " : "") + args[i].to_string();
        out += "]";
    }
    if (is_model)
    {
        out += "{";
        for (size_t i = 0; i < fields.size(); ++i)
            out += (i ? ", " : "") + fields[i].first + ": " + fields[i].second.to_string();
        out += "}";
    }
    return out;
}

namespace types
{

TypeExpr generic(std::string name, std::vector<TypeExpr> args)
{
    TypeExpr t;
    t.name = std::move(name);
    t.args = std::move(args);
    return t;
}

TypeExpr any()
{
    return generic("Any");
}
TypeExpr integer()
{
    return generic("int");
}
TypeExpr number()
{
    return generic("float");
}
TypeExpr string()
{
    return generic("str");
}
TypeExpr boolean()
{
    return generic("bool");
}
TypeExpr none()
{
    return generic("None");
}

TypeExpr mapping()
{
    return generic("Mapping");
}
TypeExpr mapping(TypeExpr key, TypeExpr value)
{
    return generic("Mapping", {std::move(key), std::move(value)});
}
TypeExpr iterable()
{
    return generic("Iterable");
}
TypeExpr iterable(TypeExpr item)
{
    return generic("Iterable", {std::move(item)});
}
TypeExpr tuple(std::vector<TypeExpr> items)
{
    return generic("Tuple", std::move(items));
}
TypeExpr set()
{
    return generic("Set");
}
TypeExpr set(TypeExpr item)
{
    return generic("Set", {std::move(item)});
}

TypeExpr sorted_dict()
{
    return generic("SortedDict");
}
TypeExpr sorted_dict(TypeExpr key, TypeExpr value)
{
    return generic("SortedDict", {std::move(key), std::move(value)});
}
TypeExpr sorted_list()
{
    return generic("SortedList");
}
TypeExpr sorted_list(TypeExpr item)
{
    return generic("SortedList", {std::move(item)});
}
TypeExpr sorted_set()
{
    return generic("SortedSet");
}
TypeExpr sorted_set(TypeExpr item)
{
    return generic("SortedSet", {std::move(item)});
}

TypeExpr model(std::string name, std::vector<std::pair<std::string, TypeExpr>> fields)
{
    TypeExpr t;
    t.name = std::move(name);
    t.fields = std::move(fields);
    t.is_model = true;
    return t;
}

} // namespace types

} // namespace sortedschema
