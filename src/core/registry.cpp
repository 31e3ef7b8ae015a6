#include "sortedschema/core/registry.hpp"

#include <algorithm>

namespace sortedschema
{

void Registry::register_builder(const std::string& kind, SchemaBuilder builder)
{
    if (kind.empty())
        throw SchemaError("cannot register a schema builder without a kind name");
    if (!builder)
        throw SchemaError("empty schema builder for kind: " + kind);
    builders_[kind] = std::move(builder);
}

const SchemaBuilder* Registry::find(const std::string& kind) const
{
    auto it = builders_.find(kind);
    return it == builders_.end() ? nullptr : &it->second;
}

std::vector<std::string> Registry::kinds() const
{
    std::vector<std::string> names;
    names.reserve(builders_.size());
    for (const auto& kv : builders_)
        names.push_back(kv.first);
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace sortedschema
