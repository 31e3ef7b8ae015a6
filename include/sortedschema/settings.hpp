#pragma once
#include "sortedschema/types.hpp"

#include <string>

namespace sortedschema
{

struct Settings
{
    std::string log_level{"INFO"};
    bool cache_schemas{true};

    bool debug() const
    {
        return log_level == "DEBUG";
    }

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace sortedschema
