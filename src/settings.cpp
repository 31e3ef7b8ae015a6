#include "sortedschema/settings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace sortedschema
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static std::string upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

Settings Settings::from_env()
{
    Settings s;
    s.log_level = upper(getenv_str("SORTEDSCHEMA_LOG_LEVEL", s.log_level));
    auto cache = getenv_str("SORTEDSCHEMA_CACHE_SCHEMAS", "1");
    s.cache_schemas = !(cache == "0" || cache == "false" || cache == "FALSE");
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = upper(j.at("log_level").get<std::string>());
    if (j.contains("cache_schemas"))
        s.cache_schemas = j.at("cache_schemas").get<bool>();
    return s;
}

} // namespace sortedschema
