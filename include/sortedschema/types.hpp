#pragma once
#include <nlohmann/json.hpp>

namespace sortedschema
{

using Json = nlohmann::json;

constexpr const char* VERSION = "1.0.0";

} // namespace sortedschema
