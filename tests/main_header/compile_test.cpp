/// @file tests/main_header/compile_test.cpp
/// @brief Compile test for main sortedschema.hpp header
///
/// This test verifies that including just <sortedschema.hpp> gives access to
/// the adapters, the registry and the container types.

#include "sortedschema.hpp"

#include <cassert>
#include <iostream>

using namespace sortedschema;

int main()
{
    std::cout << "=== Main Header Compile Test ===" << std::endl;

    std::cout << "test_adapter_accessible..." << std::endl;
    {
        TypeAdapter adapter(types::sorted_dict(types::string(), types::integer()));
        auto d = adapter.validate_json(R"({"b": 2, "a": 1})");
        assert(adapter.dump_json(d).dump() == R"({"a":1,"b":2})");
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_registry_accessible..." << std::endl;
    {
        assert(default_registry().contains("SortedList"));
        assert(std::string(VERSION) == "1.0.0");
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "=== All Main Header Tests PASSED ===" << std::endl;
    return 0;
}
