#include "sortedschema/sorted/sorted_schemas.hpp"

namespace sortedschema
{

void register_sorted_containers(Registry& registry)
{
    registry.register_builder("SortedDict", build_sorted_dict_schema);
    registry.register_builder("SortedList", build_sorted_list_schema);
    registry.register_builder("SortedSet", build_sorted_set_schema);
}

const Registry& default_registry()
{
    static const Registry registry = []
    {
        Registry r;
        register_sorted_containers(r);
        return r;
    }();
    return registry;
}

} // namespace sortedschema
