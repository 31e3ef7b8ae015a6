#include "sortedschema/containers.hpp"

#include <algorithm>
#include <iterator>

namespace sortedschema
{

SortedDict::SortedDict(const Dict& mapping)
{
    for (const auto& [k, v] : mapping.items)
        items_.insert_or_assign(k, v);
}

SortedDict::SortedDict(const std::vector<std::pair<Value, Value>>& pairs)
{
    for (const auto& [k, v] : pairs)
        items_.insert_or_assign(k, v);
}

SortedDict SortedDict::from_value(const Value& source)
{
    if (source.holds<Dict>())
        return SortedDict(source.get<Dict>());
    if (source.holds<std::shared_ptr<const SortedDict>>())
        return *source.get<std::shared_ptr<const SortedDict>>();

    std::vector<Value> members;
    if (!iterate(source, members))
        throw ContainerError("SortedDict cannot be built from " + to_string(source.type()));

    std::vector<std::pair<Value, Value>> pairs;
    pairs.reserve(members.size());
    for (const auto& m : members)
    {
        const std::vector<Value>* pair = nullptr;
        if (m.holds<Tuple>())
            pair = &m.get<Tuple>().items;
        else if (m.holds<List>())
            pair = &m.get<List>().items;
        if (!pair || pair->size() != 2)
            throw ContainerError("SortedDict update element " + repr(m) + " is not a key/value pair");
        pairs.emplace_back((*pair)[0], (*pair)[1]);
    }
    return SortedDict(pairs);
}

const Value& SortedDict::at(const Value& key) const
{
    auto it = items_.find(key);
    if (it == items_.end())
        throw ContainerError("key not found: " + repr(key));
    return it->second;
}

std::vector<Value> SortedDict::keys() const
{
    std::vector<Value> out;
    out.reserve(items_.size());
    for (const auto& kv : items_)
        out.push_back(kv.first);
    return out;
}

std::vector<Value> SortedDict::values() const
{
    std::vector<Value> out;
    out.reserve(items_.size());
    for (const auto& kv : items_)
        out.push_back(kv.second);
    return out;
}

Dict SortedDict::to_dict() const
{
    Dict out;
    out.items.reserve(items_.size());
    for (const auto& kv : items_)
        out.items.emplace_back(kv.first, kv.second);
    return out;
}

SortedList::SortedList(std::vector<Value> items) : items_(std::move(items))
{
    std::stable_sort(items_.begin(), items_.end());
}

SortedList SortedList::from_value(const Value& source)
{
    std::vector<Value> members;
    if (!iterate(source, members))
        throw ContainerError("SortedList cannot be built from " + to_string(source.type()));
    return SortedList(std::move(members));
}

const Value& SortedList::at(size_t index) const
{
    if (index >= items_.size())
        throw ContainerError("SortedList index out of range: " + std::to_string(index));
    return items_[index];
}

size_t SortedList::count(const Value& v) const
{
    auto range = std::equal_range(items_.begin(), items_.end(), v);
    return static_cast<size_t>(std::distance(range.first, range.second));
}

List SortedList::to_list() const
{
    return List{items_};
}

SortedSet::SortedSet(const std::vector<Value>& items) : items_(items.begin(), items.end()) {}

SortedSet SortedSet::from_value(const Value& source)
{
    std::vector<Value> members;
    if (!iterate(source, members))
        throw ContainerError("SortedSet cannot be built from " + to_string(source.type()));
    return SortedSet(members);
}

const Value& SortedSet::at(size_t index) const
{
    if (index >= items_.size())
        throw ContainerError("SortedSet index out of range: " + std::to_string(index));
    return *std::next(items_.begin(), static_cast<std::ptrdiff_t>(index));
}

Set SortedSet::to_set() const
{
    return Set{std::vector<Value>(items_.begin(), items_.end())};
}

List SortedSet::to_list() const
{
    return List{std::vector<Value>(items_.begin(), items_.end())};
}

} // namespace sortedschema
