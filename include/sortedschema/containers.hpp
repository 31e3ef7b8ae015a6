#pragma once
#include "sortedschema/exceptions.hpp"
#include "sortedschema/value.hpp"

#include <map>
#include <memory>
#include <set>
#include <vector>

namespace sortedschema
{

/// Mapping that iterates its keys in ascending order.
class SortedDict
{
  public:
    using storage_t = std::map<Value, Value>;
    using const_iterator = storage_t::const_iterator;

    SortedDict() = default;
    explicit SortedDict(const Dict& mapping);
    /// Pairs are applied in order; a repeated key keeps the last value.
    explicit SortedDict(const std::vector<std::pair<Value, Value>>& pairs);

    /// Accepts a Dict, a SortedDict, or an iterable whose members are 2-item
    /// tuples or lists. Throws ContainerError otherwise.
    static SortedDict from_value(const Value& source);

    size_t size() const
    {
        return items_.size();
    }
    bool empty() const
    {
        return items_.empty();
    }
    bool contains(const Value& key) const
    {
        return items_.count(key) != 0;
    }
    const Value& at(const Value& key) const;
    const_iterator begin() const
    {
        return items_.begin();
    }
    const_iterator end() const
    {
        return items_.end();
    }
    std::vector<Value> keys() const;
    std::vector<Value> values() const;

    /// Plain mapping in key order.
    Dict to_dict() const;

    bool operator==(const SortedDict& other) const
    {
        return items_ == other.items_;
    }

  private:
    storage_t items_;
};

/// Sequence kept in ascending order; equal elements keep insertion order.
class SortedList
{
  public:
    using const_iterator = std::vector<Value>::const_iterator;

    SortedList() = default;
    explicit SortedList(std::vector<Value> items);

    /// Accepts any iterable shape (see iterate()). Throws ContainerError otherwise.
    static SortedList from_value(const Value& source);

    size_t size() const
    {
        return items_.size();
    }
    bool empty() const
    {
        return items_.empty();
    }
    const Value& operator[](size_t index) const
    {
        return items_[index];
    }
    const Value& at(size_t index) const;
    size_t count(const Value& v) const;
    bool contains(const Value& v) const
    {
        return count(v) != 0;
    }
    const_iterator begin() const
    {
        return items_.begin();
    }
    const_iterator end() const
    {
        return items_.end();
    }

    List to_list() const;

    bool operator==(const SortedList& other) const
    {
        return items_ == other.items_;
    }

  private:
    std::vector<Value> items_;
};

/// Set of unique elements iterated in ascending order.
class SortedSet
{
  public:
    using const_iterator = std::set<Value>::const_iterator;

    SortedSet() = default;
    explicit SortedSet(const std::vector<Value>& items);

    /// Accepts any iterable or set; duplicates collapse. Throws ContainerError otherwise.
    static SortedSet from_value(const Value& source);

    size_t size() const
    {
        return items_.size();
    }
    bool empty() const
    {
        return items_.empty();
    }
    bool contains(const Value& v) const
    {
        return items_.count(v) != 0;
    }
    const Value& at(size_t index) const;
    const_iterator begin() const
    {
        return items_.begin();
    }
    const_iterator end() const
    {
        return items_.end();
    }

    Set to_set() const;
    List to_list() const;

    bool operator==(const SortedSet& other) const
    {
        return items_ == other.items_;
    }

  private:
    std::set<Value> items_;
};

inline Value make_value(SortedDict d)
{
    return Value(std::shared_ptr<const SortedDict>(std::make_shared<SortedDict>(std::move(d))));
}

inline Value make_value(SortedList l)
{
    return Value(std::shared_ptr<const SortedList>(std::make_shared<SortedList>(std::move(l))));
}

inline Value make_value(SortedSet s)
{
    return Value(std::shared_ptr<const SortedSet>(std::make_shared<SortedSet>(std::move(s))));
}

} // namespace sortedschema
