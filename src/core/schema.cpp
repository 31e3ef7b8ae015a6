#include "sortedschema/core/schema.hpp"

#include "sortedschema/containers.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace sortedschema::core_schema
{
namespace
{

ValidationError element_error(const std::string& expected, const Value& input)
{
    return ValidationError(ErrorKind::ElementValidationError,
                           "Input should be " + expected + ", got " + repr(input));
}

ValidationError shape_error(const std::string& expected, const Value& input)
{
    return ValidationError(ErrorKind::ShapeMismatch,
                           "Input should be " + expected + ", got " + to_string(input.type()));
}

/// Location segment for a mapping key or member: strings verbatim, others as repr.
std::string segment(const Value& v)
{
    return v.holds<std::string>() ? v.get<std::string>() : repr(v);
}

void collect(std::vector<ErrorDetail>& out, const ValidationError& e)
{
    out.insert(out.end(), e.errors().begin(), e.errors().end());
}

/// Validates `items` positionally with `schema_at(i)`, gathering every failure.
template <typename SchemaAt>
std::vector<Value> validate_items(const std::vector<Value>& items, InputMode mode,
                                  SchemaAt schema_at)
{
    std::vector<Value> out;
    out.reserve(items.size());
    std::vector<ErrorDetail> errors;
    for (size_t i = 0; i < items.size(); ++i)
    {
        try
        {
            out.push_back(schema_at(i)->validate(items[i], mode));
        }
        catch (const ValidationError& e)
        {
            collect(errors, e.at(std::to_string(i)));
        }
    }
    if (!errors.empty())
        throw ValidationError(std::move(errors));
    return out;
}

std::vector<Value> serialize_items(const std::vector<Value>& items, const Schema& schema)
{
    std::vector<Value> out;
    out.reserve(items.size());
    for (const auto& item : items)
        out.push_back(schema.serialize(item));
    return out;
}

class AnySchema : public Schema
{
  public:
    Value validate(const Value& input, InputMode) const override
    {
        return input;
    }
    std::string describe() const override
    {
        return "any";
    }
};

class IntSchema : public Schema
{
  public:
    Value validate(const Value& input, InputMode) const override
    {
        if (input.holds<int64_t>())
            return input;
        if (input.holds<double>())
        {
            double d = input.get<double>();
            if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 9.2e18)
                return static_cast<int64_t>(d);
        }
        if (input.holds<std::string>())
        {
            const auto& s = input.get<std::string>();
            try
            {
                size_t idx = 0;
                long long parsed = std::stoll(s, &idx);
                if (idx == s.size())
                    return static_cast<int64_t>(parsed);
            }
            catch (const std::logic_error&)
            {
                // not an integer literal
            }
        }
        throw element_error("a valid integer", input);
    }
    std::string describe() const override
    {
        return "int";
    }
};

class FloatSchema : public Schema
{
  public:
    Value validate(const Value& input, InputMode) const override
    {
        if (input.holds<double>())
            return input;
        if (input.holds<int64_t>())
            return static_cast<double>(input.get<int64_t>());
        if (input.holds<std::string>())
        {
            const auto& s = input.get<std::string>();
            try
            {
                size_t idx = 0;
                double parsed = std::stod(s, &idx);
                if (idx == s.size())
                    return parsed;
            }
            catch (const std::logic_error&)
            {
                // not a number literal
            }
        }
        throw element_error("a valid number", input);
    }
    std::string describe() const override
    {
        return "float";
    }
};

class StrSchema : public Schema
{
  public:
    Value validate(const Value& input, InputMode) const override
    {
        if (!input.holds<std::string>())
            throw element_error("a valid string", input);
        return input;
    }
    std::string describe() const override
    {
        return "str";
    }
};

class BoolSchema : public Schema
{
  public:
    Value validate(const Value& input, InputMode) const override
    {
        if (!input.holds<bool>())
            throw element_error("a valid boolean", input);
        return input;
    }
    std::string describe() const override
    {
        return "bool";
    }
};

class NoneSchema : public Schema
{
  public:
    Value validate(const Value& input, InputMode) const override
    {
        if (!input.holds<std::nullptr_t>())
            throw element_error("None", input);
        return input;
    }
    std::string describe() const override
    {
        return "none";
    }
};

class IsInstanceSchema : public Schema
{
  public:
    explicit IsInstanceSchema(ValueType type) : type_(type) {}

    Value validate(const Value& input, InputMode) const override
    {
        if (input.type() != type_)
            throw shape_error("an instance of " + to_string(type_), input);
        return input;
    }
    std::string describe() const override
    {
        return "is-instance[" + to_string(type_) + "]";
    }

  private:
    ValueType type_;
};

class DictSchema : public Schema
{
  public:
    DictSchema(SchemaPtr keys, SchemaPtr values) : keys_(std::move(keys)), values_(std::move(values))
    {
    }

    Value validate(const Value& input, InputMode mode) const override
    {
        Dict source;
        if (input.holds<Dict>())
            source = input.get<Dict>();
        else if (mode == InputMode::Python && input.holds<std::shared_ptr<const SortedDict>>())
            source = input.get<std::shared_ptr<const SortedDict>>()->to_dict();
        else
            throw shape_error("a valid dictionary", input);

        std::vector<std::pair<Value, Value>> out;
        out.reserve(source.items.size());
        std::vector<ErrorDetail> errors;
        for (const auto& [k, v] : source.items)
        {
            Value key;
            bool key_ok = true;
            try
            {
                key = keys_->validate(k, mode);
            }
            catch (const ValidationError& e)
            {
                collect(errors, e.at("[key]").at(segment(k)));
                key_ok = false;
            }
            try
            {
                Value value = values_->validate(v, mode);
                if (key_ok)
                    out.emplace_back(std::move(key), std::move(value));
            }
            catch (const ValidationError& e)
            {
                collect(errors, e.at(segment(k)));
            }
        }
        if (!errors.empty())
            throw ValidationError(std::move(errors));
        return Value::dict(std::move(out));
    }

    Value serialize(const Value& value) const override
    {
        if (!value.holds<Dict>())
            return value;
        Dict out;
        for (const auto& [k, v] : value.get<Dict>().items)
            out.items.emplace_back(keys_->serialize(k), values_->serialize(v));
        return Value(std::move(out));
    }

    std::string describe() const override
    {
        return "dict[" + keys_->describe() + ", " + values_->describe() + "]";
    }

  private:
    SchemaPtr keys_;
    SchemaPtr values_;
};

class IterableSchema : public Schema
{
  public:
    explicit IterableSchema(SchemaPtr items) : items_(std::move(items)) {}

    Value validate(const Value& input, InputMode mode) const override
    {
        std::vector<Value> members;
        if (mode == InputMode::Json)
        {
            if (!input.holds<List>())
                throw shape_error("a valid array", input);
            members = input.get<List>().items;
        }
        else if (!iterate(input, members))
        {
            throw shape_error("iterable", input);
        }
        return Value(List{validate_items(members, mode, [this](size_t) { return items_; })});
    }

    Value serialize(const Value& value) const override
    {
        if (!value.holds<List>())
            return value;
        return Value(List{serialize_items(value.get<List>().items, *items_)});
    }

    std::string describe() const override
    {
        return "iterable[" + items_->describe() + "]";
    }

  private:
    SchemaPtr items_;
};

class TupleSchema : public Schema
{
  public:
    explicit TupleSchema(std::vector<SchemaPtr> items) : items_(std::move(items)) {}

    Value validate(const Value& input, InputMode mode) const override
    {
        const std::vector<Value>* members = nullptr;
        if (input.holds<List>())
            members = &input.get<List>().items;
        else if (mode == InputMode::Python && input.holds<Tuple>())
            members = &input.get<Tuple>().items;
        else
            throw shape_error("a valid tuple", input);

        if (members->size() != items_.size())
            throw ValidationError(ErrorKind::ShapeMismatch,
                                  "Tuple should have " + std::to_string(items_.size()) +
                                      " items, got " + std::to_string(members->size()));
        return Value(
            Tuple{validate_items(*members, mode, [this](size_t i) { return items_[i]; })});
    }

    std::string describe() const override
    {
        std::string out = "tuple[";
        for (size_t i = 0; i < items_.size(); ++i)
            out += (i ? ", " : "") + items_[i]->describe();
        return out + "]";
    }

  private:
    std::vector<SchemaPtr> items_;
};

class SetSchema : public Schema
{
  public:
    explicit SetSchema(SchemaPtr items) : items_(std::move(items)) {}

    Value validate(const Value& input, InputMode mode) const override
    {
        const std::vector<Value>* members = nullptr;
        if (mode == InputMode::Python && input.holds<Set>())
            members = &input.get<Set>().items;
        else if (mode == InputMode::Json && input.holds<List>())
            members = &input.get<List>().items;
        else
            throw shape_error("a valid set", input);

        auto validated = validate_items(*members, mode, [this](size_t) { return items_; });
        auto sorted = validated;
        std::sort(sorted.begin(), sorted.end());
        auto dup = std::adjacent_find(sorted.begin(), sorted.end());
        if (dup != sorted.end())
            throw ValidationError(ErrorKind::ShapeMismatch,
                                  "Set items should be unique, got duplicate " + repr(*dup));
        return Value(Set{std::move(sorted)});
    }

    Value serialize(const Value& value) const override
    {
        if (!value.holds<Set>())
            return value;
        return Value::set(serialize_items(value.get<Set>().items, *items_));
    }

    std::string describe() const override
    {
        return "set[" + items_->describe() + "]";
    }

  private:
    SchemaPtr items_;
};

class AfterValidatorSchema : public Schema
{
  public:
    AfterValidatorSchema(ValidatorFn function, SchemaPtr schema)
        : function_(std::move(function)), schema_(std::move(schema))
    {
    }

    Value validate(const Value& input, InputMode mode) const override
    {
        Value intermediate = schema_->validate(input, mode);
        try
        {
            return function_(intermediate);
        }
        catch (const ContainerError& e)
        {
            throw ValidationError(ErrorKind::ShapeMismatch, e.what());
        }
    }

    std::string describe() const override
    {
        return "function-after[" + schema_->describe() + "]";
    }

  private:
    ValidatorFn function_;
    SchemaPtr schema_;
};

class UnionSchema : public Schema
{
  public:
    explicit UnionSchema(std::vector<UnionChoice> choices) : choices_(std::move(choices))
    {
        if (choices_.empty())
            throw SchemaError("union_schema needs at least one choice");
    }

    Value validate(const Value& input, InputMode mode) const override
    {
        std::vector<ErrorDetail> errors;
        for (const auto& choice : choices_)
        {
            try
            {
                return choice.schema->validate(input, mode);
            }
            catch (const ValidationError& e)
            {
                for (auto d : e.errors())
                {
                    if (d.branch.empty())
                        d.branch = choice.tag;
                    errors.push_back(std::move(d));
                }
            }
        }
        throw ValidationError(std::move(errors));
    }

    std::string describe() const override
    {
        std::string out = "union[";
        for (size_t i = 0; i < choices_.size(); ++i)
            out += (i ? ", " : "") + choices_[i].tag;
        return out + "]";
    }

  private:
    std::vector<UnionChoice> choices_;
};

class JsonOrPythonSchema : public Schema
{
  public:
    JsonOrPythonSchema(SchemaPtr json, SchemaPtr python, SerializerFn serialization)
        : json_(std::move(json)), python_(std::move(python)),
          serialization_(std::move(serialization))
    {
    }

    Value validate(const Value& input, InputMode mode) const override
    {
        return mode == InputMode::Json ? json_->validate(input, mode)
                                       : python_->validate(input, mode);
    }

    Value serialize(const Value& value) const override
    {
        return serialization_ ? serialization_(value) : python_->serialize(value);
    }

    std::string describe() const override
    {
        return "json-or-python[json=" + json_->describe() + ", python=" + python_->describe() +
               "]";
    }

  private:
    SchemaPtr json_;
    SchemaPtr python_;
    SerializerFn serialization_;
};

class ModelSchema : public Schema
{
  public:
    ModelSchema(std::string name, std::vector<std::pair<std::string, SchemaPtr>> fields)
        : name_(std::move(name)), fields_(std::move(fields))
    {
    }

    Value validate(const Value& input, InputMode mode) const override
    {
        if (!input.holds<Dict>())
            throw shape_error("a valid dictionary or instance of " + name_, input);
        const auto& source = input.get<Dict>().items;

        Dict out;
        std::vector<ErrorDetail> errors;
        for (const auto& field : fields_)
        {
            Value name(field.first);
            auto it = std::find_if(source.begin(), source.end(),
                                   [&name](const std::pair<Value, Value>& kv)
                                   { return kv.first == name; });
            if (it == source.end())
            {
                errors.push_back(ErrorDetail{
                    ErrorKind::ElementValidationError, {field.first}, "Field required", {}});
                continue;
            }
            try
            {
                out.items.emplace_back(name, field.second->validate(it->second, mode));
            }
            catch (const ValidationError& e)
            {
                collect(errors, e.at(field.first));
            }
        }
        if (!errors.empty())
            throw ValidationError(std::move(errors));
        return Value(std::move(out));
    }

    Value serialize(const Value& value) const override
    {
        if (!value.holds<Dict>())
            return value;
        Dict out;
        for (const auto& kv : value.get<Dict>().items)
        {
            const Value& key = kv.first;
            auto it = std::find_if(fields_.begin(), fields_.end(),
                                   [&key](const std::pair<std::string, SchemaPtr>& f)
                                   { return Value(f.first) == key; });
            out.items.emplace_back(key, it != fields_.end() ? it->second->serialize(kv.second)
                                                            : kv.second);
        }
        return Value(std::move(out));
    }

    std::string describe() const override
    {
        return "model[" + name_ + "]";
    }

  private:
    std::string name_;
    std::vector<std::pair<std::string, SchemaPtr>> fields_;
};

} // namespace

SchemaPtr any_schema()
{
    return std::make_shared<AnySchema>();
}

SchemaPtr int_schema()
{
    return std::make_shared<IntSchema>();
}

SchemaPtr float_schema()
{
    return std::make_shared<FloatSchema>();
}

SchemaPtr str_schema()
{
    return std::make_shared<StrSchema>();
}

SchemaPtr bool_schema()
{
    return std::make_shared<BoolSchema>();
}

SchemaPtr none_schema()
{
    return std::make_shared<NoneSchema>();
}

SchemaPtr is_instance_schema(ValueType type)
{
    return std::make_shared<IsInstanceSchema>(type);
}

SchemaPtr dict_schema(SchemaPtr keys, SchemaPtr values)
{
    return std::make_shared<DictSchema>(std::move(keys), std::move(values));
}

SchemaPtr iterable_schema(SchemaPtr items)
{
    return std::make_shared<IterableSchema>(std::move(items));
}

SchemaPtr tuple_schema(std::vector<SchemaPtr> items)
{
    return std::make_shared<TupleSchema>(std::move(items));
}

SchemaPtr set_schema(SchemaPtr items)
{
    return std::make_shared<SetSchema>(std::move(items));
}

SchemaPtr no_info_after_validator_function(ValidatorFn function, SchemaPtr schema)
{
    return std::make_shared<AfterValidatorSchema>(std::move(function), std::move(schema));
}

SchemaPtr union_schema(std::vector<UnionChoice> choices)
{
    return std::make_shared<UnionSchema>(std::move(choices));
}

SchemaPtr union_schema(const std::vector<SchemaPtr>& choices)
{
    std::vector<UnionChoice> tagged;
    tagged.reserve(choices.size());
    for (const auto& c : choices)
        tagged.push_back(UnionChoice{c->describe(), c});
    return union_schema(std::move(tagged));
}

SchemaPtr json_or_python_schema(SchemaPtr json_schema, SchemaPtr python_schema,
                                SerializerFn serialization)
{
    return std::make_shared<JsonOrPythonSchema>(std::move(json_schema), std::move(python_schema),
                                                std::move(serialization));
}

SchemaPtr model_schema(std::string name, std::vector<std::pair<std::string, SchemaPtr>> fields)
{
    return std::make_shared<ModelSchema>(std::move(name), std::move(fields));
}

} // namespace sortedschema::core_schema
