// SPDX-License-Identifier: Apache-2.0
#include "SchemaValidator.hpp"

#include <cmath>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace mcpgate::schema
{

namespace
{
    auto violation(std::string_view path, std::string_view what) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::SchemaViolation, std::format("{}: {}", path.empty() ? "$" : path, what));
    }

    auto matchesType(std::string_view type, const nlohmann::json& value) -> bool
    {
        if (type == "object")
            return value.is_object();
        if (type == "array")
            return value.is_array();
        if (type == "string")
            return value.is_string();
        if (type == "boolean")
            return value.is_boolean();
        if (type == "null")
            return value.is_null();
        if (type == "number")
            return value.is_number();
        if (type == "integer")
        {
            if (value.is_number_integer())
                return true;
            if (value.is_number_float())
            {
                auto const d = value.get<double>();
                return std::isfinite(d) && std::floor(d) == d;
            }
            return false;
        }
        return true; // unknown type names do not constrain
    }

    auto numberKeyword(const nlohmann::json& schema, const char* key) -> std::optional<double>
    {
        auto const it = schema.find(key);
        if (it == schema.end() || !it->is_number())
            return std::nullopt;
        return it->get<double>();
    }

    // Counts code points, not bytes.
    auto utf8Length(const std::string& s) -> size_t
    {
        auto count = size_t { 0 };
        for (unsigned char c: s)
        {
            if ((c & 0xC0) != 0x80)
                ++count;
        }
        return count;
    }

    auto validateAt(const nlohmann::json& schema, const nlohmann::json& value, const std::string& path)
        -> VoidResult
    {
        if (schema.is_boolean())
        {
            if (!schema.get<bool>())
                return violation(path, "no value is allowed here");
            return {};
        }
        if (!schema.is_object())
            return {};

        if (auto const it = schema.find("type"); it != schema.end())
        {
            auto matched = false;
            auto expected = std::string {};
            if (it->is_string())
            {
                matched = matchesType(it->get<std::string>(), value);
                expected = it->get<std::string>();
            }
            else if (it->is_array())
            {
                for (const auto& t: *it)
                {
                    if (!t.is_string())
                        continue;
                    matched = matched || matchesType(t.get<std::string>(), value);
                    expected += expected.empty() ? t.get<std::string>() : "|" + t.get<std::string>();
                }
            }
            else
            {
                matched = true;
            }

            if (!matched)
                return violation(path, std::format("expected {}, got {}", expected, value.type_name()));
        }

        if (auto const it = schema.find("enum"); it != schema.end() && it->is_array())
        {
            auto found = false;
            for (const auto& candidate: *it)
                found = found || candidate == value;
            if (!found)
                return violation(path, std::format("value {} is not one of {}", value.dump(), it->dump()));
        }

        if (auto const it = schema.find("const"); it != schema.end() && *it != value)
            return violation(path, std::format("value must be {}", it->dump()));

        if (value.is_string())
        {
            auto const length = static_cast<double>(utf8Length(value.get_ref<const std::string&>()));
            if (auto const min = numberKeyword(schema, "minLength"); min && length < *min)
                return violation(path, std::format("string shorter than {}", *min));
            if (auto const max = numberKeyword(schema, "maxLength"); max && length > *max)
                return violation(path, std::format("string longer than {}", *max));
        }

        if (value.is_number())
        {
            auto const number = value.get<double>();
            if (auto const min = numberKeyword(schema, "minimum"); min && number < *min)
                return violation(path, std::format("value below minimum {}", *min));
            if (auto const max = numberKeyword(schema, "maximum"); max && number > *max)
                return violation(path, std::format("value above maximum {}", *max));
        }

        if (value.is_array())
        {
            auto const count = static_cast<double>(value.size());
            if (auto const min = numberKeyword(schema, "minItems"); min && count < *min)
                return violation(path, std::format("fewer than {} items", *min));
            if (auto const max = numberKeyword(schema, "maxItems"); max && count > *max)
                return violation(path, std::format("more than {} items", *max));

            if (auto const it = schema.find("items"); it != schema.end() && (it->is_object() || it->is_boolean()))
            {
                for (size_t i = 0; i < value.size(); ++i)
                {
                    if (auto r = validateAt(*it, value[i], std::format("{}[{}]", path.empty() ? "$" : path, i)); !r)
                        return r;
                }
            }
        }

        if (value.is_object())
        {
            if (auto const it = schema.find("required"); it != schema.end() && it->is_array())
            {
                for (const auto& name: *it)
                {
                    if (name.is_string() && !value.contains(name.get<std::string>()))
                        return violation(path, std::format("missing required property '{}'", name.get<std::string>()));
                }
            }

            auto const properties = schema.find("properties");
            auto const additional = schema.find("additionalProperties");
            auto const hasProperties = properties != schema.end() && properties->is_object();

            for (const auto& [name, member]: value.items())
            {
                auto const memberPath = std::format("{}.{}", path.empty() ? "$" : path, name);
                if (hasProperties && properties->contains(name))
                {
                    if (auto r = validateAt((*properties)[name], member, memberPath); !r)
                        return r;
                }
                else if (additional != schema.end())
                {
                    if (additional->is_boolean() && !additional->get<bool>())
                        return violation(path, std::format("unexpected property '{}'", name));
                    if (auto r = validateAt(*additional, member, memberPath); !r)
                        return r;
                }
            }
        }

        return {};
    }
} // namespace

auto validate(const nlohmann::json& schema, const nlohmann::json& instance) -> VoidResult
{
    return validateAt(schema, instance, "");
}

} // namespace mcpgate::schema
