// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

namespace mcpgate::schema
{

/// @brief Validates @p instance against a JSON Schema.
///
/// Supports the subset tools use for their input shapes: type (incl. unions), properties,
/// required, additionalProperties, enum, const, items, minLength/maxLength,
/// minimum/maximum, minItems/maxItems. Unknown keywords are ignored.
///
/// @return Success, or ErrorCode::SchemaViolation naming the offending location.
[[nodiscard]] auto validate(const nlohmann::json& schema, const nlohmann::json& instance) -> VoidResult;

} // namespace mcpgate::schema
