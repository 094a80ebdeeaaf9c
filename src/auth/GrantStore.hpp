// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <auth/OAuthTypes.hpp>
#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace mcpgate::oauth
{

[[nodiscard]] auto grantToJson(const AuthorizationGrant& grant) -> nlohmann::json;
[[nodiscard]] auto grantFromJson(const nlohmann::json& doc) -> AuthorizationGrant;

/// @brief Persists authorization grants as a JSON file readable only by the owner.
class GrantStore
{
  public:
    explicit GrantStore(std::filesystem::path path);

    /// @brief Reads all grants. A missing file yields an empty map.
    [[nodiscard]] auto load() const -> Result<std::map<std::string, AuthorizationGrant>>;

    /// @brief Atomically replaces the file with @p grants (mode 0600).
    [[nodiscard]] auto save(const std::map<std::string, AuthorizationGrant>& grants) const -> VoidResult;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return _path; }

  private:
    std::filesystem::path _path;
    mutable std::mutex _mutex;
};

} // namespace mcpgate::oauth
