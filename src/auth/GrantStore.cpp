// SPDX-License-Identifier: Apache-2.0
#include "GrantStore.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>
#include <fstream>
#include <sstream>

namespace mcpgate::oauth
{

namespace
{
    auto toUnixSeconds(std::chrono::system_clock::time_point tp) -> int64_t
    {
        return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    }

    auto fromUnixSeconds(int64_t seconds) -> std::chrono::system_clock::time_point
    {
        return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
    }
} // namespace

auto grantToJson(const AuthorizationGrant& grant) -> nlohmann::json
{
    auto doc = nlohmann::json {
        { "metadata",
          {
              { "issuer", grant.metadata.issuer },
              { "authorization_endpoint", grant.metadata.authorizationEndpoint },
              { "token_endpoint", grant.metadata.tokenEndpoint },
              { "registration_endpoint", grant.metadata.registrationEndpoint },
              { "scopes_supported", grant.metadata.scopesSupported },
              { "code_challenge_methods_supported", grant.metadata.codeChallengeMethodsSupported },
          } },
        { "client_id", grant.client.clientId },
        { "client_secret", grant.client.clientSecret },
        { "tokens",
          {
              { "access_token", grant.accessToken },
              { "refresh_token", grant.refreshToken },
              { "obtained_at", toUnixSeconds(grant.obtainedAt) },
          } },
    };
    if (grant.expiresAt)
        doc["tokens"]["expires_at"] = toUnixSeconds(*grant.expiresAt);
    return doc;
}

auto grantFromJson(const nlohmann::json& doc) -> AuthorizationGrant
{
    auto const metadata = doc.value("metadata", nlohmann::json::object());
    auto const tokens = doc.value("tokens", nlohmann::json::object());

    auto grant = AuthorizationGrant {
        .metadata =
            AuthServerMetadata {
                .issuer = json::getStringOr(metadata, "issuer", ""),
                .authorizationEndpoint = json::getStringOr(metadata, "authorization_endpoint", ""),
                .tokenEndpoint = json::getStringOr(metadata, "token_endpoint", ""),
                .registrationEndpoint = json::getStringOr(metadata, "registration_endpoint", ""),
                .scopesSupported = json::getStringArray(metadata, "scopes_supported"),
                .codeChallengeMethodsSupported = json::getStringArray(metadata, "code_challenge_methods_supported"),
            },
        .client =
            ClientRegistration {
                .clientId = json::getStringOr(doc, "client_id", ""),
                .clientSecret = json::getStringOr(doc, "client_secret", ""),
            },
        .accessToken = json::getStringOr(tokens, "access_token", ""),
        .refreshToken = json::getStringOr(tokens, "refresh_token", ""),
        .expiresAt = std::nullopt,
        .obtainedAt = fromUnixSeconds(json::getIntOr(tokens, "obtained_at", 0)),
    };

    if (auto const expiresAt = json::getIntOr(tokens, "expires_at", -1); expiresAt >= 0)
        grant.expiresAt = fromUnixSeconds(expiresAt);
    return grant;
}

GrantStore::GrantStore(std::filesystem::path path): _path(std::move(path))
{
}

auto GrantStore::load() const -> Result<std::map<std::string, AuthorizationGrant>>
{
    auto lock = std::lock_guard(_mutex);
    auto grants = std::map<std::string, AuthorizationGrant> {};

    auto ec = std::error_code {};
    if (!std::filesystem::exists(_path, ec))
        return grants;

    auto file = std::ifstream(_path);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open token file: {}", _path.string()));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto doc = json::parse(ss.str());
    if (!doc)
        return makeError(ErrorCode::IoError, std::format("Corrupt token file {}: {}", _path.string(), doc.error().message));
    if (!doc->is_object())
        return grants;

    for (const auto& [backendId, entry]: doc->items())
    {
        if (entry.is_object())
            grants[backendId] = grantFromJson(entry);
    }

    log::debug("Loaded {} authorization grant(s) from {}", grants.size(), _path.string());
    return grants;
}

auto GrantStore::save(const std::map<std::string, AuthorizationGrant>& grants) const -> VoidResult
{
    auto lock = std::lock_guard(_mutex);

    auto doc = nlohmann::json::object();
    for (const auto& [backendId, grant]: grants)
        doc[backendId] = grantToJson(grant);

    auto ec = std::error_code {};
    if (_path.has_parent_path())
    {
        std::filesystem::create_directories(_path.parent_path(), ec);
        if (ec)
            return makeError(ErrorCode::IoError,
                             std::format("Cannot create {}: {}", _path.parent_path().string(), ec.message()));
    }

    auto tmpPath = _path;
    tmpPath += ".tmp";
    {
        auto file = std::ofstream(tmpPath, std::ios::trunc);
        if (!file.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot write token file: {}", tmpPath.string()));
        std::filesystem::permissions(tmpPath,
                                     std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace,
                                     ec);
        if (ec)
            log::warning("Cannot restrict permissions of {}: {}", tmpPath.string(), ec.message());
        file << doc.dump(2);
        if (!file)
            return makeError(ErrorCode::IoError, std::format("Failed writing token file: {}", tmpPath.string()));
    }

    std::filesystem::rename(tmpPath, _path, ec);
    if (ec)
        return makeError(ErrorCode::IoError, std::format("Cannot replace {}: {}", _path.string(), ec.message()));
    return {};
}

} // namespace mcpgate::oauth
