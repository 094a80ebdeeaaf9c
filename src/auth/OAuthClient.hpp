// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <auth/OAuthTypes.hpp>
#include <core/Error.hpp>
#include <http/HttpClient.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpgate::oauth
{

using CancelPredicate = std::function<bool()>;

/// @brief Network side of the OAuth 2.1 authorization code flow for MCP servers.
///
/// Stateless; every call takes the cancellation predicate of the attempt it belongs to.
class OAuthClient
{
  public:
    explicit OAuthClient(std::shared_ptr<http::HttpClient> http);

    /// @brief Locates the authorization server of @p resourceUrl and fetches its metadata.
    ///
    /// Tries protected resource metadata (or @p resourceMetadataHint), then RFC 8414 and
    /// OpenID discovery documents, and finally falls back to /authorize, /token and
    /// /register on the authorization server's origin.
    [[nodiscard]] auto discover(const std::string& resourceUrl,
                                const std::optional<std::string>& resourceMetadataHint,
                                const CancelPredicate& cancelled) -> Result<AuthServerMetadata>;

    /// @brief RFC 7591 dynamic client registration as a public client.
    [[nodiscard]] auto registerClient(const AuthServerMetadata& metadata,
                                      const std::string& redirectUri,
                                      const std::vector<std::string>& scopes,
                                      const CancelPredicate& cancelled) -> Result<ClientRegistration>;

    /// @brief Builds the URL the user must visit to grant access.
    [[nodiscard]] static auto authorizationUrl(const AuthServerMetadata& metadata,
                                               const ClientRegistration& client,
                                               const std::string& redirectUri,
                                               const std::string& codeChallenge,
                                               const std::string& state,
                                               const std::vector<std::string>& scopes,
                                               const std::string& resource) -> std::string;

    /// @brief Exchanges an authorization code for tokens.
    [[nodiscard]] auto exchangeCode(const AuthServerMetadata& metadata,
                                    const ClientRegistration& client,
                                    const std::string& code,
                                    const std::string& codeVerifier,
                                    const std::string& redirectUri,
                                    const std::string& resource,
                                    const CancelPredicate& cancelled) -> Result<TokenResponse>;

    /// @brief Obtains a new access token with a refresh token.
    [[nodiscard]] auto refresh(const AuthServerMetadata& metadata,
                               const ClientRegistration& client,
                               const std::string& refreshToken,
                               const std::string& resource,
                               const CancelPredicate& cancelled) -> Result<TokenResponse>;

  private:
    [[nodiscard]] auto fetchJson(const std::string& url, const CancelPredicate& cancelled)
        -> Result<std::optional<nlohmann::json>>;
    [[nodiscard]] auto postToken(const AuthServerMetadata& metadata,
                                 std::vector<std::pair<std::string, std::string>> form,
                                 const CancelPredicate& cancelled) -> Result<TokenResponse>;

    std::shared_ptr<http::HttpClient> _http;
};

} // namespace mcpgate::oauth
