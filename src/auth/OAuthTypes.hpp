// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace mcpgate::oauth
{

/// @brief RFC 8414 authorization server metadata (the fields the gateway uses).
struct AuthServerMetadata
{
    std::string issuer;
    std::string authorizationEndpoint;
    std::string tokenEndpoint;
    std::string registrationEndpoint;
    std::vector<std::string> scopesSupported;
    std::vector<std::string> codeChallengeMethodsSupported;
};

/// @brief Client credentials, configured or obtained by dynamic registration.
struct ClientRegistration
{
    std::string clientId;
    std::string clientSecret;
};

/// @brief Successful token endpoint response.
struct TokenResponse
{
    std::string accessToken;
    std::string refreshToken; ///< Empty if the server did not rotate/issue one.
    std::string tokenType = "Bearer";
    std::optional<std::chrono::seconds> expiresIn;
    std::string scope;
};

/// @brief Everything kept per remote backend between authorization attempts.
struct AuthorizationGrant
{
    AuthServerMetadata metadata;
    ClientRegistration client;
    std::string accessToken;
    std::string refreshToken;
    std::optional<std::chrono::system_clock::time_point> expiresAt;
    std::chrono::system_clock::time_point obtainedAt {};
};

} // namespace mcpgate::oauth
