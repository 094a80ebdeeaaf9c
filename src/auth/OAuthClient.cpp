// SPDX-License-Identifier: Apache-2.0
#include "OAuthClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <http/Url.hpp>

#include <format>

namespace mcpgate::oauth
{

namespace
{
    constexpr auto DiscoveryTimeout = std::chrono::milliseconds(10000);

    auto joinScopes(const std::vector<std::string>& scopes) -> std::string
    {
        auto out = std::string {};
        for (const auto& scope: scopes)
        {
            if (!out.empty())
                out.push_back(' ');
            out += scope;
        }
        return out;
    }

    /// Inserts a well-known suffix between origin and path as RFC 8414 section 3.1 describes.
    auto wellKnownUrl(const http::Url& base, std::string_view suffix) -> std::string
    {
        auto const path = base.path == "/" ? std::string {} : base.path;
        return std::format("{}/.well-known/{}{}", base.origin(), suffix, path);
    }

    auto metadataFromJson(const nlohmann::json& doc) -> AuthServerMetadata
    {
        return AuthServerMetadata {
            .issuer = json::getStringOr(doc, "issuer", ""),
            .authorizationEndpoint = json::getStringOr(doc, "authorization_endpoint", ""),
            .tokenEndpoint = json::getStringOr(doc, "token_endpoint", ""),
            .registrationEndpoint = json::getStringOr(doc, "registration_endpoint", ""),
            .scopesSupported = json::getStringArray(doc, "scopes_supported"),
            .codeChallengeMethodsSupported = json::getStringArray(doc, "code_challenge_methods_supported"),
        };
    }
} // namespace

OAuthClient::OAuthClient(std::shared_ptr<http::HttpClient> http): _http(std::move(http))
{
}

auto OAuthClient::fetchJson(const std::string& url, const CancelPredicate& cancelled)
    -> Result<std::optional<nlohmann::json>>
{
    auto request = http::HttpRequest {
        .method = "GET",
        .url = url,
        .headers = { { "Accept", "application/json" } },
        .body = {},
        .timeout = DiscoveryTimeout,
        .cancelled = cancelled,
    };

    auto response = _http->send(request);
    if (!response)
    {
        if (response.error().code == ErrorCode::Cancelled)
            return std::unexpected(response.error());
        log::debug("OAuth discovery: {} unreachable: {}", url, response.error().message);
        return std::optional<nlohmann::json> {};
    }

    if (!response->isSuccess())
    {
        log::debug("OAuth discovery: {} answered HTTP {}", url, response->status);
        return std::optional<nlohmann::json> {};
    }

    auto doc = json::parse(response->body);
    if (!doc || !doc->is_object())
        return std::optional<nlohmann::json> {};
    return std::optional<nlohmann::json>(std::move(*doc));
}

auto OAuthClient::discover(const std::string& resourceUrl,
                           const std::optional<std::string>& resourceMetadataHint,
                           const CancelPredicate& cancelled) -> Result<AuthServerMetadata>
{
    auto const resource = http::Url::parse(resourceUrl);
    if (!resource)
        return makeError(ErrorCode::AuthorizationFailed, resource.error().message);

    // 1. Protected resource metadata names the authorization server.
    auto resourceCandidates = std::vector<std::string> {};
    if (resourceMetadataHint)
        resourceCandidates.push_back(*resourceMetadataHint);
    resourceCandidates.push_back(wellKnownUrl(*resource, "oauth-protected-resource"));
    if (resource->path != "/")
        resourceCandidates.push_back(std::format("{}/.well-known/oauth-protected-resource", resource->origin()));

    auto authServer = resource->origin();
    for (const auto& candidate: resourceCandidates)
    {
        auto doc = fetchJson(candidate, cancelled);
        if (!doc)
            return std::unexpected(doc.error());
        if (!*doc)
            continue;

        auto const servers = json::getStringArray(**doc, "authorization_servers");
        if (!servers.empty())
        {
            authServer = servers.front();
            break;
        }
    }

    auto const server = http::Url::parse(authServer);
    if (!server)
        return makeError(ErrorCode::AuthorizationFailed,
                         std::format("Invalid authorization server '{}': {}", authServer, server.error().message));

    // 2. Authorization server metadata.
    auto metadataCandidates = std::vector<std::string> {
        wellKnownUrl(*server, "oauth-authorization-server"),
        wellKnownUrl(*server, "openid-configuration"),
    };
    if (server->path != "/")
        metadataCandidates.push_back(std::format("{}{}/.well-known/openid-configuration", server->origin(), server->path));

    for (const auto& candidate: metadataCandidates)
    {
        auto doc = fetchJson(candidate, cancelled);
        if (!doc)
            return std::unexpected(doc.error());
        if (!*doc)
            continue;

        auto metadata = metadataFromJson(**doc);
        if (metadata.authorizationEndpoint.empty() || metadata.tokenEndpoint.empty())
            continue;

        log::debug("OAuth discovery: using metadata from {}", candidate);
        return metadata;
    }

    // 3. Conventional endpoints.
    log::debug("OAuth discovery: no metadata document for {}, using default endpoints", server->origin());
    return AuthServerMetadata {
        .issuer = server->origin(),
        .authorizationEndpoint = server->origin() + "/authorize",
        .tokenEndpoint = server->origin() + "/token",
        .registrationEndpoint = server->origin() + "/register",
        .scopesSupported = {},
        .codeChallengeMethodsSupported = {},
    };
}

auto OAuthClient::registerClient(const AuthServerMetadata& metadata,
                                 const std::string& redirectUri,
                                 const std::vector<std::string>& scopes,
                                 const CancelPredicate& cancelled) -> Result<ClientRegistration>
{
    if (metadata.registrationEndpoint.empty())
        return makeError(ErrorCode::AuthorizationFailed,
                         "No client id configured and the server does not support dynamic registration");

    auto body = nlohmann::json {
        { "client_name", "mcpgate" },
        { "redirect_uris", nlohmann::json::array({ redirectUri }) },
        { "grant_types", nlohmann::json::array({ "authorization_code", "refresh_token" }) },
        { "response_types", nlohmann::json::array({ "code" }) },
        { "token_endpoint_auth_method", "none" },
    };
    if (!scopes.empty())
        body["scope"] = joinScopes(scopes);

    auto request = http::HttpRequest {
        .method = "POST",
        .url = metadata.registrationEndpoint,
        .headers = { { "Content-Type", "application/json" }, { "Accept", "application/json" } },
        .body = body.dump(),
        .timeout = DiscoveryTimeout,
        .cancelled = cancelled,
    };

    auto response = _http->send(request);
    if (!response)
        return std::unexpected(response.error());
    if (!response->isSuccess())
        return makeError(ErrorCode::AuthorizationFailed,
                         std::format("Client registration failed (HTTP {}): {}", response->status, response->body));

    auto doc = json::parse(response->body);
    if (!doc)
        return makeError(ErrorCode::AuthorizationFailed, "Client registration returned malformed JSON");

    auto clientId = json::getStringOr(*doc, "client_id", "");
    if (clientId.empty())
        return makeError(ErrorCode::AuthorizationFailed, "Client registration returned no client_id");

    log::info("Registered OAuth client {} at {}", clientId, metadata.registrationEndpoint);
    return ClientRegistration {
        .clientId = std::move(clientId),
        .clientSecret = json::getStringOr(*doc, "client_secret", ""),
    };
}

auto OAuthClient::authorizationUrl(const AuthServerMetadata& metadata,
                                   const ClientRegistration& client,
                                   const std::string& redirectUri,
                                   const std::string& codeChallenge,
                                   const std::string& state,
                                   const std::vector<std::string>& scopes,
                                   const std::string& resource) -> std::string
{
    auto params = http::QueryParams {
        { "response_type", "code" },
        { "client_id", client.clientId },
        { "redirect_uri", redirectUri },
        { "code_challenge", codeChallenge },
        { "code_challenge_method", "S256" },
        { "state", state },
    };
    if (!scopes.empty())
        params.emplace_back("scope", joinScopes(scopes));
    if (!resource.empty())
        params.emplace_back("resource", resource);

    return http::appendQuery(metadata.authorizationEndpoint, params);
}

auto OAuthClient::exchangeCode(const AuthServerMetadata& metadata,
                               const ClientRegistration& client,
                               const std::string& code,
                               const std::string& codeVerifier,
                               const std::string& redirectUri,
                               const std::string& resource,
                               const CancelPredicate& cancelled) -> Result<TokenResponse>
{
    auto form = std::vector<std::pair<std::string, std::string>> {
        { "grant_type", "authorization_code" },
        { "code", code },
        { "redirect_uri", redirectUri },
        { "code_verifier", codeVerifier },
        { "client_id", client.clientId },
    };
    if (!client.clientSecret.empty())
        form.emplace_back("client_secret", client.clientSecret);
    if (!resource.empty())
        form.emplace_back("resource", resource);

    return postToken(metadata, std::move(form), cancelled);
}

auto OAuthClient::refresh(const AuthServerMetadata& metadata,
                          const ClientRegistration& client,
                          const std::string& refreshToken,
                          const std::string& resource,
                          const CancelPredicate& cancelled) -> Result<TokenResponse>
{
    auto form = std::vector<std::pair<std::string, std::string>> {
        { "grant_type", "refresh_token" },
        { "refresh_token", refreshToken },
        { "client_id", client.clientId },
    };
    if (!client.clientSecret.empty())
        form.emplace_back("client_secret", client.clientSecret);
    if (!resource.empty())
        form.emplace_back("resource", resource);

    return postToken(metadata, std::move(form), cancelled);
}

auto OAuthClient::postToken(const AuthServerMetadata& metadata,
                            std::vector<std::pair<std::string, std::string>> form,
                            const CancelPredicate& cancelled) -> Result<TokenResponse>
{
    auto request = http::HttpRequest {
        .method = "POST",
        .url = metadata.tokenEndpoint,
        .headers = { { "Content-Type", "application/x-www-form-urlencoded" }, { "Accept", "application/json" } },
        .body = http::encodeForm(form),
        .timeout = DiscoveryTimeout,
        .cancelled = cancelled,
    };

    auto response = _http->send(request);
    if (!response)
        return std::unexpected(response.error());

    auto doc = json::parse(response->body);
    if (!response->isSuccess())
    {
        auto const error = doc ? json::getStringOr(*doc, "error", "") : std::string {};
        auto const description = doc ? json::getStringOr(*doc, "error_description", "") : std::string {};
        return makeError(ErrorCode::AuthorizationFailed,
                         std::format("Token endpoint answered HTTP {}: {} {}", response->status, error, description));
    }
    if (!doc)
        return makeError(ErrorCode::AuthorizationFailed, "Token endpoint returned malformed JSON");

    auto tokens = TokenResponse {
        .accessToken = json::getStringOr(*doc, "access_token", ""),
        .refreshToken = json::getStringOr(*doc, "refresh_token", ""),
        .tokenType = json::getStringOr(*doc, "token_type", "Bearer"),
        .expiresIn = std::nullopt,
        .scope = json::getStringOr(*doc, "scope", ""),
    };
    if (tokens.accessToken.empty())
        return makeError(ErrorCode::AuthorizationFailed, "Token endpoint returned no access_token");

    if (auto const expiresIn = json::getIntOr(*doc, "expires_in", -1); expiresIn >= 0)
        tokens.expiresIn = std::chrono::seconds(expiresIn);

    return tokens;
}

} // namespace mcpgate::oauth
