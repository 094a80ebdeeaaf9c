// SPDX-License-Identifier: Apache-2.0
#include <auth/GrantStore.hpp>
#include <auth/LoopbackCallbackServer.hpp>
#include <auth/OAuthClient.hpp>
#include <auth/Pkce.hpp>
#include <http/CurlHttpClient.hpp>
#include <http/Url.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <fstream>
#include <future>

#include "TestSupport.hpp"

using namespace mcpgate;
using namespace std::chrono_literals;

namespace
{

auto const NeverCancelled = oauth::CancelPredicate([] { return false; });

auto queryOf(const std::string& url) -> std::map<std::string, std::string>
{
    auto parsed = http::Url::parse(url);
    return parsed ? http::parseQuery(parsed->query) : std::map<std::string, std::string> {};
}

auto authServerMetadata() -> nlohmann::json
{
    return nlohmann::json {
        { "issuer", "https://auth.example.com" },
        { "authorization_endpoint", "https://auth.example.com/oauth/authorize" },
        { "token_endpoint", "https://auth.example.com/oauth/token" },
        { "registration_endpoint", "https://auth.example.com/oauth/register" },
        { "code_challenge_methods_supported", { "S256" } },
    };
}

} // namespace

TEST_CASE("base64UrlEncode uses the URL-safe alphabet without padding", "[pkce]")
{
    auto const bytes = std::array<uint8_t, 2> { 0xfb, 0xff };
    CHECK(pkce::base64UrlEncode(bytes) == "-_8");

    auto const text = std::string_view { "hello" };
    auto const span = std::span(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    CHECK(pkce::base64UrlEncode(span) == "aGVsbG8");
}

TEST_CASE("s256Challenge matches the RFC 7636 example", "[pkce]")
{
    auto challenge = pkce::s256Challenge("dBjftJeZ4CVP-mB92K27uhbUJU1p1r_wW1gFWFOEjXk");
    REQUIRE(challenge.has_value());
    CHECK(*challenge == "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM");
}

TEST_CASE("generate produces a fresh verifier and matching challenge", "[pkce]")
{
    auto first = pkce::generate();
    auto second = pkce::generate();
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());

    CHECK(first->verifier.size() == 43);
    CHECK(first->verifier != second->verifier);
    CHECK(first->challenge == *pkce::s256Challenge(first->verifier));
    CHECK(first->verifier.find_first_of("+/=") == std::string::npos);

    auto state = pkce::randomToken(16);
    REQUIRE(state.has_value());
    CHECK(state->size() == 22);
}

TEST_CASE("OAuthClient discovers the authorization server through resource metadata", "[oauth]")
{
    auto http = std::make_shared<test::FakeHttpClient>();
    http->onJson("GET",
                 "https://mcp.example.com/.well-known/oauth-protected-resource",
                 { { "resource", "https://mcp.example.com/mcp" },
                   { "authorization_servers", { "https://auth.example.com" } } });
    http->onJson("GET", "https://auth.example.com/.well-known/oauth-authorization-server", authServerMetadata());

    auto client = oauth::OAuthClient(http);
    auto metadata = client.discover("https://mcp.example.com/mcp", std::nullopt, NeverCancelled);
    REQUIRE(metadata.has_value());
    CHECK(metadata->issuer == "https://auth.example.com");
    CHECK(metadata->tokenEndpoint == "https://auth.example.com/oauth/token");
    CHECK(metadata->codeChallengeMethodsSupported == std::vector<std::string> { "S256" });

    // The path-specific resource document is tried first.
    auto const requests = http->requests();
    REQUIRE(!requests.empty());
    CHECK(requests[0].url == "https://mcp.example.com/.well-known/oauth-protected-resource/mcp");
}

TEST_CASE("OAuthClient prefers the resource metadata hint", "[oauth]")
{
    auto http = std::make_shared<test::FakeHttpClient>();
    http->onJson("GET",
                 "https://mcp.example.com/custom-prm",
                 { { "authorization_servers", { "https://auth.example.com" } } });
    http->onJson("GET", "https://auth.example.com/.well-known/oauth-authorization-server", authServerMetadata());

    auto client = oauth::OAuthClient(http);
    auto metadata =
        client.discover("https://mcp.example.com/mcp", std::string("https://mcp.example.com/custom-prm"), NeverCancelled);
    REQUIRE(metadata.has_value());
    CHECK(metadata->authorizationEndpoint == "https://auth.example.com/oauth/authorize");
    CHECK(http->requests()[0].url == "https://mcp.example.com/custom-prm");
}

TEST_CASE("OAuthClient falls back to conventional endpoints", "[oauth]")
{
    auto http = std::make_shared<test::FakeHttpClient>();
    auto client = oauth::OAuthClient(http);

    auto metadata = client.discover("https://mcp.example.com:8443/mcp", std::nullopt, NeverCancelled);
    REQUIRE(metadata.has_value());
    CHECK(metadata->authorizationEndpoint == "https://mcp.example.com:8443/authorize");
    CHECK(metadata->tokenEndpoint == "https://mcp.example.com:8443/token");
    CHECK(metadata->registrationEndpoint == "https://mcp.example.com:8443/register");
}

TEST_CASE("OAuthClient discovery stops when cancelled", "[oauth]")
{
    auto http = std::make_shared<test::FakeHttpClient>();
    http->on("GET",
             "https://mcp.example.com/.well-known/oauth-protected-resource/mcp",
             [](const http::HttpRequest&) -> Result<http::HttpResponse> {
                 return makeError(ErrorCode::Cancelled, "Request cancelled");
             });

    auto client = oauth::OAuthClient(http);
    auto metadata = client.discover("https://mcp.example.com/mcp", std::nullopt, NeverCancelled);
    REQUIRE(!metadata.has_value());
    CHECK(metadata.error().code == ErrorCode::Cancelled);
}

TEST_CASE("OAuthClient registers a public client", "[oauth]")
{
    auto http = std::make_shared<test::FakeHttpClient>();
    http->onJson("POST", "https://auth.example.com/oauth/register", { { "client_id", "dyn-123" } }, 201);

    auto client = oauth::OAuthClient(http);
    auto metadata = oauth::AuthServerMetadata { .registrationEndpoint = "https://auth.example.com/oauth/register" };
    auto registration =
        client.registerClient(metadata, "http://127.0.0.1:4711/oauth/callback", { "read", "write" }, NeverCancelled);
    REQUIRE(registration.has_value());
    CHECK(registration->clientId == "dyn-123");
    CHECK(registration->clientSecret.empty());

    auto const body = nlohmann::json::parse(http->requests()[0].body);
    CHECK(body["redirect_uris"][0] == "http://127.0.0.1:4711/oauth/callback");
    CHECK(body["token_endpoint_auth_method"] == "none");
    CHECK(body["scope"] == "read write");

    auto noEndpoint = client.registerClient(oauth::AuthServerMetadata {}, "http://x", {}, NeverCancelled);
    REQUIRE(!noEndpoint.has_value());
    CHECK(noEndpoint.error().code == ErrorCode::AuthorizationFailed);
}

TEST_CASE("authorizationUrl carries the PKCE parameters", "[oauth]")
{
    auto const url = oauth::OAuthClient::authorizationUrl(
        oauth::AuthServerMetadata { .authorizationEndpoint = "https://auth.example.com/oauth/authorize" },
        oauth::ClientRegistration { .clientId = "client-1" },
        "http://127.0.0.1:4711/oauth/callback",
        "challenge-xyz",
        "state-abc",
        { "tools:read" },
        "https://mcp.example.com/mcp");

    auto const query = queryOf(url);
    CHECK(url.starts_with("https://auth.example.com/oauth/authorize?"));
    CHECK(query.at("response_type") == "code");
    CHECK(query.at("client_id") == "client-1");
    CHECK(query.at("redirect_uri") == "http://127.0.0.1:4711/oauth/callback");
    CHECK(query.at("code_challenge") == "challenge-xyz");
    CHECK(query.at("code_challenge_method") == "S256");
    CHECK(query.at("state") == "state-abc");
    CHECK(query.at("scope") == "tools:read");
    CHECK(query.at("resource") == "https://mcp.example.com/mcp");
}

TEST_CASE("OAuthClient exchanges codes and reports token endpoint errors", "[oauth]")
{
    auto http = std::make_shared<test::FakeHttpClient>();
    http->on("POST", "https://auth.example.com/oauth/token", [](const http::HttpRequest& request) -> Result<http::HttpResponse> {
        auto const form = http::parseQuery(request.body);
        if (form.at("code") != "good-code")
        {
            return http::HttpResponse {
                .status = 400,
                .headers = {},
                .body = R"({"error":"invalid_grant","error_description":"code expired"})",
            };
        }
        return http::HttpResponse {
            .status = 200,
            .headers = {},
            .body = R"({"access_token":"at","refresh_token":"rt","expires_in":3600,"token_type":"Bearer"})",
        };
    });

    auto client = oauth::OAuthClient(http);
    auto const metadata = oauth::AuthServerMetadata { .tokenEndpoint = "https://auth.example.com/oauth/token" };
    auto const registration = oauth::ClientRegistration { .clientId = "client-1" };

    auto tokens = client.exchangeCode(
        metadata, registration, "good-code", "verifier", "http://127.0.0.1/cb", "https://mcp.example.com/mcp", NeverCancelled);
    REQUIRE(tokens.has_value());
    CHECK(tokens->accessToken == "at");
    CHECK(tokens->refreshToken == "rt");
    CHECK(tokens->expiresIn == std::chrono::seconds(3600));

    auto const form = http::parseQuery(http->requests()[0].body);
    CHECK(form.at("grant_type") == "authorization_code");
    CHECK(form.at("code_verifier") == "verifier");
    CHECK(form.at("resource") == "https://mcp.example.com/mcp");
    CHECK(!form.contains("client_secret"));

    auto rejected =
        client.exchangeCode(metadata, registration, "stale-code", "verifier", "http://127.0.0.1/cb", "", NeverCancelled);
    REQUIRE(!rejected.has_value());
    CHECK(rejected.error().code == ErrorCode::AuthorizationFailed);
    CHECK(rejected.error().message.find("invalid_grant") != std::string::npos);
}

TEST_CASE("OAuthClient refresh sends the refresh token grant", "[oauth]")
{
    auto http = std::make_shared<test::FakeHttpClient>();
    http->onJson("POST", "https://auth.example.com/oauth/token", { { "access_token", "at-2" } });

    auto client = oauth::OAuthClient(http);
    auto tokens = client.refresh(oauth::AuthServerMetadata { .tokenEndpoint = "https://auth.example.com/oauth/token" },
                                 oauth::ClientRegistration { .clientId = "c", .clientSecret = "s" },
                                 "rt-1",
                                 "",
                                 NeverCancelled);
    REQUIRE(tokens.has_value());
    CHECK(tokens->accessToken == "at-2");
    CHECK(tokens->refreshToken.empty());
    CHECK(!tokens->expiresIn.has_value());

    auto const form = http::parseQuery(http->requests()[0].body);
    CHECK(form.at("grant_type") == "refresh_token");
    CHECK(form.at("refresh_token") == "rt-1");
    CHECK(form.at("client_secret") == "s");
}

TEST_CASE("GrantStore persists grants with owner-only permissions", "[oauth]")
{
    auto const dir = test::TempDir {};
    auto store = oauth::GrantStore(dir.path() / "nested" / "tokens.json");

    auto const missing = store.load();
    REQUIRE(missing.has_value());
    CHECK(missing->empty());

    auto grant = oauth::AuthorizationGrant {
        .metadata = oauth::AuthServerMetadata { .issuer = "https://auth.example.com",
                                                .tokenEndpoint = "https://auth.example.com/token" },
        .client = oauth::ClientRegistration { .clientId = "client-1" },
        .accessToken = "at",
        .refreshToken = "rt",
        .expiresAt = std::chrono::system_clock::time_point(std::chrono::seconds(2000000000)),
        .obtainedAt = std::chrono::system_clock::time_point(std::chrono::seconds(1999996400)),
    };
    REQUIRE(store.save({ { "linear", grant } }).has_value());

    auto const perms = std::filesystem::status(store.path()).permissions();
    CHECK((perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all))
          == std::filesystem::perms::none);

    auto loaded = store.load();
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->contains("linear"));
    auto const& restored = loaded->at("linear");
    CHECK(restored.metadata.tokenEndpoint == "https://auth.example.com/token");
    CHECK(restored.client.clientId == "client-1");
    CHECK(restored.accessToken == "at");
    CHECK(restored.refreshToken == "rt");
    CHECK(restored.expiresAt == grant.expiresAt);
    CHECK(restored.obtainedAt == grant.obtainedAt);
}

TEST_CASE("GrantStore reports a corrupt file", "[oauth]")
{
    auto const dir = test::TempDir {};
    auto const path = dir.path() / "tokens.json";
    {
        auto file = std::ofstream(path);
        file << "{ not json";
    }

    auto loaded = oauth::GrantStore(path).load();
    REQUIRE(!loaded.has_value());
    CHECK(loaded.error().code == ErrorCode::IoError);
}

TEST_CASE("LoopbackCallbackServer receives the authorization redirect", "[oauth]")
{
    auto server = oauth::LoopbackCallbackServer {};
    auto redirectUri = server.listen();
    REQUIRE(redirectUri.has_value());
    CHECK(redirectUri->starts_with("http://127.0.0.1:"));
    CHECK(redirectUri->ends_with("/oauth/callback"));
    CHECK(server.port() != 0);

    auto browser = std::async(std::launch::async, [uri = *redirectUri] {
        auto client = http::CurlHttpClient {};
        return client.send(http::HttpRequest { .method = "GET", .url = uri + "?code=abc&state=xyz" });
    });

    auto callback = server.wait(5000ms, [] { return false; });
    REQUIRE(callback.has_value());
    CHECK(callback->code == "abc");
    CHECK(callback->state == "xyz");

    auto page = browser.get();
    REQUIRE(page.has_value());
    CHECK(page->status == 200);
    CHECK(page->body.find("Authorization Complete") != std::string::npos);
    server.stop();
}

TEST_CASE("LoopbackCallbackServer reports a denied authorization", "[oauth]")
{
    auto server = oauth::LoopbackCallbackServer {};
    auto redirectUri = server.listen();
    REQUIRE(redirectUri.has_value());

    auto browser = std::async(std::launch::async, [uri = *redirectUri] {
        auto client = http::CurlHttpClient {};
        return client.send(
            http::HttpRequest { .method = "GET", .url = uri + "?error=access_denied&error_description=nope" });
    });

    auto callback = server.wait(5000ms, [] { return false; });
    REQUIRE(!callback.has_value());
    CHECK(callback.error().code == ErrorCode::AuthorizationFailed);
    CHECK(callback.error().message.find("access_denied") != std::string::npos);
    (void) browser.get();
}

TEST_CASE("LoopbackCallbackServer wait honours timeout and cancellation", "[oauth]")
{
    auto server = oauth::LoopbackCallbackServer {};
    REQUIRE(server.listen().has_value());

    auto timedOut = server.wait(50ms, [] { return false; });
    REQUIRE(!timedOut.has_value());
    CHECK(timedOut.error().code == ErrorCode::Timeout);

    auto cancelled = server.wait(5000ms, [] { return true; });
    REQUIRE(!cancelled.has_value());
    CHECK(cancelled.error().code == ErrorCode::Cancelled);
}
