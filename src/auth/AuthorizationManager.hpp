// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <auth/CallbackReceiver.hpp>
#include <auth/GrantStore.hpp>
#include <auth/OAuthClient.hpp>
#include <auth/OAuthTypes.hpp>
#include <core/BackendConfig.hpp>
#include <core/Error.hpp>
#include <core/EventBus.hpp>
#include <core/Types.hpp>
#include <http/HttpClient.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace mcpgate
{

/// @brief Tunables of the authorization lifecycle.
struct AuthorizationOptions
{
    std::chrono::seconds refreshMargin { 60 };             ///< Refresh this long before expiry.
    std::chrono::milliseconds callbackTimeout { 120000 };  ///< How long to wait for the user's consent.
    std::chrono::seconds sweepInterval { 30 };              ///< Period of the background refresh sweep.
};

/// @brief Opens a URL for the user; the default spawns xdg-open (open on macOS).
using BrowserLauncher = std::function<VoidResult(const std::string& url)>;

/// @brief Returns the current wall-clock time; replaceable for tests.
using WallClock = std::function<std::chrono::system_clock::time_point()>;

/// @brief Launches @p url with the platform's URL opener.
[[nodiscard]] auto openInBrowser(const std::string& url) -> VoidResult;

/// @brief Per-backend OAuth 2.1 authorization code grant with PKCE.
///
/// Owns every grant. The connection supervisor only asks whether a backend is authorized
/// and for its current access token; refresh tokens never leave this class.
/// At most one exchange (interactive or refresh) runs per backend at any time.
class AuthorizationManager
{
  public:
    AuthorizationManager(std::shared_ptr<http::HttpClient> http, EventBus& events, AuthorizationOptions options = {});
    ~AuthorizationManager();

    AuthorizationManager(const AuthorizationManager&) = delete;
    AuthorizationManager& operator=(const AuthorizationManager&) = delete;

    /// @brief Enables persistence and loads previously stored grants.
    void setGrantStore(std::shared_ptr<oauth::GrantStore> store);
    void setBrowserLauncher(BrowserLauncher launcher);
    void setCallbackReceiverFactory(oauth::CallbackReceiverFactory factory);
    void setClock(WallClock clock);

    /// @brief Makes a remote backend known. Restores a stored grant for @p backendId if present.
    void registerBackend(const std::string& backendId, const std::string& resourceUrl, const OAuthSettings& settings);

    /// @brief Forgets a backend without deleting its persisted grant.
    void unregisterBackend(const std::string& backendId);

    /// @brief Remembers the resource metadata URL a 401 response pointed to.
    void setResourceMetadataHint(const std::string& backendId, const std::string& url);

    [[nodiscard]] auto status(const std::string& backendId) const -> AuthStatus;
    [[nodiscard]] auto isRegistered(const std::string& backendId) const -> bool;

    /// @brief True if an unexpired access token exists.
    [[nodiscard]] auto isAuthorized(const std::string& backendId) const -> bool;

    /// @brief The current unexpired access token, if any.
    [[nodiscard]] auto accessToken(const std::string& backendId) const -> std::optional<std::string>;

    /// @brief Runs the interactive flow: discovery, registration, consent, code exchange.
    [[nodiscard]] auto authorize(const std::string& backendId) -> VoidResult;

    /// @brief Silently obtains a new access token with the stored refresh token.
    ///
    /// On failure the access token is dropped and the status falls back to Idle.
    [[nodiscard]] auto refresh(const std::string& backendId) -> VoidResult;

    /// @brief Refreshes if the access token expires within the refresh margin.
    [[nodiscard]] auto ensureFresh(const std::string& backendId) -> VoidResult;

    /// @brief Refreshes every grant that is within the refresh margin of its expiry.
    void refreshExpiring();

    void startBackgroundRefresh();
    void stopBackgroundRefresh();

    /// @brief Removes the grant of @p backendId and cancels any in-flight attempt.
    void clear(const std::string& backendId);

    /// @brief Aborts an in-flight exchange of @p backendId, if any.
    void cancel(const std::string& backendId);

  private:
    struct BackendAuth
    {
        std::string resourceUrl;
        OAuthSettings settings;
        std::optional<std::string> resourceMetadataHint;
        AuthStatus status = AuthStatus::Idle;
        std::optional<oauth::AuthorizationGrant> grant;
        bool inFlight = false;
        std::shared_ptr<std::atomic<bool>> cancelFlag;
    };

    [[nodiscard]] auto runInteractiveFlow(const std::string& backendId,
                                          const BackendAuth& snapshot,
                                          const oauth::CancelPredicate& cancelled) -> Result<oauth::AuthorizationGrant>;
    [[nodiscard]] auto hasValidToken(const BackendAuth& backend) const -> bool;
    void setStatus(const std::string& backendId, AuthStatus status, std::string message = {});
    void persist();
    void sweepLoop();

    std::shared_ptr<http::HttpClient> _http;
    oauth::OAuthClient _oauth;
    EventBus& _events;
    AuthorizationOptions _options;

    std::shared_ptr<oauth::GrantStore> _store;
    BrowserLauncher _launcher;
    oauth::CallbackReceiverFactory _receiverFactory;
    WallClock _clock;

    mutable std::mutex _mutex;
    std::map<std::string, BackendAuth> _backends;
    std::map<std::string, oauth::AuthorizationGrant> _storedGrants;

    std::mutex _sweepMutex;
    std::condition_variable _sweepCv;
    bool _sweepStop = false;
    std::thread _sweeper;
};

} // namespace mcpgate
