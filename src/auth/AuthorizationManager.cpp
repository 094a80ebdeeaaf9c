// SPDX-License-Identifier: Apache-2.0
#include "AuthorizationManager.hpp"

#include <auth/LoopbackCallbackServer.hpp>
#include <auth/Pkce.hpp>
#include <core/Log.hpp>

#include <cerrno>
#include <cstring>
#include <format>
#include <vector>

#include <sys/wait.h>

#include <spawn.h>

extern char** environ;

namespace mcpgate
{

auto openInBrowser(const std::string& url) -> VoidResult
{
#if defined(__APPLE__)
    auto opener = std::string("open");
#else
    auto opener = std::string("xdg-open");
#endif
    auto target = url;
    auto argv = std::vector<char*> { opener.data(), target.data(), nullptr };

    pid_t pid;
    auto const status = posix_spawnp(&pid, opener.c_str(), nullptr, nullptr, argv.data(), environ);
    if (status != 0)
        return makeError(ErrorCode::IoError, std::format("Failed to run {}: {}", opener, std::strerror(status)));

    auto exitStatus = 0;
    if (::waitpid(pid, &exitStatus, 0) < 0 || !WIFEXITED(exitStatus) || WEXITSTATUS(exitStatus) != 0)
        return makeError(ErrorCode::IoError, std::format("{} could not open the URL", opener));
    return {};
}

AuthorizationManager::AuthorizationManager(std::shared_ptr<http::HttpClient> http,
                                           EventBus& events,
                                           AuthorizationOptions options):
    _http(http),
    _oauth(std::move(http)),
    _events(events),
    _options(options),
    _launcher(openInBrowser),
    _receiverFactory([] { return std::make_unique<oauth::LoopbackCallbackServer>(); }),
    _clock([] { return std::chrono::system_clock::now(); })
{
}

AuthorizationManager::~AuthorizationManager()
{
    stopBackgroundRefresh();

    auto lock = std::lock_guard(_mutex);
    for (auto& [id, backend]: _backends)
    {
        if (backend.cancelFlag)
            *backend.cancelFlag = true;
    }
}

void AuthorizationManager::setGrantStore(std::shared_ptr<oauth::GrantStore> store)
{
    auto loaded = store ? store->load() : Result<std::map<std::string, oauth::AuthorizationGrant>> {};
    if (!loaded)
    {
        log::warning("Ignoring stored authorization grants: {}", loaded.error());
        loaded = std::map<std::string, oauth::AuthorizationGrant> {};
    }

    auto lock = std::lock_guard(_mutex);
    _store = std::move(store);
    _storedGrants = std::move(*loaded);
    for (auto& [id, backend]: _backends)
    {
        if (auto const it = _storedGrants.find(id); it != _storedGrants.end() && !backend.grant)
        {
            backend.grant = it->second;
            backend.status = hasValidToken(backend) ? AuthStatus::Authorized : AuthStatus::Idle;
        }
    }
}

void AuthorizationManager::setBrowserLauncher(BrowserLauncher launcher)
{
    auto lock = std::lock_guard(_mutex);
    _launcher = std::move(launcher);
}

void AuthorizationManager::setCallbackReceiverFactory(oauth::CallbackReceiverFactory factory)
{
    auto lock = std::lock_guard(_mutex);
    _receiverFactory = std::move(factory);
}

void AuthorizationManager::setClock(WallClock clock)
{
    auto lock = std::lock_guard(_mutex);
    _clock = std::move(clock);
}

void AuthorizationManager::registerBackend(const std::string& backendId,
                                           const std::string& resourceUrl,
                                           const OAuthSettings& settings)
{
    auto lock = std::lock_guard(_mutex);
    auto& backend = _backends[backendId];
    backend.resourceUrl = resourceUrl;
    backend.settings = settings;

    if (!backend.grant)
    {
        if (auto const it = _storedGrants.find(backendId); it != _storedGrants.end())
            backend.grant = it->second;
    }
    backend.status = hasValidToken(backend) ? AuthStatus::Authorized : AuthStatus::Idle;
}

void AuthorizationManager::unregisterBackend(const std::string& backendId)
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _backends.find(backendId);
    if (it == _backends.end())
        return;

    if (it->second.cancelFlag)
        *it->second.cancelFlag = true;
    if (it->second.grant)
        _storedGrants[backendId] = *it->second.grant;
    _backends.erase(it);
}

void AuthorizationManager::setResourceMetadataHint(const std::string& backendId, const std::string& url)
{
    auto lock = std::lock_guard(_mutex);
    if (auto const it = _backends.find(backendId); it != _backends.end())
        it->second.resourceMetadataHint = url;
}

auto AuthorizationManager::status(const std::string& backendId) const -> AuthStatus
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _backends.find(backendId);
    return it != _backends.end() ? it->second.status : AuthStatus::None;
}

auto AuthorizationManager::isRegistered(const std::string& backendId) const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _backends.contains(backendId);
}

auto AuthorizationManager::isAuthorized(const std::string& backendId) const -> bool
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _backends.find(backendId);
    return it != _backends.end() && hasValidToken(it->second);
}

auto AuthorizationManager::accessToken(const std::string& backendId) const -> std::optional<std::string>
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _backends.find(backendId);
    if (it == _backends.end() || !hasValidToken(it->second))
        return std::nullopt;
    return it->second.grant->accessToken;
}

auto AuthorizationManager::hasValidToken(const BackendAuth& backend) const -> bool
{
    // Caller holds _mutex.
    if (!backend.grant || backend.grant->accessToken.empty())
        return false;
    return !backend.grant->expiresAt || _clock() < *backend.grant->expiresAt;
}

auto AuthorizationManager::authorize(const std::string& backendId) -> VoidResult
{
    auto snapshot = BackendAuth {};
    auto cancelFlag = std::make_shared<std::atomic<bool>>(false);
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _backends.find(backendId);
        if (it == _backends.end())
            return makeError(ErrorCode::NotFound, std::format("Backend '{}' does not use authorization", backendId));
        if (it->second.inFlight)
            return makeError(ErrorCode::AuthorizationFailed,
                             std::format("An authorization attempt for '{}' is already in progress", backendId));
        it->second.inFlight = true;
        it->second.cancelFlag = cancelFlag;
        snapshot = it->second;
    }

    auto const cancelled = [cancelFlag] { return cancelFlag->load(); };
    auto result = runInteractiveFlow(backendId, snapshot, cancelled);

    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _backends.find(backendId);
        if (it == _backends.end())
            return makeError(ErrorCode::Cancelled, "Backend removed during authorization");
        it->second.inFlight = false;
        it->second.cancelFlag.reset();
        if (result && !cancelFlag->load())
            it->second.grant = *result;
    }

    if (cancelFlag->load())
    {
        setStatus(backendId, AuthStatus::Idle, "authorization cancelled");
        return makeError(ErrorCode::Cancelled, "Authorization cancelled");
    }

    if (!result)
    {
        log::warning("Authorization of '{}' failed: {}", backendId, result.error());
        setStatus(backendId, AuthStatus::Error, result.error().message);
        if (result.error().code == ErrorCode::Cancelled || result.error().code == ErrorCode::AuthorizationFailed)
            return std::unexpected(result.error());
        if (result.error().code == ErrorCode::Timeout)
            return makeError(ErrorCode::AuthorizationFailed,
                             std::format("Authorization timed out: {}", result.error().message));
        return makeError(ErrorCode::AuthorizationFailed, result.error().message);
    }

    persist();
    setStatus(backendId, AuthStatus::Authorized);
    log::info("Backend '{}' authorized", backendId);
    return {};
}

auto AuthorizationManager::runInteractiveFlow(const std::string& backendId,
                                              const BackendAuth& snapshot,
                                              const oauth::CancelPredicate& cancelled)
    -> Result<oauth::AuthorizationGrant>
{
    setStatus(backendId, AuthStatus::Discovering);
    auto metadata = _oauth.discover(snapshot.resourceUrl, snapshot.resourceMetadataHint, cancelled);
    if (!metadata)
        return std::unexpected(metadata.error());

    auto receiverFactory = oauth::CallbackReceiverFactory {};
    auto launcher = BrowserLauncher {};
    auto clock = WallClock {};
    {
        auto lock = std::lock_guard(_mutex);
        receiverFactory = _receiverFactory;
        launcher = _launcher;
        clock = _clock;
    }

    auto receiver = receiverFactory();
    auto redirectUri = receiver->listen();
    if (!redirectUri)
        return std::unexpected(redirectUri.error());

    auto client = oauth::ClientRegistration {
        .clientId = snapshot.settings.clientId,
        .clientSecret = snapshot.settings.clientSecret,
    };
    if (client.clientId.empty())
    {
        auto registered = _oauth.registerClient(*metadata, *redirectUri, snapshot.settings.scopes, cancelled);
        if (!registered)
        {
            receiver->stop();
            return std::unexpected(registered.error());
        }
        client = std::move(*registered);
    }

    auto codes = pkce::generate();
    auto state = pkce::randomToken(16);
    if (!codes || !state)
    {
        receiver->stop();
        return makeError(ErrorCode::AuthorizationFailed, "Failed to generate PKCE parameters");
    }

    setStatus(backendId, AuthStatus::Authorizing);
    auto const url = oauth::OAuthClient::authorizationUrl(
        *metadata, client, *redirectUri, codes->challenge, *state, snapshot.settings.scopes, snapshot.resourceUrl);

    log::info("Authorize '{}' by visiting: {}", backendId, url);
    if (launcher)
    {
        if (auto launched = launcher(url); !launched)
            log::warning("Could not open a browser ({}); open the URL above manually", launched.error().message);
    }

    auto callback = receiver->wait(_options.callbackTimeout, cancelled);
    receiver->stop();
    if (!callback)
        return std::unexpected(callback.error());

    if (callback->state != *state)
        return makeError(ErrorCode::AuthorizationFailed, "OAuth state mismatch");

    auto tokens = _oauth.exchangeCode(
        *metadata, client, callback->code, codes->verifier, *redirectUri, snapshot.resourceUrl, cancelled);
    if (!tokens)
        return std::unexpected(tokens.error());

    auto const now = clock();
    return oauth::AuthorizationGrant {
        .metadata = std::move(*metadata),
        .client = std::move(client),
        .accessToken = std::move(tokens->accessToken),
        .refreshToken = std::move(tokens->refreshToken),
        .expiresAt = tokens->expiresIn ? std::optional(now + *tokens->expiresIn) : std::nullopt,
        .obtainedAt = now,
    };
}

auto AuthorizationManager::refresh(const std::string& backendId) -> VoidResult
{
    auto grant = oauth::AuthorizationGrant {};
    auto resourceUrl = std::string {};
    auto cancelFlag = std::make_shared<std::atomic<bool>>(false);
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _backends.find(backendId);
        if (it == _backends.end())
            return makeError(ErrorCode::NotFound, std::format("Backend '{}' does not use authorization", backendId));
        if (!it->second.grant || it->second.grant->refreshToken.empty())
            return makeError(ErrorCode::Unauthorized, std::format("No refresh token for '{}'", backendId));
        if (it->second.inFlight)
            return makeError(ErrorCode::AuthorizationFailed,
                             std::format("An authorization exchange for '{}' is already in progress", backendId));
        it->second.inFlight = true;
        it->second.cancelFlag = cancelFlag;
        grant = *it->second.grant;
        resourceUrl = it->second.resourceUrl;
    }

    setStatus(backendId, AuthStatus::Refreshing);
    auto tokens = _oauth.refresh(
        grant.metadata, grant.client, grant.refreshToken, resourceUrl, [cancelFlag] { return cancelFlag->load(); });

    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _backends.find(backendId);
        if (it == _backends.end())
            return makeError(ErrorCode::Cancelled, "Backend removed during refresh");

        auto& backend = it->second;
        backend.inFlight = false;
        backend.cancelFlag.reset();
        if (backend.grant)
        {
            if (tokens)
            {
                auto const now = _clock();
                backend.grant->accessToken = tokens->accessToken;
                if (!tokens->refreshToken.empty())
                    backend.grant->refreshToken = tokens->refreshToken;
                backend.grant->expiresAt =
                    tokens->expiresIn ? std::optional(now + *tokens->expiresIn) : std::nullopt;
                backend.grant->obtainedAt = now;
            }
            else
            {
                backend.grant->accessToken.clear();
                backend.grant->expiresAt.reset();
                if (tokens.error().code == ErrorCode::AuthorizationFailed)
                    backend.grant->refreshToken.clear();
            }
        }
    }

    persist();
    if (!tokens)
    {
        log::warning("Token refresh for '{}' failed: {}", backendId, tokens.error());
        setStatus(backendId, AuthStatus::Idle, tokens.error().message);
        return makeError(ErrorCode::AuthorizationFailed, tokens.error().message);
    }

    setStatus(backendId, AuthStatus::Authorized);
    log::debug("Refreshed access token of '{}'", backendId);
    return {};
}

auto AuthorizationManager::ensureFresh(const std::string& backendId) -> VoidResult
{
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _backends.find(backendId);
        if (it == _backends.end() || !it->second.grant || it->second.inFlight)
            return {};

        auto const& grant = *it->second.grant;
        if (grant.refreshToken.empty() || !grant.expiresAt)
            return {};
        if (!grant.accessToken.empty() && _clock() + _options.refreshMargin < *grant.expiresAt)
            return {};
    }
    return refresh(backendId);
}

void AuthorizationManager::refreshExpiring()
{
    auto due = std::vector<std::string> {};
    {
        auto lock = std::lock_guard(_mutex);
        auto const threshold = _clock() + _options.refreshMargin;
        for (const auto& [id, backend]: _backends)
        {
            if (backend.inFlight || !backend.grant || backend.grant->refreshToken.empty())
                continue;
            if (backend.grant->expiresAt && *backend.grant->expiresAt <= threshold)
                due.push_back(id);
        }
    }

    for (const auto& id: due)
    {
        if (auto refreshed = refresh(id); !refreshed)
            log::debug("Background refresh of '{}' failed: {}", id, refreshed.error());
    }
}

void AuthorizationManager::startBackgroundRefresh()
{
    auto lock = std::lock_guard(_sweepMutex);
    if (_sweeper.joinable())
        return;
    _sweepStop = false;
    _sweeper = std::thread([this] { sweepLoop(); });
}

void AuthorizationManager::stopBackgroundRefresh()
{
    {
        auto lock = std::lock_guard(_sweepMutex);
        _sweepStop = true;
    }
    _sweepCv.notify_all();
    if (_sweeper.joinable())
        _sweeper.join();
}

void AuthorizationManager::sweepLoop()
{
    auto lock = std::unique_lock(_sweepMutex);
    while (!_sweepStop)
    {
        _sweepCv.wait_for(lock, _options.sweepInterval, [this] { return _sweepStop; });
        if (_sweepStop)
            break;

        lock.unlock();
        refreshExpiring();
        lock.lock();
    }
}

void AuthorizationManager::clear(const std::string& backendId)
{
    {
        auto lock = std::lock_guard(_mutex);
        _storedGrants.erase(backendId);
        auto const it = _backends.find(backendId);
        if (it == _backends.end())
            return;
        if (it->second.cancelFlag)
            *it->second.cancelFlag = true;
        it->second.grant.reset();
    }

    persist();
    setStatus(backendId, AuthStatus::Idle, "authorization cleared");
}

void AuthorizationManager::cancel(const std::string& backendId)
{
    auto lock = std::lock_guard(_mutex);
    if (auto const it = _backends.find(backendId); it != _backends.end() && it->second.cancelFlag)
        *it->second.cancelFlag = true;
}

void AuthorizationManager::setStatus(const std::string& backendId, AuthStatus status, std::string message)
{
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _backends.find(backendId);
        if (it == _backends.end())
            return;
        it->second.status = status;
    }

    _events.publish(AuthorizationStatusEvent {
        .backendId = backendId,
        .status = status,
        .message = std::move(message),
    });
}

void AuthorizationManager::persist()
{
    auto store = std::shared_ptr<oauth::GrantStore> {};
    auto grants = std::map<std::string, oauth::AuthorizationGrant> {};
    {
        auto lock = std::lock_guard(_mutex);
        if (!_store)
            return;
        store = _store;
        grants = _storedGrants;
        for (const auto& [id, backend]: _backends)
        {
            if (backend.grant)
                grants[id] = *backend.grant;
            else
                grants.erase(id);
        }
    }

    if (auto saved = store->save(grants); !saved)
        log::warning("Failed to persist authorization grants: {}", saved.error());
}

} // namespace mcpgate
