// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace mcpgate::oauth
{

/// @brief Parameters delivered to the redirect URI after the user granted access.
struct CallbackResult
{
    std::string code;
    std::string state;
};

/// @brief Receives the authorization redirect of one interactive attempt.
class CallbackReceiver
{
  public:
    virtual ~CallbackReceiver() = default;

    /// @brief Starts accepting redirects.
    /// @return The redirect URI to register with the authorization server.
    [[nodiscard]] virtual auto listen() -> Result<std::string> = 0;

    /// @brief Blocks until the redirect arrives.
    /// @return The code and state; AuthorizationFailed if the user denied access or the
    ///         redirect was incomplete; Timeout or Cancelled otherwise.
    [[nodiscard]] virtual auto wait(std::chrono::milliseconds timeout, const std::function<bool()>& cancelled)
        -> Result<CallbackResult> = 0;

    /// @brief Stops accepting redirects. Idempotent.
    virtual void stop() = 0;
};

using CallbackReceiverFactory = std::function<std::unique_ptr<CallbackReceiver>()>;

} // namespace mcpgate::oauth
