// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <auth/CallbackReceiver.hpp>

#include <memory>

namespace mcpgate::oauth
{

/// @brief Temporary HTTP server on 127.0.0.1 with an ephemeral port serving /oauth/callback.
class LoopbackCallbackServer: public CallbackReceiver
{
  public:
    LoopbackCallbackServer();
    ~LoopbackCallbackServer() override;

    LoopbackCallbackServer(const LoopbackCallbackServer&) = delete;
    LoopbackCallbackServer& operator=(const LoopbackCallbackServer&) = delete;

    [[nodiscard]] auto listen() -> Result<std::string> override;
    [[nodiscard]] auto wait(std::chrono::milliseconds timeout, const std::function<bool()>& cancelled)
        -> Result<CallbackResult> override;
    void stop() override;

    /// @brief Bound port, 0 before listen().
    [[nodiscard]] auto port() const -> unsigned short;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpgate::oauth
