// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <http/HttpClient.hpp>
#include <router/RequestRouter.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace mcpgate
{

/// @brief Client of the admin routes of a running gateway, used by the CLI subcommands.
class AdminClient
{
  public:
    /// @param baseUrl Address of the gateway, e.g. "http://127.0.0.1:8931".
    AdminClient(std::shared_ptr<http::HttpClient> http, std::string baseUrl);

    /// @brief Fetches the state of every configured backend.
    [[nodiscard]] auto listBackends() -> Result<nlohmann::json>;

    /// @brief Runs a lifecycle operation and returns the backend's resulting state.
    ///
    /// Authorize waits as long as the user takes to complete the browser flow.
    [[nodiscard]] auto perform(const std::string& backendId, AdminAction action) -> Result<nlohmann::json>;

  private:
    [[nodiscard]] auto call(http::HttpRequest request) -> Result<nlohmann::json>;

    std::shared_ptr<http::HttpClient> _http;
    std::string _baseUrl;
};

/// @brief One human readable line per backend entry of listBackends() or perform().
[[nodiscard]] auto formatBackendLine(const nlohmann::json& backend) -> std::string;

} // namespace mcpgate
