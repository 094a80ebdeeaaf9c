// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/BackendConfig.hpp>
#include <core/Error.hpp>
#include <http/HttpClient.hpp>
#include <mcp/HttpTransport.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <memory>

namespace mcpgate
{

/// @brief Collaborators a transport may need besides the backend's own configuration.
struct TransportContext
{
    std::shared_ptr<http::HttpClient> httpClient;
    TokenProvider tokens;
    std::function<void(const std::string&)> onAuthorizationHint;
    std::chrono::milliseconds processGracePeriod { 5000 };
};

/// @brief Creates the transport adapter matching @p config's transport kind.
/// @return The (not yet started) transport, or InvalidArgument for incomplete parameters.
[[nodiscard]] auto makeTransport(const BackendConfig& config, const TransportContext& context)
    -> Result<std::unique_ptr<Transport>>;

} // namespace mcpgate
