// SPDX-License-Identifier: Apache-2.0
#include "TransportFactory.hpp"

#include <http/Url.hpp>
#include <mcp/StdioTransport.hpp>

#include <format>

namespace mcpgate
{

auto makeTransport(const BackendConfig& config, const TransportContext& context)
    -> Result<std::unique_ptr<Transport>>
{
    switch (config.transport)
    {
        case TransportKind::Process: {
            if (config.command.empty())
                return makeError(ErrorCode::InvalidArgument, std::format("Backend '{}' has no command", config.id));

            return std::make_unique<StdioTransport>(StdioTransportConfig {
                .command = config.command,
                .args = config.args,
                .env = config.env,
                .framing = config.framing,
                .gracePeriod = context.processGracePeriod,
            });
        }
        case TransportKind::Remote: {
            if (auto url = http::Url::parse(config.url); !url)
                return std::unexpected(url.error());
            if (!context.httpClient)
                return makeError(ErrorCode::InvalidArgument, "No HTTP client available for remote transport");

            return std::make_unique<HttpTransport>(
                HttpTransportConfig {
                    .url = config.url,
                    .headers = config.headers,
                    .onAuthorizationHint = context.onAuthorizationHint,
                },
                context.httpClient,
                context.tokens);
        }
    }
    return makeError(ErrorCode::InvalidArgument, "Unknown transport kind");
}

} // namespace mcpgate
