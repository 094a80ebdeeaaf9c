// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <map>
#include <string>
#include <vector>

namespace mcpgate
{

/// @brief Client registration and scopes used when authorizing against a remote backend.
struct OAuthSettings
{
    std::string clientId;     ///< Pre-registered client id; empty means dynamic registration.
    std::string clientSecret; ///< Optional, for confidential clients.
    std::vector<std::string> scopes;
};

/// @brief Durable configuration of one backend server.
struct BackendConfig
{
    std::string id;
    std::string name;
    bool enabled = true;
    TransportKind transport = TransportKind::Process;

    // Process transport
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    FramingMode framing = FramingMode::Line;

    // Remote transport
    std::string url;
    std::map<std::string, std::string> headers;
    bool requiresAuthorization = false;
    OAuthSettings oauth;
};

} // namespace mcpgate
