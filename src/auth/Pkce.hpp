// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace mcpgate::pkce
{

/// @brief A PKCE code verifier and its S256 challenge.
struct PkcePair
{
    std::string verifier;
    std::string challenge;
};

/// @brief Unpadded base64url encoding (RFC 4648 section 5).
[[nodiscard]] auto base64UrlEncode(std::span<const uint8_t> bytes) -> std::string;

/// @brief Returns @p byteCount cryptographically random bytes, base64url encoded.
[[nodiscard]] auto randomToken(size_t byteCount = 32) -> Result<std::string>;

/// @brief BASE64URL(SHA256(verifier)).
[[nodiscard]] auto s256Challenge(std::string_view verifier) -> Result<std::string>;

/// @brief Generates a fresh 43-character verifier and its challenge.
[[nodiscard]] auto generate() -> Result<PkcePair>;

} // namespace mcpgate::pkce
