// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcpgate::http
{

using QueryParams = std::vector<std::pair<std::string, std::string>>;

/// @brief Minimal absolute URL split into its components.
struct Url
{
    std::string scheme;          ///< Lower-case, e.g. "https".
    std::string host;            ///< IPv6 literals keep their brackets.
    std::optional<uint16_t> port;
    std::string path;            ///< Always starts with '/'.
    std::string query;           ///< Without the leading '?'.

    /// @brief Parses an absolute http(s) URL. Fragments are dropped.
    [[nodiscard]] static auto parse(std::string_view text) -> Result<Url>;

    /// @brief scheme://host[:port], omitting the scheme's default port.
    [[nodiscard]] auto origin() const -> std::string;

    [[nodiscard]] auto toString() const -> std::string;
};

/// @brief RFC 3986 percent-encoding of everything but unreserved characters.
[[nodiscard]] auto percentEncode(std::string_view text) -> std::string;

/// @brief Decodes %XX escapes; '+' becomes a space.
[[nodiscard]] auto percentDecode(std::string_view text) -> std::string;

/// @brief Builds an application/x-www-form-urlencoded body (also usable as a query string).
[[nodiscard]] auto encodeForm(const QueryParams& params) -> std::string;

/// @brief Parses "a=1&b=2" into a map; later duplicates win.
[[nodiscard]] auto parseQuery(std::string_view query) -> std::map<std::string, std::string>;

/// @brief Appends @p params to @p url with '?' or '&' as appropriate.
[[nodiscard]] auto appendQuery(std::string_view url, const QueryParams& params) -> std::string;

} // namespace mcpgate::http
