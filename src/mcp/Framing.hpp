// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcpgate::framing
{

/// @brief Upper bound for a single Content-Length framed message.
constexpr size_t MaxFrameSize = 64 * 1024 * 1024;

/// @brief Serializes a message with the given framing.
[[nodiscard]] auto encode(const nlohmann::json& message, FramingMode mode) -> std::string;

/// @brief Incremental decoder for messages read from a process's stdout.
///
/// Accepts both newline-delimited JSON and "Content-Length:" framed messages,
/// detected per message, so servers that switch styles are still understood.
class FrameDecoder
{
  public:
    /// @brief Appends raw bytes read from the stream.
    void feed(std::string_view bytes);

    /// @brief Extracts the next complete message.
    /// @return std::nullopt if more bytes are needed; otherwise the parsed message,
    ///         or a ProtocolError for a complete but malformed frame.
    [[nodiscard]] auto next() -> std::optional<Result<nlohmann::json>>;

    /// @brief Number of bytes buffered but not yet consumed.
    [[nodiscard]] auto buffered() const -> size_t { return _buffer.size(); }

  private:
    [[nodiscard]] auto nextContentLength() -> std::optional<Result<nlohmann::json>>;
    [[nodiscard]] auto nextLine() -> std::optional<Result<nlohmann::json>>;

    std::string _buffer;
};

} // namespace mcpgate::framing
