// SPDX-License-Identifier: Apache-2.0
#include "Pkce.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <memory>
#include <vector>

namespace mcpgate::pkce
{

auto base64UrlEncode(std::span<const uint8_t> bytes) -> std::string
{
    static constexpr auto Alphabet =
        std::string_view { "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_" };

    auto out = std::string {};
    out.reserve((bytes.size() * 4 + 2) / 3);

    auto i = size_t { 0 };
    for (; i + 3 <= bytes.size(); i += 3)
    {
        auto const n = (uint32_t(bytes[i]) << 16) | (uint32_t(bytes[i + 1]) << 8) | uint32_t(bytes[i + 2]);
        out.push_back(Alphabet[(n >> 18) & 0x3F]);
        out.push_back(Alphabet[(n >> 12) & 0x3F]);
        out.push_back(Alphabet[(n >> 6) & 0x3F]);
        out.push_back(Alphabet[n & 0x3F]);
    }

    auto const rest = bytes.size() - i;
    if (rest == 1)
    {
        auto const n = uint32_t(bytes[i]) << 16;
        out.push_back(Alphabet[(n >> 18) & 0x3F]);
        out.push_back(Alphabet[(n >> 12) & 0x3F]);
    }
    else if (rest == 2)
    {
        auto const n = (uint32_t(bytes[i]) << 16) | (uint32_t(bytes[i + 1]) << 8);
        out.push_back(Alphabet[(n >> 18) & 0x3F]);
        out.push_back(Alphabet[(n >> 12) & 0x3F]);
        out.push_back(Alphabet[(n >> 6) & 0x3F]);
    }

    return out;
}

auto randomToken(size_t byteCount) -> Result<std::string>
{
    auto bytes = std::vector<uint8_t>(byteCount);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1)
        return makeError(ErrorCode::AuthorizationFailed, "Secure random generator unavailable");
    return base64UrlEncode(bytes);
}

auto s256Challenge(std::string_view verifier) -> Result<std::string>
{
    auto ctx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx)
        return makeError(ErrorCode::AuthorizationFailed, "Failed to create EVP_MD_CTX");

    auto digest = std::array<uint8_t, EVP_MAX_MD_SIZE> {};
    auto digestLength = 0u;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(ctx.get(), verifier.data(), verifier.size()) != 1
        || EVP_DigestFinal_ex(ctx.get(), digest.data(), &digestLength) != 1)
        return makeError(ErrorCode::AuthorizationFailed, "SHA-256 computation failed");

    return base64UrlEncode(std::span<const uint8_t>(digest.data(), digestLength));
}

auto generate() -> Result<PkcePair>
{
    return randomToken(32).and_then([](std::string verifier) -> Result<PkcePair> {
        return s256Challenge(verifier).transform([&](std::string challenge) {
            return PkcePair { .verifier = std::move(verifier), .challenge = std::move(challenge) };
        });
    });
}

} // namespace mcpgate::pkce
