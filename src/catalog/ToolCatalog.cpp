// SPDX-License-Identifier: Apache-2.0
#include "ToolCatalog.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <mutex>

namespace mcpgate
{

namespace
{
    auto toLower(std::string_view s) -> std::string
    {
        auto out = std::string {};
        out.reserve(s.size());
        for (unsigned char c: s)
            out.push_back(static_cast<char>(std::tolower(c)));
        return out;
    }

    auto tokenize(std::string_view query) -> std::vector<std::string>
    {
        auto tokens = std::vector<std::string> {};
        auto pos = size_t { 0 };
        while (pos < query.size())
        {
            while (pos < query.size() && std::isspace(static_cast<unsigned char>(query[pos])))
                ++pos;
            auto const start = pos;
            while (pos < query.size() && !std::isspace(static_cast<unsigned char>(query[pos])))
                ++pos;
            if (pos > start)
                tokens.push_back(toLower(query.substr(start, pos - start)));
        }
        return tokens;
    }

    auto byBackendThenName(const CatalogEntry& a, const CatalogEntry& b) -> bool
    {
        if (a.backendName != b.backendName)
            return a.backendName < b.backendName;
        if (a.name != b.name)
            return a.name < b.name;
        return a.backendId < b.backendId;
    }
} // namespace

void ToolCatalog::replaceBackendEntries(const std::string& backendId,
                                        const std::string& backendName,
                                        const std::vector<ToolDefinition>& tools)
{
    auto slice = Slice { .backendName = backendName, .entries = {} };
    slice.entries.reserve(tools.size());
    for (const auto& tool: tools)
    {
        slice.entries.push_back(CatalogEntry {
            .backendId = backendId,
            .backendName = backendName,
            .name = tool.name,
            .title = tool.title,
            .description = tool.description,
            .inputSchema = tool.inputSchema,
        });
    }

    auto lock = std::unique_lock(_mutex);
    _slices[backendId] = std::move(slice);
    log::debug("Catalog: {} now offers {} tool(s)", backendId, tools.size());
}

void ToolCatalog::removeBackend(const std::string& backendId)
{
    auto lock = std::unique_lock(_mutex);
    if (_slices.erase(backendId) > 0)
        log::debug("Catalog: removed {}", backendId);
}

auto ToolCatalog::search(std::string_view query) const -> std::vector<CatalogEntry>
{
    auto const tokens = tokenize(query);
    auto results = std::vector<CatalogEntry> {};
    if (tokens.empty())
        return results;

    {
        auto lock = std::shared_lock(_mutex);
        for (const auto& [id, slice]: _slices)
        {
            auto const backendName = toLower(slice.backendName);
            for (const auto& entry: slice.entries)
            {
                auto const name = toLower(entry.name);
                auto const description = toLower(entry.description);
                auto const matches = std::ranges::all_of(tokens, [&](const std::string& token) {
                    return name.find(token) != std::string::npos || description.find(token) != std::string::npos
                           || backendName.find(token) != std::string::npos;
                });
                if (matches)
                    results.push_back(entry);
            }
        }
    }

    std::ranges::sort(results, byBackendThenName);
    return results;
}

auto ToolCatalog::get(std::string_view backendId, std::string_view name) const -> Result<CatalogEntry>
{
    auto lock = std::shared_lock(_mutex);
    auto const it = _slices.find(backendId);
    if (it == _slices.end())
        return makeError(ErrorCode::NotFound, std::format("No tools known for backend '{}'", backendId));

    auto const entry =
        std::ranges::find_if(it->second.entries, [&](const CatalogEntry& e) { return e.name == name; });
    if (entry == it->second.entries.end())
        return makeError(ErrorCode::NotFound, std::format("Backend '{}' has no tool '{}'", backendId, name));

    return *entry;
}

auto ToolCatalog::listBackendsSummary() const -> std::vector<BackendSummary>
{
    auto summaries = std::vector<BackendSummary> {};
    {
        auto lock = std::shared_lock(_mutex);
        for (const auto& [id, slice]: _slices)
        {
            auto summary = BackendSummary { .backendId = id, .name = slice.backendName, .operationNames = {} };
            for (const auto& entry: slice.entries)
                summary.operationNames.push_back(entry.name);
            summaries.push_back(std::move(summary));
        }
    }

    std::ranges::sort(summaries, [](const BackendSummary& a, const BackendSummary& b) {
        return a.name != b.name ? a.name < b.name : a.backendId < b.backendId;
    });
    return summaries;
}

auto ToolCatalog::entries(std::string_view backendId) const -> std::vector<CatalogEntry>
{
    auto lock = std::shared_lock(_mutex);
    auto const it = _slices.find(backendId);
    if (it == _slices.end())
        return {};
    return it->second.entries;
}

auto ToolCatalog::allEntries() const -> std::vector<CatalogEntry>
{
    auto results = std::vector<CatalogEntry> {};
    {
        auto lock = std::shared_lock(_mutex);
        for (const auto& [id, slice]: _slices)
            results.insert(results.end(), slice.entries.begin(), slice.entries.end());
    }
    std::ranges::sort(results, byBackendThenName);
    return results;
}

auto ToolCatalog::hasBackend(std::string_view backendId) const -> bool
{
    auto lock = std::shared_lock(_mutex);
    return _slices.find(backendId) != _slices.end();
}

} // namespace mcpgate
