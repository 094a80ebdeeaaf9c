// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mcpgate
{

/// @brief A callable operation advertised by a connected backend.
struct CatalogEntry
{
    std::string backendId;
    std::string backendName;
    std::string name;
    std::string title;
    std::string description;
    nlohmann::json inputSchema;
};

/// @brief Per-backend overview returned by list_servers.
struct BackendSummary
{
    std::string backendId;
    std::string name;
    std::vector<std::string> operationNames;
};

/// @brief Live, searchable index of every connected backend's tools.
///
/// Entries are stored in per-backend slices which are only ever replaced or removed
/// as a whole. Readers never observe a half-replaced slice.
class ToolCatalog
{
  public:
    /// @brief Atomically replaces the slice of @p backendId.
    void replaceBackendEntries(const std::string& backendId,
                               const std::string& backendName,
                               const std::vector<ToolDefinition>& tools);

    /// @brief Drops the slice of @p backendId. No-op if absent.
    void removeBackend(const std::string& backendId);

    /// @brief Keyword search. Every whitespace-separated token must occur (case-insensitively)
    ///        in the entry name, description or backend name.
    /// @return Matches ordered by backend name, then entry name; empty for a blank query.
    [[nodiscard]] auto search(std::string_view query) const -> std::vector<CatalogEntry>;

    /// @brief Exact lookup of one operation.
    [[nodiscard]] auto get(std::string_view backendId, std::string_view name) const -> Result<CatalogEntry>;

    /// @brief One summary per backend with a slice, ordered by backend name.
    [[nodiscard]] auto listBackendsSummary() const -> std::vector<BackendSummary>;

    /// @brief Entries of a single backend, in advertised order.
    [[nodiscard]] auto entries(std::string_view backendId) const -> std::vector<CatalogEntry>;

    /// @brief All entries ordered by backend name, then entry name.
    [[nodiscard]] auto allEntries() const -> std::vector<CatalogEntry>;

    [[nodiscard]] auto hasBackend(std::string_view backendId) const -> bool;

  private:
    struct Slice
    {
        std::string backendName;
        std::vector<CatalogEntry> entries;
    };

    mutable std::shared_mutex _mutex;
    std::map<std::string, Slice, std::less<>> _slices;
};

} // namespace mcpgate
