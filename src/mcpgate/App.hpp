// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcpgate/Config.hpp>

#include <memory>

namespace mcpgate
{

/// @brief Main application orchestrator that wires all components together.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Binds the local endpoint and connects every enabled backend.
    /// @return Success, or the error that makes serving impossible.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Serves until SIGINT or SIGTERM, then shuts down.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpgate
