// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <gatelink/Config.hpp>

#include <memory>

namespace gatelink
{

/// @brief Interactive gateway client that wires sessions, router and console together.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Loads the device identity and creates the gateway clients.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Connects and runs the interactive loop until /quit or end of input.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace gatelink
