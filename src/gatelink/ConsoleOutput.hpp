// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <events/Sinks.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace gatelink
{

/// @brief Renders one structured operation as human readable outline lines.
///
/// Components of a surface update become one indented line each, showing the
/// component type and its literal text when present.
[[nodiscard]] auto describeOperation(const nlohmann::ordered_json& operation) -> std::vector<std::string>;

/// @brief Terminal presentation of conversation, canvas and diff output.
///
/// Text fragments are printed inline; everything else starts on its own line.
class ConsoleOutput final: public ConversationSink, public RenderingSink, public EditorSink
{
  public:
    void postEvent(const CanonicalEvent& event) override;
    void postStructuredOperations(const std::vector<nlohmann::ordered_json>& operations) override;
    void showDiff(std::string_view original, std::string_view modified, std::string_view title) override;

    /// @brief Prints an informational line (command output, connectivity).
    void notice(std::string_view text);

  private:
    bool _midLine = false;

    void endLine();
};

} // namespace gatelink
