// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace gatelink::canvas
{

/// @brief Surface used when a message names none.
constexpr auto DefaultSurfaceId = std::string_view { "main" };

/// @brief Allocates `<prefix>_<n>` component ids for one conversion call.
///
/// The counter is shared by all prefixes and starts at 1.
class IdAllocator
{
  public:
    [[nodiscard]] auto next(std::string_view prefix) -> std::string;

  private:
    std::uint64_t _counter = 0;
};

/// @brief Wraps a scalar property value as a structured literal.
///
/// string → literalString, number → literalNumber, boolean → literalBoolean,
/// null → empty literalString. Objects and arrays are returned unchanged.
[[nodiscard]] auto wrapValue(const nlohmann::ordered_json& value) -> nlohmann::ordered_json;

/// @brief Returns true if @p message is one of the four structured operations
/// (surfaceUpdate, beginRendering, dataModelUpdate, deleteSurface).
[[nodiscard]] auto isStructuredOperation(const nlohmann::ordered_json& message) -> bool;

/// @brief Converts a batch of freeform UI payloads into structured operations.
///
/// Already structured batches are returned unchanged. Batches containing structured
/// operations or surface creations are converted message by message. Batches of bare
/// components are merged into one titled surface.
[[nodiscard]] auto convertBatch(const std::vector<nlohmann::ordered_json>& messages)
    -> std::vector<nlohmann::ordered_json>;

/// @brief Converts every message on its own and concatenates the results.
[[nodiscard]] auto convertEach(const std::vector<nlohmann::ordered_json>& messages)
    -> std::vector<nlohmann::ordered_json>;

/// @brief Parses newline separated JSON objects and converts them with convertBatch().
///
/// Lines that fail to parse are logged and skipped.
[[nodiscard]] auto convertJsonl(std::string_view text) -> std::vector<nlohmann::ordered_json>;

} // namespace gatelink::canvas
