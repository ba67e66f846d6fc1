/**
 * @file json.hpp
 * @brief Minimal helpers for emitting NDJSON by hand.
 */

#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace workflow_orchestrator {

/// Escape a string for embedding inside a JSON string literal (no quotes added).
[[nodiscard]] std::string json_escape(std::string_view text);

/// Escape and wrap in double quotes.
[[nodiscard]] std::string json_quote(std::string_view text);

/// Render a list of strings as a JSON array.
[[nodiscard]] std::string json_array(const std::vector<std::string>& items);

/// Format a timestamp as ISO 8601 UTC with millisecond precision.
[[nodiscard]] std::string format_timestamp(Timestamp ts);

}  // namespace workflow_orchestrator
