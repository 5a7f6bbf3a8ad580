// =============================================================================
// chipscan - Delimited Line Helpers
// =============================================================================
// Zero-copy helpers shared by the query and reference line parsers:
// whitespace/tab field splitting, trailing whitespace trimming and strict
// unsigned integer parsing.
// =============================================================================

#ifndef CHIPSCAN_IO_LINE_FIELDS_H
#define CHIPSCAN_IO_LINE_FIELDS_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chipscan/common/types.h"

namespace chipscan::io {

/// @brief Check for a space, tab, CR or LF character.
[[nodiscard]] constexpr bool isFieldSeparator(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

/// @brief Split a line on runs of whitespace.
/// @param line Input line; the returned views point into it.
/// @param fields Output vector, cleared first so callers can reuse its capacity.
/// @param maxFields Stop after this many fields (0 = no limit).
void splitFields(std::string_view line, std::vector<std::string_view>& fields,
                 std::size_t maxFields = 0);

/// @brief Parse a base-pair position; rejects signs, blanks and trailing junk.
[[nodiscard]] std::optional<Position> parsePosition(std::string_view text) noexcept;

/// @brief True for empty or whitespace-only lines.
[[nodiscard]] bool isBlankLine(std::string_view line) noexcept;

/// @brief Trim trailing whitespace (CR/LF) from a string in place.
void trimRight(std::string& str);

/// @brief Truncated copy of a line for diagnostics.
[[nodiscard]] std::string diagnosticExcerpt(std::string_view line);

}  // namespace chipscan::io

#endif  // CHIPSCAN_IO_LINE_FIELDS_H
