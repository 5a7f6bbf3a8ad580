// =============================================================================
// chipscan - Delimited Line Helpers Implementation
// =============================================================================

#include "chipscan/io/line_fields.h"

#include <algorithm>
#include <charconv>

namespace chipscan::io {

void splitFields(std::string_view line, std::vector<std::string_view>& fields,
                 std::size_t maxFields) {
    fields.clear();

    std::size_t pos = 0;
    const std::size_t size = line.size();

    while (pos < size) {
        while (pos < size && isFieldSeparator(line[pos])) {
            ++pos;
        }
        if (pos >= size) {
            break;
        }

        std::size_t end = pos;
        while (end < size && !isFieldSeparator(line[end])) {
            ++end;
        }

        fields.push_back(line.substr(pos, end - pos));
        if (maxFields != 0 && fields.size() >= maxFields) {
            return;
        }
        pos = end;
    }
}

std::optional<Position> parsePosition(std::string_view text) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }

    Position value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

bool isBlankLine(std::string_view line) noexcept {
    return std::all_of(line.begin(), line.end(), [](char c) { return isFieldSeparator(c); });
}

void trimRight(std::string& str) {
    auto it = std::find_if(str.rbegin(), str.rend(),
                           [](char c) { return !isFieldSeparator(c); });
    str.erase(it.base(), str.end());
}

std::string diagnosticExcerpt(std::string_view line) {
    return std::string(line.substr(0, kMaxDiagnosticLineLength));
}

}  // namespace chipscan::io
