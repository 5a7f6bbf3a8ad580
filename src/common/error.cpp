// =============================================================================
// chipscan - Error Handling Framework Implementation
// =============================================================================

#include "chipscan/common/error.h"

#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace chipscan {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::vector<std::string> parts;
    if (!filePath.empty()) {
        parts.push_back(fmt::format("file: {}", filePath));
    }
    if (!memberName.empty()) {
        parts.push_back(fmt::format("member: {}", memberName));
    }
    if (lineNumber) {
        parts.push_back(fmt::format("line: {}", *lineNumber));
    }
    if (byteOffset) {
        parts.push_back(fmt::format("offset: {:#x}", *byteOffset));
    }
    if (parts.empty()) {
        return {};
    }

    std::string out = fmt::format("{}", fmt::join(parts, ", "));
#ifndef NDEBUG
    out += fmt::format(" (at {}:{})", location.file_name(), location.line());
#endif
    return out;
}

// =============================================================================
// ChipScanException Implementation
// =============================================================================

void ChipScanException::formatWhat() {
    what_ = fmt::format("[{}] {}", errorCodeToString(code_), message_);
    if (!context_) {
        return;
    }
    if (std::string detail = context_->format(); !detail.empty()) {
        what_ += fmt::format(" ({})", detail);
    }
}

// =============================================================================
// IOError Implementation
// =============================================================================

std::string IOError::withSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

// =============================================================================
// Exception Classification
// =============================================================================

ErrorCode errorCodeOf(const std::exception& ex) noexcept {
    if (const auto* known = dynamic_cast<const ChipScanException*>(&ex)) {
        return known->code();
    }
    return ErrorCode::kInternalError;
}

}  // namespace chipscan
