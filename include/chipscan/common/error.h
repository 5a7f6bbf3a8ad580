// =============================================================================
// chipscan - Error Handling Framework
// =============================================================================
// Exit codes, the exception hierarchy thrown by the parsers and the archive
// reader, and the Result type used to carry per-candidate failures out of the
// worker threads.
//
// Recovery granularity:
//   ParseError    one input line        (skipped and counted)
//   ArchiveError  one reference archive (reported, scan continues)
//   ScoreError    one candidate         (reported, scan continues)
//   IOError, UsageError and the kNoVariants / kNoCandidates codes end the run.
//   Any other std::exception reaching main() exits with kInternalError.
// =============================================================================

#ifndef CHIPSCAN_COMMON_ERROR_H
#define CHIPSCAN_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace chipscan {

// =============================================================================
// Error Codes
// =============================================================================

/// @brief Failure categories. The numeric value is the process exit status.
enum class ErrorCode : std::uint8_t {
    kSuccess = 0,
    kUsageError = 1,    ///< Bad command line.
    kIOError = 2,       ///< Missing path, unreadable file or directory.
    kParseError = 3,    ///< Malformed query or reference line.
    kArchiveError = 4,  ///< Corrupt, truncated or unsupported ZIP container.
    kScoreError = 5,    ///< Member stream failed while a candidate was scored.
    kNoVariants = 6,    ///< Query file produced an empty index.
    kNoCandidates = 7,  ///< Reference directory produced nothing to rank.
    kInternalError = 8  ///< Exception from outside the chipscan hierarchy.
};

[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Short lowercase label used as the prefix of every what() string.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kParseError:
            return "parse error";
        case ErrorCode::kArchiveError:
            return "archive error";
        case ErrorCode::kScoreError:
            return "score error";
        case ErrorCode::kNoVariants:
            return "no usable variants";
        case ErrorCode::kNoCandidates:
            return "no candidates";
        case ErrorCode::kInternalError:
            return "internal error";
    }
    return "unknown error";
}

// =============================================================================
// Error Context
// =============================================================================

/// @brief Where a failure happened: file, archive member, line and byte offset.
/// @note Built with a fluent chain, e.g.
///       `ErrorContext(archivePath).withMember(name).withOffset(pos)`.
struct ErrorContext {
    std::string filePath;
    std::string memberName;
    std::optional<std::uint64_t> lineNumber;  ///< 1-based.
    std::optional<std::uint64_t> byteOffset;

    /// @brief Throw site, appended to format() in debug builds.
    std::source_location location;

    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    ErrorContext& withMember(std::string name) {
        memberName = std::move(name);
        return *this;
    }

    ErrorContext& withLine(std::uint64_t line) {
        lineNumber = line;
        return *this;
    }

    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief "file: ..., member: ..., line: N, offset: 0x..", or empty when nothing is set.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Exceptions
// =============================================================================

/// @brief Root of the chipscan exception hierarchy.
/// @note what() is "[label] message (context)", rendered once at construction.
class ChipScanException : public std::exception {
public:
    ChipScanException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    ChipScanException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief The bare message, without label or context.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

private:
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

class UsageError : public ChipScanException {
public:
    explicit UsageError(std::string message)
        : ChipScanException(ErrorCode::kUsageError, std::move(message)) {}
    UsageError(std::string message, ErrorContext context)
        : ChipScanException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Filesystem failure. May carry the OS error that caused it.
class IOError : public ChipScanException {
public:
    explicit IOError(std::string message)
        : ChipScanException(ErrorCode::kIOError, std::move(message)) {}
    IOError(std::string message, ErrorContext context)
        : ChipScanException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Appends the OS description and numeric value to @p message.
    IOError(std::string message, std::error_code ec)
        : ChipScanException(ErrorCode::kIOError, withSystemError(message, ec)),
          systemError_(ec) {}
    IOError(std::string message, std::error_code ec, ErrorContext context)
        : ChipScanException(ErrorCode::kIOError, withSystemError(message, ec),
                            std::move(context)),
          systemError_(ec) {}

    [[nodiscard]] std::error_code systemError() const noexcept { return systemError_; }

private:
    static std::string withSystemError(const std::string& message, std::error_code ec);

    std::error_code systemError_;
};

/// @brief Malformed input line. Also raised with kNoVariants for an unusable query file.
class ParseError : public ChipScanException {
public:
    explicit ParseError(std::string message)
        : ChipScanException(ErrorCode::kParseError, std::move(message)) {}
    ParseError(std::string message, ErrorContext context)
        : ChipScanException(ErrorCode::kParseError, std::move(message), std::move(context)) {}
    ParseError(ErrorCode code, std::string message, ErrorContext context)
        : ChipScanException(code, std::move(message), std::move(context)) {}
};

class ArchiveError : public ChipScanException {
public:
    explicit ArchiveError(std::string message)
        : ChipScanException(ErrorCode::kArchiveError, std::move(message)) {}
    ArchiveError(std::string message, ErrorContext context)
        : ChipScanException(ErrorCode::kArchiveError, std::move(message), std::move(context)) {}
};

class ScoreError : public ChipScanException {
public:
    explicit ScoreError(std::string message)
        : ChipScanException(ErrorCode::kScoreError, std::move(message)) {}
    ScoreError(std::string message, ErrorContext context)
        : ChipScanException(ErrorCode::kScoreError, std::move(message), std::move(context)) {}
};

/// @brief Code of a ChipScanException, or kInternalError for any other exception.
[[nodiscard]] ErrorCode errorCodeOf(const std::exception& ex) noexcept;

// =============================================================================
// Result
// =============================================================================

/// @brief Copyable failure value stored in a Result.
/// @note Built from an exception it keeps the full what() text, context included.
class Error {
public:
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    explicit Error(const ChipScanException& ex) : code_(ex.code()), message_(ex.what()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

private:
    ErrorCode code_;
    std::string message_;
};

template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Run @p func and capture any exception it throws as an Error.
/// @param fallback Code used for exceptions outside the ChipScanException hierarchy.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func, ErrorCode fallback = ErrorCode::kIOError)
    -> Result<std::invoke_result_t<F&>> {
    try {
        return func();
    } catch (const ChipScanException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{fallback, ex.what()});
    }
}

}  // namespace chipscan

#endif  // CHIPSCAN_COMMON_ERROR_H
