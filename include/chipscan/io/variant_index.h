// =============================================================================
// chipscan - Query Variant Index
// =============================================================================
// In-memory lookup of the query variants, keyed by variant identifier.
//
// This module provides:
// - VariantIndex: Read-only identifier -> Variant map built from a
//   linkage-map (.bim) file
// - Line-level tolerance: malformed lines are counted and reported, the load
//   only fails when no usable variant remains
// - DuplicatePolicy: fixed resolution of repeated identifiers
//
// Input line layout (whitespace or tab delimited):
//   <chromosome> <identifier> <genetic distance> <position> <allele A> <allele B> [...]
//
// Usage:
//   auto index = VariantIndex::fromFile("/path/to/query.bim");
//   if (auto variant = index.find("rs123")) {
//       // ...
//   }
//
// Thread Safety:
// - Construction is single-threaded
// - After construction all member functions are const; concurrent lookups
//   from any number of threads are safe without locking
// =============================================================================

#ifndef CHIPSCAN_IO_VARIANT_INDEX_H
#define CHIPSCAN_IO_VARIANT_INDEX_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "chipscan/common/error.h"
#include "chipscan/common/types.h"

namespace chipscan::io {

// =============================================================================
// Index Options
// =============================================================================

/// @brief How repeated identifiers in the query file are resolved.
enum class DuplicatePolicy : std::uint8_t {
    /// @brief Keep the first definition; later ones are counted and dropped.
    kFirstWins = 0,

    /// @brief Each later definition replaces the earlier one.
    kLastWins = 1
};

/// @brief Parse "first"/"last" into a DuplicatePolicy.
/// @throws UsageError for any other value.
[[nodiscard]] DuplicatePolicy parseDuplicatePolicy(std::string_view text);

[[nodiscard]] std::string_view duplicatePolicyToString(DuplicatePolicy policy) noexcept;

/// @brief Configuration options for building a VariantIndex.
struct VariantIndexOptions {
    /// @brief Duplicate identifier resolution.
    DuplicatePolicy duplicatePolicy = DuplicatePolicy::kFirstWins;
};

// =============================================================================
// Build Statistics
// =============================================================================

/// @brief Diagnostic for one rejected input line.
struct MalformedLine {
    /// @brief Line number (1-based).
    std::uint64_t lineNumber = 0;

    /// @brief Why the line was rejected.
    std::string message;

    /// @brief The problematic line content (truncated).
    std::string lineContent;
};

/// @brief Statistics collected while building the index.
struct IndexBuildStats {
    /// @brief Total lines read, including skipped and malformed ones.
    std::uint64_t linesRead = 0;

    /// @brief Distinct identifiers held by the index.
    std::uint64_t variantsLoaded = 0;

    /// @brief Lines rejected by the parser.
    std::uint64_t malformedLines = 0;

    /// @brief Well-formed lines whose identifier was already present.
    std::uint64_t duplicateIds = 0;

    /// @brief Blank and comment lines.
    std::uint64_t skippedLines = 0;

    /// @brief First kMaxReportedMalformedLines rejected lines.
    std::vector<MalformedLine> malformedSamples;
};

// =============================================================================
// VariantIndex Class
// =============================================================================

/// @brief Immutable identifier -> Variant lookup built from the query file.
class VariantIndex {
public:
    /// @brief Build from raw text lines.
    /// @param lines Lines of a linkage-map file, without terminators.
    /// @param options Build options.
    /// @param sourceName Name used in error messages.
    /// @throws ParseError (code kNoVariants) if no valid variant results.
    [[nodiscard]] static VariantIndex build(std::span<const std::string> lines,
                                            VariantIndexOptions options = {},
                                            std::string sourceName = "<lines>");

    /// @brief Build from a text stream, one variant per line.
    /// @throws ParseError (code kNoVariants) if no valid variant results.
    /// @throws IOError if the stream fails before EOF.
    [[nodiscard]] static VariantIndex fromStream(std::istream& stream,
                                                 VariantIndexOptions options = {},
                                                 std::string sourceName = "<stream>");

    /// @brief Build from a linkage-map file.
    /// @throws IOError if the file cannot be opened or read.
    /// @throws ParseError (code kNoVariants) if no valid variant results.
    [[nodiscard]] static VariantIndex fromFile(const std::filesystem::path& path,
                                               VariantIndexOptions options = {});

    /// @brief Parse one query line into a Variant.
    /// @throws ParseError on wrong field count or non-numeric position.
    [[nodiscard]] static Variant parseLine(std::string_view line);

    VariantIndex(const VariantIndex&) = delete;
    VariantIndex& operator=(const VariantIndex&) = delete;
    VariantIndex(VariantIndex&&) noexcept = default;
    VariantIndex& operator=(VariantIndex&&) noexcept = default;
    ~VariantIndex() = default;

    /// @brief Look up a variant by identifier.
    /// @return The indexed variant, or nullopt if absent.
    [[nodiscard]] std::optional<Variant> find(std::string_view id) const;

    /// @brief Look up a variant without copying it.
    /// @return Pointer into the index, or nullptr if absent.
    [[nodiscard]] const Variant* lookup(std::string_view id) const;

    [[nodiscard]] bool contains(std::string_view id) const { return lookup(id) != nullptr; }

    /// @brief Number of distinct identifiers.
    [[nodiscard]] std::size_t size() const noexcept { return variants_.size(); }

    [[nodiscard]] bool empty() const noexcept { return variants_.empty(); }

    [[nodiscard]] const IndexBuildStats& stats() const noexcept { return stats_; }

    [[nodiscard]] DuplicatePolicy duplicatePolicy() const noexcept { return policy_; }

private:
    class Builder;

    /// @brief Transparent hash so lookups by string_view do not allocate.
    struct IdHash {
        using is_transparent = void;
        [[nodiscard]] std::size_t operator()(std::string_view id) const noexcept {
            return std::hash<std::string_view>{}(id);
        }
    };

    using Map = std::unordered_map<std::string, Variant, IdHash, std::equal_to<>>;

    VariantIndex(Map variants, IndexBuildStats stats, DuplicatePolicy policy)
        : variants_(std::move(variants)), stats_(std::move(stats)), policy_(policy) {}

    Map variants_;
    IndexBuildStats stats_;
    DuplicatePolicy policy_ = DuplicatePolicy::kFirstWins;
};

}  // namespace chipscan::io

#endif  // CHIPSCAN_IO_VARIANT_INDEX_H
