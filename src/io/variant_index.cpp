// =============================================================================
// chipscan - Query Variant Index Implementation
// =============================================================================

#include "chipscan/io/variant_index.h"

#include <fstream>

#include <fmt/format.h>

#include "chipscan/common/logger.h"
#include "chipscan/io/line_fields.h"

namespace chipscan::io {

namespace {

/// @brief Minimum number of fields in a linkage-map line.
constexpr std::size_t kMinQueryFields = 6;

constexpr std::size_t kChromosomeField = 0;
constexpr std::size_t kIdField = 1;
constexpr std::size_t kPositionField = 3;
constexpr std::size_t kAlleleAField = 4;
constexpr std::size_t kAlleleBField = 5;

[[nodiscard]] bool isCommentLine(std::string_view line) noexcept {
    auto first = line.find_first_not_of(" \t");
    return first != std::string_view::npos && line[first] == '#';
}

}  // namespace

// =============================================================================
// Duplicate Policy
// =============================================================================

DuplicatePolicy parseDuplicatePolicy(std::string_view text) {
    if (text == "first") {
        return DuplicatePolicy::kFirstWins;
    }
    if (text == "last") {
        return DuplicatePolicy::kLastWins;
    }
    throw UsageError(fmt::format("Unknown duplicate policy '{}' (expected first or last)", text));
}

std::string_view duplicatePolicyToString(DuplicatePolicy policy) noexcept {
    switch (policy) {
        case DuplicatePolicy::kFirstWins:
            return "first";
        case DuplicatePolicy::kLastWins:
            return "last";
    }
    return "first";
}

// =============================================================================
// Builder
// =============================================================================

/// @brief Accumulates lines into a map while tracking build statistics.
class VariantIndex::Builder {
public:
    Builder(VariantIndexOptions options, std::string sourceName)
        : options_(options), sourceName_(std::move(sourceName)) {}

    void addLine(std::string_view line) {
        ++stats_.linesRead;

        if (isBlankLine(line) || isCommentLine(line)) {
            ++stats_.skippedLines;
            return;
        }

        Variant variant;
        try {
            variant = VariantIndex::parseLine(line);
        } catch (const ParseError& e) {
            recordMalformed(e.message(), line);
            return;
        }

        auto it = variants_.find(variant.id);
        if (it == variants_.end()) {
            std::string key = variant.id;
            variants_.emplace(std::move(key), std::move(variant));
            return;
        }

        ++stats_.duplicateIds;
        CHIPSCAN_LOG_DEBUG("Duplicate variant id {} at {}:{} ({} wins)", variant.id, sourceName_,
                           stats_.linesRead, duplicatePolicyToString(options_.duplicatePolicy));
        if (options_.duplicatePolicy == DuplicatePolicy::kLastWins) {
            it->second = std::move(variant);
        }
    }

    [[nodiscard]] VariantIndex finish() && {
        stats_.variantsLoaded = variants_.size();

        if (variants_.empty()) {
            throw ParseError(ErrorCode::kNoVariants,
                             fmt::format("Query variant file yielded no usable variants "
                                         "({} lines read, {} malformed)",
                                         stats_.linesRead, stats_.malformedLines),
                             ErrorContext(sourceName_));
        }

        if (stats_.malformedLines > 0) {
            CHIPSCAN_LOG_WARNING("{}: skipped {} malformed line(s) of {}", sourceName_,
                                 stats_.malformedLines, stats_.linesRead);
        }
        CHIPSCAN_LOG_INFO("{}: {} variants loaded ({} duplicate ids, policy {})", sourceName_,
                          stats_.variantsLoaded, stats_.duplicateIds,
                          duplicatePolicyToString(options_.duplicatePolicy));

        return VariantIndex(std::move(variants_), std::move(stats_), options_.duplicatePolicy);
    }

private:
    void recordMalformed(const std::string& message, std::string_view line) {
        ++stats_.malformedLines;
        if (stats_.malformedSamples.size() < kMaxReportedMalformedLines) {
            stats_.malformedSamples.push_back(MalformedLine{
                .lineNumber = stats_.linesRead,
                .message = message,
                .lineContent = diagnosticExcerpt(line),
            });
            CHIPSCAN_LOG_DEBUG("{}:{}: {}", sourceName_, stats_.linesRead, message);
        }
    }

    VariantIndexOptions options_;
    std::string sourceName_;
    Map variants_;
    IndexBuildStats stats_;
};

// =============================================================================
// VariantIndex Implementation
// =============================================================================

Variant VariantIndex::parseLine(std::string_view line) {
    std::vector<std::string_view> fields;
    splitFields(line, fields, kMinQueryFields);

    if (fields.size() < kMinQueryFields) {
        throw ParseError(fmt::format("expected at least {} fields, found {}", kMinQueryFields,
                                     fields.size()));
    }

    auto position = parsePosition(fields[kPositionField]);
    if (!position.has_value()) {
        throw ParseError(fmt::format("non-numeric position '{}'", fields[kPositionField]));
    }

    Variant variant;
    variant.chromosome = std::string(fields[kChromosomeField]);
    variant.id = std::string(fields[kIdField]);
    variant.position = *position;
    variant.alleles = AllelePair(std::string(fields[kAlleleAField]),
                                 std::string(fields[kAlleleBField]));
    return variant;
}

VariantIndex VariantIndex::build(std::span<const std::string> lines, VariantIndexOptions options,
                                 std::string sourceName) {
    Builder builder(options, std::move(sourceName));
    for (const auto& line : lines) {
        builder.addLine(line);
    }
    return std::move(builder).finish();
}

VariantIndex VariantIndex::fromStream(std::istream& stream, VariantIndexOptions options,
                                      std::string sourceName) {
    Builder builder(options, sourceName);

    std::string line;
    while (std::getline(stream, line)) {
        trimRight(line);
        builder.addLine(line);
    }

    if (stream.bad()) {
        throw IOError("Failed while reading query variant file", ErrorContext(sourceName));
    }

    return std::move(builder).finish();
}

VariantIndex VariantIndex::fromFile(const std::filesystem::path& path,
                                    VariantIndexOptions options) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IOError("Failed to open query variant file", ErrorContext(path.string()));
    }

    CHIPSCAN_LOG_DEBUG("Reading query variants from {}", path.string());
    return fromStream(file, options, path.string());
}

std::optional<Variant> VariantIndex::find(std::string_view id) const {
    if (const Variant* variant = lookup(id)) {
        return *variant;
    }
    return std::nullopt;
}

const Variant* VariantIndex::lookup(std::string_view id) const {
    auto it = variants_.find(id);
    return it != variants_.end() ? &it->second : nullptr;
}

}  // namespace chipscan::io
