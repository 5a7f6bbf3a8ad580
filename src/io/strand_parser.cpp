// =============================================================================
// chipscan - Strand File Record Parser Implementation
// =============================================================================

#include "chipscan/io/strand_parser.h"

#include <charconv>

#include <fmt/format.h>

#include "chipscan/io/line_fields.h"

namespace chipscan::io {

namespace {

constexpr std::size_t kCompactLayoutFields = 5;
constexpr std::size_t kRaynerLayoutFields = 6;

constexpr std::size_t kIdField = 0;
constexpr std::size_t kChromosomeField = 1;
constexpr std::size_t kPositionField = 2;
constexpr std::size_t kPercentField = 3;

[[nodiscard]] std::optional<double> parsePercent(std::string_view text) noexcept {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

StrandRecord StrandRecordParser::parseLine(std::string_view line) {
    splitFields(line, fields_, kRaynerLayoutFields);

    if (fields_.size() < kCompactLayoutFields) {
        throw ParseError(fmt::format("expected at least {} fields, found {}",
                                     kCompactLayoutFields, fields_.size()));
    }

    const bool raynerLayout = fields_.size() >= kRaynerLayoutFields;
    const std::size_t strandField = raynerLayout ? 4 : 3;
    const std::size_t allelesField = raynerLayout ? 5 : 4;

    auto position = parsePosition(fields_[kPositionField]);
    if (!position.has_value()) {
        throw ParseError(fmt::format("non-numeric position '{}'", fields_[kPositionField]));
    }

    auto alleles = parseAlleles(fields_[allelesField]);
    if (!alleles.has_value()) {
        throw ParseError(fmt::format("cannot derive allele pair from '{}'",
                                     fields_[allelesField]));
    }

    StrandRecord record;
    record.id = std::string(fields_[kIdField]);
    record.chromosome = std::string(fields_[kChromosomeField]);
    record.position = *position;
    record.strand = parseStrandOrientation(fields_[strandField]);
    record.alleles = std::move(*alleles);
    if (raynerLayout) {
        // Non-numeric percent values are tolerated; the column is informational.
        record.percentMatch = parsePercent(fields_[kPercentField]);
    }
    return record;
}

bool StrandRecordParser::isBlank(std::string_view line) noexcept {
    return isBlankLine(line);
}

std::optional<AllelePair> StrandRecordParser::parseAlleles(std::string_view field) {
    auto slash = field.find('/');
    if (slash != std::string_view::npos) {
        auto first = field.substr(0, slash);
        auto second = field.substr(slash + 1);
        if (first.empty() || second.empty() || second.find('/') != std::string_view::npos) {
            return std::nullopt;
        }
        return AllelePair(std::string(first), std::string(second));
    }

    if (field.size() != 2) {
        return std::nullopt;
    }
    return AllelePair(std::string(1, field[0]), std::string(1, field[1]));
}

}  // namespace chipscan::io
