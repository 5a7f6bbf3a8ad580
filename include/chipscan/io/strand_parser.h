// =============================================================================
// chipscan - Strand File Record Parser
// =============================================================================
// Parses one line of a chip strand annotation file into a StrandRecord.
//
// Accepted layouts (whitespace or tab delimited):
//   6+ fields: <id> <chromosome> <position> <percent match> <strand> <alleles>
//   5 fields:  <id> <chromosome> <position> <strand> <alleles>
//
// The alleles field holds either two concatenated codes ("AG", "ID") or a
// slash-separated pair ("A/G", "A/AT").
// =============================================================================

#ifndef CHIPSCAN_IO_STRAND_PARSER_H
#define CHIPSCAN_IO_STRAND_PARSER_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chipscan/common/error.h"
#include "chipscan/common/types.h"

namespace chipscan::io {

// =============================================================================
// Strand Record
// =============================================================================

/// @brief One record of a reference strand file.
struct StrandRecord {
    /// @brief Variant identifier (join key).
    std::string id;

    /// @brief Chromosome label.
    std::string chromosome;

    /// @brief Base-pair position.
    Position position = 0;

    /// @brief Percent match of the chip oligo to the genome (Rayner layout only).
    std::optional<double> percentMatch;

    /// @brief Strand orientation of the allele annotation.
    StrandOrientation strand = StrandOrientation::kUnknown;

    /// @brief Annotated allele pair.
    AllelePair alleles;
};

// =============================================================================
// StrandRecordParser Class
// =============================================================================

/// @brief Parser for strand file lines.
///
/// Thread Safety:
/// - Not thread-safe; each worker owns its own instance
class StrandRecordParser {
public:
    StrandRecordParser() { fields_.reserve(8); }

    /// @brief Parse a line into a record.
    /// @throws ParseError on too few fields, non-numeric position or an
    ///         unusable alleles field.
    [[nodiscard]] StrandRecord parseLine(std::string_view line);

    /// @brief Blank lines carry no record and are skipped by callers.
    [[nodiscard]] static bool isBlank(std::string_view line) noexcept;

    /// @brief Split an alleles annotation into a pair.
    /// @return The pair, or nullopt if the field cannot be split into two codes.
    [[nodiscard]] static std::optional<AllelePair> parseAlleles(std::string_view field);

private:
    /// @brief Reused field buffer.
    std::vector<std::string_view> fields_;
};

}  // namespace chipscan::io

#endif  // CHIPSCAN_IO_STRAND_PARSER_H
