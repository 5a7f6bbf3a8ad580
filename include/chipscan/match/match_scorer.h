// =============================================================================
// chipscan - Match Scorer
// =============================================================================
// Joins the records of one candidate strand file against the query index and
// accumulates match counters.
//
// Per record:
// - identifier found in the index              -> nameMatches
// - ... and the position equals the query's    -> namePosMatches
// - ... and the pair is A/T or C/G             -> atcgMatches (strand unknowable)
// - ... else the pair equals the query pair    -> originalStrandMatches
// - ... else it equals the complemented pair   -> plusStrandMatches
//
// Rates are derived from the integer counters at reporting time only, and
// every rate is 0 when its denominator is 0. completenessRate measures the
// reference side: how much of the chip's distinct variant list the query hits.
//
// Thread Safety:
// - A MatchScorer is owned by one worker
// - The referenced VariantIndex is shared read-only
// =============================================================================

#ifndef CHIPSCAN_MATCH_MATCH_SCORER_H
#define CHIPSCAN_MATCH_MATCH_SCORER_H

#include <cstdint>
#include <istream>
#include <string>
#include <string_view>

#include "chipscan/common/error.h"
#include "chipscan/common/types.h"
#include "chipscan/io/strand_parser.h"
#include "chipscan/io/variant_index.h"

namespace chipscan::match {

// =============================================================================
// Match Statistics
// =============================================================================

/// @brief Raw counters for one candidate.
struct MatchStats {
    /// @brief Display name of the candidate (member base name).
    std::string candidateName;

    /// @brief Archive the member was read from.
    std::string archivePath;

    /// @brief Full member path inside the archive.
    std::string memberName;

    std::uint64_t nameMatches = 0;
    std::uint64_t namePosMatches = 0;
    std::uint64_t originalStrandMatches = 0;
    std::uint64_t plusStrandMatches = 0;
    std::uint64_t atcgMatches = 0;

    /// @brief Records counted in the nameMatchRate denominator.
    std::uint64_t totalRecords = 0;

    /// @brief Lines the strand parser rejected.
    std::uint64_t malformedRecords = 0;

    /// @brief Number of variants in the query index.
    std::uint64_t querySize = 0;

    /// @brief Distinct identifiers among the well-formed records. Filled by score().
    std::uint64_t distinctRecordIds = 0;

    friend bool operator==(const MatchStats&, const MatchStats&) = default;
};

/// @brief Ratios derived from MatchStats.
struct MatchRates {
    double nameMatchRate = 0.0;
    double namePosMatchRate = 0.0;
    double originalStrandRate = 0.0;
    double plusStrandRate = 0.0;
    double atcgRate = 0.0;

    /// @brief Fraction of the query found at the same position.
    double queryCoverageRate = 0.0;

    /// @brief namePosMatches over the distinct identifiers of the reference file.
    double completenessRate = 0.0;

    friend bool operator==(const MatchRates&, const MatchRates&) = default;
};

/// @brief numerator / denominator, or 0 when the denominator is 0.
[[nodiscard]] constexpr double safeRatio(std::uint64_t numerator,
                                         std::uint64_t denominator) noexcept {
    return denominator == 0
               ? 0.0
               : static_cast<double>(numerator) / static_cast<double>(denominator);
}

/// @brief Derive all ratios from the counters.
[[nodiscard]] MatchRates computeRates(const MatchStats& stats) noexcept;

// =============================================================================
// Scorer Options
// =============================================================================

/// @brief Configuration options for MatchScorer.
struct ScorerOptions {
    /// @brief Count rejected lines toward totalRecords.
    bool countMalformedRecords = kCountMalformedRecordsDefault;
};

// =============================================================================
// MatchScorer Class
// =============================================================================

/// @brief Scores candidate record streams against a query index.
class MatchScorer {
public:
    /// @brief Construct a scorer.
    /// @param index Query index; must outlive the scorer.
    /// @param options Scoring options.
    explicit MatchScorer(const io::VariantIndex& index, ScorerOptions options = {});

    /// @brief Score every line of a candidate stream.
    /// @param candidateName Name recorded in the result.
    /// @param lines Text stream of strand records.
    /// @return Complete statistics for the candidate.
    /// @throws ScoreError if the stream fails before its natural end.
    [[nodiscard]] MatchStats score(std::string_view candidateName, std::istream& lines);

    /// @brief Fold one parsed record into the counters.
    void accumulate(const io::StrandRecord& record, MatchStats& stats) const;

    [[nodiscard]] const ScorerOptions& options() const noexcept { return options_; }

private:
    const io::VariantIndex* index_;
    ScorerOptions options_;
    io::StrandRecordParser parser_;
};

}  // namespace chipscan::match

#endif  // CHIPSCAN_MATCH_MATCH_SCORER_H
