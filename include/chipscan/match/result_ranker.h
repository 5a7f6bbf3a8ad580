// =============================================================================
// chipscan - Result Ranker
// =============================================================================
// Orders successfully scored candidates.
//
// Order: nameMatchRate descending, then namePosMatchRate descending. The sort
// is stable, so exact ties keep discovery order and the ranking is identical
// for every worker count.
// =============================================================================

#ifndef CHIPSCAN_MATCH_RESULT_RANKER_H
#define CHIPSCAN_MATCH_RESULT_RANKER_H

#include <cstddef>
#include <string>
#include <vector>

#include "chipscan/match/match_scorer.h"
#include "chipscan/match/scan_coordinator.h"

namespace chipscan::match {

/// @brief Read-only view of one ranked candidate.
class RankedResult {
public:
    RankedResult(std::size_t rank, MatchStats stats)
        : rank_(rank), stats_(std::move(stats)), rates_(computeRates(stats_)) {}

    /// @brief 1-based position in the ranking.
    [[nodiscard]] std::size_t rank() const noexcept { return rank_; }

    [[nodiscard]] const MatchStats& stats() const noexcept { return stats_; }
    [[nodiscard]] const MatchRates& rates() const noexcept { return rates_; }

    [[nodiscard]] const std::string& candidateName() const noexcept {
        return stats_.candidateName;
    }
    [[nodiscard]] const std::string& archivePath() const noexcept { return stats_.archivePath; }
    [[nodiscard]] const std::string& memberName() const noexcept { return stats_.memberName; }

private:
    std::size_t rank_;
    MatchStats stats_;
    MatchRates rates_;
};

/// @brief Ranking order: true if @p a sorts before @p b.
[[nodiscard]] bool ranksBefore(const MatchRates& a, const MatchRates& b) noexcept;

/// @brief Rank statistics given in discovery order.
[[nodiscard]] std::vector<RankedResult> rankResults(std::vector<MatchStats> results);

/// @brief Rank the successful outcomes; failures are skipped.
[[nodiscard]] std::vector<RankedResult> rankResults(const std::vector<CandidateOutcome>& outcomes);

}  // namespace chipscan::match

#endif  // CHIPSCAN_MATCH_RESULT_RANKER_H
