// =============================================================================
// chipscan - Result Ranker Implementation
// =============================================================================

#include "chipscan/match/result_ranker.h"

#include <algorithm>
#include <numeric>

namespace chipscan::match {

bool ranksBefore(const MatchRates& a, const MatchRates& b) noexcept {
    if (a.nameMatchRate != b.nameMatchRate) {
        return a.nameMatchRate > b.nameMatchRate;
    }
    return a.namePosMatchRate > b.namePosMatchRate;
}

std::vector<RankedResult> rankResults(std::vector<MatchStats> results) {
    std::vector<MatchRates> rates;
    rates.reserve(results.size());
    for (const auto& stats : results) {
        rates.push_back(computeRates(stats));
    }

    std::vector<std::size_t> order(results.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&rates](std::size_t a, std::size_t b) {
        return ranksBefore(rates[a], rates[b]);
    });

    std::vector<RankedResult> ranked;
    ranked.reserve(results.size());
    for (std::size_t i = 0; i < order.size(); ++i) {
        ranked.emplace_back(i + 1, std::move(results[order[i]]));
    }
    return ranked;
}

std::vector<RankedResult> rankResults(const std::vector<CandidateOutcome>& outcomes) {
    std::vector<MatchStats> results;
    for (const auto& outcome : outcomes) {
        if (outcome.succeeded()) {
            results.push_back(*outcome.result);
        }
    }
    return rankResults(std::move(results));
}

}  // namespace chipscan::match
