// =============================================================================
// chipscan - Match Scorer Implementation
// =============================================================================

#include "chipscan/match/match_scorer.h"

#include <ios>
#include <string>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>

#include "chipscan/common/logger.h"

namespace chipscan::match {

MatchRates computeRates(const MatchStats& stats) noexcept {
    MatchRates rates;
    rates.nameMatchRate = safeRatio(stats.nameMatches, stats.totalRecords);
    rates.namePosMatchRate = safeRatio(stats.namePosMatches, stats.nameMatches);
    rates.originalStrandRate = safeRatio(stats.originalStrandMatches, stats.namePosMatches);
    rates.plusStrandRate = safeRatio(stats.plusStrandMatches, stats.namePosMatches);
    rates.atcgRate = safeRatio(stats.atcgMatches, stats.namePosMatches);
    rates.queryCoverageRate = safeRatio(stats.namePosMatches, stats.querySize);
    rates.completenessRate = safeRatio(stats.namePosMatches, stats.distinctRecordIds);
    return rates;
}

MatchScorer::MatchScorer(const io::VariantIndex& index, ScorerOptions options)
    : index_(&index), options_(options) {}

void MatchScorer::accumulate(const io::StrandRecord& record, MatchStats& stats) const {
    ++stats.totalRecords;

    const Variant* variant = index_->lookup(record.id);
    if (variant == nullptr) {
        return;
    }
    ++stats.nameMatches;

    if (variant->position != record.position) {
        return;
    }
    ++stats.namePosMatches;

    if (record.alleles.isPalindromic()) {
        ++stats.atcgMatches;
        return;
    }

    if (record.alleles.sameAs(variant->alleles)) {
        ++stats.originalStrandMatches;
    } else if (record.alleles.sameAs(variant->alleles.complemented())) {
        ++stats.plusStrandMatches;
    }
}

MatchStats MatchScorer::score(std::string_view candidateName, std::istream& lines) {
    MatchStats stats;
    stats.candidateName = std::string(candidateName);
    stats.querySize = index_->size();

    std::unordered_set<std::string> seenIds;
    std::string line;
    std::uint64_t lineNumber = 0;
    try {
        while (std::getline(lines, line)) {
            ++lineNumber;
            if (io::StrandRecordParser::isBlank(line)) {
                continue;
            }

            try {
                auto record = parser_.parseLine(line);
                accumulate(record, stats);
                seenIds.insert(std::move(record.id));
            } catch (const ParseError& e) {
                ++stats.malformedRecords;
                if (options_.countMalformedRecords) {
                    ++stats.totalRecords;
                }
                if (stats.malformedRecords <= kMaxReportedMalformedLines) {
                    CHIPSCAN_LOG_DEBUG("{}:{}: {}", candidateName, lineNumber, e.message());
                }
            }
        }
    } catch (const ChipScanException& e) {
        throw ScoreError(fmt::format("Record stream failed after {} lines: {}", lineNumber,
                                     e.what()),
                         ErrorContext().withMember(std::string(candidateName)).withLine(lineNumber));
    } catch (const std::ios_base::failure& e) {
        throw ScoreError(fmt::format("Record stream failed after {} lines: {}", lineNumber,
                                     e.what()),
                         ErrorContext().withMember(std::string(candidateName)).withLine(lineNumber));
    }

    if (lines.bad()) {
        throw ScoreError(fmt::format("Record stream failed after {} lines", lineNumber),
                         ErrorContext().withMember(std::string(candidateName)).withLine(lineNumber));
    }

    stats.distinctRecordIds = seenIds.size();
    if (stats.malformedRecords > 0) {
        CHIPSCAN_LOG_INFO("{}: {} malformed line(s) skipped", candidateName,
                          stats.malformedRecords);
    }
    return stats;
}

}  // namespace chipscan::match
