// =============================================================================
// chipscan - Scan Coordinator
// =============================================================================
// Discovers every candidate strand file in a reference directory and scores
// them concurrently against one shared query index.
//
// This module provides:
// - discoverArchives / discoverCandidates: Reproducible candidate enumeration
// - ScanCoordinator: Bounded TBB worker arena with a join barrier
// - ScanReport: Every outcome, success or failure, in discovery order
//
// Guarantees:
// - Every discovered candidate is attempted exactly once
// - A failing candidate or archive never stops the others
// - run() returns only once all candidates have completed or failed
// - Outcome order does not depend on the worker count
//
// Progress:
// Workers push ProgressEvents onto a bounded concurrent queue drained by one
// reporter thread, which is the only caller of the configured sink.
// =============================================================================

#ifndef CHIPSCAN_MATCH_SCAN_COORDINATOR_H
#define CHIPSCAN_MATCH_SCAN_COORDINATOR_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "chipscan/common/error.h"
#include "chipscan/common/types.h"
#include "chipscan/io/variant_index.h"
#include "chipscan/match/match_scorer.h"

namespace chipscan::match {

// =============================================================================
// Candidates and Outcomes
// =============================================================================

/// @brief One reference member to be scored.
struct Candidate {
    std::filesystem::path archivePath;
    std::string memberName;

    /// @brief Display name (member base name).
    std::string name;
};

/// @brief Result of scoring one candidate, or of failing to list one archive.
struct CandidateOutcome {
    std::string candidateName;
    std::filesystem::path archivePath;

    /// @brief Member path; empty for an archive-level failure.
    std::string memberName;

    Result<MatchStats> result;

    [[nodiscard]] bool succeeded() const noexcept { return result.has_value(); }

    [[nodiscard]] bool isArchiveFailure() const noexcept { return memberName.empty(); }
};

/// @brief Candidates found in one directory scan.
struct CandidateDiscovery {
    /// @brief Members to score, in discovery order.
    std::vector<Candidate> candidates;

    /// @brief Archives that could not be listed, with their slot in the outcome order.
    struct ArchiveFailure {
        std::filesystem::path archivePath;
        Error error;

        /// @brief Number of candidates discovered before this archive.
        std::size_t position = 0;
    };
    std::vector<ArchiveFailure> failures;

    /// @brief Archives examined, including failed ones.
    std::size_t archivesScanned = 0;
};

/// @brief List archive files directly inside @p directory, sorted by file name.
/// @param suffix Archive suffix, matched case-insensitively.
/// @throws IOError if the directory is missing or unreadable.
[[nodiscard]] std::vector<std::filesystem::path> discoverArchives(
    const std::filesystem::path& directory, std::string_view suffix = kDefaultArchiveSuffix);

/// @brief Open each archive once and enumerate its reference members.
/// @throws IOError if the directory is missing or unreadable.
[[nodiscard]] CandidateDiscovery discoverCandidates(
    const std::filesystem::path& directory, std::string_view archiveSuffix = kDefaultArchiveSuffix,
    std::string_view memberSuffix = kDefaultMemberSuffix);

// =============================================================================
// Progress Reporting
// =============================================================================

enum class ProgressKind : std::uint8_t {
    kStarted = 0,
    kCompleted = 1,
    kFailed = 2
};

[[nodiscard]] std::string_view progressKindToString(ProgressKind kind) noexcept;

/// @brief Message sent from a worker to the progress reporter.
struct ProgressEvent {
    ProgressKind kind = ProgressKind::kStarted;
    std::string candidateName;

    /// @brief Slot of the candidate in the outcome order.
    std::size_t index = 0;

    /// @brief Total candidates in this run.
    std::size_t total = 0;

    /// @brief Failure message for kFailed.
    std::string detail;
};

/// @brief Progress callback. Always invoked from the single reporter thread.
using ProgressSink = std::function<void(const ProgressEvent&)>;

// =============================================================================
// Scan Options and Report
// =============================================================================

/// @brief Configuration options for ScanCoordinator.
struct ScanOptions {
    /// @brief Maximum concurrent workers (0 = hardware concurrency).
    std::size_t workerCount = 0;

    /// @brief Emit per-candidate progress through the logger.
    bool verbose = false;

    std::string archiveSuffix = std::string(kDefaultArchiveSuffix);
    std::string memberSuffix = std::string(kDefaultMemberSuffix);

    ScorerOptions scorer;

    /// @brief Optional progress consumer.
    ProgressSink progressSink;
};

/// @brief Complete result of one scan.
struct ScanReport {
    /// @brief One entry per candidate plus one per failed archive, in discovery order.
    std::vector<CandidateOutcome> outcomes;

    std::size_t archivesScanned = 0;
    std::size_t archivesFailed = 0;

    /// @brief Successful statistics, in discovery order.
    [[nodiscard]] std::vector<MatchStats> successes() const;

    /// @brief Failed outcomes (candidates and archives), in discovery order.
    [[nodiscard]] std::vector<const CandidateOutcome*> failures() const;

    /// @brief Number of member candidates discovered (excludes archive failures).
    [[nodiscard]] std::size_t candidateCount() const noexcept;
};

// =============================================================================
// ScanCoordinator Class
// =============================================================================

/// @brief Drives concurrent scoring of all candidates in a directory.
class ScanCoordinator {
public:
    explicit ScanCoordinator(ScanOptions options = {});

    /// @brief Score every candidate in @p directory.
    /// @param directory Reference directory (not searched recursively).
    /// @param index Shared query index; must outlive the call.
    /// @param workerCount Maximum concurrent workers (0 = hardware concurrency).
    /// @throws IOError if the directory is missing or unreadable.
    [[nodiscard]] ScanReport run(const std::filesystem::path& directory,
                                 const io::VariantIndex& index, std::size_t workerCount) const;

    /// @brief Score using ScanOptions::workerCount.
    [[nodiscard]] ScanReport run(const std::filesystem::path& directory,
                                 const io::VariantIndex& index) const;

    /// @brief Score an already discovered candidate set.
    [[nodiscard]] ScanReport run(const CandidateDiscovery& discovery,
                                 const io::VariantIndex& index, std::size_t workerCount) const;

    /// @brief Score one candidate on the calling thread.
    [[nodiscard]] Result<MatchStats> scoreCandidate(const Candidate& candidate,
                                                    const io::VariantIndex& index) const;

    [[nodiscard]] const ScanOptions& options() const noexcept { return options_; }

    /// @brief Resolve 0 to the hardware concurrency (at least 1).
    [[nodiscard]] static std::size_t resolveWorkerCount(std::size_t requested) noexcept;

private:
    ScanOptions options_;
};

}  // namespace chipscan::match

#endif  // CHIPSCAN_MATCH_SCAN_COORDINATOR_H
