// =============================================================================
// chipscan - Scan Coordinator Implementation
// =============================================================================

#include "chipscan/match/scan_coordinator.h"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <thread>

#include <tbb/blocked_range.h>
#include <tbb/concurrent_queue.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include "chipscan/common/logger.h"
#include "chipscan/io/zip_archive.h"

namespace chipscan::match {

namespace {

namespace fs = std::filesystem;

/// @brief Bound on queued progress events before workers wait for the reporter.
constexpr std::ptrdiff_t kProgressQueueCapacity = 256;

[[nodiscard]] bool hasSuffixIgnoreCase(std::string_view name, std::string_view suffix) noexcept {
    if (name.size() <= suffix.size()) {
        return false;
    }
    auto tail = name.substr(name.size() - suffix.size());
    return std::equal(tail.begin(), tail.end(), suffix.begin(), suffix.end(),
                      [](char a, char b) { return toUpperBase(a) == toUpperBase(b); });
}

/// @brief Worker -> reporter message channel.
///
/// Workers publish into a bounded concurrent queue; one reporter thread pops
/// events and is the only code that touches the sink or formats progress.
class ProgressChannel {
public:
    ProgressChannel(ProgressSink sink, bool verbose)
        : sink_(std::move(sink)), verbose_(verbose) {
        if (!active()) {
            return;
        }
        queue_.set_capacity(kProgressQueueCapacity);
        reporter_ = std::thread([this] { drain(); });
    }

    ~ProgressChannel() {
        if (reporter_.joinable()) {
            queue_.push(std::nullopt);
            reporter_.join();
        }
    }

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    [[nodiscard]] bool active() const noexcept { return static_cast<bool>(sink_) || verbose_; }

    void publish(ProgressEvent event) {
        if (active()) {
            queue_.push(std::move(event));
        }
    }

private:
    void drain() {
        std::optional<ProgressEvent> event;
        std::size_t finished = 0;
        while (true) {
            queue_.pop(event);
            if (!event.has_value()) {
                return;
            }

            if (event->kind != ProgressKind::kStarted) {
                ++finished;
            }
            if (verbose_) {
                if (event->kind == ProgressKind::kFailed) {
                    CHIPSCAN_LOG_WARNING("[{}/{}] {} failed: {}", finished, event->total,
                                         event->candidateName, event->detail);
                } else if (event->kind == ProgressKind::kCompleted) {
                    CHIPSCAN_LOG_INFO("[{}/{}] {} scored", finished, event->total,
                                      event->candidateName);
                } else {
                    CHIPSCAN_LOG_DEBUG("Scoring {}", event->candidateName);
                }
            }

            if (sink_) {
                try {
                    sink_(*event);
                } catch (const std::exception& e) {
                    CHIPSCAN_LOG_WARNING("Progress sink failed: {}", e.what());
                }
            }
        }
    }

    ProgressSink sink_;
    bool verbose_;
    tbb::concurrent_bounded_queue<std::optional<ProgressEvent>> queue_;
    std::thread reporter_;
};

[[nodiscard]] CandidateOutcome archiveFailureOutcome(
    const CandidateDiscovery::ArchiveFailure& failure) {
    CandidateOutcome outcome;
    outcome.candidateName = failure.archivePath.filename().string();
    outcome.archivePath = failure.archivePath;
    outcome.result = std::unexpected(failure.error);
    return outcome;
}

}  // namespace

// =============================================================================
// Discovery
// =============================================================================

std::vector<fs::path> discoverArchives(const fs::path& directory, std::string_view suffix) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        throw IOError("Reference directory does not exist or is not a directory",
                      ErrorContext(directory.string()));
    }

    fs::directory_iterator it(directory, ec);
    if (ec) {
        throw IOError("Failed to read reference directory", ec, ErrorContext(directory.string()));
    }

    std::vector<fs::path> archives;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw IOError("Failed to read reference directory", ec,
                          ErrorContext(directory.string()));
        }
        std::error_code typeEc;
        if (!it->is_regular_file(typeEc)) {
            continue;
        }
        if (hasSuffixIgnoreCase(it->path().filename().string(), suffix)) {
            archives.push_back(it->path());
        }
    }
    if (ec) {
        throw IOError("Failed to read reference directory", ec, ErrorContext(directory.string()));
    }

    std::sort(archives.begin(), archives.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return archives;
}

CandidateDiscovery discoverCandidates(const fs::path& directory, std::string_view archiveSuffix,
                                      std::string_view memberSuffix) {
    CandidateDiscovery discovery;

    for (const auto& archivePath : discoverArchives(directory, archiveSuffix)) {
        ++discovery.archivesScanned;
        try {
            io::ZipArchive archive(archivePath);
            archive.open();
            auto members = archive.referenceMembers(memberSuffix);
            if (members.empty()) {
                CHIPSCAN_LOG_INFO("{}: no {} members", archivePath.string(), memberSuffix);
            }
            for (const auto& member : members) {
                discovery.candidates.push_back(Candidate{
                    .archivePath = archivePath,
                    .memberName = member.name,
                    .name = std::string(member.baseName()),
                });
            }
        } catch (const ChipScanException& e) {
            CHIPSCAN_LOG_WARNING("Skipping archive {}: {}", archivePath.string(), e.what());
            discovery.failures.push_back(CandidateDiscovery::ArchiveFailure{
                .archivePath = archivePath,
                .error = Error(e),
                .position = discovery.candidates.size(),
            });
        }
    }

    CHIPSCAN_LOG_DEBUG("Discovered {} candidates in {} archives ({} unreadable)",
                       discovery.candidates.size(), discovery.archivesScanned,
                       discovery.failures.size());
    return discovery;
}

// =============================================================================
// Progress
// =============================================================================

std::string_view progressKindToString(ProgressKind kind) noexcept {
    switch (kind) {
        case ProgressKind::kStarted:
            return "started";
        case ProgressKind::kCompleted:
            return "completed";
        case ProgressKind::kFailed:
            return "failed";
    }
    return "unknown";
}

// =============================================================================
// ScanReport
// =============================================================================

std::vector<MatchStats> ScanReport::successes() const {
    std::vector<MatchStats> stats;
    for (const auto& outcome : outcomes) {
        if (outcome.succeeded()) {
            stats.push_back(*outcome.result);
        }
    }
    return stats;
}

std::vector<const CandidateOutcome*> ScanReport::failures() const {
    std::vector<const CandidateOutcome*> failed;
    for (const auto& outcome : outcomes) {
        if (!outcome.succeeded()) {
            failed.push_back(&outcome);
        }
    }
    return failed;
}

std::size_t ScanReport::candidateCount() const noexcept {
    return static_cast<std::size_t>(
        std::count_if(outcomes.begin(), outcomes.end(),
                      [](const CandidateOutcome& outcome) { return !outcome.isArchiveFailure(); }));
}

// =============================================================================
// ScanCoordinator Implementation
// =============================================================================

ScanCoordinator::ScanCoordinator(ScanOptions options) : options_(std::move(options)) {}

std::size_t ScanCoordinator::resolveWorkerCount(std::size_t requested) noexcept {
    if (requested > 0) {
        return requested;
    }
    return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

Result<MatchStats> ScanCoordinator::scoreCandidate(const Candidate& candidate,
                                                   const io::VariantIndex& index) const {
    return tryExecute(
        [&] {
            io::ZipArchive archive(candidate.archivePath);
            archive.open();
            auto stream = archive.openMember(candidate.memberName);

            MatchScorer scorer(index, options_.scorer);
            MatchStats stats = scorer.score(candidate.name, *stream);
            stats.archivePath = candidate.archivePath.string();
            stats.memberName = candidate.memberName;
            return stats;
        },
        ErrorCode::kScoreError);
}

ScanReport ScanCoordinator::run(const fs::path& directory, const io::VariantIndex& index,
                                std::size_t workerCount) const {
    auto discovery =
        discoverCandidates(directory, options_.archiveSuffix, options_.memberSuffix);
    return run(discovery, index, workerCount);
}

ScanReport ScanCoordinator::run(const fs::path& directory, const io::VariantIndex& index) const {
    return run(directory, index, options_.workerCount);
}

ScanReport ScanCoordinator::run(const CandidateDiscovery& discovery,
                                const io::VariantIndex& index, std::size_t workerCount) const {
    const auto& candidates = discovery.candidates;

    ScanReport report;
    report.archivesScanned = discovery.archivesScanned;
    report.archivesFailed = discovery.failures.size();
    report.outcomes.resize(candidates.size() + discovery.failures.size());

    // Interleave archive failures at the position their archive was discovered.
    std::vector<std::size_t> slots(candidates.size());
    std::size_t slot = 0;
    std::size_t nextFailure = 0;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        while (nextFailure < discovery.failures.size() &&
               discovery.failures[nextFailure].position == i) {
            report.outcomes[slot++] = archiveFailureOutcome(discovery.failures[nextFailure++]);
        }
        slots[i] = slot++;
    }
    while (nextFailure < discovery.failures.size()) {
        report.outcomes[slot++] = archiveFailureOutcome(discovery.failures[nextFailure++]);
    }

    if (candidates.empty()) {
        return report;
    }

    const std::size_t workers = resolveWorkerCount(workerCount);
    CHIPSCAN_LOG_INFO("Scoring {} candidates from {} archives on {} workers", candidates.size(),
                      discovery.archivesScanned, workers);

    const std::size_t total = candidates.size();
    ProgressChannel progress(options_.progressSink, options_.verbose);

    tbb::task_arena arena(static_cast<int>(workers));
    arena.execute([&] {
        tbb::parallel_for(
            tbb::blocked_range<std::size_t>(0, total, 1),
            [&](const tbb::blocked_range<std::size_t>& range) {
                for (std::size_t i = range.begin(); i < range.end(); ++i) {
                    const Candidate& candidate = candidates[i];
                    CandidateOutcome& outcome = report.outcomes[slots[i]];

                    progress.publish(ProgressEvent{.kind = ProgressKind::kStarted,
                                                   .candidateName = candidate.name,
                                                   .index = slots[i],
                                                   .total = total,
                                                   .detail = {}});

                    outcome.candidateName = candidate.name;
                    outcome.archivePath = candidate.archivePath;
                    outcome.memberName = candidate.memberName;
                    outcome.result = scoreCandidate(candidate, index);

                    if (outcome.succeeded()) {
                        progress.publish(ProgressEvent{.kind = ProgressKind::kCompleted,
                                                       .candidateName = candidate.name,
                                                       .index = slots[i],
                                                       .total = total,
                                                       .detail = {}});
                    } else {
                        progress.publish(ProgressEvent{.kind = ProgressKind::kFailed,
                                                       .candidateName = candidate.name,
                                                       .index = slots[i],
                                                       .total = total,
                                                       .detail = outcome.result.error().message()});
                    }
                }
            });
    });

    CHIPSCAN_LOG_INFO("Scan finished: {} scored, {} failed", report.successes().size(),
                      report.failures().size());
    return report;
}

}  // namespace chipscan::match
