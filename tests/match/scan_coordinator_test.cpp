// =============================================================================
// chipscan - Scan Coordinator Tests
// =============================================================================
// Tests for candidate discovery, concurrent scoring and fault isolation.
//
// Properties:
// - Every discovered candidate yields exactly one outcome
// - A corrupt archive or member never affects the others
// - Outcomes and rankings are identical for every worker count
// =============================================================================

#include "chipscan/match/scan_coordinator.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "chipscan/match/result_ranker.h"
#include "support/zip_fixture.h"

namespace chipscan::match::test {

using chipscan::test::bimLine;
using chipscan::test::FixtureMember;
using chipscan::test::FixtureMethod;
using chipscan::test::joinLines;
using chipscan::test::strandLine;
using chipscan::test::TempDir;
using chipscan::test::ZipFixtureWriter;

namespace {

constexpr int kQueryVariants = 20;

[[nodiscard]] io::VariantIndex makeQuery() {
    std::vector<std::string> lines;
    for (int i = 1; i <= kQueryVariants; ++i) {
        lines.push_back(bimLine("1", fmt::format("rs{}", i), 1000 * i, "A", "G"));
    }
    return io::VariantIndex::build(lines);
}

/// @brief Strand file sharing the first @p shared query ids, at matching positions.
[[nodiscard]] std::string strandFile(int shared, int unrelated, bool complemented = false) {
    std::vector<std::string> lines;
    for (int i = 1; i <= shared; ++i) {
        lines.push_back(strandLine(fmt::format("rs{}", i), "1", 1000 * i,
                                   complemented ? "-" : "+", complemented ? "TC" : "AG"));
    }
    for (int i = 0; i < unrelated; ++i) {
        lines.push_back(strandLine(fmt::format("exm{}", i), "2", 50 + i, "+", "AC"));
    }
    return joinLines(lines);
}

/// @brief Reference directory with two good archives, one corrupt archive and noise.
void writeReferenceDir(const TempDir& dir) {
    (void)dir.writeZip("a_illumina.zip",
                       ZipFixtureWriter()
                           .add("illumina/GSA-b37.strand", strandFile(20, 0))
                           .add("illumina/readme.txt", "not a strand file\n")
                           .add("illumina/GSA-b38.strand", strandFile(10, 10), FixtureMethod::kBzip2));
    (void)dir.writeFile("b_broken.zip", "PK but not really a zip archive");
    (void)dir.writeZip("c_affy.ZIP", ZipFixtureWriter().add(
                                         "Axiom-b37.strand", strandFile(5, 15, true),
                                         FixtureMethod::kLzma));
    (void)dir.writeFile("notes.txt", "ignored\n");
    std::filesystem::create_directories(dir.path() / "nested.zip");
    std::filesystem::create_directories(dir.path() / "sub");
    (void)dir.writeZip("sub/deep.zip", ZipFixtureWriter().add("deep.strand", strandFile(20, 0)));
}

[[nodiscard]] std::vector<std::string> outcomeNames(const ScanReport& report) {
    std::vector<std::string> names;
    for (const auto& outcome : report.outcomes) {
        names.push_back(outcome.candidateName);
    }
    return names;
}

}  // namespace

// =============================================================================
// Discovery Tests
// =============================================================================

TEST(CandidateDiscoveryTest, ArchivesSortedAndFilteredBySuffix) {
    TempDir dir;
    writeReferenceDir(dir);

    auto archives = discoverArchives(dir.path());

    ASSERT_EQ(archives.size(), 3u);
    EXPECT_EQ(archives[0].filename(), "a_illumina.zip");
    EXPECT_EQ(archives[1].filename(), "b_broken.zip");
    EXPECT_EQ(archives[2].filename(), "c_affy.ZIP");
}

TEST(CandidateDiscoveryTest, MissingDirectoryIsIOError) {
    TempDir dir;
    EXPECT_THROW((void)discoverArchives(dir.path() / "absent"), IOError);
    EXPECT_THROW((void)discoverArchives(dir.writeFile("file.zip", "x")), IOError);
}

TEST(CandidateDiscoveryTest, CandidatesInArchiveThenEntryOrder) {
    TempDir dir;
    writeReferenceDir(dir);

    auto discovery = discoverCandidates(dir.path());

    EXPECT_EQ(discovery.archivesScanned, 3u);
    ASSERT_EQ(discovery.candidates.size(), 3u);
    EXPECT_EQ(discovery.candidates[0].name, "GSA-b37.strand");
    EXPECT_EQ(discovery.candidates[0].memberName, "illumina/GSA-b37.strand");
    EXPECT_EQ(discovery.candidates[1].name, "GSA-b38.strand");
    EXPECT_EQ(discovery.candidates[2].name, "Axiom-b37.strand");
    EXPECT_EQ(discovery.candidates[2].archivePath.filename(), "c_affy.ZIP");

    ASSERT_EQ(discovery.failures.size(), 1u);
    EXPECT_EQ(discovery.failures[0].archivePath.filename(), "b_broken.zip");
    EXPECT_EQ(discovery.failures[0].position, 2u);
    EXPECT_EQ(discovery.failures[0].error.code(), ErrorCode::kArchiveError);
}

// =============================================================================
// Scan Tests
// =============================================================================

TEST(ScanCoordinatorTest, CorruptArchiveDoesNotStopOthers) {
    TempDir dir;
    writeReferenceDir(dir);
    auto index = makeQuery();

    ScanCoordinator coordinator;
    auto report = coordinator.run(dir.path(), index, 2);

    EXPECT_EQ(report.archivesScanned, 3u);
    EXPECT_EQ(report.archivesFailed, 1u);
    EXPECT_EQ(report.candidateCount(), 3u);
    EXPECT_EQ(outcomeNames(report),
              (std::vector<std::string>{"GSA-b37.strand", "GSA-b38.strand", "b_broken.zip",
                                        "Axiom-b37.strand"}));

    auto successes = report.successes();
    ASSERT_EQ(successes.size(), 3u);
    auto failures = report.failures();
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_TRUE(failures[0]->isArchiveFailure());

    const auto& identical = successes[0];
    EXPECT_EQ(identical.memberName, "illumina/GSA-b37.strand");
    EXPECT_EQ(identical.archivePath, (dir.path() / "a_illumina.zip").string());
    auto rates = computeRates(identical);
    EXPECT_DOUBLE_EQ(rates.nameMatchRate, 1.0);
    EXPECT_DOUBLE_EQ(rates.namePosMatchRate, 1.0);
    EXPECT_DOUBLE_EQ(rates.originalStrandRate, 1.0);
    EXPECT_DOUBLE_EQ(rates.queryCoverageRate, 1.0);

    EXPECT_DOUBLE_EQ(computeRates(successes[1]).nameMatchRate, 0.5);

    auto flipped = computeRates(successes[2]);
    EXPECT_DOUBLE_EQ(flipped.nameMatchRate, 0.25);
    EXPECT_DOUBLE_EQ(flipped.plusStrandRate, 1.0);
    EXPECT_DOUBLE_EQ(flipped.originalStrandRate, 0.0);
}

TEST(ScanCoordinatorTest, CorruptMemberRecordedAsScoreError) {
    TempDir dir;
    FixtureMember bad;
    bad.name = "bad.strand";
    bad.content = strandFile(20, 0);
    bad.corruptPayload = true;
    (void)dir.writeZip("chips.zip", ZipFixtureWriter()
                                        .add("good.strand", strandFile(20, 0))
                                        .addMember(bad)
                                        .add("other.strand", strandFile(4, 4)));
    auto index = makeQuery();

    auto report = ScanCoordinator().run(dir.path(), index, 4);

    ASSERT_EQ(report.outcomes.size(), 3u);
    EXPECT_TRUE(report.outcomes[0].succeeded());
    ASSERT_FALSE(report.outcomes[1].succeeded());
    EXPECT_FALSE(report.outcomes[1].isArchiveFailure());
    EXPECT_EQ(report.outcomes[1].result.error().code(), ErrorCode::kScoreError);
    EXPECT_TRUE(report.outcomes[2].succeeded());

    auto ranked = rankResults(report.outcomes);
    ASSERT_EQ(ranked.size(), 2u);
    EXPECT_EQ(ranked[0].candidateName(), "good.strand");
}

TEST(ScanCoordinatorTest, ResultsIndependentOfWorkerCount) {
    TempDir dir;
    ZipFixtureWriter first;
    ZipFixtureWriter second;
    for (int i = 0; i < 24; ++i) {
        // Pairs of candidates share rates so ties must fall back to discovery order.
        auto content = strandFile(i / 2, 20 - i / 2);
        (i % 2 == 0 ? first : second)
            .add(fmt::format("chip{:02d}.strand", i), content,
                 i % 3 == 0 ? FixtureMethod::kStored : FixtureMethod::kDeflate);
    }
    (void)dir.writeZip("first.zip", first);
    (void)dir.writeZip("second.zip", second);
    auto index = makeQuery();

    ScanCoordinator coordinator;
    auto baseline = coordinator.run(dir.path(), index, 1);
    auto baselineRanking = rankResults(baseline.outcomes);
    ASSERT_EQ(baseline.successes().size(), 24u);

    for (std::size_t workers : {2u, 16u}) {
        auto report = coordinator.run(dir.path(), index, workers);
        EXPECT_EQ(outcomeNames(report), outcomeNames(baseline)) << "workers=" << workers;
        EXPECT_EQ(report.successes(), baseline.successes()) << "workers=" << workers;

        auto ranking = rankResults(report.outcomes);
        ASSERT_EQ(ranking.size(), baselineRanking.size());
        for (std::size_t i = 0; i < ranking.size(); ++i) {
            EXPECT_EQ(ranking[i].candidateName(), baselineRanking[i].candidateName());
            EXPECT_EQ(ranking[i].rank(), baselineRanking[i].rank());
        }
    }
}

TEST(ScanCoordinatorTest, EmptyDirectoryHasNoCandidates) {
    TempDir dir;
    auto index = makeQuery();

    auto report = ScanCoordinator().run(dir.path(), index, 2);

    EXPECT_TRUE(report.outcomes.empty());
    EXPECT_EQ(report.candidateCount(), 0u);
    EXPECT_EQ(report.archivesScanned, 0u);
}

TEST(ScanCoordinatorTest, ArchiveWithoutStrandMembersHasNoCandidates) {
    TempDir dir;
    (void)dir.writeZip("docs.zip", ZipFixtureWriter().add("README.md", "# chips\n"));
    auto index = makeQuery();

    auto report = ScanCoordinator().run(dir.path(), index, 2);

    EXPECT_EQ(report.archivesScanned, 1u);
    EXPECT_EQ(report.candidateCount(), 0u);
}

TEST(ScanCoordinatorTest, MissingDirectoryIsIOError) {
    TempDir dir;
    auto index = makeQuery();
    EXPECT_THROW((void)ScanCoordinator().run(dir.path() / "absent", index, 1), IOError);
}

TEST(ScanCoordinatorTest, CustomMemberSuffix) {
    TempDir dir;
    (void)dir.writeZip("chips.zip", ZipFixtureWriter()
                                        .add("a.strand", strandFile(2, 0))
                                        .add("b.txt", strandFile(3, 0)));
    auto index = makeQuery();

    ScanOptions options;
    options.memberSuffix = ".txt";
    auto report = ScanCoordinator(options).run(dir.path(), index, 1);

    EXPECT_EQ(outcomeNames(report), (std::vector<std::string>{"b.txt"}));
}

TEST(ScanCoordinatorTest, ProgressSinkSeesEveryCandidate) {
    TempDir dir;
    writeReferenceDir(dir);
    auto index = makeQuery();

    std::vector<ProgressEvent> events;
    ScanOptions options;
    options.progressSink = [&events](const ProgressEvent& event) { events.push_back(event); };
    auto report = ScanCoordinator(options).run(dir.path(), index, 3);

    const auto count = [&events](ProgressKind kind) {
        return std::count_if(events.begin(), events.end(),
                             [kind](const ProgressEvent& e) { return e.kind == kind; });
    };
    EXPECT_EQ(count(ProgressKind::kStarted), 3);
    EXPECT_EQ(count(ProgressKind::kCompleted), 3);
    EXPECT_EQ(count(ProgressKind::kFailed), 0);
    for (const auto& event : events) {
        EXPECT_EQ(event.total, 3u);
        EXPECT_LT(event.index, report.outcomes.size());
        EXPECT_EQ(report.outcomes[event.index].candidateName, event.candidateName);
    }
}

TEST(ScanCoordinatorTest, ThrowingSinkDoesNotAbortScan) {
    TempDir dir;
    writeReferenceDir(dir);
    auto index = makeQuery();

    ScanOptions options;
    options.progressSink = [](const ProgressEvent&) { throw std::runtime_error("sink down"); };
    auto report = ScanCoordinator(options).run(dir.path(), index, 2);

    EXPECT_EQ(report.successes().size(), 3u);
}

TEST(ScanCoordinatorTest, ResolveWorkerCount) {
    EXPECT_GE(ScanCoordinator::resolveWorkerCount(0), 1u);
    EXPECT_EQ(ScanCoordinator::resolveWorkerCount(3), 3u);
}

TEST(ScanCoordinatorTest, ProgressKindNames) {
    EXPECT_EQ(progressKindToString(ProgressKind::kStarted), "started");
    EXPECT_EQ(progressKindToString(ProgressKind::kCompleted), "completed");
    EXPECT_EQ(progressKindToString(ProgressKind::kFailed), "failed");
}

}  // namespace chipscan::match::test
