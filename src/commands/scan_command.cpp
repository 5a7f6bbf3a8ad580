// =============================================================================
// chipscan - Scan Command Implementation
// =============================================================================

#include "scan_command.h"

#include <chrono>
#include <fstream>
#include <iostream>

#include <fmt/format.h>

#include "chipscan/common/logger.h"

namespace chipscan::commands {

// =============================================================================
// Result Table
// =============================================================================

std::string resultTableHeader() {
    return "name\tnameMatchRate\tnamePosMatchRate\toriginalStrandRate\tplusStrandRate\t"
           "atcgRate\tqueryCoverageRate\tcompletenessRate";
}

std::string formatResultRow(const match::RankedResult& result) {
    const auto& rates = result.rates();
    return fmt::format("{}\t{:.6f}\t{:.6f}\t{:.6f}\t{:.6f}\t{:.6f}\t{:.6f}\t{:.6f}",
                       result.candidateName(), rates.nameMatchRate, rates.namePosMatchRate,
                       rates.originalStrandRate, rates.plusStrandRate, rates.atcgRate,
                       rates.queryCoverageRate, rates.completenessRate);
}

void writeResultTable(std::ostream& out, const std::vector<match::RankedResult>& results,
                      bool header) {
    if (header) {
        out << resultTableHeader() << '\n';
    }
    for (const auto& result : results) {
        out << formatResultRow(result) << '\n';
    }
    out.flush();
}

// =============================================================================
// ScanCommand Implementation
// =============================================================================

ScanCommand::ScanCommand(ScanCommandOptions options) : options_(std::move(options)) {}

ScanCommand::~ScanCommand() = default;

ScanCommand::ScanCommand(ScanCommand&&) noexcept = default;
ScanCommand& ScanCommand::operator=(ScanCommand&&) noexcept = default;

int ScanCommand::execute() {
    try {
        auto startTime = std::chrono::steady_clock::now();

        io::VariantIndexOptions indexOptions;
        indexOptions.duplicatePolicy = options_.duplicatePolicy;
        auto index = io::VariantIndex::fromFile(options_.queryPath, indexOptions);

        match::ScanOptions scanOptions;
        scanOptions.workerCount = options_.threads;
        scanOptions.verbose = options_.verbose > 0;
        scanOptions.scorer.countMalformedRecords = options_.countMalformed;

        match::ScanCoordinator coordinator(std::move(scanOptions));
        auto report = coordinator.run(options_.referenceDir, index, options_.threads);

        reportFailures(report);

        if (report.candidateCount() == 0) {
            throw ChipScanException(
                ErrorCode::kNoCandidates,
                fmt::format("No candidate strand files found ({} archives examined, {} unreadable)",
                            report.archivesScanned, report.archivesFailed),
                ErrorContext(options_.referenceDir.string()));
        }

        results_ = match::rankResults(report.outcomes);
        if (results_.empty()) {
            CHIPSCAN_LOG_WARNING("None of the {} candidates could be scored",
                                 report.candidateCount());
        }

        writeResults();

        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime);
        CHIPSCAN_LOG_INFO("Ranked {} of {} candidates in {:.2f}s", results_.size(),
                          report.candidateCount(), elapsed.count());
        if (!results_.empty()) {
            CHIPSCAN_LOG_INFO("Best match: {} (nameMatchRate {:.4f})",
                              results_.front().candidateName(),
                              results_.front().rates().nameMatchRate);
        }
        return toExitCode(ErrorCode::kSuccess);

    } catch (const ChipScanException& e) {
        CHIPSCAN_LOG_ERROR("Scan failed: {}", e.what());
        return e.exitCode();
    }
}

void ScanCommand::reportFailures(const match::ScanReport& report) const {
    for (const auto* outcome : report.failures()) {
        if (outcome->isArchiveFailure()) {
            CHIPSCAN_LOG_WARNING("Excluded archive {}: {}", outcome->archivePath.string(),
                                 outcome->result.error().message());
        } else {
            CHIPSCAN_LOG_WARNING("Excluded candidate {} ({}): {}", outcome->candidateName,
                                 errorCodeToString(outcome->result.error().code()),
                                 outcome->result.error().message());
        }
    }
}

void ScanCommand::writeResults() const {
    if (options_.outputPath.empty() || options_.outputPath == "-") {
        writeResultTable(std::cout, results_, options_.writeHeader);
        return;
    }

    std::ofstream file(options_.outputPath);
    if (!file.is_open()) {
        throw IOError("Failed to open output file", ErrorContext(options_.outputPath.string()));
    }
    writeResultTable(file, results_, options_.writeHeader);
    if (!file) {
        throw IOError("Failed to write output file", ErrorContext(options_.outputPath.string()));
    }
}

}  // namespace chipscan::commands
