// =============================================================================
// chipscan - Scan Command
// =============================================================================
// Command handler tying the engine together for the command-line tool.
//
// This module provides:
// - ScanCommand: Load the query, scan the reference directory, rank the
//   candidates and write the result table
// - writeResultTable: Tab-separated rendering of a ranking
//
// Exit codes follow ErrorCode: kNoVariants when the query yields nothing,
// kNoCandidates when the reference directory holds no candidate.
// =============================================================================

#ifndef CHIPSCAN_COMMANDS_SCAN_COMMAND_H
#define CHIPSCAN_COMMANDS_SCAN_COMMAND_H

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "chipscan/common/error.h"
#include "chipscan/io/variant_index.h"
#include "chipscan/match/result_ranker.h"
#include "chipscan/match/scan_coordinator.h"

namespace chipscan::commands {

// =============================================================================
// Scan Options
// =============================================================================

/// @brief Configuration options for the scan command.
struct ScanCommandOptions {
    /// @brief Query linkage-map (.bim) file.
    std::filesystem::path queryPath;

    /// @brief Directory holding the reference archives.
    std::filesystem::path referenceDir;

    /// @brief Result table destination (empty or "-" = stdout).
    std::filesystem::path outputPath;

    /// @brief Worker threads (0 = auto-detect).
    std::size_t threads = 0;

    /// @brief Verbosity (0 = quiet progress, 1+ = per-candidate progress).
    int verbose = 0;

    /// @brief Write a column header line before the rows.
    bool writeHeader = false;

    io::DuplicatePolicy duplicatePolicy = io::DuplicatePolicy::kFirstWins;

    /// @brief Count malformed strand lines toward totalRecords.
    bool countMalformed = kCountMalformedRecordsDefault;
};

// =============================================================================
// Result Table
// =============================================================================

/// @brief Column header line (without newline).
[[nodiscard]] std::string resultTableHeader();

/// @brief One tab-separated row (without newline).
[[nodiscard]] std::string formatResultRow(const match::RankedResult& result);

/// @brief Write a ranking, one row per candidate, in ranked order.
void writeResultTable(std::ostream& out, const std::vector<match::RankedResult>& results,
                      bool header);

// =============================================================================
// ScanCommand Class
// =============================================================================

/// @brief Command handler for scanning a reference directory.
class ScanCommand {
public:
    /// @brief Construct with options.
    explicit ScanCommand(ScanCommandOptions options);

    ~ScanCommand();

    // Non-copyable, movable
    ScanCommand(const ScanCommand&) = delete;
    ScanCommand& operator=(const ScanCommand&) = delete;
    ScanCommand(ScanCommand&&) noexcept;
    ScanCommand& operator=(ScanCommand&&) noexcept;

    /// @brief Execute the scan.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const ScanCommandOptions& options() const noexcept { return options_; }

    /// @brief Ranking produced by the last successful execute().
    [[nodiscard]] const std::vector<match::RankedResult>& results() const noexcept {
        return results_;
    }

private:
    /// @brief Log every excluded candidate with its cause.
    void reportFailures(const match::ScanReport& report) const;

    /// @brief Write the ranking to the configured destination.
    void writeResults() const;

    ScanCommandOptions options_;
    std::vector<match::RankedResult> results_;
};

}  // namespace chipscan::commands

#endif  // CHIPSCAN_COMMANDS_SCAN_COMMAND_H
