// =============================================================================
// chipscan - Genotyping Chip Strand File Matcher
// =============================================================================
// Main entry point for the chipscan command-line tool.
//
// This file implements the CLI using CLI11, providing:
// - Positional arguments: query .bim file, reference strand directory
// - Options: threads, verbosity, output file, header, duplicate policy,
//   malformed-line accounting, log file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

#include "chipscan/common/error.h"
#include "chipscan/common/logger.h"
#include "chipscan/common/types.h"
#include "chipscan/io/variant_index.h"

#include "commands/scan_command.h"

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "chipscan: find the genotyping chip and genome build of a PLINK dataset\n"
    "Scores a .bim variant list against every .strand file inside the ZIP\n"
    "archives of a reference directory and ranks the candidates.";

// =============================================================================
// CLI Options
// =============================================================================

struct CliOptions {
    std::string queryPath;
    std::string referenceDir;
    std::string outputPath;
    std::size_t threads = 0;           // 0 = auto-detect
    int verbosity = 0;                 // 0 = normal, 1 = progress, 2 = debug
    bool quiet = false;
    bool header = false;
    std::string duplicatePolicy = "first";
    bool countMalformed = chipscan::kCountMalformedRecordsDefault;
    std::string logFile;
};

CliOptions gOptions;

void setupOptions(CLI::App& app) {
    app.add_option("query", gOptions.queryPath, "Query variant file (PLINK .bim)")
        ->required()
        ->check(CLI::ExistingFile);

    app.add_option("strand-dir", gOptions.referenceDir,
                   "Directory containing strand file ZIP archives")
        ->required()
        ->check(CLI::ExistingDirectory);

    app.add_option("-t,--threads", gOptions.threads, "Number of worker threads (0 = auto-detect)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v progress, -vv debug)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Only log errors");

    app.add_option("-o,--output", gOptions.outputPath, "Write the result table to FILE")
        ->type_name("FILE");

    app.add_flag("--header", gOptions.header, "Write a column header line");

    app.add_option("--duplicate-policy", gOptions.duplicatePolicy,
                   "Which definition of a repeated query identifier is kept")
        ->default_val("first")
        ->check(CLI::IsMember({"first", "last"}));

    app.add_flag("--count-malformed", gOptions.countMalformed,
                 "Count malformed strand lines toward the record total");

    app.add_option("--log-file", gOptions.logFile, "Also write log output to FILE")
        ->type_name("FILE");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    setupOptions(app);

    CLI11_PARSE(app, argc, argv);

    try {
        chipscan::log::Config logConfig;
        logConfig.logFile = gOptions.logFile;
        logConfig.level = chipscan::log::levelFromVerbosity(gOptions.verbosity, gOptions.quiet);
        chipscan::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return chipscan::toExitCode(chipscan::ErrorCode::kIOError);
    }

    int exitCode = EXIT_SUCCESS;
    try {
        chipscan::commands::ScanCommandOptions opts;
        opts.queryPath = gOptions.queryPath;
        opts.referenceDir = gOptions.referenceDir;
        opts.outputPath = gOptions.outputPath;
        opts.threads = gOptions.threads;
        opts.verbose = gOptions.verbosity;
        opts.writeHeader = gOptions.header;
        opts.duplicatePolicy = chipscan::io::parseDuplicatePolicy(gOptions.duplicatePolicy);
        opts.countMalformed = gOptions.countMalformed;

        chipscan::commands::ScanCommand command(std::move(opts));
        exitCode = command.execute();
    } catch (const chipscan::ChipScanException& ex) {
        CHIPSCAN_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        CHIPSCAN_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = chipscan::toExitCode(chipscan::errorCodeOf(ex));
    }

    chipscan::log::shutdown();
    return exitCode;
}
