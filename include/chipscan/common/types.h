// =============================================================================
// chipscan - Common Type Definitions
// =============================================================================
// Core type definitions for the chipscan library.
//
// This module defines:
// - Position, RecordCount: Type aliases for coordinates and counters
// - StrandOrientation: Enum for strand annotation
// - AllelePair: Biallelic allele codes with complement/palindrome helpers
// - Variant: A query variant loaded from a linkage-map file
// - Default suffixes and policy constants
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef CHIPSCAN_COMMON_TYPES_H
#define CHIPSCAN_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace chipscan {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Base-pair position on a chromosome.
using Position = std::uint64_t;

/// @brief Type alias for record and match counters.
using RecordCount = std::uint64_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief File name suffix of archives in the reference directory.
inline constexpr std::string_view kDefaultArchiveSuffix = ".zip";

/// @brief File name suffix of reference (strand) members inside an archive.
inline constexpr std::string_view kDefaultMemberSuffix = ".strand";

/// @brief Whether malformed reference lines count toward totalRecords by default.
/// @note Changes the denominator of nameMatchRate.
inline constexpr bool kCountMalformedRecordsDefault = false;

/// @brief Maximum number of malformed-line diagnostics retained per input.
inline constexpr std::size_t kMaxReportedMalformedLines = 16;

/// @brief Maximum number of characters of an offending line kept in a diagnostic.
inline constexpr std::size_t kMaxDiagnosticLineLength = 100;

// =============================================================================
// Strand Orientation
// =============================================================================

/// @brief Strand on which a reference record reports its alleles.
enum class StrandOrientation : std::uint8_t {
    kPlus = 0,
    kMinus = 1,
    kUnknown = 2
};

/// @brief Parse a strand annotation ("+", "-", anything else is unknown).
[[nodiscard]] constexpr StrandOrientation parseStrandOrientation(std::string_view text) noexcept {
    if (text == "+") {
        return StrandOrientation::kPlus;
    }
    if (text == "-") {
        return StrandOrientation::kMinus;
    }
    return StrandOrientation::kUnknown;
}

[[nodiscard]] constexpr std::string_view strandOrientationToString(StrandOrientation s) noexcept {
    switch (s) {
        case StrandOrientation::kPlus:
            return "+";
        case StrandOrientation::kMinus:
            return "-";
        case StrandOrientation::kUnknown:
            return "?";
    }
    return "?";
}

// =============================================================================
// Allele Helpers
// =============================================================================

/// @brief Upper-case an ASCII allele character.
[[nodiscard]] constexpr char toUpperBase(char c) noexcept {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

/// @brief Watson-Crick complement of a base; non-ACGT codes are returned unchanged.
[[nodiscard]] constexpr char complementBase(char c) noexcept {
    switch (toUpperBase(c)) {
        case 'A':
            return 'T';
        case 'T':
            return 'A';
        case 'C':
            return 'G';
        case 'G':
            return 'C';
        default:
            return toUpperBase(c);
    }
}

/// @brief Upper-case an allele code (single base or multi-character indel code).
[[nodiscard]] std::string normalizeAllele(std::string_view allele);

/// @brief Complement every base of an allele code.
[[nodiscard]] std::string complementAllele(std::string_view allele);

// =============================================================================
// AllelePair
// =============================================================================

/// @brief Two allele codes of a biallelic variant.
/// @note Comparisons are order-independent: A/G equals G/A.
struct AllelePair {
    std::string first;
    std::string second;

    AllelePair() = default;

    AllelePair(std::string a, std::string b)
        : first(normalizeAllele(a)), second(normalizeAllele(b)) {}

    /// @brief Unordered equality of two pairs.
    [[nodiscard]] bool sameAs(const AllelePair& other) const noexcept {
        return (first == other.first && second == other.second) ||
               (first == other.second && second == other.first);
    }

    /// @brief Pair with both alleles complemented (A<->T, C<->G).
    [[nodiscard]] AllelePair complemented() const {
        return AllelePair(complementAllele(first), complementAllele(second));
    }

    /// @brief True for A/T and C/G pairs, whose strand cannot be told from alleles.
    [[nodiscard]] bool isPalindromic() const noexcept {
        if (first.size() != 1 || second.size() != 1) {
            return false;
        }
        const char a = first[0];
        const char b = second[0];
        return (a == 'A' && b == 'T') || (a == 'T' && b == 'A') || (a == 'C' && b == 'G') ||
               (a == 'G' && b == 'C');
    }

    [[nodiscard]] std::string toString() const { return first + "/" + second; }

    friend bool operator==(const AllelePair&, const AllelePair&) = default;
};

// =============================================================================
// Variant
// =============================================================================

/// @brief A query variant as loaded from a linkage-map (.bim) line.
/// @note Immutable once inserted into a VariantIndex.
struct Variant {
    /// @brief Variant identifier (join key).
    std::string id;

    /// @brief Chromosome label as written in the input.
    std::string chromosome;

    /// @brief Base-pair position.
    Position position = 0;

    /// @brief Allele A and allele B, upper-cased.
    AllelePair alleles;

    friend bool operator==(const Variant&, const Variant&) = default;
};

}  // namespace chipscan

#endif  // CHIPSCAN_COMMON_TYPES_H
