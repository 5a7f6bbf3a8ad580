// =============================================================================
// chipscan - ZIP Archive Reader
// =============================================================================
// Read-only access to ZIP containers through libzip, without extracting
// members to disk.
//
// This module provides:
// - ZipArchive: Opens a container and snapshots its member table
// - ZipEntry: Per-member metadata taken from zip_stat_index()
// - ZipEntryInputStream: Single-pass std::istream over one member, fed by
//   zip_fread() and failing with ArchiveError on decode or CRC errors
//
// Which compression methods decode depends on how libzip was built; stored,
// deflate, bzip2 and LZMA are expected. ZIP64 is handled by libzip.
// Encrypted members are rejected.
//
// Usage:
//   ZipArchive archive("/refs/GSA-24v1-0_A1-b37.strand.zip");
//   archive.open();
//   for (const auto& entry : archive.referenceMembers(".strand")) {
//       auto stream = archive.openMember(entry);
//       std::string line;
//       while (std::getline(*stream, line)) { ... }
//   }
//
// Thread Safety:
// - A ZipArchive is not thread-safe; each worker opens its own instance
// - Member streams share the archive handle and may outlive the ZipArchive
// =============================================================================

#ifndef CHIPSCAN_IO_ZIP_ARCHIVE_H
#define CHIPSCAN_IO_ZIP_ARCHIVE_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <source_location>
#include <streambuf>
#include <string>
#include <string_view>
#include <vector>

#include <zip.h>

#include "chipscan/common/error.h"
#include "chipscan/common/types.h"

namespace chipscan::io {

// =============================================================================
// Compression Methods
// =============================================================================

/// @brief Whether the linked libzip can decode a raw method id.
[[nodiscard]] bool isZipMethodSupported(std::uint16_t method) noexcept;

/// @brief Human-readable name for a raw method id, for diagnostics.
[[nodiscard]] std::string_view zipMethodName(std::uint16_t method) noexcept;

// =============================================================================
// ZipEntry
// =============================================================================

/// @brief Metadata of one archive member.
struct ZipEntry {
    /// @brief Member path inside the archive ('/' separated).
    std::string name;

    /// @brief Position in the central directory, as libzip indexes it.
    std::uint64_t index = 0;

    std::uint16_t method = ZIP_CM_STORE;
    std::uint16_t encryptionMethod = ZIP_EM_NONE;
    std::uint32_t crc32 = 0;
    std::uint64_t compressedSize = 0;
    std::uint64_t uncompressedSize = 0;

    [[nodiscard]] bool isDirectory() const noexcept {
        return !name.empty() && name.back() == '/';
    }

    [[nodiscard]] bool isEncrypted() const noexcept { return encryptionMethod != ZIP_EM_NONE; }

    /// @brief Last path component of the member name.
    [[nodiscard]] std::string_view baseName() const noexcept;
};

/// @brief Check whether a member name denotes a reference file.
/// @note Directories and macOS resource-fork entries are never reference files.
[[nodiscard]] bool isReferenceMember(std::string_view name,
                                     std::string_view suffix = kDefaultMemberSuffix) noexcept;

// =============================================================================
// libzip Handles
// =============================================================================

/// @brief Archive handle shared by a ZipArchive and the member streams it opened.
using ZipHandle = std::shared_ptr<zip_t>;

struct ZipFileCloser {
    void operator()(zip_file_t* file) const noexcept { zip_fclose(file); }
};

using ZipFilePtr = std::unique_ptr<zip_file_t, ZipFileCloser>;

// =============================================================================
// ZipEntryStreamBuf
// =============================================================================

/// @brief Stream buffer reading one decoded member through zip_fread().
/// @note Throws ArchiveError from underflow() when libzip reports a read,
///       decompression or CRC failure.
class ZipEntryStreamBuf : public std::streambuf {
public:
    /// @param handle Open archive; kept alive for the lifetime of the buffer.
    /// @param archiveName Archive path, for error context.
    /// @param entry Member to read.
    /// @param bufferSize Internal buffer size.
    ZipEntryStreamBuf(ZipHandle handle, std::string archiveName, ZipEntry entry,
                      std::size_t bufferSize = 64 * 1024);

    ~ZipEntryStreamBuf() override;

    ZipEntryStreamBuf(const ZipEntryStreamBuf&) = delete;
    ZipEntryStreamBuf& operator=(const ZipEntryStreamBuf&) = delete;

protected:
    int_type underflow() override;

private:
    [[nodiscard]] ErrorContext context(
        std::source_location loc = std::source_location::current()) const;

    ZipHandle handle_;
    ZipFilePtr file_;
    std::string archiveName_;
    ZipEntry entry_;
    std::vector<char> buffer_;
    std::uint64_t produced_ = 0;
    bool finished_ = false;
};

// =============================================================================
// ZipEntryInputStream
// =============================================================================

/// @brief Input stream over one archive member.
/// @note badbit is in the exception mask, so read errors raised by the
///       stream buffer propagate out of std::getline and friends.
class ZipEntryInputStream : public std::istream {
public:
    ZipEntryInputStream(ZipHandle handle, std::string archiveName, ZipEntry entry);

    ~ZipEntryInputStream() override;

    ZipEntryInputStream(const ZipEntryInputStream&) = delete;
    ZipEntryInputStream& operator=(const ZipEntryInputStream&) = delete;

private:
    std::unique_ptr<ZipEntryStreamBuf> buffer_;
};

// =============================================================================
// ZipArchive Class
// =============================================================================

/// @brief Reader for a ZIP container.
class ZipArchive {
public:
    explicit ZipArchive(std::filesystem::path archivePath);

    ~ZipArchive();

    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;
    ZipArchive(ZipArchive&&) noexcept;
    ZipArchive& operator=(ZipArchive&&) noexcept;

    /// @brief Open the archive and read its member table.
    /// @throws ArchiveError if the file is missing, unreadable or not a ZIP archive.
    void open();

    /// @brief Release this reader's reference to the archive handle.
    void close() noexcept;

    [[nodiscard]] bool isOpen() const noexcept { return handle_ != nullptr; }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return archivePath_; }

    /// @brief All members in central directory order.
    /// @throws ArchiveError if the archive is not open.
    [[nodiscard]] const std::vector<ZipEntry>& entries() const;

    /// @brief Names of all members in central directory order.
    [[nodiscard]] std::vector<std::string> listMembers() const;

    /// @brief Members accepted by isReferenceMember(), in central directory order.
    [[nodiscard]] std::vector<ZipEntry> referenceMembers(
        std::string_view suffix = kDefaultMemberSuffix) const;

    /// @brief Find a member by its full name.
    /// @return Pointer to the entry, or nullptr if absent.
    [[nodiscard]] const ZipEntry* findEntry(std::string_view name) const;

    /// @brief Open a single-pass decoding stream over a member.
    /// @throws ArchiveError for directories, encrypted members, unsupported
    ///         methods, or when libzip cannot open the member.
    [[nodiscard]] std::unique_ptr<std::istream> openMember(const ZipEntry& entry);

    /// @brief Open a member by name.
    /// @throws ArchiveError if the member does not exist.
    [[nodiscard]] std::unique_ptr<std::istream> openMember(std::string_view name);

private:
    void readMemberTable();

    [[nodiscard]] ErrorContext context(
        std::source_location loc = std::source_location::current()) const;

    std::filesystem::path archivePath_;
    ZipHandle handle_;
    std::vector<ZipEntry> entries_;
};

}  // namespace chipscan::io

#endif  // CHIPSCAN_IO_ZIP_ARCHIVE_H
