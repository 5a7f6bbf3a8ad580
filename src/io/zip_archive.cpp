// =============================================================================
// chipscan - ZIP Archive Reader Implementation
// =============================================================================

#include "chipscan/io/zip_archive.h"

#include <algorithm>

#include <fmt/format.h>

#include "chipscan/common/logger.h"

namespace chipscan::io {

namespace {

/// @brief Message for a libzip error code returned through zip_open()'s errorp.
[[nodiscard]] std::string libzipErrorString(int code) {
    zip_error_t error;
    zip_error_init_with_code(&error, code);
    std::string message = zip_error_strerror(&error);
    zip_error_fini(&error);
    return message;
}

void discardArchive(zip_t* archive) noexcept {
    if (archive != nullptr) {
        zip_discard(archive);
    }
}

}  // namespace

// =============================================================================
// Compression Methods
// =============================================================================

bool isZipMethodSupported(std::uint16_t method) noexcept {
    return zip_compression_method_supported(static_cast<zip_int32_t>(method), 0) != 0;
}

std::string_view zipMethodName(std::uint16_t method) noexcept {
    switch (method) {
        case ZIP_CM_STORE:
            return "stored";
        case ZIP_CM_DEFLATE:
            return "deflate";
        case ZIP_CM_BZIP2:
            return "bzip2";
        case ZIP_CM_LZMA:
            return "lzma";
        case ZIP_CM_XZ:
            return "xz";
        case ZIP_CM_ZSTD:
            return "zstd";
        default:
            return "unknown";
    }
}

// =============================================================================
// ZipEntry
// =============================================================================

std::string_view ZipEntry::baseName() const noexcept {
    std::string_view view = name;
    if (!view.empty() && view.back() == '/') {
        view.remove_suffix(1);
    }
    auto slash = view.rfind('/');
    return slash == std::string_view::npos ? view : view.substr(slash + 1);
}

bool isReferenceMember(std::string_view name, std::string_view suffix) noexcept {
    if (name.empty() || name.back() == '/') {
        return false;
    }
    if (name.starts_with("__MACOSX/") || name.find("/__MACOSX/") != std::string_view::npos) {
        return false;
    }
    auto slash = name.rfind('/');
    std::string_view base = slash == std::string_view::npos ? name : name.substr(slash + 1);
    if (base.starts_with("._")) {
        return false;
    }
    return base.size() > suffix.size() && base.ends_with(suffix);
}

// =============================================================================
// ZipEntryStreamBuf Implementation
// =============================================================================

ZipEntryStreamBuf::ZipEntryStreamBuf(ZipHandle handle, std::string archiveName, ZipEntry entry,
                                     std::size_t bufferSize)
    : handle_(std::move(handle)),
      archiveName_(std::move(archiveName)),
      entry_(std::move(entry)),
      buffer_(bufferSize) {
    file_.reset(zip_fopen_index(handle_.get(), entry_.index, 0));
    if (!file_) {
        throw ArchiveError(
            fmt::format("Cannot open member: {}", zip_error_strerror(zip_get_error(handle_.get()))),
            context());
    }
}

ZipEntryStreamBuf::~ZipEntryStreamBuf() = default;

ErrorContext ZipEntryStreamBuf::context(std::source_location loc) const {
    return ErrorContext(archiveName_, loc).withMember(entry_.name);
}

ZipEntryStreamBuf::int_type ZipEntryStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    if (finished_) {
        return traits_type::eof();
    }

    // libzip verifies the CRC-32 once the last byte has been read, so a
    // damaged member fails here rather than ending silently.
    zip_int64_t bytesRead = zip_fread(file_.get(), buffer_.data(), buffer_.size());
    if (bytesRead < 0) {
        throw ArchiveError(fmt::format("Failed to read member after {} bytes: {}", produced_,
                                       zip_file_strerror(file_.get())),
                           context().withOffset(produced_));
    }
    if (bytesRead == 0) {
        finished_ = true;
        return traits_type::eof();
    }

    produced_ += static_cast<std::uint64_t>(bytesRead);
    setg(buffer_.data(), buffer_.data(), buffer_.data() + bytesRead);
    return traits_type::to_int_type(*gptr());
}

// =============================================================================
// ZipEntryInputStream Implementation
// =============================================================================

ZipEntryInputStream::ZipEntryInputStream(ZipHandle handle, std::string archiveName,
                                         ZipEntry entry)
    : std::istream(nullptr),
      buffer_(std::make_unique<ZipEntryStreamBuf>(std::move(handle), std::move(archiveName),
                                                  std::move(entry))) {
    rdbuf(buffer_.get());
    exceptions(std::ios::badbit);
}

ZipEntryInputStream::~ZipEntryInputStream() = default;

// =============================================================================
// ZipArchive Implementation
// =============================================================================

ZipArchive::ZipArchive(std::filesystem::path archivePath) : archivePath_(std::move(archivePath)) {}

ZipArchive::~ZipArchive() { close(); }

ZipArchive::ZipArchive(ZipArchive&&) noexcept = default;
ZipArchive& ZipArchive::operator=(ZipArchive&&) noexcept = default;

ErrorContext ZipArchive::context(std::source_location loc) const {
    return ErrorContext(archivePath_.string(), loc);
}

void ZipArchive::open() {
    if (isOpen()) {
        return;
    }

    int errorCode = ZIP_ER_OK;
    zip_t* raw = zip_open(archivePath_.c_str(), ZIP_RDONLY, &errorCode);
    if (raw == nullptr) {
        throw ArchiveError(fmt::format("Cannot open archive: {}", libzipErrorString(errorCode)),
                           context());
    }
    handle_ = ZipHandle(raw, discardArchive);

    try {
        readMemberTable();
    } catch (const ArchiveError&) {
        close();
        throw;
    }

    CHIPSCAN_LOG_DEBUG("Opened archive {}: {} members", archivePath_.string(), entries_.size());
}

void ZipArchive::close() noexcept {
    handle_.reset();
    entries_.clear();
}

void ZipArchive::readMemberTable() {
    zip_t* archive = handle_.get();
    zip_int64_t count = zip_get_num_entries(archive, 0);
    if (count < 0) {
        throw ArchiveError(
            fmt::format("Cannot read member table: {}", zip_error_strerror(zip_get_error(archive))),
            context());
    }

    entries_.clear();
    entries_.reserve(static_cast<std::size_t>(count));
    for (zip_uint64_t i = 0; i < static_cast<zip_uint64_t>(count); ++i) {
        zip_stat_t stat;
        zip_stat_init(&stat);
        if (zip_stat_index(archive, i, 0, &stat) != 0) {
            throw ArchiveError(fmt::format("Cannot stat member {}: {}", i,
                                           zip_error_strerror(zip_get_error(archive))),
                               context());
        }

        ZipEntry entry;
        entry.index = i;
        if ((stat.valid & ZIP_STAT_NAME) != 0 && stat.name != nullptr) {
            entry.name = stat.name;
        }
        if ((stat.valid & ZIP_STAT_COMP_METHOD) != 0) {
            entry.method = stat.comp_method;
        }
        if ((stat.valid & ZIP_STAT_ENCRYPTION_METHOD) != 0) {
            entry.encryptionMethod = stat.encryption_method;
        }
        if ((stat.valid & ZIP_STAT_CRC) != 0) {
            entry.crc32 = stat.crc;
        }
        if ((stat.valid & ZIP_STAT_COMP_SIZE) != 0) {
            entry.compressedSize = stat.comp_size;
        }
        if ((stat.valid & ZIP_STAT_SIZE) != 0) {
            entry.uncompressedSize = stat.size;
        }
        entries_.push_back(std::move(entry));
    }
}

const std::vector<ZipEntry>& ZipArchive::entries() const {
    if (!isOpen()) {
        throw ArchiveError("Archive is not open", context());
    }
    return entries_;
}

std::vector<std::string> ZipArchive::listMembers() const {
    std::vector<std::string> names;
    names.reserve(entries().size());
    for (const auto& entry : entries_) {
        names.push_back(entry.name);
    }
    return names;
}

std::vector<ZipEntry> ZipArchive::referenceMembers(std::string_view suffix) const {
    std::vector<ZipEntry> members;
    for (const auto& entry : entries()) {
        if (isReferenceMember(entry.name, suffix)) {
            members.push_back(entry);
        }
    }
    return members;
}

const ZipEntry* ZipArchive::findEntry(std::string_view name) const {
    const auto& all = entries();
    auto it = std::find_if(all.begin(), all.end(),
                           [name](const ZipEntry& entry) { return entry.name == name; });
    return it != all.end() ? &*it : nullptr;
}

std::unique_ptr<std::istream> ZipArchive::openMember(const ZipEntry& entry) {
    if (!isOpen()) {
        throw ArchiveError("Archive is not open", context());
    }
    if (entry.isDirectory()) {
        throw ArchiveError("Member is a directory", context().withMember(entry.name));
    }
    if (entry.isEncrypted()) {
        throw ArchiveError("Encrypted members are not supported",
                           context().withMember(entry.name));
    }
    if (!isZipMethodSupported(entry.method)) {
        throw ArchiveError(fmt::format("Unsupported compression method {} ({})", entry.method,
                                       zipMethodName(entry.method)),
                           context().withMember(entry.name));
    }

    CHIPSCAN_LOG_TRACE("Opening member {} ({}, {} -> {} bytes)", entry.name,
                       zipMethodName(entry.method), entry.compressedSize, entry.uncompressedSize);
    return std::make_unique<ZipEntryInputStream>(handle_, archivePath_.string(), entry);
}

std::unique_ptr<std::istream> ZipArchive::openMember(std::string_view name) {
    const ZipEntry* entry = findEntry(name);
    if (entry == nullptr) {
        throw ArchiveError(fmt::format("No member named '{}'", name), context());
    }
    return openMember(*entry);
}

}  // namespace chipscan::io
