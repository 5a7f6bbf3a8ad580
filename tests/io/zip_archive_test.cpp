// =============================================================================
// chipscan - ZIP Archive Reader Tests
// =============================================================================
// Archives are produced by ZipFixtureWriter through libzip's writer, then read
// back through ZipArchive.
// =============================================================================

#include "chipscan/io/zip_archive.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "support/zip_fixture.h"

namespace chipscan::io::test {

using chipscan::test::FixtureMember;
using chipscan::test::FixtureMethod;
using chipscan::test::TempDir;
using chipscan::test::ZipFixtureWriter;

namespace {

/// @brief Read a whole member stream.
[[nodiscard]] std::string slurp(std::istream& stream) {
    return std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
}

/// @brief Read a member line by line, as the scorer does.
[[nodiscard]] std::vector<std::string> readLines(std::istream& stream) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

/// @brief Content large enough to span several decoder buffers.
[[nodiscard]] std::string largeStrandContent(std::size_t records) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < records; ++i) {
        oss << "rs" << i << "\t" << (i % 22) + 1 << "\t" << i * 37 << "\t100\t+\tAG\n";
    }
    return oss.str();
}

}  // namespace

// =============================================================================
// Member Filter Tests
// =============================================================================

TEST(ZipArchiveTest, ReferenceMemberFilter) {
    EXPECT_TRUE(isReferenceMember("GSA-24v1-0_A1-b37.strand"));
    EXPECT_TRUE(isReferenceMember("nested/dir/chip-b38.strand"));
    EXPECT_FALSE(isReferenceMember("chip-b37.strand.txt"));
    EXPECT_FALSE(isReferenceMember("README"));
    EXPECT_FALSE(isReferenceMember("strands/"));
    EXPECT_FALSE(isReferenceMember(".strand"));
    EXPECT_FALSE(isReferenceMember("__MACOSX/._chip-b37.strand"));
    EXPECT_FALSE(isReferenceMember("dir/._chip-b37.strand"));
    EXPECT_TRUE(isReferenceMember("chip.miss", ".miss"));
}

TEST(ZipArchiveTest, EntryBaseName) {
    ZipEntry entry;
    entry.name = "a/b/chip-b37.strand";
    EXPECT_EQ(entry.baseName(), "chip-b37.strand");
    entry.name = "chip.strand";
    EXPECT_EQ(entry.baseName(), "chip.strand");
}

TEST(ZipArchiveTest, MethodNames) {
    EXPECT_TRUE(isZipMethodSupported(0));
    EXPECT_TRUE(isZipMethodSupported(8));
    EXPECT_TRUE(isZipMethodSupported(12));
    EXPECT_TRUE(isZipMethodSupported(14));
    EXPECT_FALSE(isZipMethodSupported(99));
    EXPECT_EQ(zipMethodName(12), "bzip2");
    EXPECT_EQ(zipMethodName(99), "unknown");
}

// =============================================================================
// Directory Tests
// =============================================================================

TEST(ZipArchiveTest, ListsMembersInDirectoryOrder) {
    TempDir dir;
    auto path = dir.writeZip("chips.zip", ZipFixtureWriter()
                                              .add("b-b37.strand", "rs1\t1\t1\t100\t+\tAG\n")
                                              .addDirectory("docs/")
                                              .add("docs/readme.txt", "hello")
                                              .add("a-b38.strand", "rs2\t1\t2\t100\t+\tAG\n"));

    ZipArchive archive(path);
    archive.open();
    ASSERT_TRUE(archive.isOpen());

    auto names = archive.listMembers();
    ASSERT_EQ(names.size(), 4u);
    EXPECT_EQ(names[0], "b-b37.strand");
    EXPECT_EQ(names[1], "docs/");
    EXPECT_EQ(names[3], "a-b38.strand");

    auto refs = archive.referenceMembers();
    ASSERT_EQ(refs.size(), 2u);
    EXPECT_EQ(refs[0].name, "b-b37.strand");
    EXPECT_EQ(refs[1].name, "a-b38.strand");

    EXPECT_TRUE(archive.entries()[1].isDirectory());
    EXPECT_NE(archive.findEntry("docs/readme.txt"), nullptr);
    EXPECT_EQ(archive.findEntry("missing"), nullptr);
}

TEST(ZipArchiveTest, EmptyArchive) {
    TempDir dir;
    auto path = dir.writeZip("empty.zip", ZipFixtureWriter());

    ZipArchive archive(path);
    archive.open();
    EXPECT_TRUE(archive.entries().empty());
    EXPECT_TRUE(archive.referenceMembers().empty());
}

TEST(ZipArchiveTest, EntryMetadataFromMemberTable) {
    TempDir dir;
    const std::string content = largeStrandContent(500);
    auto path = dir.writeZip("meta.zip", ZipFixtureWriter()
                                             .add("one.strand", content, FixtureMethod::kBzip2)
                                             .add("two.strand", "rs1\t1\t1\t100\t+\tAG\n",
                                                  FixtureMethod::kStored));

    ZipArchive archive(path);
    archive.open();
    ASSERT_EQ(archive.entries().size(), 2u);

    const auto& first = archive.entries()[0];
    EXPECT_EQ(first.index, 0u);
    EXPECT_EQ(first.method, ZIP_CM_BZIP2);
    EXPECT_EQ(first.uncompressedSize, content.size());
    EXPECT_FALSE(first.isEncrypted());

    const auto& second = archive.entries()[1];
    EXPECT_EQ(second.index, 1u);
    EXPECT_EQ(second.method, ZIP_CM_STORE);
    EXPECT_EQ(second.compressedSize, second.uncompressedSize);
}

TEST(ZipArchiveTest, NotAZipIsArchiveError) {
    TempDir dir;
    auto path = dir.writeFile("fake.zip", "this is definitely not a zip archive at all");
    ZipArchive archive(path);
    EXPECT_THROW(archive.open(), ArchiveError);
    EXPECT_FALSE(archive.isOpen());
}

TEST(ZipArchiveTest, TruncatedArchiveIsArchiveError) {
    TempDir dir;
    (void)dir.writeZip("whole.zip", ZipFixtureWriter().add("chip.strand", largeStrandContent(50)));
    auto bytes = dir.readFile("whole.zip");
    auto path = dir.writeFile("cut.zip", std::string_view(bytes).substr(0, bytes.size() / 2));
    ZipArchive archive(path);
    EXPECT_THROW(archive.open(), ArchiveError);
}

TEST(ZipArchiveTest, MissingFileIsArchiveError) {
    TempDir dir;
    ZipArchive archive(dir.path() / "absent.zip");
    EXPECT_THROW(archive.open(), ArchiveError);
}

TEST(ZipArchiveTest, EntriesRequireOpenArchive) {
    TempDir dir;
    ZipArchive archive(dir.path() / "absent.zip");
    EXPECT_THROW((void)archive.entries(), ArchiveError);
}

// =============================================================================
// Member Stream Tests
// =============================================================================

class ZipMethodTest : public ::testing::TestWithParam<FixtureMethod> {};

TEST_P(ZipMethodTest, StreamsMemberContent) {
    TempDir dir;
    const std::string content = largeStrandContent(5000);
    auto path = dir.writeZip("m.zip", ZipFixtureWriter().add("chip.strand", content, GetParam()));

    ZipArchive archive(path);
    archive.open();
    auto stream = archive.openMember("chip.strand");
    auto lines = readLines(*stream);

    ASSERT_EQ(lines.size(), 5000u);
    EXPECT_EQ(lines.front(), "rs0\t1\t0\t100\t+\tAG");
    EXPECT_EQ(lines.back(), "rs4999\t6\t184963\t100\t+\tAG");
    EXPECT_FALSE(stream->bad());
}

TEST_P(ZipMethodTest, EmptyMember) {
    TempDir dir;
    auto path = dir.writeZip("m.zip", ZipFixtureWriter().add("empty.strand", "", GetParam()));

    ZipArchive archive(path);
    archive.open();
    auto stream = archive.openMember("empty.strand");
    EXPECT_EQ(slurp(*stream), "");
}

TEST_P(ZipMethodTest, DamagedPayloadRaisedFromStream) {
    TempDir dir;
    FixtureMember member;
    member.name = "bad.strand";
    member.content = largeStrandContent(100);
    member.method = GetParam();
    member.corruptPayload = true;
    auto path = dir.writeZip("m.zip", ZipFixtureWriter().addMember(member));

    ZipArchive archive(path);
    archive.open();
    EXPECT_THROW(
        {
            auto stream = archive.openMember("bad.strand");
            (void)readLines(*stream);
        },
        ArchiveError);
}

INSTANTIATE_TEST_SUITE_P(AllMethods, ZipMethodTest,
                         ::testing::Values(FixtureMethod::kStored, FixtureMethod::kDeflate,
                                           FixtureMethod::kBzip2, FixtureMethod::kLzma));

TEST(ZipArchiveTest, StoredMemberWithDamagedDataFailsCrcCheck) {
    TempDir dir;
    FixtureMember member;
    member.name = "cut.strand";
    member.content = largeStrandContent(2000);
    member.method = FixtureMethod::kStored;
    member.corruptPayload = true;
    auto path = dir.writeZip("m.zip", ZipFixtureWriter()
                                          .add("ok.strand", "rs1\t1\t1\t100\t+\tAG\n")
                                          .addMember(member));

    ZipArchive archive(path);
    archive.open();
    EXPECT_EQ(slurp(*archive.openMember("ok.strand")), "rs1\t1\t1\t100\t+\tAG\n");

    auto stream = archive.openMember("cut.strand");
    try {
        (void)readLines(*stream);
        FAIL() << "damaged member read to the end";
    } catch (const ArchiveError& e) {
        ASSERT_TRUE(e.context().has_value());
        EXPECT_EQ(e.context()->memberName, "cut.strand");
        EXPECT_EQ(e.context()->filePath, path.string());
    }
}

TEST(ZipArchiveTest, EncryptedMemberIsRejected) {
    TempDir dir;
    FixtureMember member;
    member.name = "secret.strand";
    member.content = "rs1\t1\t1\t100\t+\tAG\n";
    member.encrypted = true;
    auto path = dir.writeZip("m.zip", ZipFixtureWriter().addMember(member));

    ZipArchive archive(path);
    archive.open();
    EXPECT_THROW((void)archive.openMember("secret.strand"), ArchiveError);
}

TEST(ZipArchiveTest, OpenMissingMemberIsArchiveError) {
    TempDir dir;
    auto path = dir.writeZip("m.zip", ZipFixtureWriter().add("a.strand", "x\n"));
    ZipArchive archive(path);
    archive.open();
    EXPECT_THROW((void)archive.openMember("b.strand"), ArchiveError);
}

TEST(ZipArchiveTest, MembersStreamIndependently) {
    TempDir dir;
    auto path = dir.writeZip("m.zip", ZipFixtureWriter()
                                          .add("a.strand", "a1\na2\na3\n", FixtureMethod::kBzip2)
                                          .add("b.strand", "b1\nb2\n", FixtureMethod::kLzma));
    ZipArchive archive(path);
    archive.open();
    auto a = archive.openMember("a.strand");
    auto b = archive.openMember("b.strand");

    std::string line;
    ASSERT_TRUE(std::getline(*a, line));
    EXPECT_EQ(line, "a1");
    ASSERT_TRUE(std::getline(*b, line));
    EXPECT_EQ(line, "b1");
    ASSERT_TRUE(std::getline(*a, line));
    EXPECT_EQ(line, "a2");
    EXPECT_EQ(slurp(*b), "b2\n");
}

TEST(ZipArchiveTest, MemberStreamOutlivesArchive) {
    TempDir dir;
    auto path = dir.writeZip("m.zip", ZipFixtureWriter().add("a.strand", "a1\na2\n"));

    std::unique_ptr<std::istream> stream;
    {
        ZipArchive archive(path);
        archive.open();
        stream = archive.openMember("a.strand");
    }
    EXPECT_EQ(slurp(*stream), "a1\na2\n");
}

TEST(ZipArchiveTest, ErrorsRecordTheirThrowSite) {
    TempDir dir;
    auto path = dir.writeZip("m.zip", ZipFixtureWriter().add("a.strand", "x\n"));
    ZipArchive archive(path);

    std::optional<ErrorContext> notOpen;
    try {
        (void)archive.entries();
    } catch (const ArchiveError& e) {
        notOpen = e.context();
    }

    archive.open();
    std::optional<ErrorContext> noMember;
    try {
        (void)archive.openMember("b.strand");
    } catch (const ArchiveError& e) {
        noMember = e.context();
    }

    ASSERT_TRUE(notOpen.has_value());
    ASSERT_TRUE(noMember.has_value());
    EXPECT_NE(notOpen->location.line(), noMember->location.line());
    EXPECT_TRUE(std::string_view(noMember->location.file_name()).ends_with("zip_archive.cpp"));
    EXPECT_NE(std::string_view(noMember->location.function_name()).find("openMember"),
              std::string_view::npos);
}

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(ZipArchiveProperty, AnyContentSurvivesEveryMethod, ()) {
    const auto length = *rc::gen::inRange<std::size_t>(0, 20000);
    const auto content = *rc::gen::container<std::string>(
        length, rc::gen::element('A', 'C', 'G', 'T', '\t', '\n', '+', '1'));
    const auto method = *rc::gen::element(FixtureMethod::kStored, FixtureMethod::kDeflate,
                                          FixtureMethod::kBzip2, FixtureMethod::kLzma);

    TempDir dir;
    auto path = dir.writeZip("p.zip", ZipFixtureWriter().add("p.strand", content, method));

    ZipArchive archive(path);
    archive.open();
    auto stream = archive.openMember("p.strand");
    RC_ASSERT(slurp(*stream) == content);
}

}  // namespace chipscan::io::test
