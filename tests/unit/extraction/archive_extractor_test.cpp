#include <gtest/gtest.h>
#include <prebuilt/extraction/archive_extractor.hpp>

#include "../../support/temp_dir_scope.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using namespace prebuilt;
using namespace prebuilt::extraction;
using prebuilt::test_support::TempDirScope;

namespace {

using Entries = std::vector<std::pair<std::string, std::string>>;

// Build a tar archive with libarchive's writer; gzip-compressed unless plain is set
void write_tar(const fs::path& out, const Entries& files, bool plain = false) {
    struct archive* a = archive_write_new();
    ASSERT_NE(a, nullptr);
    if (!plain)
        archive_write_add_filter_gzip(a);
    archive_write_set_format_pax_restricted(a);
    ASSERT_EQ(archive_write_open_filename(a, out.string().c_str()), ARCHIVE_OK);

    for (const auto& [name, data] : files) {
        struct archive_entry* e = archive_entry_new();
        archive_entry_set_pathname(e, name.c_str());
        archive_entry_set_size(e, static_cast<la_int64_t>(data.size()));
        archive_entry_set_filetype(e, AE_IFREG);
        archive_entry_set_perm(e, 0644);
        EXPECT_EQ(archive_write_header(a, e), ARCHIVE_OK);
        if (!data.empty())
            archive_write_data(a, data.data(), data.size());
        archive_entry_free(e);
    }
    archive_write_close(a);
    archive_write_free(a);
}

std::string read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

} // namespace

TEST(TarGzExtractor, ExtractsNestedEntries) {
    TempDirScope dir(TempDirScope::unique_path("prebuilt-extract"));
    auto archive = dir.path() / "prebuild.tar.gz";
    write_tar(archive, {{"build/Release/addon.node", "ELF..."}, {"build/LICENSE", "MIT"}});

    auto dest = dir.path() / "pkg";
    auto res = makeTarGzExtractor()->extract(archive, dest);
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(res.value().entries, 2u);
    EXPECT_TRUE(res.value().warnings.empty());
    EXPECT_EQ(read_file(dest / "build" / "Release" / "addon.node"), "ELF...");
    EXPECT_EQ(read_file(dest / "build" / "LICENSE"), "MIT");
}

TEST(TarGzExtractor, AcceptsUncompressedTar) {
    TempDirScope dir(TempDirScope::unique_path("prebuilt-extract"));
    auto archive = dir.path() / "plain.tar";
    write_tar(archive, {{"a.txt", "alpha"}}, true);

    auto res = makeTarGzExtractor()->extract(archive, dir.path() / "out");
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(read_file(dir.path() / "out" / "a.txt"), "alpha");
}

TEST(TarGzExtractor, OverwritesExistingFiles) {
    TempDirScope dir(TempDirScope::unique_path("prebuilt-extract"));
    auto dest = dir.path() / "pkg";
    fs::create_directories(dest);
    {
        std::ofstream old(dest / "addon.node", std::ios::trunc);
        old << "stale";
    }
    auto archive = dir.path() / "prebuild.tar.gz";
    write_tar(archive, {{"addon.node", "fresh"}});

    auto res = makeTarGzExtractor()->extract(archive, dest);
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(read_file(dest / "addon.node"), "fresh");
}

TEST(TarGzExtractor, SkipsEntriesEscapingDestination) {
    TempDirScope dir(TempDirScope::unique_path("prebuilt-extract"));
    auto archive = dir.path() / "evil.tar.gz";
    write_tar(archive, {{"../escaped.txt", "gotcha"}, {"ok.txt", "fine"}});

    auto dest = dir.path() / "pkg";
    auto res = makeTarGzExtractor()->extract(archive, dest);
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(res.value().entries, 1u);
    ASSERT_EQ(res.value().warnings.size(), 1u);
    EXPECT_NE(res.value().warnings[0].find("escaped.txt"), std::string::npos);
    EXPECT_FALSE(fs::exists(dir.path() / "escaped.txt"));
    EXPECT_EQ(read_file(dest / "ok.txt"), "fine");
}

TEST(TarGzExtractor, MissingArchiveIsExtractError) {
    TempDirScope dir(TempDirScope::unique_path("prebuilt-extract"));
    auto res = makeTarGzExtractor()->extract(dir.path() / "absent.tar.gz", dir.path() / "out");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::ExtractError);
}

TEST(TarGzExtractor, GarbageIsExtractError) {
    TempDirScope dir(TempDirScope::unique_path("prebuilt-extract"));
    auto archive = dir.path() / "garbage.tar.gz";
    {
        std::ofstream out(archive, std::ios::binary | std::ios::trunc);
        out << "this is not an archive, just some text that libarchive cannot bid on";
    }
    auto res = makeTarGzExtractor()->extract(archive, dir.path() / "out");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::ExtractError);
}
