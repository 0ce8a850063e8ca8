#include <gtest/gtest.h>
#include <prebuilt/digest/digest.hpp>

#include "../../support/temp_dir_scope.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;
using namespace prebuilt;
using namespace prebuilt::digest;

namespace {

constexpr const char* kAbcSha256 =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
constexpr const char* kEmptySha256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

ByteSpan as_bytes(std::string_view s) {
    return {reinterpret_cast<const std::byte*>(s.data()), s.size()};
}

std::string digest_of(std::string_view s) {
    auto sink = newDigestStream();
    EXPECT_TRUE(sink->update(as_bytes(s)));
    auto out = sink->finalize();
    EXPECT_TRUE(out.has_value());
    return out ? out.value() : std::string{};
}

} // namespace

TEST(DigestSink, KnownAnswerVectors) {
    EXPECT_EQ(digest_of("abc"), kAbcSha256);
    EXPECT_EQ(digest_of(""), kEmptySha256);
}

TEST(DigestSink, NoUpdatesHashesEmptyInput) {
    auto sink = newDigestStream();
    auto out = sink->finalize();
    ASSERT_TRUE(out) << out.error().message;
    EXPECT_EQ(out.value(), kEmptySha256);
}

TEST(DigestSink, ChunkingDoesNotChangeResult) {
    std::string payload;
    for (int i = 0; i < 10000; ++i)
        payload.push_back(static_cast<char>('a' + (i * 7) % 26));

    const auto whole = digest_of(payload);

    for (std::size_t chunk : {std::size_t{1}, std::size_t{3}, std::size_t{64}, std::size_t{4097}}) {
        auto sink = newDigestStream();
        std::string_view rest(payload);
        while (!rest.empty()) {
            auto n = std::min(chunk, rest.size());
            ASSERT_TRUE(sink->update(as_bytes(rest.substr(0, n))));
            ASSERT_TRUE(sink->update(ByteSpan{})); // empty chunks are no-ops
            rest.remove_prefix(n);
        }
        auto out = sink->finalize();
        ASSERT_TRUE(out);
        EXPECT_EQ(out.value(), whole) << "chunk size " << chunk;
    }
}

TEST(DigestSink, FinalizeIsTerminal) {
    auto sink = newDigestStream();
    ASSERT_TRUE(sink->update(as_bytes("abc")));
    EXPECT_FALSE(sink->finalized());
    ASSERT_TRUE(sink->finalize());
    EXPECT_TRUE(sink->finalized());

    auto again = sink->finalize();
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::DigestState);

    auto late = sink->update(as_bytes("more"));
    ASSERT_FALSE(late);
    EXPECT_EQ(late.error().code, ErrorCode::DigestState);
}

TEST(VerifyDigest, CaseInsensitiveExactMatch) {
    std::string upper(kAbcSha256);
    for (auto& c : upper)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    EXPECT_TRUE(verifyDigest(kAbcSha256, kAbcSha256));
    EXPECT_TRUE(verifyDigest(kAbcSha256, upper));
    EXPECT_TRUE(verifyDigest(upper, kAbcSha256));
}

TEST(VerifyDigest, RejectsPrefixesAndLengthMismatch) {
    std::string_view full(kAbcSha256);
    EXPECT_FALSE(verifyDigest(full, full.substr(0, 63)));
    EXPECT_FALSE(verifyDigest(full.substr(0, 8), full));
    EXPECT_FALSE(verifyDigest(full, std::string(full) + "0"));
    EXPECT_FALSE(verifyDigest(kAbcSha256, kEmptySha256));
    EXPECT_FALSE(verifyDigest("", ""));
}

TEST(VerifyDigest, IsSha256Hex) {
    EXPECT_TRUE(isSha256Hex(kAbcSha256));
    EXPECT_TRUE(isSha256Hex("BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"));
    EXPECT_FALSE(isSha256Hex(""));
    EXPECT_FALSE(isSha256Hex(std::string_view(kAbcSha256).substr(1)));
    EXPECT_FALSE(isSha256Hex("zz7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
}

TEST(DigestFile, StreamsExistingFile) {
    test_support::TempDirScope dir(test_support::TempDirScope::unique_path("prebuilt-digest"));
    auto file = dir.path() / "abc.bin";
    {
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out << "abc";
    }
    auto res = digestFile(file);
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_EQ(res.value(), kAbcSha256);
}

TEST(DigestFile, LargerThanOneBlock) {
    test_support::TempDirScope dir(test_support::TempDirScope::unique_path("prebuilt-digest"));
    std::string payload(3 * DEFAULT_BUFFER_SIZE + 17, 'x');
    auto file = dir.path() / "big.bin";
    {
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    }
    auto res = digestFile(file);
    ASSERT_TRUE(res);
    EXPECT_EQ(res.value(), digest_of(payload));
}

TEST(DigestFile, MissingFileIsFilesystemError) {
    test_support::TempDirScope dir(test_support::TempDirScope::unique_path("prebuilt-digest"));
    auto res = digestFile(dir.path() / "absent.bin");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::FilesystemError);
}
