#include "mpu/upload/hasher.hpp"

#include "temp_files.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using mpu::upload::Digest;
using mpu::upload::DigestAlgorithm;
using mpu::upload::Hasher;
using mpu::upload::StreamingDigest;

namespace {

const std::string kSample = "+ELokXtvOjByfb92hqVRE74SOaA0B2AS3iwtPkjv74HTY76sqt";

} // namespace

TEST(HasherTest, Md5MatchesKnownBase64) {
    Hasher hasher(DigestAlgorithm::Md5);
    const Digest digest = hasher.digest(kSample);

    EXPECT_EQ(digest.algorithm, DigestAlgorithm::Md5);
    EXPECT_EQ(digest.bytes.size(), 16u);
    EXPECT_EQ(digest.base64(), "CoM0C8BkxBNJJJyzEO+PYw==");
}

TEST(HasherTest, Sha256MatchesKnownBase64) {
    Hasher hasher(DigestAlgorithm::Sha256);
    const Digest digest = hasher.digest(kSample);

    EXPECT_EQ(digest.bytes.size(), 32u);
    EXPECT_EQ(digest.base64(), "2GMyryXzElFw2g5yZxpPEU8dgoIRv9FNHoZeTSKU67s=");
}

TEST(HasherTest, EmptyInputHex) {
    Hasher hasher;
    EXPECT_EQ(hasher.digest(std::string()).hex(), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST(HasherTest, StreamingMatchesOneShot) {
    StreamingDigest streaming(DigestAlgorithm::Sha256);
    const auto* bytes = reinterpret_cast<const std::uint8_t*>(kSample.data());
    streaming.update(bytes, 7);
    streaming.update(bytes + 7, kSample.size() - 7);

    Hasher hasher(DigestAlgorithm::Sha256);
    EXPECT_EQ(streaming.finish(), hasher.digest(kSample));
}

TEST(HasherTest, CombinedDigestHashesConcatenatedPartDigests) {
    Hasher hasher;
    const Digest first = hasher.digest(std::string("abc"));
    const Digest second = hasher.digest(std::string("def"));

    EXPECT_EQ(first.hex(), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(hasher.combined_digest({first, second}).hex(), "4c8e93283780e078db9e0c6b9b3f8043");
}

TEST(HasherTest, CombinedDigestDependsOnOrder) {
    Hasher hasher;
    const Digest first = hasher.digest(std::string("abc"));
    const Digest second = hasher.digest(std::string("def"));

    EXPECT_NE(hasher.combined_digest({first, second}), hasher.combined_digest({second, first}));
}

TEST(HasherTest, MultipartEtagFormat) {
    Hasher hasher;
    const Digest combined = hasher.combined_digest({hasher.digest(std::string("abc")),
                                                    hasher.digest(std::string("def"))});
    EXPECT_EQ(Hasher::multipart_etag(combined, 2), "4c8e93283780e078db9e0c6b9b3f8043-2");
}

TEST(HasherTest, HexAndBase64RoundTripThroughParsers) {
    Hasher hasher;
    const Digest digest = hasher.digest(kSample);

    auto from_hex = Digest::from_hex(DigestAlgorithm::Md5, digest.hex());
    ASSERT_TRUE(from_hex.has_value());
    EXPECT_EQ(*from_hex, digest);

    auto from_base64 = Digest::from_base64(DigestAlgorithm::Md5, "CoM0C8BkxBNJJJyzEO+PYw==");
    ASSERT_TRUE(from_base64.has_value());
    EXPECT_EQ(*from_base64, digest);

    EXPECT_FALSE(Digest::from_hex(DigestAlgorithm::Md5, "not-hex").has_value());
}

TEST(HasherTest, FileDigestMatchesInMemoryDigest) {
    const mpu::test_support::TempDir dir("mpu_hasher_test_");
    const auto content = mpu::test_support::make_content(200 * 1024 + 13);
    const auto path = mpu::test_support::write_file(dir / "payload.bin", content);

    Hasher hasher(DigestAlgorithm::Sha256);
    auto result = hasher.file_digest(path);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), hasher.digest(content));
}

TEST(HasherTest, FileDigestOfMissingFileIsIoError) {
    Hasher hasher;
    auto result = hasher.file_digest("/nonexistent/mpu/file.bin");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, mpu::ErrorKind::Io);
}

TEST(HasherTest, UnknownAlgorithmThrows) {
    EXPECT_THROW(StreamingDigest(static_cast<DigestAlgorithm>(99)), std::runtime_error);
}
