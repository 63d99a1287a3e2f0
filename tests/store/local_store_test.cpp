#include "mpu/store/local_store.hpp"

#include "mpu/events/event_bus.hpp"
#include "mpu/upload/coordinator.hpp"

#include "temp_files.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using mpu::StoreError;
using mpu::store::CompletedPart;
using mpu::store::LocalObjectStore;
using mpu::upload::Digest;
using mpu::upload::Hasher;
using mpu::upload::PartLimits;
using mpu::test_support::TempDir;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

std::vector<std::uint8_t> bytes_of(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

PartLimits tiny_limits() {
    PartLimits limits;
    limits.min_part_size = 4;
    limits.max_part_size = 1024;
    return limits;
}

} // namespace

TEST(LocalObjectStoreTest, StagesPartsAndAssemblesObject) {
    const TempDir temp("mpu_local_store_test_");
    const fs::path& root = temp.path();
    LocalObjectStore store(root, mpu::upload::DigestAlgorithm::Md5, tiny_limits());
    ASSERT_TRUE(store.create_bucket("bucket").is_ok());

    auto id = store.initiate("bucket", "nested/dir/object.txt", {{"md5", "digest-value"}});
    ASSERT_TRUE(id.is_ok());

    auto p2 = store.upload_part(id.value(), 2, bytes_of("sit amet"), Digest{});
    auto p1 = store.upload_part(id.value(), 1, bytes_of("lorem ipsum dolor "), Digest{});
    ASSERT_TRUE(p1.is_ok());
    ASSERT_TRUE(p2.is_ok());
    EXPECT_TRUE(fs::exists(root / ".uploads" / id.value() / "part-00001"));
    EXPECT_TRUE(fs::exists(root / ".uploads" / id.value() / "part-00002"));

    auto completed = store.complete(id.value(), {CompletedPart{1, p1.value().etag},
                                                 CompletedPart{2, p2.value().etag}});
    ASSERT_TRUE(completed.is_ok());
    EXPECT_EQ(completed.value().total_size, 26u);

    const fs::path object = root / "bucket" / "nested" / "dir" / "object.txt";
    EXPECT_EQ(store.object_path("bucket", "nested/dir/object.txt"), object);
    EXPECT_EQ(read_file(object), "lorem ipsum dolor sit amet");
    EXPECT_FALSE(fs::exists(root / ".uploads" / id.value()));

    auto head = store.head("bucket", "nested/dir/object.txt");
    ASSERT_TRUE(head.is_ok());
    EXPECT_EQ(head.value().size, 26u);
    EXPECT_EQ(head.value().etag, completed.value().etag);
    EXPECT_EQ(head.value().metadata.at("md5"), "digest-value");
}

TEST(LocalObjectStoreTest, AbortRemovesStagedParts) {
    const TempDir temp("mpu_local_store_test_");
    const fs::path& root = temp.path();
    LocalObjectStore store(root, mpu::upload::DigestAlgorithm::Md5, tiny_limits());
    ASSERT_TRUE(store.create_bucket("bucket").is_ok());

    auto id = store.initiate("bucket", "key", {});
    ASSERT_TRUE(id.is_ok());
    ASSERT_TRUE(store.upload_part(id.value(), 1, bytes_of("abcdef"), Digest{}).is_ok());

    ASSERT_TRUE(store.abort(id.value()).is_ok());
    EXPECT_FALSE(fs::exists(root / ".uploads" / id.value()));
    EXPECT_FALSE(fs::exists(root / "bucket" / "key"));

    auto again = store.abort(id.value());
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().code, StoreError::Code::NoSuchUpload);
}

TEST(LocalObjectStoreTest, RejectsBadDigestAndUnsafeKeys) {
    const TempDir temp("mpu_local_store_test_");
    const fs::path& root = temp.path();
    LocalObjectStore store(root, mpu::upload::DigestAlgorithm::Md5, tiny_limits());
    ASSERT_TRUE(store.create_bucket("bucket").is_ok());

    auto escape = store.initiate("bucket", "../outside", {});
    ASSERT_TRUE(escape.is_error());
    EXPECT_EQ(escape.error().code, StoreError::Code::InvalidRequest);

    auto missing = store.initiate("nobucket", "key", {});
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, StoreError::Code::NoSuchBucket);

    auto id = store.initiate("bucket", "key", {});
    ASSERT_TRUE(id.is_ok());
    auto bad = store.upload_part(id.value(), 1, bytes_of("abcdef"), Hasher{}.digest(std::string("other")));
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().code, StoreError::Code::BadDigest);

    const Hasher sha256(mpu::upload::DigestAlgorithm::Sha256);
    auto bad_sha = store.upload_part(id.value(), 1, bytes_of("abcdef"), sha256.digest(std::string("other")));
    ASSERT_TRUE(bad_sha.is_error());
    EXPECT_EQ(bad_sha.error().code, StoreError::Code::BadDigest);
    EXPECT_TRUE(store.upload_part(id.value(), 1, bytes_of("abcdef"), sha256.digest(std::string("abcdef"))).is_ok());
}

TEST(LocalObjectStoreTest, HeadOfMissingObjectIsNoSuchKey) {
    const TempDir temp("mpu_local_store_test_");
    const fs::path& root = temp.path();
    LocalObjectStore store(root);
    ASSERT_TRUE(store.create_bucket("bucket").is_ok());

    auto head = store.head("bucket", "absent");
    ASSERT_TRUE(head.is_error());
    EXPECT_EQ(head.error().code, StoreError::Code::NoSuchKey);
}

TEST(LocalObjectStoreTest, CoordinatorUploadsIntoDirectoryTree) {
    const TempDir temp("mpu_local_store_test_");
    const fs::path& root = temp.path();
    const fs::path source = root / "source.bin";
    std::string content;
    for (int i = 0; i < 500; ++i) {
        content += "line " + std::to_string(i) + "\n";
    }
    {
        std::ofstream out(source, std::ios::binary);
        out << content;
    }

    PartLimits limits;
    limits.min_part_size = 512;
    limits.max_part_size = 4096;
    LocalObjectStore store(root / "store", mpu::upload::DigestAlgorithm::Md5, limits);
    ASSERT_TRUE(store.create_bucket("bucket").is_ok());

    mpu::events::EventBus bus;
    mpu::upload::CoordinatorOptions options;
    options.concurrency = 3;
    options.retry.initial_backoff = std::chrono::milliseconds{0};
    mpu::upload::UploadCoordinator coordinator(store, bus, options);

    auto result = coordinator.upload(source, "bucket", "copy.bin");
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(result.value().total_size_bytes, content.size());
    EXPECT_EQ(read_file(root / "store" / "bucket" / "copy.bin"), content);
}
