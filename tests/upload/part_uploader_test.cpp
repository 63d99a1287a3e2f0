#include "mpu/upload/part_uploader.hpp"

#include "fault_injecting_store.hpp"
#include "temp_files.hpp"

#include "mpu/store/memory_store.hpp"
#include "mpu/upload/chunker.hpp"
#include "mpu/upload/session.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <optional>

using mpu::ErrorKind;
using mpu::StoreError;
using mpu::store::InMemoryObjectStore;
using mpu::test_support::FaultInjectingStore;
using mpu::upload::Chunker;
using mpu::upload::Hasher;
using mpu::upload::PartState;
using mpu::upload::PartUploader;
using mpu::upload::SourceFile;
using mpu::upload::UploadSession;
using namespace mpu::test_support;

namespace {

InMemoryObjectStore::Options small_parts() {
    InMemoryObjectStore::Options options;
    options.limits.min_part_size = 1024;
    options.limits.max_part_size = 64 * 1024;
    return options;
}

struct Fixture {
    explicit Fixture(std::size_t size)
        : inner(small_parts()), faults(inner), content(make_content(size, 7)) {
        inner.create_bucket("bucket");
        path = write_file(dir / "source.bin", content);

        auto plan = Chunker::plan(size, inner.limits());
        session = std::make_unique<UploadSession>("bucket", "key", plan.value());
        auto id = inner.initiate("bucket", "key", {});
        EXPECT_TRUE(id.is_ok());
        if (id.is_ok()) {
            EXPECT_TRUE(session->begin(id.value()).is_ok());
        }
    }

    InMemoryObjectStore inner;
    FaultInjectingStore faults;
    std::vector<std::uint8_t> content;
    TempDir dir{"mpu_part_uploader_test_"};
    std::filesystem::path path;
    std::unique_ptr<UploadSession> session;
};

} // namespace

TEST(PartUploaderTest, VerifiesPartAgainstStoreAck) {
    Fixture fx(3000);
    auto source = SourceFile::open(fx.path);
    ASSERT_TRUE(source.is_ok());

    const PartUploader uploader(fx.faults, source.value(), Hasher{});
    const auto& spec = fx.session->plan().parts[1];
    auto& slot = fx.session->part_slot(spec.index);

    auto result = uploader.upload(*fx.session, spec, slot);
    ASSERT_TRUE(result.is_ok());

    EXPECT_EQ(slot.state, PartState::Verified);
    EXPECT_EQ(slot.attempts, 1u);
    EXPECT_EQ(slot.size_bytes, spec.byte_length);
    EXPECT_FALSE(slot.etag.empty());
    ASSERT_TRUE(slot.remote_digest.has_value());
    EXPECT_EQ(*slot.remote_digest, slot.local_digest);

    const std::vector<std::uint8_t> expected(fx.content.begin() + spec.byte_offset,
                                             fx.content.begin() + spec.byte_offset + spec.byte_length);
    EXPECT_EQ(slot.local_digest, Hasher{}.digest(expected));
}

TEST(PartUploaderTest, ReportedDigestMismatchIsPartIntegrity) {
    Fixture fx(3000);
    fx.faults.corrupt_part_digest = 2;
    auto source = SourceFile::open(fx.path);
    ASSERT_TRUE(source.is_ok());

    const PartUploader uploader(fx.faults, source.value(), Hasher{});
    const auto& spec = fx.session->plan().parts[1];
    auto& slot = fx.session->part_slot(spec.index);

    auto result = uploader.upload(*fx.session, spec, slot);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::PartIntegrity);
    EXPECT_EQ(result.error().part_index, std::optional<std::uint32_t>(2));
    EXPECT_EQ(result.error().expected, slot.local_digest.hex());
    EXPECT_NE(result.error().observed, result.error().expected);
    EXPECT_TRUE(result.error().retryable);
    EXPECT_EQ(slot.state, PartState::Failed);
    ASSERT_TRUE(slot.last_error.has_value());
}

TEST(PartUploaderTest, ReportedSizeMismatchIsPartIntegrity) {
    Fixture fx(3000);
    fx.faults.short_ack_part = 1;
    auto source = SourceFile::open(fx.path);
    ASSERT_TRUE(source.is_ok());

    const PartUploader uploader(fx.faults, source.value(), Hasher{});
    const auto& spec = fx.session->plan().parts[0];

    auto result = uploader.upload(*fx.session, spec, fx.session->part_slot(spec.index));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::PartIntegrity);
    EXPECT_EQ(result.error().expected, std::to_string(spec.byte_length));
    EXPECT_EQ(result.error().observed, std::to_string(spec.byte_length - 1));
}

TEST(PartUploaderTest, StoreErrorKeepsRetryability) {
    Fixture fx(3000);
    fx.faults.throttle_part = 3;
    fx.faults.throttle_count = 1;
    auto source = SourceFile::open(fx.path);
    ASSERT_TRUE(source.is_ok());

    const PartUploader uploader(fx.faults, source.value(), Hasher{});
    const auto& spec = fx.session->plan().parts[2];
    auto& slot = fx.session->part_slot(spec.index);

    auto first = uploader.upload(*fx.session, spec, slot);
    ASSERT_TRUE(first.is_error());
    EXPECT_EQ(first.error().kind, ErrorKind::Store);
    EXPECT_TRUE(first.error().retryable);
    ASSERT_TRUE(first.error().store_error.has_value());
    EXPECT_EQ(first.error().store_error->code, StoreError::Code::Throttled);

    auto second = uploader.upload(*fx.session, spec, slot);
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(slot.attempts, 2u);
    EXPECT_EQ(slot.state, PartState::Verified);
    EXPECT_FALSE(slot.last_error.has_value());
}
