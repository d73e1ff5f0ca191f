#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "sluice/storage/fs_destination.hpp"
#include "sluice/storage/hashing.hpp"
#include "sluice/upload/upload.hpp"
#include "memory_destination.hpp"
#include "test_dirs.hpp"

using namespace sluice::core;
using namespace sluice::upload;

namespace {

BufferView view_of(const std::string& s) {
    return BufferView{reinterpret_cast<const u8*>(s.data()), s.size()};
}

std::string blake3_hex(const std::string& data) {
    Hash256 h{};
    EXPECT_TRUE(is_ok(sluice::storage::hash_compute(view_of(data), &h)));
    char hex[65];
    EXPECT_TRUE(is_ok(sluice::storage::hash_to_hex(h, hex, sizeof(hex))));
    return hex;
}

// close() must come back well within this, on every path.
constexpr auto kCloseTimeout = std::chrono::seconds(10);

Status close_with_timeout(BlockingWriter& writer) {
    auto fut = std::async(std::launch::async, [&writer] { return writer.close(); });
    if (fut.wait_for(kCloseTimeout) != std::future_status::ready) {
        ADD_FAILURE() << "close() did not return";
        std::abort();
    }
    return fut.get();
}

} // namespace

// ============================================================================
// Filesystem-backed uploads
// ============================================================================

class UploadTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = scratch_.str();
        sluice::storage::FsDestinationConfig cfg{};
        cfg.root = root_.c_str();
        cfg.sync_on_commit = false;
        dest_ = std::make_unique<sluice::storage::FsDestination>(cfg);
    }

    std::filesystem::path object_path(const std::string& bucket, const std::string& object) const {
        return scratch_.path() / bucket / object;
    }

    ScratchDir scratch_;
    std::string root_;
    std::unique_ptr<sluice::storage::FsDestination> dest_;
};

TEST_F(UploadTest, HelloIsStoredVerbatim) {
    std::unique_ptr<BlockingWriter> w;
    ASSERT_TRUE(is_ok(begin_upload(dest_.get(), "b", "o.txt", 5, &w)));

    u64 n = 0;
    ASSERT_TRUE(is_ok(w->write(view_of("hello"), &n)));
    EXPECT_EQ(n, 5u);
    EXPECT_TRUE(is_ok(close_with_timeout(*w)));
    EXPECT_EQ(w->state(), WriterState::Released);
    EXPECT_EQ(w->bytes_written(), 5u);

    EXPECT_EQ(read_all(object_path("b", "o.txt")), "hello");
}

TEST_F(UploadTest, ManyWritesArriveInOrder) {
    std::string expected;
    for (int i = 0; i < 2000; ++i) {
        expected += std::to_string(i);
        expected.push_back(',');
    }

    std::unique_ptr<BlockingWriter> w;
    ASSERT_TRUE(is_ok(begin_upload(dest_.get(), "b", "dir/list.csv", static_cast<i64>(expected.size()), &w)));

    size_t off = 0;
    size_t step = 1;
    while (off < expected.size()) {
        const size_t len = std::min(step, expected.size() - off);
        u64 n = 0;
        ASSERT_TRUE(is_ok(w->write({reinterpret_cast<const u8*>(expected.data() + off), len}, &n)));
        ASSERT_EQ(n, len);
        off += len;
        step = step * 3 + 1;
    }
    ASSERT_TRUE(is_ok(close_with_timeout(*w)));

    EXPECT_EQ(read_all(object_path("b", "dir/list.csv")), expected);
}

TEST_F(UploadTest, EmptyObject) {
    std::unique_ptr<BlockingWriter> w;
    ASSERT_TRUE(is_ok(begin_upload(dest_.get(), "b", "empty", 0, &w)));
    EXPECT_TRUE(is_ok(close_with_timeout(*w)));
    ASSERT_TRUE(std::filesystem::exists(object_path("b", "empty")));
    EXPECT_EQ(std::filesystem::file_size(object_path("b", "empty")), 0u);
}

TEST_F(UploadTest, EmptyBucketIsInvalidWithoutDestination) {
    std::unique_ptr<BlockingWriter> w;
    ASSERT_TRUE(is_ok(begin_upload(dest_.get(), "", "o.txt", 5, &w)));

    const Status s = close_with_timeout(*w);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_TRUE(std::filesystem::is_empty(scratch_.path()));
}

TEST_F(UploadTest, EmptyObjectNameIsInvalid) {
    std::unique_ptr<BlockingWriter> w;
    ASSERT_TRUE(is_ok(begin_upload(dest_.get(), "b", "", 5, &w)));
    EXPECT_EQ(close_with_timeout(*w).code, StatusCode::Invalid);
    EXPECT_TRUE(std::filesystem::is_empty(scratch_.path()));
}

TEST_F(UploadTest, NegativeSizeIsInvalid) {
    std::unique_ptr<BlockingWriter> w;
    ASSERT_TRUE(is_ok(begin_upload(dest_.get(), "b", "o.txt", -1, &w)));
    EXPECT_EQ(close_with_timeout(*w).code, StatusCode::Invalid);
    EXPECT_FALSE(std::filesystem::exists(object_path("b", "o.txt")));
}

TEST_F(UploadTest, ValidationErrorSurfacesFromWrite) {
    std::unique_ptr<BlockingWriter> w;
    ASSERT_TRUE(is_ok(begin_upload(dest_.get(), "", "o.txt", 5, &w)));

    u64 n = 0;
    const Status ws = w->write(view_of("hello"), &n);
    EXPECT_EQ(ws.code, StatusCode::Invalid);
    EXPECT_EQ(n, 0u);
    EXPECT_EQ(close_with_timeout(*w).code, StatusCode::Invalid);
}

TEST_F(UploadTest, ExistingObjectIsExistsAndUnmodified) {
    write_all(object_path("b", "o.txt"), "keep me");

    std::unique_ptr<BlockingWriter> w;
    ASSERT_TRUE(is_ok(begin_upload(dest_.get(), "b", "o.txt", 5, &w)));

    u64 n = 0;
    (void)w->write(view_of("hello"), &n);
    const Status s = close_with_timeout(*w);
    EXPECT_EQ(s.code, StatusCode::Exists);
    EXPECT_EQ(read_all(object_path("b", "o.txt")), "keep me");
}

TEST_F(UploadTest, ShortWriteFailsAndLeavesNothing) {
    std::unique_ptr<BlockingWriter> w;
    ASSERT_TRUE(is_ok(begin_upload(dest_.get(), "b", "o.txt", 10, &w)));

    u64 n = 0;
    ASSERT_TRUE(is_ok(w->write(view_of("hello"), &n)));
    const Status s = close_with_timeout(*w);
    EXPECT_EQ(s.code, StatusCode::ShortTransfer);
    EXPECT_FALSE(std::filesystem::exists(object_path("b", "o.txt")));
}

TEST_F(UploadTest, ExtraBytesAreRefusedAfterDeclaredSize) {
    std::unique_ptr<BlockingWriter> w;
    ASSERT_TRUE(is_ok(begin_upload(dest_.get(), "b", "o.txt", 5, &w)));

    u64 n = 0;
    ASSERT_TRUE(is_ok(w->write(view_of("hello"), &n)));
    const Status extra = w->write(view_of("!"), &n);
    EXPECT_EQ(extra.code, StatusCode::Closed);
    EXPECT_EQ(n, 0u);

    EXPECT_TRUE(is_ok(close_with_timeout(*w)));
    EXPECT_EQ(read_all(object_path("b", "o.txt")), "hello");
}

TEST_F(UploadTest, InvalidPathShapeIsInvalid) {
    std::unique_ptr<BlockingWriter> w;
    ASSERT_TRUE(is_ok(begin_upload(dest_.get(), "b", "../escape", 1, &w)));
    EXPECT_EQ(close_with_timeout(*w).code, StatusCode::Invalid);
    EXPECT_FALSE(std::filesystem::exists(scratch_.path().parent_path() / "escape"));
}

TEST_F(UploadTest, MatchingDigestCommits) {
    UploadRequest req;
    req.bucket = "b";
    req.object = "d.txt";
    req.size_bytes = 11;
    req.digest_hex = blake3_hex("hello world");

    std::unique_ptr<BlockingWriter> w;
    ASSERT_TRUE(is_ok(begin_upload(dest_.get(), std::move(req), &w)));
    u64 n = 0;
    ASSERT_TRUE(is_ok(w->write(view_of("hello world"), &n)));
    EXPECT_TRUE(is_ok(close_with_timeout(*w)));
    EXPECT_EQ(read_all(object_path("b", "d.txt")), "hello world");
}

TEST_F(UploadTest, DigestMismatchIsCorruptAndDiscarded) {
    UploadRequest req;
    req.bucket = "b";
    req.object = "d.txt";
    req.size_bytes = 11;
    req.digest_hex = blake3_hex("hello WORLD");

    std::unique_ptr<BlockingWriter> w;
    ASSERT_TRUE(is_ok(begin_upload(dest_.get(), std::move(req), &w)));
    u64 n = 0;
    ASSERT_TRUE(is_ok(w->write(view_of("hello world"), &n)));
    EXPECT_EQ(close_with_timeout(*w).code, StatusCode::Corrupt);
    EXPECT_FALSE(std::filesystem::exists(object_path("b", "d.txt")));
}

TEST_F(UploadTest, MalformedDigestIsInvalid) {
    UploadRequest req;
    req.bucket = "b";
    req.object = "d.txt";
    req.size_bytes = 1;
    req.digest_hex = "abc";

    std::unique_ptr<BlockingWriter> w;
    ASSERT_TRUE(is_ok(begin_upload(dest_.get(), std::move(req), &w)));
    EXPECT_EQ(close_with_timeout(*w).code, StatusCode::Invalid);
    EXPECT_FALSE(std::filesystem::exists(object_path("b", "d.txt")));
}

TEST_F(UploadTest, AbandonedWriterLeavesNothing) {
    {
        std::unique_ptr<BlockingWriter> w;
        ASSERT_TRUE(is_ok(begin_upload(dest_.get(), "b", "o.txt", 10, &w)));
        u64 n = 0;
        ASSERT_TRUE(is_ok(w->write(view_of("half"), &n)));
    }
    EXPECT_FALSE(std::filesystem::exists(object_path("b", "o.txt")));
}

TEST_F(UploadTest, ConcurrentUploadsToSameIdentityOneWins) {
    std::unique_ptr<BlockingWriter> a;
    std::unique_ptr<BlockingWriter> b;
    ASSERT_TRUE(is_ok(begin_upload(dest_.get(), "b", "race", 1, &a)));
    ASSERT_TRUE(is_ok(begin_upload(dest_.get(), "b", "race", 1, &b)));

    auto feed = [](BlockingWriter* w, const char* c) {
        u64 n = 0;
        (void)w->write(view_of(c), &n);
        return w->close();
    };
    auto fa = std::async(std::launch::async, feed, a.get(), "A");
    auto fb = std::async(std::launch::async, feed, b.get(), "B");
    const Status sa = fa.get();
    const Status sb = fb.get();

    EXPECT_NE(is_ok(sa), is_ok(sb));
    const Status& loser = is_ok(sa) ? sb : sa;
    EXPECT_EQ(loser.code, StatusCode::Exists);
    EXPECT_EQ(read_all(object_path("b", "race")), is_ok(sa) ? "A" : "B");
}

TEST_F(UploadTest, NullArgumentsAreRejectedImmediately) {
    std::unique_ptr<BlockingWriter> w;
    EXPECT_EQ(begin_upload(nullptr, "b", "o", 1, &w).code, StatusCode::Invalid);
    EXPECT_EQ(begin_upload(dest_.get(), "b", "o", 1, nullptr).code, StatusCode::Invalid);
    EXPECT_EQ(w, nullptr);
}

// ============================================================================
// Failure injection
// ============================================================================

TEST(UploadFaults, CreateFailureIsReturned) {
    MemoryDestination dest;
    dest.faults.create = make_status(StatusDomain::Storage, StatusCode::Io, 13);

    std::unique_ptr<BlockingWriter> w;
    ASSERT_TRUE(is_ok(begin_upload(&dest, "b", "o", 3, &w)));
    const Status s = close_with_timeout(*w);
    EXPECT_EQ(s.code, StatusCode::Io);
    EXPECT_EQ(s.aux, 13u);
    EXPECT_EQ(dest.created(), 0);
}

TEST(UploadFaults, SinkWriteFailureUnblocksWriterAndDiscards) {
    MemoryDestination dest;
    dest.faults.fail_write_after = 4;

    std::unique_ptr<BlockingWriter> w;
    ASSERT_TRUE(is_ok(begin_upload(&dest, "b", "o", 1 << 20, &w)));

    const std::string chunk(256 * 1024, 'q');
    u64 n = 0;
    const Status ws = w->write(view_of(chunk), &n);
    EXPECT_EQ(ws.code, StatusCode::Io);
    EXPECT_LT(n, chunk.size());

    const Status s = close_with_timeout(*w);
    EXPECT_EQ(s.code, StatusCode::Io);
    EXPECT_EQ(s.aux, 28u);
    EXPECT_FALSE(dest.has("b/o"));
    EXPECT_FALSE(dest.has_partial("b/o"));
}

TEST(UploadFaults, CommitFailureIsReturnedAndDiscards) {
    MemoryDestination dest;
    dest.faults.commit = make_status(StatusDomain::Storage, StatusCode::Io, 5);

    std::unique_ptr<BlockingWriter> w;
    ASSERT_TRUE(is_ok(begin_upload(&dest, "b", "o", 3, &w)));
    u64 n = 0;
    ASSERT_TRUE(is_ok(w->write(view_of("abc"), &n)));
    const Status s = close_with_timeout(*w);
    EXPECT_EQ(s.code, StatusCode::Io);
    EXPECT_EQ(s.aux, 5u);
    EXPECT_FALSE(dest.has("b/o"));
    EXPECT_FALSE(dest.has_partial("b/o"));
}

TEST(UploadFaults, CloseReturnsOnlyAfterCommit) {
    MemoryDestination dest;

    std::unique_ptr<BlockingWriter> w;
    ASSERT_TRUE(is_ok(begin_upload(&dest, "b", "o", 3, &w)));
    u64 n = 0;
    ASSERT_TRUE(is_ok(w->write(view_of("xyz"), &n)));
    ASSERT_TRUE(is_ok(close_with_timeout(*w)));
    EXPECT_TRUE(dest.has("b/o"));
    EXPECT_EQ(dest.get("b/o"), "xyz");
}

// ============================================================================
// Request validation
// ============================================================================

TEST(UploadValidate, RulesInOrder) {
    Hash256 digest{};
    bool has_digest = true;

    UploadRequest req;
    req.bucket = "b";
    req.object = "o";
    req.size_bytes = 0;
    EXPECT_TRUE(is_ok(validate_request(req, &digest, &has_digest)));
    EXPECT_FALSE(has_digest);

    req.size_bytes = -5;
    EXPECT_EQ(validate_request(req, &digest, &has_digest).code, StatusCode::Invalid);

    req.size_bytes = 5;
    req.digest_hex = std::string(64, 'A');
    ASSERT_TRUE(is_ok(validate_request(req, &digest, &has_digest)));
    EXPECT_TRUE(has_digest);
    EXPECT_EQ(digest.b[0], 0xAA);

    req.digest_hex = std::string(63, 'a') + "g";
    EXPECT_EQ(validate_request(req, &digest, &has_digest).code, StatusCode::Invalid);

    req.digest_hex.clear();
    req.bucket.clear();
    EXPECT_EQ(validate_request(req, &digest, &has_digest).code, StatusCode::Invalid);
    EXPECT_EQ(validate_request(req, nullptr, &has_digest).code, StatusCode::Invalid);
}
