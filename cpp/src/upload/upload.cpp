#include "sluice/upload/upload.hpp"

#include <new>
#include <system_error>
#include <thread>
#include <utility>

#include "sluice/storage/hashing.hpp"
#include "sluice/upload/copy.hpp"

namespace sluice::upload {

using namespace sluice::core;

namespace {

// Create, fill, verify and commit the object. Every failure after creation
// discards the object before returning.
Status transfer(sluice::storage::Destination& dest,
                const UploadRequest& request,
                sluice::io::PipeReader& reader) noexcept {
    Hash256 expected{};
    bool has_digest = false;
    Status s = validate_request(request, &expected, &has_digest);
    if (!is_ok(s)) {
        return s;
    }

    const u64 size = static_cast<u64>(request.size_bytes);

    std::unique_ptr<sluice::storage::Sink> sink;
    s = dest.create_exclusive(request.bucket, request.object, size, &sink);
    if (!is_ok(s)) {
        return s;
    }
    if (!sink) {
        return make_status(StatusDomain::Upload, StatusCode::Unknown);
    }

    sluice::storage::Hasher hasher;
    u64 copied = 0;
    s = copy_exactly(*sink, reader, size, &copied, has_digest ? &hasher : nullptr);
    if (!is_ok(s)) {
        sink->discard();
        return s;
    }

    if (has_digest) {
        Hash256 actual{};
        hasher.finalize(&actual);
        if (actual != expected) {
            sink->discard();
            return make_status(StatusDomain::Upload, StatusCode::Corrupt);
        }
    }

    s = sink->commit();
    if (!is_ok(s)) {
        sink->discard();
        return s;
    }
    return ok_status();
}

} // namespace

Status validate_request(const UploadRequest& request, Hash256* digest, bool* has_digest) noexcept {
    if (!digest || !has_digest) {
        return make_status(StatusDomain::Upload, StatusCode::Invalid);
    }
    *has_digest = false;

    if (request.bucket.empty() || request.object.empty()) {
        return make_status(StatusDomain::Upload, StatusCode::Invalid);
    }
    if (request.size_bytes < 0) {
        return make_status(StatusDomain::Upload, StatusCode::Invalid);
    }

    if (!request.digest_hex.empty()) {
        Status s = sluice::storage::hash_from_hex(request.digest_hex.c_str(), digest);
        if (!is_ok(s)) {
            return make_status(StatusDomain::Upload, StatusCode::Invalid);
        }
        *has_digest = true;
    }
    return ok_status();
}

void run_upload(sluice::storage::Destination& dest,
                const UploadRequest& request,
                sluice::io::PipeReader reader,
                BlockingWriter& writer) noexcept {
    const Status s = transfer(dest, request, reader);

    // On failure the pipe is closed first so a blocked write() returns the
    // error; on success release() comes first. Either way, once each.
    if (is_ok(s)) {
        writer.release(s);
        (void)reader.close();
    } else {
        (void)reader.close(s);
        writer.release(s);
    }
}

Status begin_upload(sluice::storage::Destination* dest,
                    UploadRequest request,
                    std::unique_ptr<BlockingWriter>* out) noexcept {
    if (!dest || !out) {
        return make_status(StatusDomain::Upload, StatusCode::Invalid);
    }

    sluice::io::PipeReader reader;
    sluice::io::PipeWriter pipe_writer;
    Status s = sluice::io::make_pipe(&reader, &pipe_writer);
    if (!is_ok(s)) {
        return s;
    }

    std::unique_ptr<BlockingWriter> writer;
    try {
        writer = std::make_unique<BlockingWriter>(std::move(pipe_writer));
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Upload, StatusCode::Unavailable);
    }

    try {
        BlockingWriter* handle = writer.get();
        std::thread worker([dest, request = std::move(request), reader = std::move(reader), handle]() mutable {
            run_upload(*dest, request, std::move(reader), *handle);
        });
        writer->adopt_worker(std::move(worker));
    } catch (const std::system_error& e) {
        return make_status(StatusDomain::Upload, StatusCode::Unavailable, static_cast<u32>(e.code().value()));
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Upload, StatusCode::Unavailable);
    }

    *out = std::move(writer);
    return ok_status();
}

Status begin_upload(sluice::storage::Destination* dest,
                    const std::string& bucket,
                    const std::string& object,
                    i64 size_bytes,
                    std::unique_ptr<BlockingWriter>* out) noexcept {
    UploadRequest request;
    try {
        request.bucket = bucket;
        request.object = object;
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Upload, StatusCode::Unavailable);
    }
    request.size_bytes = size_bytes;
    return begin_upload(dest, std::move(request), out);
}

} // namespace sluice::upload
