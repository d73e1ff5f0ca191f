#pragma once

#include <memory>
#include <string>

#include "sluice/core/errors.hpp"
#include "sluice/core/types.hpp"
#include "sluice/io/pipe.hpp"
#include "sluice/storage/destination.hpp"
#include "sluice/upload/blocking_writer.hpp"

namespace sluice::upload {

using i64 = sluice::core::i64;

// Parameters for one upload
struct UploadRequest {
    std::string bucket;         // Must be non-empty
    std::string object;         // Must be non-empty
    i64 size_bytes{0};          // Exact number of bytes the caller will write
    std::string digest_hex;     // Optional: BLAKE3 of the content, 64 hex digits
};

// ========================================================================
// Upload Lifecycle
// ========================================================================

// Start an upload into dest
// - Returns at once with a writer; a worker thread runs concurrently
// - Request problems are not reported here: they surface from the
//   writer's write() or close()
// - Fails only when dest or out is null, or the worker cannot be started
// - dest must outlive the returned writer
[[nodiscard]] sluice::core::Status begin_upload(sluice::storage::Destination* dest,
                                                UploadRequest request,
                                                std::unique_ptr<BlockingWriter>* out) noexcept;

[[nodiscard]] sluice::core::Status begin_upload(sluice::storage::Destination* dest,
                                                const std::string& bucket,
                                                const std::string& object,
                                                i64 size_bytes,
                                                std::unique_ptr<BlockingWriter>* out) noexcept;

// Worker body, run on the thread begin_upload() starts
// - Validates the request, creates the object, copies exactly
//   size_bytes from reader into it, verifies the digest, commits
// - Whatever happens, calls writer.release() once and closes reader once
// - An object that is not committed is discarded
void run_upload(sluice::storage::Destination& dest,
                const UploadRequest& request,
                sluice::io::PipeReader reader,
                BlockingWriter& writer) noexcept;

// Checks that need no destination access. On success *digest and
// *has_digest describe the optional content digest.
[[nodiscard]] sluice::core::Status validate_request(const UploadRequest& request,
                                                    sluice::core::Hash256* digest,
                                                    bool* has_digest) noexcept;

} // namespace sluice::upload
