#pragma once

#include "sluice/core/errors.hpp"
#include "sluice/io/pipe.hpp"
#include "sluice/storage/destination.hpp"
#include "sluice/storage/hashing.hpp"

namespace sluice::upload {

using u64 = sluice::core::u64;

constexpr u64 kCopyChunkBytes = 32 * 1024;

// Move exactly n bytes from src into dst.
// - Never reads past n, so bytes beyond n stay with the writer
// - src ending early fails with ShortTransfer
// - Other src or dst failures are returned as reported
// - hasher, when given, sees every byte written to dst
// *copied holds the bytes written to dst on every return.
[[nodiscard]] sluice::core::Status copy_exactly(sluice::storage::Sink& dst,
                                                sluice::io::PipeReader& src,
                                                u64 n,
                                                u64* copied,
                                                sluice::storage::Hasher* hasher = nullptr) noexcept;

} // namespace sluice::upload
