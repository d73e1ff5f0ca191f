#pragma once

#include <cstdio>

#include "sluice/cli/options.hpp"
#include "sluice/core/errors.hpp"
#include "sluice/core/types.hpp"

namespace sluice::cli {
    using u64 = sluice::core::u64;

    constexpr u64 kPutWriteBytes = 64 * 1024;

    // Stream in into opts.bucket/opts.object under opts.root, in
    // kPutWriteBytes writes, declaring opts.size_bytes up front.
    // *bytes_written counts what the upload handle accepted.
    // A read failure on in returns Cli/Io and abandons the upload.
    [[nodiscard]] sluice::core::Status put_stream(const PutOptions& opts,
                                                  std::FILE* in,
                                                  u64* bytes_written) noexcept;

} // namespace sluice::cli
