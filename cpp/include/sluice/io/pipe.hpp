#pragma once

#include <memory>
#include <utility>

#include "sluice/core/buffer.hpp"
#include "sluice/core/errors.hpp"

namespace sluice::io {

using u8 = sluice::core::u8;
using u64 = sluice::core::u64;

namespace detail {
struct PipeState;
} // namespace detail

class PipeReader;

// ========================================================================
// Synchronous in-memory pipe
// ========================================================================
//
// A write is handed to the reader in place; nothing is buffered inside the
// pipe. write() returns only after reads have consumed every byte of it, or
// after either end has been closed. A zero-length write returns at once.
//
// close(err) on one end is seen by the other end:
// - the reader gets err, or EndOfStream when the writer closed with ok
// - the writer gets err, or Closed when the reader closed with ok
// Only the first close of an end is recorded; later closes are no-ops.
// Operations on an end after it has been closed itself return Closed.
//
// Dropping an end without closing it closes it with Closed.

class PipeWriter {
public:
    PipeWriter() noexcept = default;
    ~PipeWriter() noexcept;

    PipeWriter(PipeWriter&& other) noexcept = default;
    PipeWriter& operator=(PipeWriter&& other) noexcept;
    PipeWriter(const PipeWriter&) = delete;
    PipeWriter& operator=(const PipeWriter&) = delete;

    // Blocks until data.len bytes were read or the pipe was closed.
    // *written receives the number of bytes the reader consumed.
    [[nodiscard]] sluice::core::Status write(sluice::core::BufferView data, u64* written) noexcept;

    [[nodiscard]] sluice::core::Status close(sluice::core::Status err = sluice::core::ok_status()) noexcept;

    [[nodiscard]] bool valid() const noexcept { return state_ != nullptr; }

private:
    friend sluice::core::Status make_pipe(PipeReader* reader, PipeWriter* writer) noexcept;
    explicit PipeWriter(std::shared_ptr<detail::PipeState> state) noexcept;

    std::shared_ptr<detail::PipeState> state_;
};

class PipeReader {
public:
    PipeReader() noexcept = default;
    ~PipeReader() noexcept;

    PipeReader(PipeReader&& other) noexcept = default;
    PipeReader& operator=(PipeReader&& other) noexcept;
    PipeReader(const PipeReader&) = delete;
    PipeReader& operator=(const PipeReader&) = delete;

    // Blocks until a writer offers data or the pipe is closed. Copies at
    // most out.len bytes of the pending write into out.
    [[nodiscard]] sluice::core::Status read(sluice::core::BufferMut out, u64* read_bytes) noexcept;

    [[nodiscard]] sluice::core::Status close(sluice::core::Status err = sluice::core::ok_status()) noexcept;

    [[nodiscard]] bool valid() const noexcept { return state_ != nullptr; }

private:
    friend sluice::core::Status make_pipe(PipeReader* reader, PipeWriter* writer) noexcept;
    explicit PipeReader(std::shared_ptr<detail::PipeState> state) noexcept;

    std::shared_ptr<detail::PipeState> state_;
};

// Create a connected reader/writer pair.
[[nodiscard]] sluice::core::Status make_pipe(PipeReader* reader, PipeWriter* writer) noexcept;

} // namespace sluice::io
