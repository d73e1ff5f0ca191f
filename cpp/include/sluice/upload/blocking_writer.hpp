#pragma once

#include <thread>

#include "sluice/core/buffer.hpp"
#include "sluice/core/errors.hpp"
#include "sluice/io/completion.hpp"
#include "sluice/io/pipe.hpp"

namespace sluice::upload {

using u8 = sluice::core::u8;
using u64 = sluice::core::u64;

enum class WriterState : u8 {
    Pending = 0,        // accepting writes
    ClosedWaiting = 1,  // close() is waiting for release()
    Released = 2,       // close() returned
};

// Write end of an upload.
//
// write() hands bytes to the consumer through a synchronous pipe. close()
// closes the pipe, then blocks until the consumer calls release(), and
// returns the consumer's status if it failed, else the pipe close status.
//
// release() must be called exactly once per writer; a second call aborts
// the process.
class BlockingWriter {
public:
    explicit BlockingWriter(sluice::io::PipeWriter writer);

    // Closing is implied: an unclosed writer closes its pipe with Closed and
    // waits for its worker, if one was adopted.
    ~BlockingWriter() noexcept;

    BlockingWriter(const BlockingWriter&) = delete;
    BlockingWriter& operator=(const BlockingWriter&) = delete;

    [[nodiscard]] sluice::core::Status write(sluice::core::BufferView data, u64* written) noexcept;

    // Only the first call waits; later calls return the same status.
    [[nodiscard]] sluice::core::Status close() noexcept;

    void release(sluice::core::Status err) noexcept;

    // Takes ownership of the thread that will call release(). close() and
    // the destructor join it.
    void adopt_worker(std::thread worker) noexcept;

    [[nodiscard]] WriterState state() const noexcept { return state_; }

    // Bytes the consumer accepted through write().
    [[nodiscard]] u64 bytes_written() const noexcept { return bytes_written_; }

private:
    void join_worker() noexcept;

    sluice::io::PipeWriter writer_;
    sluice::io::Completion released_;
    std::thread worker_;
    WriterState state_{WriterState::Pending};
    u64 bytes_written_{0};
    sluice::core::Status result_{};
};

} // namespace sluice::upload
