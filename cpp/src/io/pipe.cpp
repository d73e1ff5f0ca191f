#include "sluice/io/pipe.hpp"

#include <algorithm>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <new>

namespace sluice::io {

using namespace sluice::core;

namespace detail {

struct PipeState {
    std::mutex mutex;
    std::condition_variable cv;

    // Serializes concurrent writers so their bytes never interleave.
    std::mutex write_mutex;

    // The write currently offered to the reader.
    const u8* pending{nullptr};
    u64 pending_len{0};

    bool reader_closed{false};
    Status reader_err{};
    bool writer_closed{false};
    Status writer_err{};
};

} // namespace detail

namespace {

// What the writer sees once the reader is gone.
Status reader_gone(const detail::PipeState& st) noexcept {
    if (!is_ok(st.reader_err)) {
        return st.reader_err;
    }
    return make_status(StatusDomain::Pipe, StatusCode::Closed);
}

// What the reader sees once the writer is gone.
Status writer_gone(const detail::PipeState& st) noexcept {
    if (!is_ok(st.writer_err)) {
        return st.writer_err;
    }
    return make_status(StatusDomain::Pipe, StatusCode::EndOfStream);
}

} // namespace

// ========================================================================
// PipeWriter
// ========================================================================

PipeWriter::PipeWriter(std::shared_ptr<detail::PipeState> state) noexcept
    : state_(std::move(state)) {}

PipeWriter::~PipeWriter() noexcept {
    if (state_) {
        (void)close(make_status(StatusDomain::Pipe, StatusCode::Closed));
    }
}

PipeWriter& PipeWriter::operator=(PipeWriter&& other) noexcept {
    if (this != &other) {
        if (state_) {
            (void)close(make_status(StatusDomain::Pipe, StatusCode::Closed));
        }
        state_ = std::move(other.state_);
    }
    return *this;
}

Status PipeWriter::write(BufferView data, u64* written) noexcept {
    if (!written) {
        return make_status(StatusDomain::Pipe, StatusCode::Invalid);
    }
    *written = 0;

    if (!state_) {
        return make_status(StatusDomain::Pipe, StatusCode::Invalid);
    }
    if (!data.data && data.len > 0) {
        return make_status(StatusDomain::Pipe, StatusCode::Invalid);
    }

    detail::PipeState& st = *state_;
    std::lock_guard<std::mutex> serial(st.write_mutex);
    std::unique_lock<std::mutex> lock(st.mutex);

    if (st.writer_closed) {
        return make_status(StatusDomain::Pipe, StatusCode::Closed);
    }
    if (st.reader_closed) {
        return reader_gone(st);
    }
    if (data.len == 0) {
        return ok_status();
    }

    st.pending = data.data;
    st.pending_len = data.len;
    st.cv.notify_all();

    st.cv.wait(lock, [&st] {
        return st.pending_len == 0 || st.reader_closed || st.writer_closed;
    });

    const u64 consumed = data.len - st.pending_len;
    st.pending = nullptr;
    st.pending_len = 0;
    *written = consumed;

    if (consumed == data.len) {
        return ok_status();
    }
    if (st.reader_closed) {
        return reader_gone(st);
    }
    return make_status(StatusDomain::Pipe, StatusCode::Closed);
}

Status PipeWriter::close(Status err) noexcept {
    if (!state_) {
        return make_status(StatusDomain::Pipe, StatusCode::Invalid);
    }

    detail::PipeState& st = *state_;
    {
        std::lock_guard<std::mutex> lock(st.mutex);
        if (!st.writer_closed) {
            st.writer_closed = true;
            st.writer_err = err;
        }
    }
    st.cv.notify_all();
    return ok_status();
}

// ========================================================================
// PipeReader
// ========================================================================

PipeReader::PipeReader(std::shared_ptr<detail::PipeState> state) noexcept
    : state_(std::move(state)) {}

PipeReader::~PipeReader() noexcept {
    if (state_) {
        (void)close(make_status(StatusDomain::Pipe, StatusCode::Closed));
    }
}

PipeReader& PipeReader::operator=(PipeReader&& other) noexcept {
    if (this != &other) {
        if (state_) {
            (void)close(make_status(StatusDomain::Pipe, StatusCode::Closed));
        }
        state_ = std::move(other.state_);
    }
    return *this;
}

Status PipeReader::read(BufferMut out, u64* read_bytes) noexcept {
    if (!read_bytes) {
        return make_status(StatusDomain::Pipe, StatusCode::Invalid);
    }
    *read_bytes = 0;

    if (!state_) {
        return make_status(StatusDomain::Pipe, StatusCode::Invalid);
    }
    if (!out.data && out.len > 0) {
        return make_status(StatusDomain::Pipe, StatusCode::Invalid);
    }

    detail::PipeState& st = *state_;
    std::unique_lock<std::mutex> lock(st.mutex);

    if (st.reader_closed) {
        return make_status(StatusDomain::Pipe, StatusCode::Closed);
    }
    if (out.len == 0) {
        return ok_status();
    }

    st.cv.wait(lock, [&st] {
        return st.pending_len > 0 || st.writer_closed || st.reader_closed;
    });

    if (st.reader_closed) {
        return make_status(StatusDomain::Pipe, StatusCode::Closed);
    }

    // Bytes already offered are delivered even if the writer closed since.
    if (st.pending_len > 0) {
        const u64 n = std::min(out.len, st.pending_len);
        std::memcpy(out.data, st.pending, static_cast<size_t>(n));
        st.pending += n;
        st.pending_len -= n;
        *read_bytes = n;
        if (st.pending_len == 0) {
            st.cv.notify_all();
        }
        return ok_status();
    }

    return writer_gone(st);
}

Status PipeReader::close(Status err) noexcept {
    if (!state_) {
        return make_status(StatusDomain::Pipe, StatusCode::Invalid);
    }

    detail::PipeState& st = *state_;
    {
        std::lock_guard<std::mutex> lock(st.mutex);
        if (!st.reader_closed) {
            st.reader_closed = true;
            st.reader_err = err;
        }
    }
    st.cv.notify_all();
    return ok_status();
}

// ========================================================================
// Construction
// ========================================================================

Status make_pipe(PipeReader* reader, PipeWriter* writer) noexcept {
    if (!reader || !writer) {
        return make_status(StatusDomain::Pipe, StatusCode::Invalid);
    }

    std::shared_ptr<detail::PipeState> state;
    try {
        state = std::make_shared<detail::PipeState>();
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Pipe, StatusCode::Unavailable);
    }

    *reader = PipeReader(state);
    *writer = PipeWriter(std::move(state));
    return ok_status();
}

} // namespace sluice::io
