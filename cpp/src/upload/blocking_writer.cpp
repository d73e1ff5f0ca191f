#include "sluice/upload/blocking_writer.hpp"

#include <system_error>
#include <utility>

namespace sluice::upload {

using namespace sluice::core;

BlockingWriter::BlockingWriter(sluice::io::PipeWriter writer)
    : writer_(std::move(writer)) {}

BlockingWriter::~BlockingWriter() noexcept {
    if (state_ == WriterState::Pending && worker_.joinable()) {
        (void)writer_.close(make_status(StatusDomain::Upload, StatusCode::Closed));
        (void)released_.wait();
    }
    join_worker();
}

Status BlockingWriter::write(BufferView data, u64* written) noexcept {
    if (!written) {
        return make_status(StatusDomain::Upload, StatusCode::Invalid);
    }
    if (state_ != WriterState::Pending) {
        *written = 0;
        return make_status(StatusDomain::Upload, StatusCode::Closed);
    }

    Status s = writer_.write(data, written);
    bytes_written_ += *written;
    return s;
}

Status BlockingWriter::close() noexcept {
    if (state_ != WriterState::Pending) {
        return result_;
    }
    state_ = WriterState::ClosedWaiting;

    const Status close_status = writer_.close();
    const Status worker_status = released_.wait();
    join_worker();

    // The worker knows why it failed; prefer its status.
    result_ = is_ok(worker_status) ? close_status : worker_status;
    state_ = WriterState::Released;
    return result_;
}

void BlockingWriter::release(Status err) noexcept {
    released_.signal(err);
}

void BlockingWriter::adopt_worker(std::thread worker) noexcept {
    if (worker_.joinable()) {
        fatal("blocking writer already owns a worker");
    }
    worker_ = std::move(worker);
}

void BlockingWriter::join_worker() noexcept {
    if (!worker_.joinable()) {
        return;
    }
    try {
        worker_.join();
    } catch (const std::system_error&) {
        fatal("failed to join upload worker");
    }
}

} // namespace sluice::upload
