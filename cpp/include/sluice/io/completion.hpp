#pragma once

#include <atomic>
#include <future>

#include "sluice/core/errors.hpp"

namespace sluice::io {

// One-shot completion carrying a Status.
//
// signal() resolves it exactly once; a second signal() is a programming
// error and aborts the process. wait() blocks until it is resolved and may
// be called any number of times, from any thread.
class Completion {
public:
    Completion();

    Completion(const Completion&) = delete;
    Completion& operator=(const Completion&) = delete;

    void signal(sluice::core::Status s) noexcept;

    [[nodiscard]] sluice::core::Status wait() const noexcept;

    [[nodiscard]] bool signaled() const noexcept {
        return signaled_.load(std::memory_order_acquire);
    }

private:
    std::promise<sluice::core::Status> promise_;
    std::shared_future<sluice::core::Status> future_;
    std::atomic<bool> signaled_{false};
};

} // namespace sluice::io
