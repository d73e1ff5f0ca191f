#include "sluice/io/completion.hpp"

namespace sluice::io {

using namespace sluice::core;

Completion::Completion()
    : future_(promise_.get_future().share()) {}

void Completion::signal(Status s) noexcept {
    if (signaled_.exchange(true, std::memory_order_acq_rel)) {
        fatal("completion signaled more than once");
    }
    promise_.set_value(s);
}

Status Completion::wait() const noexcept {
    return future_.get();
}

} // namespace sluice::io
