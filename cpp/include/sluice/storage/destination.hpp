#pragma once

#include <memory>
#include <string>

#include "sluice/core/buffer.hpp"
#include "sluice/core/errors.hpp"
#include "sluice/core/types.hpp"

namespace sluice::storage {

using u32 = sluice::core::u32;
using u64 = sluice::core::u64;

// A freshly created destination object being filled.
//
// Bytes written become visible under the object's identity only as the
// sink sees fit; commit() is the point after which they are durable.
// A sink that is destroyed without commit() discards what it wrote.
class Sink {
public:
    virtual ~Sink() = default;

    // Writes all of data or fails.
    [[nodiscard]] virtual sluice::core::Status write(sluice::core::BufferView data) noexcept = 0;

    [[nodiscard]] virtual sluice::core::Status commit() noexcept = 0;

    // Removes the object. No-op after a successful commit().
    virtual void discard() noexcept = 0;
};

// Where objects named by (bucket, object) are created.
class Destination {
public:
    virtual ~Destination() = default;

    // Creates the object exclusively. Fails with StatusCode::Exists when the
    // identity is already taken; the existing object is left untouched.
    [[nodiscard]] virtual sluice::core::Status create_exclusive(const std::string& bucket,
                                                                const std::string& object,
                                                                u64 size_bytes,
                                                                std::unique_ptr<Sink>* out) noexcept = 0;
};

} // namespace sluice::storage
