#pragma once

#include <blake3.h>

#include "sluice/core/buffer.hpp"
#include "sluice/core/errors.hpp"
#include "sluice/core/types.hpp"

namespace sluice::storage {
    using u8 = sluice::core::u8;
    using u64 = sluice::core::u64;

    constexpr u64 kHashHexChars = 64;

    [[nodiscard]] constexpr bool hash_is_zero(const sluice::core::Hash256& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    sluice::core::Status hash_compute(sluice::core::BufferView data, sluice::core::Hash256* out) noexcept;

    // Lowercase hex, NUL-terminated. out_size must be at least 65.
    sluice::core::Status hash_to_hex(const sluice::core::Hash256& hash, char* out, u64 out_size) noexcept;

    // Accepts exactly 64 hex digits, either case.
    sluice::core::Status hash_from_hex(const char* hex, sluice::core::Hash256* out) noexcept;

    // Incremental BLAKE3 over a byte stream.
    class Hasher {
    public:
        Hasher() noexcept;

        void update(sluice::core::BufferView data) noexcept;
        void finalize(sluice::core::Hash256* out) const noexcept;

    private:
        blake3_hasher state_;
    };

} // namespace sluice::storage
