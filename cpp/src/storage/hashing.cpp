#include "sluice/storage/hashing.hpp"

#include <cstddef>
#include <cstring>

namespace sluice::storage {
    namespace {
        [[nodiscard]] int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }
    } // namespace

    sluice::core::Status hash_compute(sluice::core::BufferView data, sluice::core::Hash256* out) noexcept {
        if (out == nullptr){
            return sluice::core::make_status(sluice::core::StatusDomain::Storage, sluice::core::StatusCode::Invalid);
        }
        if (data.len > 0 && data.data == nullptr){
            return sluice::core::make_status(sluice::core::StatusDomain::Storage, sluice::core::StatusCode::Invalid);
        }

        Hasher hasher;
        hasher.update(data);
        hasher.finalize(out);
        return sluice::core::ok_status();
    }

    sluice::core::Status hash_to_hex(const sluice::core::Hash256& hash, char* out, u64 out_size) noexcept {
        if (out == nullptr || out_size < kHashHexChars + 1) {
            return sluice::core::make_status(sluice::core::StatusDomain::Storage, sluice::core::StatusCode::Invalid);
        }

        static const char hex[] = "0123456789abcdef";
        size_t pos = 0;
        for (u8 b : hash.b) {
            out[pos++] = hex[(b >> 4) & 0xF];
            out[pos++] = hex[b & 0xF];
        }
        out[pos] = '\0';
        return sluice::core::ok_status();
    }

    sluice::core::Status hash_from_hex(const char* hex, sluice::core::Hash256* out) noexcept {
        if (hex == nullptr || out == nullptr) {
            return sluice::core::make_status(sluice::core::StatusDomain::Storage, sluice::core::StatusCode::Invalid);
        }
        if (std::strlen(hex) != kHashHexChars) {
            return sluice::core::make_status(sluice::core::StatusDomain::Storage, sluice::core::StatusCode::Invalid);
        }

        sluice::core::Hash256 h{};
        for (size_t i = 0; i < h.b.size(); ++i) {
            const int hi = hex_value(hex[i * 2]);
            const int lo = hex_value(hex[i * 2 + 1]);
            if (hi < 0 || lo < 0) {
                return sluice::core::make_status(sluice::core::StatusDomain::Storage, sluice::core::StatusCode::Invalid);
            }
            h.b[i] = static_cast<u8>((hi << 4) | lo);
        }
        *out = h;
        return sluice::core::ok_status();
    }

    Hasher::Hasher() noexcept {
        blake3_hasher_init(&state_);
    }

    void Hasher::update(sluice::core::BufferView data) noexcept {
        if (data.len > 0 && data.data != nullptr) {
            blake3_hasher_update(&state_, data.data, static_cast<size_t>(data.len));
        }
    }

    void Hasher::finalize(sluice::core::Hash256* out) const noexcept {
        if (out != nullptr) {
            blake3_hasher_finalize(&state_, out->b.data(), out->b.size());
        }
    }
} // namespace sluice::storage
