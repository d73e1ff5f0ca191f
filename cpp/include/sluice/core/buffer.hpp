#pragma once

#include <type_traits>

#include "sluice/core/types.hpp"

namespace sluice::core {
    struct BufferView {
        const u8* data{nullptr};
        u64 len{0};
    };

    struct BufferMut {
        u8* data{nullptr};
        u64 len{0};
    };

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<BufferMut>);
    static_assert(std::is_standard_layout_v<BufferMut>);
} // namespace sluice::core
