#pragma once

#include <cstdint>
#include <cstddef>
#include <type_traits>

namespace etf::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Non-owning view over an encoded buffer. Decoding never writes through it.
    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    [[nodiscard]] constexpr bool buffer_valid(BufferView in) noexcept {
        return in.len == 0 || in.data != nullptr;
    }

    // True when [off, off + n) lies inside 'in'. Computed in 64 bits so a
    // forged 32-bit length cannot wrap.
    [[nodiscard]] constexpr bool buffer_has(BufferView in, u32 off, u64 n) noexcept {
        return static_cast<u64>(off) + n <= static_cast<u64>(in.len);
    }

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);

} // namespace etf::core
