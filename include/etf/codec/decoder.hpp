#pragma once

#include <type_traits>

#include "etf/codec/tags.hpp"
#include "etf/core/errors.hpp"
#include "etf/core/types.hpp"
#include "etf/term/term.hpp"

namespace etf::codec {
    using u8 = etf::core::u8;
    using u32 = etf::core::u32;
    using BufferView = etf::core::BufferView;

    inline constexpr u32 kDefaultMaxDepth = 512;

    struct DecodeOptions {
        u32 max_depth{kDefaultMaxDepth};    // Nesting limit for tuples, lists and maps
        u32 max_input_bytes{0};             // 0 = unlimited
    };

    // ========================================================================
    // Entry points
    //
    // All of them are pure over 'in'. On failure the out-parameters are left
    // untouched except 'consumed'/'next', which are zeroed, and the returned
    // Status carries StatusDomain::Codec with 'aux' set to the byte offset
    // where decoding stopped.
    // ========================================================================

    // Decode one root term: version marker (131) followed by exactly one term.
    // '*consumed' includes the version byte; trailing bytes are not an error.
    [[nodiscard]] etf::core::Status decode_root(BufferView in,
                                                etf::term::Term* out,
                                                u32* consumed,
                                                const DecodeOptions& opts = {}) noexcept;

    // Decode one term starting at 'offset' (no version marker).
    // '*next' receives the offset just past the term.
    [[nodiscard]] etf::core::Status decode_term(BufferView in,
                                                u32 offset,
                                                etf::term::Term* out,
                                                u32* next,
                                                const DecodeOptions& opts = {}) noexcept;

    // Same tag rules and bounds checks as decode_term, without building a Term.
    // Used to capture the raw bytes of a sub-term.
    [[nodiscard]] etf::core::Status skip_term(BufferView in,
                                              u32 offset,
                                              u32* next,
                                              const DecodeOptions& opts = {}) noexcept;

    static_assert(std::is_trivially_copyable_v<DecodeOptions>);
    static_assert(std::is_standard_layout_v<DecodeOptions>);
} // namespace etf::codec
