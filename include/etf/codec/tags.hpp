#pragma once

#include <type_traits>

#include "etf/core/types.hpp"

namespace etf::codec {
    using u8 = etf::core::u8;

    // Leading byte of every encoded root term.
    inline constexpr u8 kVersionMagic = 131;

    // Tag bytes of the external term format (erl_ext_dist). Only the ones
    // listed in tag_supported() are decoded; the rest exist so diagnostics
    // can name what was rejected.
    enum class ExtTag : u8 {
        NewFloat = 70,
        BitBinary = 77,
        Compressed = 80,
        AtomCacheRef = 82,
        NewPid = 88,
        NewPort = 89,
        NewerReference = 90,
        SmallInteger = 97,
        Integer = 98,
        Float = 99,
        Atom = 100,
        Reference = 101,
        Port = 102,
        Pid = 103,
        SmallTuple = 104,
        LargeTuple = 105,
        Nil = 106,
        String = 107,
        List = 108,
        Binary = 109,
        SmallBig = 110,
        LargeBig = 111,
        NewFun = 112,
        Export = 113,
        NewReference = 114,
        SmallAtom = 115,
        Map = 116,
        Fun = 117,
        AtomUtf8 = 118,
        SmallAtomUtf8 = 119,
        V4Port = 120,
        Local = 121,
    };

    [[nodiscard]] constexpr u8 tag_byte(ExtTag t) noexcept {
        return static_cast<u8>(t);
    }

    [[nodiscard]] constexpr bool tag_supported(u8 tag) noexcept {
        switch (static_cast<ExtTag>(tag)) {
        case ExtTag::SmallInteger:
        case ExtTag::Integer:
        case ExtTag::Atom:
        case ExtTag::SmallTuple:
        case ExtTag::LargeTuple:
        case ExtTag::Nil:
        case ExtTag::String:
        case ExtTag::List:
        case ExtTag::Binary:
        case ExtTag::SmallBig:
        case ExtTag::Map:
        case ExtTag::SmallAtomUtf8:
            return true;
        default:
            return false;
        }
    }

    // Protocol name of a tag byte ("SMALL_INTEGER_EXT", ...), "UNKNOWN" otherwise.
    [[nodiscard]] const char* tag_name(u8 tag) noexcept;

    static_assert(sizeof(ExtTag) == 1);
    static_assert(std::is_trivially_copyable_v<ExtTag>);
} // namespace etf::codec
