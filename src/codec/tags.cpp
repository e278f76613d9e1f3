#include "etf/codec/tags.hpp"

namespace etf::codec {
    const char* tag_name(u8 tag) noexcept {
        switch (static_cast<ExtTag>(tag)) {
            case ExtTag::NewFloat: return "NEW_FLOAT_EXT";
            case ExtTag::BitBinary: return "BIT_BINARY_EXT";
            case ExtTag::Compressed: return "COMPRESSED";
            case ExtTag::AtomCacheRef: return "ATOM_CACHE_REF";
            case ExtTag::NewPid: return "NEW_PID_EXT";
            case ExtTag::NewPort: return "NEW_PORT_EXT";
            case ExtTag::NewerReference: return "NEWER_REFERENCE_EXT";
            case ExtTag::SmallInteger: return "SMALL_INTEGER_EXT";
            case ExtTag::Integer: return "INTEGER_EXT";
            case ExtTag::Float: return "FLOAT_EXT";
            case ExtTag::Atom: return "ATOM_EXT";
            case ExtTag::Reference: return "REFERENCE_EXT";
            case ExtTag::Port: return "PORT_EXT";
            case ExtTag::Pid: return "PID_EXT";
            case ExtTag::SmallTuple: return "SMALL_TUPLE_EXT";
            case ExtTag::LargeTuple: return "LARGE_TUPLE_EXT";
            case ExtTag::Nil: return "NIL_EXT";
            case ExtTag::String: return "STRING_EXT";
            case ExtTag::List: return "LIST_EXT";
            case ExtTag::Binary: return "BINARY_EXT";
            case ExtTag::SmallBig: return "SMALL_BIG_EXT";
            case ExtTag::LargeBig: return "LARGE_BIG_EXT";
            case ExtTag::NewFun: return "NEW_FUN_EXT";
            case ExtTag::Export: return "EXPORT_EXT";
            case ExtTag::NewReference: return "NEW_REFERENCE_EXT";
            case ExtTag::SmallAtom: return "SMALL_ATOM_EXT";
            case ExtTag::Map: return "MAP_EXT";
            case ExtTag::Fun: return "FUN_EXT";
            case ExtTag::AtomUtf8: return "ATOM_UTF8_EXT";
            case ExtTag::SmallAtomUtf8: return "SMALL_ATOM_UTF8_EXT";
            case ExtTag::V4Port: return "V4_PORT_EXT";
            case ExtTag::Local: return "LOCAL_EXT";
        }
        return "UNKNOWN";
    }
} // namespace etf::codec
