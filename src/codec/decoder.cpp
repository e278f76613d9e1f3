#include "etf/codec/decoder.hpp"

#include <array>
#include <new>
#include <string>
#include <utility>
#include <vector>

namespace etf::codec {
    namespace {
        using etf::core::Status;
        using etf::core::StatusCode;
        using etf::core::StatusDomain;
        using etf::core::buffer_has;
        using etf::core::is_ok;
        using etf::core::make_status;
        using etf::core::ok_status;
        using etf::term::Term;

        using u16 = etf::core::u16;
        using u64 = etf::core::u64;

        struct Context {
            BufferView in{};
            u32 max_depth{kDefaultMaxDepth};
        };

        // Every sub-decoder reads the payload that starts at 'off' (the tag byte
        // is at off - 1), stores the value in '*out' and the offset past the
        // payload in '*next'. '*out' is only written on success.
        using DecodeFn = Status (*)(const Context& ctx, u32 off, u32 depth, Term* out, u32* next);

        [[nodiscard]] Status fail(StatusCode code, u32 off) noexcept {
            return make_status(StatusDomain::Codec, code, off);
        }

        u16 get_u16_be(const u8* p) noexcept {
            return static_cast<u16>((static_cast<u16>(p[0]) << 8) | static_cast<u16>(p[1]));
        }

        u32 get_u32_be(const u8* p) noexcept {
            u32 v = 0;
            for (u32 i = 0; i < 4; ++i) {
                v = (v << 8) | static_cast<u32>(p[i]);
            }
            return v;
        }

        const u8* at(const Context& ctx, u32 off) noexcept {
            return ctx.in.data + off;
        }

        Status decode_any(const Context& ctx, u32 off, u32 depth, Term* out, u32* next);

        // ====================================================================
        // Scalars
        // ====================================================================

        Status decode_unsupported(const Context&, u32 off, u32, Term*, u32*) {
            return fail(StatusCode::UnsupportedTag, off - 1);
        }

        Status decode_small_int(const Context& ctx, u32 off, u32, Term* out, u32* next) {
            if (!buffer_has(ctx.in, off, 1)) return fail(StatusCode::Truncated, off);
            *out = Term::small_int(*at(ctx, off));
            *next = off + 1;
            return ok_status();
        }

        Status decode_integer(const Context& ctx, u32 off, u32, Term* out, u32* next) {
            if (!buffer_has(ctx.in, off, 4)) return fail(StatusCode::Truncated, off);
            *out = Term::integer(get_u32_be(at(ctx, off)));
            *next = off + 4;
            return ok_status();
        }

        Status decode_nil(const Context&, u32 off, u32, Term* out, u32* next) {
            *out = Term::nil();
            *next = off;
            return ok_status();
        }

        // Shared by ATOM_EXT (16-bit length) and SMALL_ATOM_UTF8_EXT (8-bit length).
        Status decode_atom_text(const Context& ctx, u32 off, u32 len_bytes, Term* out, u32* next) {
            if (!buffer_has(ctx.in, off, len_bytes)) return fail(StatusCode::Truncated, off);
            const u32 len = len_bytes == 2 ? get_u16_be(at(ctx, off)) : *at(ctx, off);
            const u32 body = off + len_bytes;
            if (!buffer_has(ctx.in, body, len)) return fail(StatusCode::Truncated, body);

            *out = Term::atom(std::string_view(reinterpret_cast<const char*>(at(ctx, body)), len));
            *next = body + len;
            return ok_status();
        }

        Status decode_atom(const Context& ctx, u32 off, u32, Term* out, u32* next) {
            return decode_atom_text(ctx, off, 2, out, next);
        }

        Status decode_small_atom_utf8(const Context& ctx, u32 off, u32, Term* out, u32* next) {
            return decode_atom_text(ctx, off, 1, out, next);
        }

        Status decode_string(const Context& ctx, u32 off, u32, Term* out, u32* next) {
            if (!buffer_has(ctx.in, off, 2)) return fail(StatusCode::Truncated, off);
            const u32 len = get_u16_be(at(ctx, off));
            const u32 body = off + 2;
            if (!buffer_has(ctx.in, body, len)) return fail(StatusCode::Truncated, body);

            *out = Term::string(std::vector<u8>(at(ctx, body), at(ctx, body) + len));
            *next = body + len;
            return ok_status();
        }

        Status decode_binary(const Context& ctx, u32 off, u32, Term* out, u32* next) {
            if (!buffer_has(ctx.in, off, 4)) return fail(StatusCode::Truncated, off);
            const u32 len = get_u32_be(at(ctx, off));
            const u32 body = off + 4;
            if (!buffer_has(ctx.in, body, len)) return fail(StatusCode::Truncated, body);

            *out = Term::binary(std::vector<u8>(at(ctx, body), at(ctx, body) + len));
            *next = body + len;
            return ok_status();
        }

        // SMALL_BIG_EXT: n (u8), sign (u8), n magnitude bytes, least significant first.
        Status decode_small_big(const Context& ctx, u32 off, u32, Term* out, u32* next) {
            if (!buffer_has(ctx.in, off, 2)) return fail(StatusCode::Truncated, off);
            const u32 len = *at(ctx, off);
            const u8 sign = *at(ctx, off + 1);
            if (sign > 1) return fail(StatusCode::Invalid, off + 1);
            const u32 body = off + 2;
            if (!buffer_has(ctx.in, body, len)) return fail(StatusCode::Truncated, body);

            *out = Term::big_int(sign == 1, std::vector<u8>(at(ctx, body), at(ctx, body) + len));
            *next = body + len;
            return ok_status();
        }

        // ====================================================================
        // Composites
        // ====================================================================

        // Decodes 'count' consecutive terms one level below 'depth'.
        Status decode_elements(const Context& ctx, u32 off, u32 count, u32 depth, std::vector<Term>* out, u32* next) {
            // Every term occupies at least its tag byte.
            if (!buffer_has(ctx.in, off, count)) return fail(StatusCode::Truncated, off);

            std::vector<Term> elems;
            elems.reserve(count);
            u32 pos = off;
            for (u32 i = 0; i < count; ++i) {
                Term t;
                const Status s = decode_any(ctx, pos, depth + 1, &t, &pos);
                if (!is_ok(s)) {
                    return s;
                }
                elems.push_back(std::move(t));
            }

            *out = std::move(elems);
            *next = pos;
            return ok_status();
        }

        Status decode_tuple(const Context& ctx, u32 off, u32 arity_bytes, u32 depth, Term* out, u32* next) {
            if (depth >= ctx.max_depth) return fail(StatusCode::DepthExceeded, off - 1);
            if (!buffer_has(ctx.in, off, arity_bytes)) return fail(StatusCode::Truncated, off);
            const u32 arity = arity_bytes == 4 ? get_u32_be(at(ctx, off)) : *at(ctx, off);

            std::vector<Term> elems;
            const Status s = decode_elements(ctx, off + arity_bytes, arity, depth, &elems, next);
            if (!is_ok(s)) {
                return s;
            }
            *out = Term::tuple(std::move(elems));
            return ok_status();
        }

        Status decode_small_tuple(const Context& ctx, u32 off, u32 depth, Term* out, u32* next) {
            return decode_tuple(ctx, off, 1, depth, out, next);
        }

        Status decode_large_tuple(const Context& ctx, u32 off, u32 depth, Term* out, u32* next) {
            return decode_tuple(ctx, off, 4, depth, out, next);
        }

        // LIST_EXT: length N, N elements, then the tail. A Nil tail makes the
        // list proper; anything else is kept as the improper tail.
        Status decode_list(const Context& ctx, u32 off, u32 depth, Term* out, u32* next) {
            if (depth >= ctx.max_depth) return fail(StatusCode::DepthExceeded, off - 1);
            if (!buffer_has(ctx.in, off, 4)) return fail(StatusCode::Truncated, off);
            const u32 len = get_u32_be(at(ctx, off));

            std::vector<Term> elems;
            u32 pos = 0;
            Status s = decode_elements(ctx, off + 4, len, depth, &elems, &pos);
            if (!is_ok(s)) {
                return s;
            }

            Term tail;
            s = decode_any(ctx, pos, depth + 1, &tail, &pos);
            if (!is_ok(s)) {
                return s;
            }

            *out = Term::list(std::move(elems), std::move(tail));
            *next = pos;
            return ok_status();
        }

        // MAP_EXT: arity, then arity key/value pairs. Keys are stored under
        // their display form; a repeated key overwrites the earlier value.
        Status decode_map(const Context& ctx, u32 off, u32 depth, Term* out, u32* next) {
            if (depth >= ctx.max_depth) return fail(StatusCode::DepthExceeded, off - 1);
            if (!buffer_has(ctx.in, off, 4)) return fail(StatusCode::Truncated, off);
            const u32 arity = get_u32_be(at(ctx, off));
            u32 pos = off + 4;
            if (!buffer_has(ctx.in, pos, static_cast<u64>(arity) * 2)) return fail(StatusCode::Truncated, pos);

            std::vector<std::pair<std::string, Term>> entries;
            entries.reserve(arity);
            for (u32 i = 0; i < arity; ++i) {
                Term key;
                Status s = decode_any(ctx, pos, depth + 1, &key, &pos);
                if (!is_ok(s)) {
                    return s;
                }
                Term value;
                s = decode_any(ctx, pos, depth + 1, &value, &pos);
                if (!is_ok(s)) {
                    return s;
                }
                entries.emplace_back(etf::term::term_to_string(key), std::move(value));
            }

            *out = Term::map(std::move(entries));
            *next = pos;
            return ok_status();
        }

        constexpr std::array<DecodeFn, 256> make_dispatch() noexcept {
            std::array<DecodeFn, 256> t{};
            for (DecodeFn& fn : t) {
                fn = &decode_unsupported;
            }
            t[tag_byte(ExtTag::SmallInteger)] = &decode_small_int;
            t[tag_byte(ExtTag::Integer)] = &decode_integer;
            t[tag_byte(ExtTag::Atom)] = &decode_atom;
            t[tag_byte(ExtTag::SmallTuple)] = &decode_small_tuple;
            t[tag_byte(ExtTag::LargeTuple)] = &decode_large_tuple;
            t[tag_byte(ExtTag::Nil)] = &decode_nil;
            t[tag_byte(ExtTag::String)] = &decode_string;
            t[tag_byte(ExtTag::List)] = &decode_list;
            t[tag_byte(ExtTag::Binary)] = &decode_binary;
            t[tag_byte(ExtTag::SmallBig)] = &decode_small_big;
            t[tag_byte(ExtTag::Map)] = &decode_map;
            t[tag_byte(ExtTag::SmallAtomUtf8)] = &decode_small_atom_utf8;
            return t;
        }

        constexpr std::array<DecodeFn, 256> kDispatch = make_dispatch();

        Status decode_any(const Context& ctx, u32 off, u32 depth, Term* out, u32* next) {
            if (!buffer_has(ctx.in, off, 1)) return fail(StatusCode::Truncated, off);
            const u8 tag = *at(ctx, off);
            return kDispatch[tag](ctx, off + 1, depth, out, next);
        }

        // ====================================================================
        // Skipping
        // ====================================================================

        Status skip_bytes(const Context& ctx, u32 off, u64 n, u32* next) noexcept {
            if (!buffer_has(ctx.in, off, n)) return fail(StatusCode::Truncated, off);
            *next = off + static_cast<u32>(n);
            return ok_status();
        }

        Status skip_any(const Context& ctx, u32 off, u32 depth, u32* next) noexcept;

        // Skips 'count' consecutive terms one level below 'depth'.
        Status skip_many(const Context& ctx, u32 off, u64 count, u32 depth, u32* next) noexcept {
            if (!buffer_has(ctx.in, off, count)) return fail(StatusCode::Truncated, off);
            u32 pos = off;
            for (u64 i = 0; i < count; ++i) {
                const Status s = skip_any(ctx, pos, depth + 1, &pos);
                if (!is_ok(s)) {
                    return s;
                }
            }
            *next = pos;
            return ok_status();
        }

        Status skip_any(const Context& ctx, u32 off, u32 depth, u32* next) noexcept {
            if (!buffer_has(ctx.in, off, 1)) return fail(StatusCode::Truncated, off);
            const u8 tag = *at(ctx, off);
            const u32 body = off + 1;

            const bool composite = tag == tag_byte(ExtTag::SmallTuple) || tag == tag_byte(ExtTag::LargeTuple) ||
                                   tag == tag_byte(ExtTag::List) || tag == tag_byte(ExtTag::Map);
            // Same order as the decoder: depth before the arity read.
            if (composite && depth >= ctx.max_depth) return fail(StatusCode::DepthExceeded, off);

            switch (static_cast<ExtTag>(tag)) {
            case ExtTag::SmallInteger:
                return skip_bytes(ctx, body, 1, next);
            case ExtTag::Integer:
                return skip_bytes(ctx, body, 4, next);
            case ExtTag::Nil:
                *next = body;
                return ok_status();
            case ExtTag::Atom:
            case ExtTag::String:
                if (!buffer_has(ctx.in, body, 2)) return fail(StatusCode::Truncated, body);
                return skip_bytes(ctx, body + 2, get_u16_be(at(ctx, body)), next);
            case ExtTag::SmallAtomUtf8:
                if (!buffer_has(ctx.in, body, 1)) return fail(StatusCode::Truncated, body);
                return skip_bytes(ctx, body + 1, *at(ctx, body), next);
            case ExtTag::Binary:
                if (!buffer_has(ctx.in, body, 4)) return fail(StatusCode::Truncated, body);
                return skip_bytes(ctx, body + 4, get_u32_be(at(ctx, body)), next);
            case ExtTag::SmallBig:
                if (!buffer_has(ctx.in, body, 2)) return fail(StatusCode::Truncated, body);
                if (*at(ctx, body + 1) > 1) return fail(StatusCode::Invalid, body + 1);
                return skip_bytes(ctx, body + 2, *at(ctx, body), next);
            case ExtTag::SmallTuple:
                if (!buffer_has(ctx.in, body, 1)) return fail(StatusCode::Truncated, body);
                return skip_many(ctx, body + 1, *at(ctx, body), depth, next);
            case ExtTag::LargeTuple:
                if (!buffer_has(ctx.in, body, 4)) return fail(StatusCode::Truncated, body);
                return skip_many(ctx, body + 4, get_u32_be(at(ctx, body)), depth, next);
            case ExtTag::List:
                // Elements plus the tail.
                if (!buffer_has(ctx.in, body, 4)) return fail(StatusCode::Truncated, body);
                return skip_many(ctx, body + 4, static_cast<u64>(get_u32_be(at(ctx, body))) + 1, depth, next);
            case ExtTag::Map:
                if (!buffer_has(ctx.in, body, 4)) return fail(StatusCode::Truncated, body);
                return skip_many(ctx, body + 4, static_cast<u64>(get_u32_be(at(ctx, body))) * 2, depth, next);
            default:
                return fail(StatusCode::UnsupportedTag, off);
            }
        }

        [[nodiscard]] Status check_entry(BufferView in, const void* out, const u32* next, const DecodeOptions& opts) noexcept {
            if (out == nullptr || next == nullptr || !etf::core::buffer_valid(in)) {
                return make_status(StatusDomain::Codec, StatusCode::Invalid);
            }
            if (opts.max_input_bytes != 0 && in.len > opts.max_input_bytes) {
                return make_status(StatusDomain::Codec, StatusCode::TooLarge);
            }
            return ok_status();
        }
    } // namespace

    etf::core::Status decode_root(BufferView in, etf::term::Term* out, u32* consumed, const DecodeOptions& opts) noexcept {
        if (consumed != nullptr) {
            *consumed = 0;
        }
        const Status entry = check_entry(in, out, consumed, opts);
        if (!is_ok(entry)) {
            return entry;
        }

        if (in.len == 0) return fail(StatusCode::Truncated, 0);
        if (in.data[0] != kVersionMagic) return fail(StatusCode::InvalidVersion, 0);

        u32 next = 0;
        const Status s = decode_term(in, 1, out, &next, opts);
        if (!is_ok(s)) {
            return s;
        }
        *consumed = next;
        return ok_status();
    }

    etf::core::Status decode_term(BufferView in, u32 offset, etf::term::Term* out, u32* next, const DecodeOptions& opts) noexcept {
        if (next != nullptr) {
            *next = 0;
        }
        const Status entry = check_entry(in, out, next, opts);
        if (!is_ok(entry)) {
            return entry;
        }

        const Context ctx{in, opts.max_depth};
        try {
            Term t;
            u32 pos = 0;
            const Status s = decode_any(ctx, offset, 0, &t, &pos);
            if (!is_ok(s)) {
                return s;
            }
            *out = std::move(t);
            *next = pos;
            return ok_status();
        } catch (const std::bad_alloc&) {
            return fail(StatusCode::OutOfMemory, offset);
        }
    }

    etf::core::Status skip_term(BufferView in, u32 offset, u32* next, const DecodeOptions& opts) noexcept {
        if (next != nullptr) {
            *next = 0;
        }
        const Status entry = check_entry(in, next, next, opts);
        if (!is_ok(entry)) {
            return entry;
        }

        const Context ctx{in, opts.max_depth};
        u32 pos = 0;
        const Status s = skip_any(ctx, offset, 0, &pos);
        if (!is_ok(s)) {
            return s;
        }
        *next = pos;
        return ok_status();
    }
} // namespace etf::codec
