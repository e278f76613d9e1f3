#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "etf/core/errors.hpp"
#include "etf/core/types.hpp"

namespace etf::term {
    using u8 = etf::core::u8;
    using u32 = etf::core::u32;
    using i64 = etf::core::i64;

    enum class TermKind : u8 {
        Nil = 0,
        SmallInt,
        Int,
        BigInt,
        Atom,
        Binary,
        String,
        List,
        Tuple,
        Map,
    };

    // One decoded value. Composite terms own their children; copies are deep.
    //
    // Storage by kind:
    //   SmallInt, Int      uint_value()
    //   BigInt             negative() + bytes() (magnitude, little-endian, no high zero bytes)
    //   Atom, Binary       bytes() / text()
    //   String             bytes(), one element per byte
    //   Tuple, List        elements(); an improper list also has tail()
    //   Map                map_key(i) / map_value(i), keys unique
    class Term {
    public:
        Term() = default;

        [[nodiscard]] static Term nil();
        [[nodiscard]] static Term small_int(u8 v);
        [[nodiscard]] static Term integer(u32 v);
        [[nodiscard]] static Term big_int(bool negative, std::vector<u8> magnitude_le);
        [[nodiscard]] static Term atom(std::string_view text);
        [[nodiscard]] static Term binary(std::vector<u8> bytes);
        [[nodiscard]] static Term string(std::vector<u8> bytes);
        [[nodiscard]] static Term tuple(std::vector<Term> elements);
        [[nodiscard]] static Term list(std::vector<Term> elements);
        // A Nil tail yields a proper list.
        [[nodiscard]] static Term list(std::vector<Term> elements, Term tail);
        [[nodiscard]] static Term map();
        // Later entries overwrite earlier ones with the same key.
        [[nodiscard]] static Term map(std::vector<std::pair<std::string, Term>> entries);

        // Inserts under term_to_string(key), overwriting an existing entry in place.
        void map_put(const Term& key, Term value);
        void map_put(std::string key, Term value);

        [[nodiscard]] TermKind kind() const noexcept { return kind_; }
        [[nodiscard]] bool is_nil() const noexcept { return kind_ == TermKind::Nil; }
        [[nodiscard]] bool is_integer() const noexcept {
            return kind_ == TermKind::SmallInt || kind_ == TermKind::Int || kind_ == TermKind::BigInt;
        }

        [[nodiscard]] u32 uint_value() const noexcept { return uint_; }
        [[nodiscard]] bool negative() const noexcept { return negative_; }
        [[nodiscard]] const std::vector<u8>& bytes() const noexcept { return bytes_; }
        [[nodiscard]] std::string_view text() const noexcept;

        [[nodiscard]] const std::vector<Term>& elements() const noexcept { return children_; }
        [[nodiscard]] bool improper() const noexcept { return !tail_.empty(); }
        // nullptr unless this is an improper list.
        [[nodiscard]] const Term* tail() const noexcept;

        [[nodiscard]] std::size_t map_size() const noexcept { return keys_.size(); }
        [[nodiscard]] std::string_view map_key(std::size_t i) const noexcept { return keys_[i]; }
        [[nodiscard]] const Term& map_value(std::size_t i) const noexcept { return children_[i]; }
        [[nodiscard]] const Term* map_find(std::string_view key) const noexcept;

        friend bool operator==(const Term& a, const Term& b) noexcept;

    private:
        TermKind kind_{TermKind::Nil};
        bool negative_{false};
        u32 uint_{0};
        std::vector<u8> bytes_;
        std::vector<Term> children_;
        std::vector<Term> tail_;
        std::vector<std::string> keys_;
    };

    [[nodiscard]] const char* term_kind_name(TermKind kind) noexcept;

    // Display form. Integers render in decimal, atoms/binaries/strings as their
    // raw bytes, composites in Erlang syntax: [] {a,b} [a,b|c] #{k => v}.
    // Map keys are stored under this form.
    [[nodiscard]] std::string term_to_string(const Term& t);

    [[nodiscard]] std::string bigint_to_decimal(bool negative, const std::vector<u8>& magnitude_le);

    // SmallInt, Int and BigInt only. Overflow when a BigInt does not fit.
    [[nodiscard]] etf::core::Status term_to_i64(const Term& t, i64* out) noexcept;

} // namespace etf::term
