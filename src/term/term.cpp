#include "etf/term/term.hpp"

#include <cstdint>
#include <limits>
#include <unordered_map>

namespace etf::term {
    namespace {
        using u64 = etf::core::u64;

        void trim_magnitude(std::vector<u8>* mag) {
            while (!mag->empty() && mag->back() == 0) {
                mag->pop_back();
            }
        }

        void append_uint(std::string* out, u64 v) {
            char buf[24];
            size_t n = 0;
            do {
                buf[n++] = static_cast<char>('0' + (v % 10));
                v /= 10;
            } while (v != 0);
            while (n > 0) {
                out->push_back(buf[--n]);
            }
        }

        void append_term(std::string* out, const Term& t) {
            switch (t.kind()) {
            case TermKind::Nil:
                out->append("[]");
                return;
            case TermKind::SmallInt:
            case TermKind::Int:
                append_uint(out, t.uint_value());
                return;
            case TermKind::BigInt:
                out->append(bigint_to_decimal(t.negative(), t.bytes()));
                return;
            case TermKind::Atom:
            case TermKind::Binary:
            case TermKind::String:
                out->append(t.text());
                return;
            case TermKind::Tuple:
            case TermKind::List: {
                const bool is_tuple = t.kind() == TermKind::Tuple;
                out->push_back(is_tuple ? '{' : '[');
                const std::vector<Term>& elems = t.elements();
                for (size_t i = 0; i < elems.size(); ++i) {
                    if (i > 0) {
                        out->push_back(',');
                    }
                    append_term(out, elems[i]);
                }
                if (const Term* tail = t.tail(); tail != nullptr) {
                    out->push_back('|');
                    append_term(out, *tail);
                }
                out->push_back(is_tuple ? '}' : ']');
                return;
            }
            case TermKind::Map:
                out->append("#{");
                for (size_t i = 0; i < t.map_size(); ++i) {
                    if (i > 0) {
                        out->push_back(',');
                    }
                    out->append(t.map_key(i));
                    out->append(" => ");
                    append_term(out, t.map_value(i));
                }
                out->push_back('}');
                return;
            }
        }
    } // namespace

    Term Term::nil() {
        return Term{};
    }

    Term Term::small_int(u8 v) {
        Term t;
        t.kind_ = TermKind::SmallInt;
        t.uint_ = v;
        return t;
    }

    Term Term::integer(u32 v) {
        Term t;
        t.kind_ = TermKind::Int;
        t.uint_ = v;
        return t;
    }

    Term Term::big_int(bool negative, std::vector<u8> magnitude_le) {
        Term t;
        t.kind_ = TermKind::BigInt;
        t.bytes_ = std::move(magnitude_le);
        trim_magnitude(&t.bytes_);
        t.negative_ = negative && !t.bytes_.empty();
        return t;
    }

    Term Term::atom(std::string_view text) {
        Term t;
        t.kind_ = TermKind::Atom;
        t.bytes_.assign(text.begin(), text.end());
        return t;
    }

    Term Term::binary(std::vector<u8> bytes) {
        Term t;
        t.kind_ = TermKind::Binary;
        t.bytes_ = std::move(bytes);
        return t;
    }

    Term Term::string(std::vector<u8> bytes) {
        Term t;
        t.kind_ = TermKind::String;
        t.bytes_ = std::move(bytes);
        return t;
    }

    Term Term::tuple(std::vector<Term> elements) {
        Term t;
        t.kind_ = TermKind::Tuple;
        t.children_ = std::move(elements);
        return t;
    }

    Term Term::list(std::vector<Term> elements) {
        Term t;
        t.kind_ = TermKind::List;
        t.children_ = std::move(elements);
        return t;
    }

    Term Term::list(std::vector<Term> elements, Term tail) {
        Term t = list(std::move(elements));
        if (!tail.is_nil()) {
            t.tail_.push_back(std::move(tail));
        }
        return t;
    }

    Term Term::map() {
        Term t;
        t.kind_ = TermKind::Map;
        return t;
    }

    Term Term::map(std::vector<std::pair<std::string, Term>> entries) {
        Term t = map();
        t.keys_.reserve(entries.size());
        t.children_.reserve(entries.size());

        std::unordered_map<std::string_view, size_t> index;
        index.reserve(entries.size());
        for (auto& e : entries) {
            // Keys are views into 'entries', which outlives 'index'.
            auto it = index.find(e.first);
            if (it != index.end()) {
                t.children_[it->second] = std::move(e.second);
                continue;
            }
            index.emplace(e.first, t.keys_.size());
            t.keys_.push_back(e.first);
            t.children_.push_back(std::move(e.second));
        }
        return t;
    }

    void Term::map_put(const Term& key, Term value) {
        map_put(term_to_string(key), std::move(value));
    }

    void Term::map_put(std::string key, Term value) {
        for (size_t i = 0; i < keys_.size(); ++i) {
            if (keys_[i] == key) {
                children_[i] = std::move(value);
                return;
            }
        }
        keys_.push_back(std::move(key));
        children_.push_back(std::move(value));
    }

    std::string_view Term::text() const noexcept {
        return std::string_view(reinterpret_cast<const char*>(bytes_.data()), bytes_.size());
    }

    const Term* Term::tail() const noexcept {
        return tail_.empty() ? nullptr : &tail_.front();
    }

    const Term* Term::map_find(std::string_view key) const noexcept {
        for (size_t i = 0; i < keys_.size(); ++i) {
            if (keys_[i] == key) {
                return &children_[i];
            }
        }
        return nullptr;
    }

    bool operator==(const Term& a, const Term& b) noexcept {
        if (a.kind_ != b.kind_ || a.uint_ != b.uint_ || a.negative_ != b.negative_) {
            return false;
        }
        if (a.bytes_ != b.bytes_ || a.tail_ != b.tail_) {
            return false;
        }
        if (a.kind_ != TermKind::Map) {
            return a.children_ == b.children_;
        }

        // Maps compare as sets of entries.
        if (a.keys_.size() != b.keys_.size()) {
            return false;
        }
        for (size_t i = 0; i < a.keys_.size(); ++i) {
            const Term* other = b.map_find(a.keys_[i]);
            if (other == nullptr || !(a.children_[i] == *other)) {
                return false;
            }
        }
        return true;
    }

    const char* term_kind_name(TermKind kind) noexcept {
        switch (kind) {
            case TermKind::Nil: return "Nil";
            case TermKind::SmallInt: return "SmallInt";
            case TermKind::Int: return "Int";
            case TermKind::BigInt: return "BigInt";
            case TermKind::Atom: return "Atom";
            case TermKind::Binary: return "Binary";
            case TermKind::String: return "String";
            case TermKind::List: return "List";
            case TermKind::Tuple: return "Tuple";
            case TermKind::Map: return "Map";
        }
        return "Unknown";
    }

    std::string term_to_string(const Term& t) {
        std::string out;
        append_term(&out, t);
        return out;
    }

    std::string bigint_to_decimal(bool negative, const std::vector<u8>& magnitude_le) {
        // Base 2^32 limbs, least significant first.
        std::vector<u32> limbs((magnitude_le.size() + 3) / 4, 0);
        for (size_t i = 0; i < magnitude_le.size(); ++i) {
            limbs[i / 4] |= static_cast<u32>(magnitude_le[i]) << (8 * (i % 4));
        }
        while (!limbs.empty() && limbs.back() == 0) {
            limbs.pop_back();
        }
        if (limbs.empty()) {
            return "0";
        }

        // Repeated division by 10^9 yields base-10^9 chunks, least significant first.
        constexpr u32 kChunk = 1000000000u;
        std::vector<u32> chunks;
        while (!limbs.empty()) {
            u64 rem = 0;
            for (size_t i = limbs.size(); i-- > 0;) {
                const u64 cur = (rem << 32) | limbs[i];
                limbs[i] = static_cast<u32>(cur / kChunk);
                rem = cur % kChunk;
            }
            chunks.push_back(static_cast<u32>(rem));
            while (!limbs.empty() && limbs.back() == 0) {
                limbs.pop_back();
            }
        }

        std::string out;
        if (negative) {
            out.push_back('-');
        }
        append_uint(&out, chunks.back());
        for (size_t i = chunks.size() - 1; i-- > 0;) {
            std::string part;
            append_uint(&part, chunks[i]);
            out.append(9 - part.size(), '0');
            out.append(part);
        }
        return out;
    }

    etf::core::Status term_to_i64(const Term& t, i64* out) noexcept {
        if (out == nullptr) {
            return etf::core::make_status(etf::core::StatusDomain::Term, etf::core::StatusCode::Invalid);
        }

        switch (t.kind()) {
        case TermKind::SmallInt:
        case TermKind::Int:
            *out = static_cast<i64>(t.uint_value());
            return etf::core::ok_status();
        case TermKind::BigInt:
            break;
        default:
            return etf::core::make_status(etf::core::StatusDomain::Term, etf::core::StatusCode::Invalid);
        }

        const std::vector<u8>& mag = t.bytes();
        if (mag.size() > sizeof(u64)) {
            return etf::core::make_status(etf::core::StatusDomain::Term, etf::core::StatusCode::Overflow);
        }

        u64 ans = 0;
        for (size_t i = mag.size(); i-- > 0;) {
            ans = (ans << 8) | mag[i];
        }

        constexpr u64 kMaxPositive = static_cast<u64>(std::numeric_limits<i64>::max());
        if (!t.negative()) {
            if (ans > kMaxPositive) {
                return etf::core::make_status(etf::core::StatusDomain::Term, etf::core::StatusCode::Overflow);
            }
            *out = static_cast<i64>(ans);
            return etf::core::ok_status();
        }

        if (ans > kMaxPositive + 1) {
            return etf::core::make_status(etf::core::StatusDomain::Term, etf::core::StatusCode::Overflow);
        }
        *out = ans == kMaxPositive + 1 ? std::numeric_limits<i64>::min() : -static_cast<i64>(ans);
        return etf::core::ok_status();
    }

} // namespace etf::term
