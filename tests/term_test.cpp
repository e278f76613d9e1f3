#include <limits>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "etf/term/term.hpp"

using etf::core::StatusCode;
using etf::term::Term;
using etf::term::TermKind;

TEST(Term, DefaultIsNil) {
    const Term t;
    EXPECT_TRUE(t.is_nil());
    EXPECT_EQ(t, Term::nil());
    EXPECT_EQ(etf::term::term_to_string(t), "[]");
}

TEST(Term, DisplayForms) {
    EXPECT_EQ(etf::term::term_to_string(Term::small_int(7)), "7");
    EXPECT_EQ(etf::term::term_to_string(Term::integer(4294967295u)), "4294967295");
    EXPECT_EQ(etf::term::term_to_string(Term::atom("ok")), "ok");
    EXPECT_EQ(etf::term::term_to_string(Term::binary({'b', 'i', 'n'})), "bin");
    EXPECT_EQ(etf::term::term_to_string(Term::string({'s', 't'})), "st");

    const Term nested = Term::tuple({
        Term::atom("reply"),
        Term::list({Term::small_int(1), Term::small_int(2)}, Term::atom("t")),
        Term::map({{"k", Term::list({})}}),
    });
    EXPECT_EQ(etf::term::term_to_string(nested), "{reply,[1,2|t],#{k => []}}");
}

TEST(Term, ListWithNilTailIsProper) {
    const Term t = Term::list({Term::small_int(1)}, Term::nil());
    EXPECT_FALSE(t.improper());
    EXPECT_EQ(t.tail(), nullptr);
    EXPECT_EQ(t, Term::list({Term::small_int(1)}));
}

TEST(Term, BigIntIsCanonical) {
    const Term padded = Term::big_int(false, {0x2a, 0x00, 0x00});
    EXPECT_EQ(padded.bytes().size(), 1u);
    EXPECT_EQ(padded, Term::big_int(false, {0x2a}));

    const Term negative_zero = Term::big_int(true, {0x00, 0x00});
    EXPECT_FALSE(negative_zero.negative());
    EXPECT_EQ(negative_zero, Term::big_int(false, {}));
    EXPECT_EQ(etf::term::term_to_string(negative_zero), "0");
}

TEST(Term, BigIntDecimal) {
    // 10^9 exercises zero padding of the low chunk.
    EXPECT_EQ(etf::term::bigint_to_decimal(false, {0x00, 0xca, 0x9a, 0x3b}), "1000000000");
    EXPECT_EQ(etf::term::bigint_to_decimal(true, {0xff}), "-255");

    std::vector<etf::core::u8> two_pow_128(17, 0);
    two_pow_128[16] = 1;
    EXPECT_EQ(etf::term::bigint_to_decimal(false, two_pow_128), "340282366920938463463374607431768211456");
    EXPECT_EQ(etf::term::bigint_to_decimal(true, two_pow_128), "-340282366920938463463374607431768211456");
}

TEST(Term, ToI64Limits) {
    etf::core::i64 v = 0;

    const Term max = Term::big_int(false, {0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f});
    ASSERT_EQ(etf::term::term_to_i64(max, &v).code, StatusCode::Ok);
    EXPECT_EQ(v, std::numeric_limits<etf::core::i64>::max());

    const Term min = Term::big_int(true, {0, 0, 0, 0, 0, 0, 0, 0x80});
    ASSERT_EQ(etf::term::term_to_i64(min, &v).code, StatusCode::Ok);
    EXPECT_EQ(v, std::numeric_limits<etf::core::i64>::min());

    const Term too_big = Term::big_int(false, {0, 0, 0, 0, 0, 0, 0, 0x80});
    const etf::core::Status s = etf::term::term_to_i64(too_big, &v);
    EXPECT_EQ(s.code, StatusCode::Overflow);
    EXPECT_EQ(s.domain, etf::core::StatusDomain::Term);

    ASSERT_EQ(etf::term::term_to_i64(Term::integer(0xffffffffu), &v).code, StatusCode::Ok);
    EXPECT_EQ(v, 4294967295);
}

TEST(Term, ToI64RejectsNonIntegers) {
    etf::core::i64 v = 0;
    EXPECT_EQ(etf::term::term_to_i64(Term::atom("1"), &v).code, StatusCode::Invalid);
    EXPECT_EQ(etf::term::term_to_i64(Term::small_int(1), nullptr).code, StatusCode::Invalid);
}

TEST(Term, MapPutOverwritesInPlace) {
    Term m = Term::map();
    m.map_put(Term::atom("a"), Term::small_int(1));
    m.map_put(Term::atom("b"), Term::small_int(2));
    m.map_put(Term::binary({'a'}), Term::small_int(3));

    ASSERT_EQ(m.map_size(), 2u);
    EXPECT_EQ(m.map_key(0), "a");
    EXPECT_EQ(m.map_value(0), Term::small_int(3));
    EXPECT_EQ(m.map_key(1), "b");
    EXPECT_EQ(m.map_find("missing"), nullptr);
}

TEST(Term, MapFactoryKeepsLastDuplicate) {
    std::vector<std::pair<std::string, Term>> entries;
    entries.emplace_back("x", Term::small_int(1));
    entries.emplace_back("y", Term::small_int(2));
    entries.emplace_back("x", Term::small_int(3));

    const Term m = Term::map(std::move(entries));
    ASSERT_EQ(m.map_size(), 2u);
    EXPECT_EQ(m.map_key(0), "x");
    EXPECT_EQ(*m.map_find("x"), Term::small_int(3));
}

TEST(Term, MapEqualityIgnoresOrder) {
    Term a = Term::map();
    a.map_put("one", Term::small_int(1));
    a.map_put("two", Term::small_int(2));

    Term b = Term::map();
    b.map_put("two", Term::small_int(2));
    b.map_put("one", Term::small_int(1));

    EXPECT_EQ(a, b);
    b.map_put("two", Term::small_int(22));
    EXPECT_NE(a, b);
}

TEST(Term, KindsDoNotCompareEqual) {
    EXPECT_NE(Term::small_int(1), Term::integer(1));
    EXPECT_NE(Term::atom("a"), Term::binary({'a'}));
    EXPECT_NE(Term::tuple({}), Term::list({}));
    EXPECT_NE(Term::list({}), Term::nil());
}

TEST(Term, CopiesAreDeep) {
    const Term original = Term::tuple({Term::list({Term::atom("a")}, Term::small_int(9))});
    Term copy = original;
    EXPECT_EQ(copy, original);

    copy = Term::nil();
    ASSERT_EQ(original.elements().size(), 1u);
    ASSERT_NE(original.elements()[0].tail(), nullptr);
    EXPECT_EQ(*original.elements()[0].tail(), Term::small_int(9));
}

TEST(Term, KindNames) {
    EXPECT_STREQ(etf::term::term_kind_name(TermKind::BigInt), "BigInt");
    EXPECT_STREQ(etf::term::term_kind_name(TermKind::Map), "Map");
}
