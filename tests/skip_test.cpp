#include <vector>

#include <gtest/gtest.h>

#include "etf/codec/decoder.hpp"
#include "term_builder.hpp"

using etf::core::StatusCode;

namespace {
    // Decodes and skips the term at 'off' and checks both stop at the same place.
    void expect_skip_matches_decode(const etf::test::TermBuilder& b, etf::core::u32 off) {
        etf::term::Term t;
        etf::core::u32 decoded_next = 0;
        ASSERT_EQ(etf::codec::decode_term(b.view(), off, &t, &decoded_next).code, StatusCode::Ok);

        etf::core::u32 skipped_next = 0;
        ASSERT_EQ(etf::codec::skip_term(b.view(), off, &skipped_next).code, StatusCode::Ok);
        EXPECT_EQ(skipped_next, decoded_next);
        EXPECT_EQ(skipped_next, b.buf.size());
    }
} // namespace

TEST(CodecSkip, ScalarsMatchDecode) {
    {
        etf::test::TermBuilder b;
        b.small_int(1);
        expect_skip_matches_decode(b, 0);
    }
    {
        etf::test::TermBuilder b;
        b.integer(0xdeadbeefu);
        expect_skip_matches_decode(b, 0);
    }
    {
        etf::test::TermBuilder b;
        b.atom("node@host");
        expect_skip_matches_decode(b, 0);
    }
    {
        etf::test::TermBuilder b;
        b.small_atom_utf8("ok");
        expect_skip_matches_decode(b, 0);
    }
    {
        etf::test::TermBuilder b;
        b.binary("payload");
        expect_skip_matches_decode(b, 0);
    }
    {
        etf::test::TermBuilder b;
        b.string("abc");
        expect_skip_matches_decode(b, 0);
    }
    {
        etf::test::TermBuilder b;
        b.small_big(true, {1, 2, 3, 4, 5, 6, 7, 8, 9, 10});
        expect_skip_matches_decode(b, 0);
    }
    {
        etf::test::TermBuilder b;
        b.nil();
        expect_skip_matches_decode(b, 0);
    }
}

TEST(CodecSkip, CompositesMatchDecode) {
    etf::test::TermBuilder b;
    b.small_tuple(3)
        .large_tuple(1).atom("x")
        .list(2).small_int(1).small_int(2).small_int(3)
        .map(2).atom("a").nil().binary("b").list(0).nil();

    expect_skip_matches_decode(b, 0);
}

TEST(CodecSkip, CapturesRawBytesOfLeadingElement) {
    // {Ref, {put, <<"data">>}}: skip Ref to echo its bytes back, decode the rest.
    etf::test::TermBuilder b;
    b.version().small_tuple(2)
        .small_tuple(2).atom("ref").integer(77)
        .small_tuple(2).atom("put").binary("data");

    const etf::core::u32 ref_start = 3;
    etf::core::u32 ref_end = 0;
    ASSERT_EQ(etf::codec::skip_term(b.view(), ref_start, &ref_end).code, StatusCode::Ok);

    etf::test::TermBuilder ref;
    ref.small_tuple(2).atom("ref").integer(77);
    const std::vector<etf::core::u8> captured(b.buf.begin() + ref_start, b.buf.begin() + ref_end);
    EXPECT_EQ(captured, ref.buf);

    etf::term::Term body;
    etf::core::u32 next = 0;
    ASSERT_EQ(etf::codec::decode_term(b.view(), ref_end, &body, &next).code, StatusCode::Ok);
    EXPECT_EQ(etf::term::term_to_string(body), "{put,data}");
    EXPECT_EQ(next, b.buf.size());
}

TEST(CodecSkip, RejectsWhatDecodeRejects) {
    etf::core::u32 next = 0;

    etf::test::TermBuilder unsupported;
    unsupported.small_tuple(1).tag(etf::codec::ExtTag::Pid);
    etf::core::Status s = etf::codec::skip_term(unsupported.view(), 0, &next);
    EXPECT_EQ(s.code, StatusCode::UnsupportedTag);
    EXPECT_EQ(s.aux, 2u);
    EXPECT_EQ(next, 0u);

    etf::test::TermBuilder truncated;
    truncated.tag(etf::codec::ExtTag::Binary).write_u32(100).text("short");
    s = etf::codec::skip_term(truncated.view(), 0, &next);
    EXPECT_EQ(s.code, StatusCode::Truncated);
    EXPECT_EQ(s.aux, 5u);

    etf::test::TermBuilder bad_sign;
    bad_sign.raw({110, 0, 7});
    EXPECT_EQ(etf::codec::skip_term(bad_sign.view(), 0, &next).code, StatusCode::Invalid);

    etf::test::TermBuilder forged;
    forged.map(0xffffffffu).nil();
    EXPECT_EQ(etf::codec::skip_term(forged.view(), 0, &next).code, StatusCode::Truncated);
}

TEST(CodecSkip, HonoursDepthLimit) {
    etf::test::TermBuilder b;
    b.list(1).list(1).list(1).nil().nil().nil().nil();

    etf::codec::DecodeOptions opts{};
    opts.max_depth = 2;
    etf::core::u32 next = 0;
    const etf::core::Status s = etf::codec::skip_term(b.view(), 0, &next, opts);
    EXPECT_EQ(s.code, StatusCode::DepthExceeded);
    EXPECT_EQ(s.aux, 10u);

    opts.max_depth = 3;
    ASSERT_EQ(etf::codec::skip_term(b.view(), 0, &next, opts).code, StatusCode::Ok);
    EXPECT_EQ(next, b.buf.size());
}

TEST(CodecSkip, DepthCheckedBeforeArityLikeDecode) {
    // Inner tuple tag is the last byte, so its arity is missing.
    etf::test::TermBuilder b;
    b.small_tuple(1).tag(etf::codec::ExtTag::SmallTuple);

    etf::codec::DecodeOptions opts{};
    opts.max_depth = 1;

    etf::term::Term t;
    etf::core::u32 decoded_next = 0;
    const etf::core::Status decoded = etf::codec::decode_term(b.view(), 0, &t, &decoded_next, opts);
    EXPECT_EQ(decoded.code, StatusCode::DepthExceeded);
    EXPECT_EQ(decoded.aux, 2u);

    etf::core::u32 skipped_next = 0;
    const etf::core::Status skipped = etf::codec::skip_term(b.view(), 0, &skipped_next, opts);
    EXPECT_EQ(skipped.code, decoded.code);
    EXPECT_EQ(skipped.aux, decoded.aux);

    // Without the limit both report the missing arity.
    opts.max_depth = 2;
    EXPECT_EQ(etf::codec::decode_term(b.view(), 0, &t, &decoded_next, opts).code, StatusCode::Truncated);
    const etf::core::Status truncated = etf::codec::skip_term(b.view(), 0, &skipped_next, opts);
    EXPECT_EQ(truncated.code, StatusCode::Truncated);
    EXPECT_EQ(truncated.aux, 3u);
}
