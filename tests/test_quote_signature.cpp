#include <sstream>

#include <gtest/gtest.h>

#include "application/gadgets/quote_encoder_gadget.hpp"
#include "pricesnark/signature_gadget.hpp"
#include "test_helpers.hpp"

using libsnark::pb_variable;
using libsnark::protoboard;

namespace {

struct encoder_fixture {
    protoboard<FieldT> pb;
    pb_variable<FieldT> flag;
    QuoteColumns<FieldT> quotes;
    std::shared_ptr<quote_encoder_gadget<FieldT>> encoder;

    encoder_fixture()
    {
        flag.allocate(pb, "flag");
        quotes.allocate(pb, 1, "quotes");
        encoder.reset(new quote_encoder_gadget<FieldT>(pb, flag, quotes.slot(0), "encoder"));
        encoder->generate_r1cs_constraints();
    }

    bool accepts(const FieldT &active, const QuoteVals<FieldT> &quote)
    {
        pb.val(flag) = active;
        quotes.assign(pb, {quote});
        encoder->generate_r1cs_witness();
        return pb.is_satisfied();
    }
};

struct signature_fixture {
    protoboard<FieldT> pb;
    pb_variable<FieldT> flag;
    pb_variable<FieldT> message;
    pb_variable<FieldT> s_low;
    std::shared_ptr<quote_signature_gadget<FieldT>> signature;

    signature_fixture()
    {
        flag.allocate(pb, "flag");
        message.allocate(pb, "message");
        s_low.allocate(pb, "s_low");
        signature.reset(new quote_signature_gadget<FieldT>(pb, flag, message, s_low, "signature"));
        signature->generate_r1cs_constraints();
    }

    bool accepts(const FieldT &active, const FieldT &msg, const SignatureVals<FieldT> &sig)
    {
        pb.val(flag) = active;
        pb.val(message) = msg;
        pb.val(s_low) = sig.s_low;
        signature->generate_r1cs_witness(sig);
        return pb.is_satisfied();
    }
};

FieldT flip_bit(const FieldT &v, size_t bit)
{
    const FieldT power = FieldT(2)^bit;
    return v.as_bigint().test_bit(bit) ? v - power : v + power;
}

}

TEST(QuoteEncoder, MessagePacksPriceAndConfidence)
{
    encoder_fixture f;
    const QuoteVals<FieldT> quote = make_quote<FieldT>(100, 5, 1000, 999);
    ASSERT_TRUE(f.accepts(FieldT::one(), quote));
    EXPECT_EQ(f.pb.val(f.encoder->message), FieldT(100) + (FieldT(2)^64) * FieldT(5));
    EXPECT_EQ(f.pb.val(f.encoder->message), quote_message(quote));
}

TEST(QuoteEncoder, PaddingSlotEncodesZero)
{
    encoder_fixture f;
    ASSERT_TRUE(f.accepts(FieldT::zero(), QuoteVals<FieldT>::padding()));
    EXPECT_EQ(f.pb.val(f.encoder->message), FieldT::zero());
    EXPECT_EQ(f.pb.val(f.encoder->timestamp->masked), FieldT::zero());
}

TEST(QuoteEncoder, RejectsOversizedField)
{
    const uint64_t max = UINT64_MAX;
    {
        encoder_fixture f;
        EXPECT_TRUE(f.accepts(FieldT::one(), make_quote<FieldT>(max, max, max, max)));
    }
    {
        encoder_fixture f;
        QuoteVals<FieldT> quote = make_quote<FieldT>(100, 5, 1000, 1000);
        quote.confidence = FieldT(2)^64;
        EXPECT_FALSE(f.accepts(FieldT::one(), quote));
    }
    {
        encoder_fixture f;
        QuoteVals<FieldT> quote = make_quote<FieldT>(100, 5, 1000, 1000);
        quote.observed_online = sentinel_value<FieldT>();
        EXPECT_FALSE(f.accepts(FieldT::one(), quote));
    }
}

TEST(QuoteSignature, AcceptsSignedMessage)
{
    signature_fixture f;
    const FieldT msg = quote_message(make_quote<FieldT>(100, 5, 1000, 1000));
    EXPECT_TRUE(f.accepts(FieldT::one(), msg, sign_message(test_key(0), msg)));
}

TEST(QuoteSignature, RejectsOtherMessage)
{
    signature_fixture f;
    const FieldT msg = quote_message(make_quote<FieldT>(100, 5, 1000, 1000));
    const SignatureVals<FieldT> sig = sign_message(test_key(0), msg);
    EXPECT_FALSE(f.accepts(FieldT::one(), msg + FieldT::one(), sig));
}

TEST(QuoteSignature, RejectsFlippedBitOfS)
{
    const FieldT msg = quote_message(make_quote<FieldT>(100, 5, 1000, 1000));
    const SignatureVals<FieldT> sig = sign_message(test_key(0), msg);

    const size_t positions[] = {0, 1, 17, 100, 250};
    for (size_t bit : positions){
        signature_fixture f;
        ASSERT_TRUE(f.accepts(FieldT::one(), msg, sig));

        libsnark::pb_variable<FieldT> b = f.signature->sig_S[bit];
        f.pb.val(b) = FieldT::one() - f.pb.val(b);
        EXPECT_FALSE(f.pb.is_satisfied()) << "bit " << bit;
    }
}

TEST(QuoteSignature, RejectsOtherPublicKey)
{
    const FieldT msg = quote_message(make_quote<FieldT>(100, 5, 1000, 1000));
    SignatureVals<FieldT> sig = sign_message(test_key(0), msg);
    const SignatureVals<FieldT> other = sign_message(test_key(1), msg);
    sig.A_x = other.A_x;
    sig.A_y = other.A_y;

    signature_fixture f;
    EXPECT_FALSE(f.accepts(FieldT::one(), msg, sig));
}

TEST(QuoteSignature, RejectsFlippedBitOfPublicKey)
{
    const FieldT msg = quote_message(make_quote<FieldT>(100, 5, 1000, 1000));
    const SignatureVals<FieldT> sig = sign_message(test_key(0), msg);

    const size_t positions[] = {0, 1, 64, 200, 253};
    for (size_t bit : positions){
        SignatureVals<FieldT> tampered = sig;
        tampered.A_x = flip_bit(sig.A_x, bit);
        signature_fixture fx;
        EXPECT_FALSE(fx.accepts(FieldT::one(), msg, tampered)) << "A_x bit " << bit;

        tampered = sig;
        tampered.A_y = flip_bit(sig.A_y, bit);
        signature_fixture fy;
        EXPECT_FALSE(fy.accepts(FieldT::one(), msg, tampered)) << "A_y bit " << bit;
    }
}

TEST(QuoteSignature, BindsLowBitOfS)
{
    const FieldT msg = quote_message(make_quote<FieldT>(100, 5, 1000, 1000));
    SignatureVals<FieldT> sig = sign_message(test_key(0), msg);
    sig.s_low = FieldT::one() - sig.s_low;

    signature_fixture f;
    EXPECT_FALSE(f.accepts(FieldT::one(), msg, sig));
}

TEST(QuoteSignature, PaddingSlotIgnoresLowBit)
{
    SignatureVals<FieldT> sig = sign_message(padding_key(), FieldT::zero());
    sig.s_low = sentinel_value<FieldT>();

    signature_fixture f;
    EXPECT_TRUE(f.accepts(FieldT::zero(), FieldT::zero(), sig));
}

TEST(SignedQuote, StreamRoundTrip)
{
    const signed_quote<FieldT> original = sign_quote(test_key(0), make_quote<FieldT>(123456, 78, 1700000000, 1700000001));

    std::stringstream ss;
    ss << original;
    signed_quote<FieldT> restored;
    ss >> restored;

    EXPECT_EQ(restored.quote.price, original.quote.price);
    EXPECT_EQ(restored.quote.timestamp, original.quote.timestamp);
    EXPECT_EQ(restored.signature.S, original.signature.S);
    EXPECT_EQ(restored.signature.A_x, original.signature.A_x);
    EXPECT_EQ(restored.signature.s_low, original.signature.s_low);
}
