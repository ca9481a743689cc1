#include "unit-tests.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace wcc;
using namespace wcc::tests;

namespace
{
    std::string word(const std::string & hex)
    {
        return std::string(64 - hex.size(), '0') + hex;
    }

    std::string rightPadded(const std::string & hex)
    {
        return hex + std::string(64 - hex.size(), '0');
    }

    evmc::address recipient()
    {
        return *chain::parseAddress("0x742d35Cc6634C0532925a3b844Bc454e4438f44e");
    }
}

TEST_F(UnitTest, Abi_EncodeCall_TransferMatchesKnownCalldata)
{
    const std::vector<abi::Param> params{
        {"to", abi::tag::address()},
        {"amount", abi::tag::uintN(256)}
    };

    const auto call_res = abi::encodeCall("transfer", params, {abi::val::address(recipient()), abi::val::integer(1000)});
    ASSERT_TRUE(call_res.has_value());

    EXPECT_EQ(call_res->selectorHex(), "a9059cbb");
    EXPECT_EQ(call_res->head.size(), 2u);
    EXPECT_TRUE(call_res->tail.empty());
    EXPECT_EQ(call_res->hex(),
        "0xa9059cbb"
        + word("742d35cc6634c0532925a3b844bc454e4438f44e")
        + word("3e8"));
}

TEST_F(UnitTest, Abi_EncodeCall_TransferSpecFixture)
{
    const auto to = chain::parseAddress("0x0000000000000000000000000000000000000001");
    ASSERT_TRUE(to.has_value());

    const auto call_res = abi::encodeCall("transfer",
        {{"to", abi::tag::address()}, {"amount", abi::tag::uintN(256)}},
        {abi::val::address(*to), abi::val::integer(1000000)});
    ASSERT_TRUE(call_res.has_value());

    EXPECT_EQ(call_res->hex(), "0xa9059cbb" + word("1") + word("f4240"));
}

TEST_F(UnitTest, Abi_EncodeCall_StaticArgumentsStayInHead)
{
    const auto function_res = abi::parseSignature("baz(uint32,bool)");
    ASSERT_TRUE(function_res.has_value());

    const auto call_res = function_res->encode({abi::val::integer(69), abi::val::boolean(true)});
    ASSERT_TRUE(call_res.has_value());

    EXPECT_EQ(call_res->hex(), "0xcdcd77c0" + word("45") + word("1"));
}

TEST_F(UnitTest, Abi_EncodeCall_DynamicArgumentsUseTailOffsets)
{
    const auto function_res = abi::parseSignature("sam(bytes,bool,uint256[])");
    ASSERT_TRUE(function_res.has_value());

    const auto call_res = function_res->encode({
        abi::val::bytes({'d', 'a', 'v', 'e'}),
        abi::val::boolean(true),
        abi::val::array({abi::val::integer(1), abi::val::integer(2), abi::val::integer(3)})
    });
    ASSERT_TRUE(call_res.has_value());

    EXPECT_EQ(call_res->selectorHex(), "a5643bf2");
    ASSERT_EQ(call_res->head.size(), 3u);
    EXPECT_EQ(call_res->tail.size(), 6u * abi::WORD_SIZE);

    EXPECT_EQ(call_res->hex(),
        "0xa5643bf2"
        + word("60")
        + word("1")
        + word("a0")
        + word("4")
        + rightPadded("64617665")
        + word("3")
        + word("1")
        + word("2")
        + word("3"));
}

TEST_F(UnitTest, Abi_EncodeCall_OffsetsIncreaseAndPointPastHead)
{
    const std::vector<abi::Param> params{
        {"a", abi::tag::string()},
        {"b", abi::tag::uintN()},
        {"c", abi::tag::bytes()},
        {"d", abi::tag::string()}
    };

    const auto call_res = abi::encodeCall("f", params, {
        abi::val::string(std::string(40, 'x')),
        abi::val::integer(9),
        abi::val::bytes({}),
        abi::val::string("z")
    });
    ASSERT_TRUE(call_res.has_value());
    ASSERT_EQ(call_res->head.size(), params.size());

    const abi::BigInt head_size = abi::WORD_SIZE * params.size();
    const abi::BigInt first = abi::wordToUint(call_res->head[0]);
    const abi::BigInt second = abi::wordToUint(call_res->head[2]);
    const abi::BigInt third = abi::wordToUint(call_res->head[3]);

    EXPECT_EQ(first, head_size);
    EXPECT_GT(second, first);
    EXPECT_GT(third, second);
    EXPECT_EQ(abi::BigInt(second - first), 3 * abi::WORD_SIZE);
    EXPECT_EQ(abi::BigInt(third - second), abi::WORD_SIZE);
    EXPECT_EQ(abi::wordToUint(call_res->head[1]), 9);
}

TEST_F(UnitTest, Abi_EncodeCall_StringOffsetAndPadding)
{
    const auto function_res = abi::parseSignature("setName(string)");
    ASSERT_TRUE(function_res.has_value());

    const auto call_res = function_res->encode({abi::val::string("hello")});
    ASSERT_TRUE(call_res.has_value());

    const std::string args = call_res->hex().substr(2 + 8);
    EXPECT_EQ(args, word("20") + word("5") + rightPadded("68656c6c6f"));
}

TEST_F(UnitTest, Abi_EncodeCall_EmptyStringHasLengthWordOnly)
{
    const auto function_res = abi::parseSignature("setName(string)");
    ASSERT_TRUE(function_res.has_value());

    const auto call_res = function_res->encode({abi::val::string("")});
    ASSERT_TRUE(call_res.has_value());

    EXPECT_EQ(call_res->tail.size(), abi::WORD_SIZE);
    EXPECT_EQ(call_res->hex().substr(2 + 8), word("20") + word("0"));
}

TEST_F(UnitTest, Abi_EncodeCall_ExactWordStringIsNotPadded)
{
    const std::string content(32, 'a');
    const auto call_res = abi::encodeCall("f", {{"s", abi::tag::string()}}, {abi::val::string(content)});
    ASSERT_TRUE(call_res.has_value());

    EXPECT_EQ(call_res->tail.size(), 2 * abi::WORD_SIZE);
}

TEST_F(UnitTest, Abi_EncodeCall_NoArguments)
{
    const auto call_res = abi::encodeCall("totalSupply", {}, {});
    ASSERT_TRUE(call_res.has_value());

    EXPECT_EQ(call_res->hex(), "0x18160ddd");
    EXPECT_TRUE(call_res->argumentBytes().empty());
}

TEST_F(UnitTest, Abi_EncodeCall_ArityMismatch)
{
    const auto call_res = abi::encodeCall("transfer",
        {{"to", abi::tag::address()}, {"amount", abi::tag::uintN()}},
        {abi::val::address(recipient())});

    ASSERT_FALSE(call_res.has_value());
    EXPECT_EQ(call_res.error().kind, abi::Error::Kind::ARITY_MISMATCH);
}

TEST_F(UnitTest, Abi_EncodeValue_RejectsShortAddress)
{
    const auto encoded = abi::encodeValue(abi::tag::address(), abi::val::address(abi::Bytes(19, 0x11)));

    ASSERT_FALSE(encoded.has_value());
    EXPECT_EQ(encoded.error().kind, abi::Error::Kind::INVALID_ADDRESS);
}

TEST_F(UnitTest, Abi_EncodeValue_RejectsNegativeUnsigned)
{
    const auto encoded = abi::encodeValue(abi::tag::uintN(256), abi::val::integer(-1));

    ASSERT_FALSE(encoded.has_value());
    EXPECT_EQ(encoded.error().kind, abi::Error::Kind::NEGATIVE_VALUE_FOR_UNSIGNED);
}

TEST_F(UnitTest, Abi_EncodeValue_ChecksDeclaredWidth)
{
    EXPECT_TRUE(abi::encodeValue(abi::tag::uintN(8), abi::val::integer(255)).has_value());

    const auto too_big = abi::encodeValue(abi::tag::uintN(8), abi::val::integer(256));
    ASSERT_FALSE(too_big.has_value());
    EXPECT_EQ(too_big.error().kind, abi::Error::Kind::VALUE_OUT_OF_RANGE);

    const auto above_256 = abi::encodeValue(abi::tag::uintN(256), abi::val::integer(abi::BigInt(1) << 256));
    ASSERT_FALSE(above_256.has_value());
    EXPECT_EQ(above_256.error().kind, abi::Error::Kind::VALUE_OUT_OF_RANGE);
}

TEST_F(UnitTest, Abi_EncodeValue_InvalidIntegerWidth)
{
    for(const abi::TypeTag & type : {abi::tag::uintN(7), abi::tag::intN(0), abi::tag::uintN(264)})
    {
        const auto encoded = abi::encodeValue(type, abi::val::integer(1));
        ASSERT_FALSE(encoded.has_value()) << abi::toString(type);
        EXPECT_EQ(encoded.error().kind, abi::Error::Kind::UNSUPPORTED_TYPE) << abi::toString(type);
    }
}

TEST_F(UnitTest, Abi_EncodeValue_BoolWords)
{
    const auto true_word = abi::encodeValue(abi::tag::boolean(), abi::val::boolean(true));
    ASSERT_TRUE(true_word.has_value());
    ASSERT_EQ(true_word->size(), abi::WORD_SIZE);
    EXPECT_TRUE(std::all_of(true_word->begin(), true_word->end() - 1, [](std::uint8_t b) { return b == 0x00; }));
    EXPECT_EQ(true_word->back(), 0x01);

    const auto false_word = abi::encodeValue(abi::tag::boolean(), abi::val::boolean(false));
    ASSERT_TRUE(false_word.has_value());
    EXPECT_EQ(*false_word, abi::Bytes(abi::WORD_SIZE, 0x00));
}

TEST_F(UnitTest, Abi_Word_AddressRoundTrip)
{
    const evmc::address address = recipient();

    const auto encoded = abi::encodeValue(abi::tag::address(), abi::val::address(address));
    ASSERT_TRUE(encoded.has_value());
    ASSERT_EQ(encoded->size(), abi::WORD_SIZE);

    EXPECT_EQ(abi::addressFromWord(encoded->data()), address);
    EXPECT_TRUE(std::all_of(encoded->begin(), encoded->begin() + 12, [](std::uint8_t b) { return b == 0x00; }));
}

TEST_F(UnitTest, Abi_EncodeValue_NegativeSignedIsTwosComplement)
{
    const auto encoded = abi::encodeValue(abi::tag::intN(256), abi::val::integer(-1));
    ASSERT_TRUE(encoded.has_value());

    EXPECT_EQ(utils::toHex(*encoded, false), std::string(64, 'f'));
}

TEST_F(UnitTest, Abi_EncodeValue_TypeMismatch)
{
    const auto encoded = abi::encodeValue(abi::tag::boolean(), abi::val::string("true"));

    ASSERT_FALSE(encoded.has_value());
    EXPECT_EQ(encoded.error().kind, abi::Error::Kind::VALUE_TYPE_MISMATCH);
}

TEST_F(UnitTest, Abi_EncodeValue_ArrayOfStringsIsInlineWithoutOffsets)
{
    const auto encoded = abi::encodeValue(abi::tag::array(abi::tag::string()),
        abi::val::array({abi::val::string("a"), abi::val::string("b")}));
    ASSERT_TRUE(encoded.has_value());

    // count word, then each element's own length word and padded content
    ASSERT_EQ(encoded->size(), 5 * abi::WORD_SIZE);
    EXPECT_EQ(utils::toHex(*encoded, false),
        word("2")
        + word("1") + rightPadded("61")
        + word("1") + rightPadded("62"));
}

TEST_F(UnitTest, Abi_CanonicalSignature_UsesCanonicalTypeNames)
{
    const std::vector<abi::Param> params{
        {"owners", abi::tag::array(abi::tag::address())},
        {"amount", abi::tag::uintN()},
        {"memo", abi::tag::string()}
    };

    EXPECT_EQ(abi::canonicalSignature("batch", params), "batch(address[],uint256,string)");
}
