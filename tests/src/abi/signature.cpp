#include "unit-tests.hpp"

#include <string>
#include <vector>

using namespace wcc;
using namespace wcc::tests;

TEST_F(UnitTest, Abi_ParseSignature_NormalizesWhitespaceAndAliases)
{
    const auto function_res = abi::parseSignature(" transfer( address , uint ) ");
    ASSERT_TRUE(function_res.has_value());

    EXPECT_EQ(function_res->name, "transfer");
    ASSERT_EQ(function_res->inputs.size(), 2u);
    EXPECT_EQ(function_res->inputs[0].name, "param0");
    EXPECT_EQ(function_res->inputs[1].name, "param1");
    EXPECT_EQ(function_res->signature(), "transfer(address,uint256)");

    const auto selector = function_res->selector();
    EXPECT_EQ(utils::toHex(selector.data(), selector.size(), false), "a9059cbb");
}

TEST_F(UnitTest, Abi_ParseSignature_NoParameters)
{
    const auto function_res = abi::parseSignature("decimals()");
    ASSERT_TRUE(function_res.has_value());

    EXPECT_TRUE(function_res->inputs.empty());
    EXPECT_EQ(function_res->signature(), "decimals()");
}

TEST_F(UnitTest, Abi_ParseSignature_Malformed)
{
    for(const std::string signature : {"transfer", "transfer(address", "(address)", "transfer(address,)", "trans fer(address)"})
    {
        const auto function_res = abi::parseSignature(signature);
        ASSERT_FALSE(function_res.has_value()) << signature;
        EXPECT_EQ(function_res.error().kind, abi::Error::Kind::INVALID_SIGNATURE_FORMAT) << signature;
    }
}

TEST_F(UnitTest, Abi_ParseTypeList)
{
    const auto types_res = abi::parseTypeList("address, uint256,string");
    ASSERT_TRUE(types_res.has_value());

    ASSERT_EQ(types_res->size(), 3u);
    EXPECT_EQ((*types_res)[0], abi::tag::address());
    EXPECT_EQ((*types_res)[1], abi::tag::uintN());
    EXPECT_EQ((*types_res)[2], abi::tag::string());

    const auto empty_res = abi::parseTypeList("");
    ASSERT_TRUE(empty_res.has_value());
    EXPECT_TRUE(empty_res->empty());
}

TEST_F(UnitTest, Abi_DecodeCall_ReturnsArguments)
{
    const auto function_res = abi::parseSignature("approve(address,uint256)");
    ASSERT_TRUE(function_res.has_value());

    const auto spender = *chain::parseAddress("0x2c7536e3605d9c16a7a3d7b1898e529396a65c23");
    const auto call_res = function_res->encode({abi::val::address(spender), abi::val::integer(42)});
    ASSERT_TRUE(call_res.has_value());

    const auto values = abi::decodeCall(*function_res, call_res->bytes());
    ASSERT_TRUE(values.has_value());
    ASSERT_EQ(values->size(), 2u);
    EXPECT_EQ((*values)[0], abi::val::address(spender));
    EXPECT_EQ((*values)[1], abi::val::integer(42));
}

TEST_F(UnitTest, Abi_DecodeCall_SelectorMismatch)
{
    const auto transfer = abi::parseSignature("transfer(address,uint256)");
    const auto approve = abi::parseSignature("approve(address,uint256)");
    ASSERT_TRUE(transfer.has_value());
    ASSERT_TRUE(approve.has_value());

    const auto call_res = transfer->encode({abi::val::address(evmc::address{}), abi::val::integer(1)});
    ASSERT_TRUE(call_res.has_value());

    const auto values = abi::decodeCall(*approve, call_res->bytes());
    ASSERT_FALSE(values.has_value());
    EXPECT_EQ(values.error().kind, abi::Error::Kind::SELECTOR_MISMATCH);
}

TEST_F(UnitTest, Abi_DecodeCall_ShortCalldata)
{
    const auto function_res = abi::parseSignature("totalSupply()");
    ASSERT_TRUE(function_res.has_value());

    const auto values = abi::decodeCall(*function_res, {0x18, 0x16});
    ASSERT_FALSE(values.has_value());
    EXPECT_EQ(values.error().kind, abi::Error::Kind::TRUNCATED_DATA);

    const auto no_args = abi::decodeCall(*function_res, {0x18, 0x16, 0x0d, 0xdd});
    ASSERT_TRUE(no_args.has_value());
    EXPECT_TRUE(no_args->empty());
}
