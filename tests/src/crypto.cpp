#include "unit-tests.hpp"

#include <string>
#include <vector>

using namespace wcc;
using namespace wcc::tests;

TEST_F(UnitTest, Crypto_Keccak256_EmptyInput)
{
    EXPECT_EQ(utils::toHex(crypto::keccak256(std::string{}), false),
        "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

TEST_F(UnitTest, Crypto_ConstructSelector_KnownTokenSelectors)
{
    const std::vector<std::pair<std::string, std::string>> cases{
        {"transfer(address,uint256)", "a9059cbb"},
        {"transferFrom(address,address,uint256)", "23b872dd"},
        {"approve(address,uint256)", "095ea7b3"},
        {"balanceOf(address)", "70a08231"},
        {"allowance(address,address)", "dd62ed3e"},
        {"totalSupply()", "18160ddd"},
        {"ownerOf(uint256)", "6352211e"},
        {"safeTransferFrom(address,address,uint256)", "42842e0e"},
        {"safeTransferFrom(address,address,uint256,bytes)", "b88d4fde"}
    };

    for(const auto & [signature, expected] : cases)
    {
        const crypto::Selector selector = crypto::constructSelector(signature);
        EXPECT_EQ(utils::toHex(selector.data(), selector.size(), false), expected) << signature;
    }
}

TEST_F(UnitTest, Crypto_ConstructEventTopic_Transfer)
{
    EXPECT_EQ(utils::toHex(crypto::constructEventTopic("Transfer(address,address,uint256)"), true),
        "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef");
}

TEST_F(UnitTest, Crypto_PrivateKeyToAddress_KnownKeys)
{
    const auto one = crypto::privateKeyToAddress("0x0000000000000000000000000000000000000000000000000000000000000001");
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(chain::addressToHex(*one), "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");

    const auto sample = crypto::privateKeyToAddress("4c0883a69102937d6231471b5dbb6204fe5129617082792ae468d01a3f362318");
    ASSERT_TRUE(sample.has_value());
    EXPECT_EQ(chain::addressToHex(*sample), "0x2c7536e3605d9c16a7a3d7b1898e529396a65c23");
}

TEST_F(UnitTest, Crypto_PrivateKeyToAddress_RejectsBadKeys)
{
    const auto short_key = crypto::privateKeyToAddress("0x1234");
    ASSERT_FALSE(short_key.has_value());
    EXPECT_EQ(short_key.error().kind, crypto::KeyError::Kind::INVALID_PRIVATE_KEY);

    const auto zero_key = crypto::privateKeyToAddress(std::string(64, '0'));
    ASSERT_FALSE(zero_key.has_value());
    EXPECT_EQ(zero_key.error().kind, crypto::KeyError::Kind::INVALID_PRIVATE_KEY);

    EXPECT_FALSE(crypto::validatePrivateKey(std::string(63, 'a') + "g"));
}

TEST_F(UnitTest, Crypto_GeneratePrivateKey_ProducesUsableKeys)
{
    const auto first = crypto::generatePrivateKey();
    const auto second = crypto::generatePrivateKey();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    EXPECT_NE(*first, *second);
    EXPECT_TRUE(crypto::privateKeyToAddress(*first).has_value());
}

TEST_F(UnitTest, Crypto_PrivateKeyToPublicKey_GeneratorPoint)
{
    crypto::PrivateKey key{};
    key[31] = 0x01;

    const auto public_key = crypto::privateKeyToPublicKey(key);
    ASSERT_TRUE(public_key.has_value());
    EXPECT_EQ(utils::toHex(public_key->x, false), "79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
    EXPECT_EQ(utils::toHex(public_key->y, false), "483ada7726a3c4655da4fbfc0e1108a8fd17b448a68554199c47d08ffb10d4b8");
}

TEST_F(UnitTest, Crypto_DecodeTopicWords)
{
    const auto words = crypto::decodeTopicWords({
        "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef",
        "0x000000000000000000000000742d35cc6634c0532925a3b844bc454e4438f44e"
    });
    ASSERT_TRUE(words.has_value());
    ASSERT_EQ(words->size(), 2u);
    EXPECT_EQ(chain::addressToHex(chain::topicWordToAddress((*words)[1])), "0x742d35cc6634c0532925a3b844bc454e4438f44e");

    EXPECT_FALSE(crypto::decodeTopicWords({}).has_value());
    EXPECT_FALSE(crypto::decodeTopicWords({"0x1234"}).has_value());
}
