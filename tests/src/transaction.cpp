#include "unit-tests.hpp"

#include <string>
#include <vector>

using namespace wcc;
using namespace wcc::tests;

namespace
{
    const std::string TOKEN_ADDRESS = "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48";
    const std::string TRANSFER_TOPIC = "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef";

    json receiptJson()
    {
        return json::parse(R"({
            "transactionHash": "0x1111111111111111111111111111111111111111111111111111111111111111",
            "blockNumber": "0x10",
            "blockHash": "0x2222222222222222222222222222222222222222222222222222222222222222",
            "transactionIndex": "0x1",
            "from": "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf",
            "to": "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48",
            "gasUsed": "0xb411",
            "cumulativeGasUsed": "0x1b411",
            "status": "0x1",
            "contractAddress": null,
            "logs": [
                {
                    "address": "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48",
                    "topics": [
                        "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef",
                        "0x0000000000000000000000007e5f4552091a69125d5dfcb7b8c2659029395bdf",
                        "0x0000000000000000000000002c7536e3605d9c16a7a3d7b1898e529396a65c23"
                    ],
                    "data": "0x00000000000000000000000000000000000000000000000000000000000003e8",
                    "blockNumber": "0x10",
                    "transactionIndex": "0x1",
                    "logIndex": "0x0",
                    "removed": false
                }
            ]
        })");
    }
}

TEST_F(UnitTest, Transaction_EstimateGas_CountsZeroAndNonZeroBytes)
{
    EXPECT_EQ(chain::estimateGas(std::vector<std::uint8_t>{}).value(), 21000u);
    EXPECT_EQ(chain::estimateGas(std::vector<std::uint8_t>{0x00, 0x00, 0x01}).value(), 21000u + 4 + 4 + 16);
    EXPECT_EQ(chain::estimateGas(std::string("0xa9059cbb")).value(), 21000u + 4 * 16);
}

TEST_F(UnitTest, Transaction_EstimateGas_TransferCalldata)
{
    const auto call = token::ERC20Token{.address = *chain::parseAddress(TOKEN_ADDRESS)}.encodeTransfer(
        *chain::parseAddress("0x742d35cc6634c0532925a3b844bc454e4438f44e"), 1000);
    ASSERT_TRUE(call.has_value());

    // selector 4, address 20 and amount 2 non-zero bytes, the remaining 42 are zero
    EXPECT_EQ(chain::estimateGas(call->bytes()).value(), 21000u + 26 * 16 + 42 * 4);
}

TEST_F(UnitTest, Transaction_EstimateGas_Errors)
{
    EXPECT_EQ(chain::estimateGas(std::string("0xabc")).error().kind, chain::Error::Kind::INVALID_HEX);
    EXPECT_EQ(chain::estimateGas(std::vector<std::uint8_t>{}, chain::Wei(-1)).error().kind, chain::Error::Kind::INVALID_VALUE);
}

TEST_F(UnitTest, Transaction_CreateTransaction)
{
    const auto transaction = chain::createTransaction(TOKEN_ADDRESS, units::weiPerEther(), {0x01, 0x00});
    ASSERT_TRUE(transaction.has_value());

    EXPECT_EQ(chain::addressToHex(transaction->to), TOKEN_ADDRESS);
    EXPECT_EQ(transaction->gas, 21000u + 16 + 4);
    EXPECT_EQ(transaction->gas_price, chain::suggestGasPrice());
    EXPECT_EQ(transaction->nonce, 0u);
    EXPECT_EQ(transaction->calculateFee(), chain::Wei(21020) * chain::Wei(20'000'000'000ULL));

    const auto invalid = chain::createTransaction(std::string("0x1234"), 0, {});
    ASSERT_FALSE(invalid.has_value());
    EXPECT_EQ(invalid.error().kind, chain::Error::Kind::INVALID_ADDRESS);
}

TEST_F(UnitTest, Transaction_Hash_DependsOnEveryField)
{
    const auto base = chain::createTransaction(TOKEN_ADDRESS, 0, {0x01});
    ASSERT_TRUE(base.has_value());

    chain::Transaction other = *base;
    EXPECT_EQ(other.hash(), base->hash());

    other.nonce = 1;
    EXPECT_NE(other.hash(), base->hash());

    other = *base;
    other.data = {0x02};
    EXPECT_NE(other.hash(), base->hash());

    EXPECT_EQ(base->hashHex().size(), 66u);
}

TEST_F(UnitTest, Transaction_ParseToJson)
{
    const auto transaction = chain::createTransaction(TOKEN_ADDRESS, 5, {});
    ASSERT_TRUE(transaction.has_value());

    const auto transaction_json = parse::parseToJson(*transaction, parse::use_json);
    ASSERT_TRUE(transaction_json.has_value());

    EXPECT_EQ(transaction_json->at("to"), TOKEN_ADDRESS);
    EXPECT_EQ(transaction_json->at("value"), "5");
    EXPECT_EQ(transaction_json->at("gas"), 21000u);
    EXPECT_EQ(transaction_json->at("data"), "0x");
    EXPECT_EQ(transaction_json->at("fee"), "420000000000000");
    EXPECT_EQ(transaction_json->at("hash"), transaction->hashHex());
}

TEST_F(UnitTest, Transaction_ParseReceipt)
{
    const auto receipt = parse::parseFromJson<chain::TransactionReceipt>(receiptJson(), parse::use_json);
    ASSERT_TRUE(receipt.has_value());

    EXPECT_EQ(receipt->block_number, 16u);
    EXPECT_EQ(receipt->gas_used, 0xb411u);
    EXPECT_EQ(receipt->cumulative_gas_used, 0x1b411u);
    EXPECT_TRUE(receipt->succeeded());
    ASSERT_TRUE(receipt->to.has_value());
    EXPECT_EQ(chain::addressToHex(*receipt->to), TOKEN_ADDRESS);
    EXPECT_FALSE(receipt->contract_address.has_value());

    ASSERT_EQ(receipt->logs.size(), 1u);
    const chain::Log & log = receipt->logs[0];
    EXPECT_EQ(chain::addressToHex(log.address), TOKEN_ADDRESS);
    ASSERT_EQ(log.topics.size(), 3u);
    EXPECT_EQ(utils::toHex(log.topics[0]), TRANSFER_TOPIC);
    EXPECT_EQ(log.data.size(), 32u);
    EXPECT_EQ(log.block_number, 16u);
    EXPECT_EQ(log.block_hash, evmc::bytes32{});
}

TEST_F(UnitTest, Transaction_ParseReceipt_MissingAndMalformedFields)
{
    json receipt = receiptJson();
    receipt.erase("gasUsed");
    EXPECT_EQ(parse::parseFromJson<chain::TransactionReceipt>(receipt, parse::use_json).error().kind, parse::Error::Kind::MISSING_FIELD);

    receipt = receiptJson();
    receipt["logs"][0]["topics"][0] = "0x1234";
    EXPECT_EQ(parse::parseFromJson<chain::TransactionReceipt>(receipt, parse::use_json).error().kind, parse::Error::Kind::INVALID_VALUE);

    receipt = receiptJson();
    receipt["status"] = "0x0";
    const auto failed = parse::parseFromJson<chain::TransactionReceipt>(receipt, parse::use_json);
    ASSERT_TRUE(failed.has_value());
    EXPECT_FALSE(failed->succeeded());
}

TEST_F(UnitTest, Transaction_LogJsonRoundTrip)
{
    const json log_json = receiptJson().at("logs").at(0);

    const auto log = parse::parseFromJson<chain::Log>(log_json, parse::use_json);
    ASSERT_TRUE(log.has_value());

    const auto rendered = parse::parseToJson(*log, parse::use_json);
    ASSERT_TRUE(rendered.has_value());

    EXPECT_EQ(rendered->at("address"), log_json.at("address"));
    EXPECT_EQ(rendered->at("topics"), log_json.at("topics"));
    EXPECT_EQ(rendered->at("data"), log_json.at("data"));
    EXPECT_EQ(rendered->at("blockNumber"), "0x10");
    EXPECT_EQ(rendered->at("logIndex"), "0x0");
}
