#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

#include "address.hpp"
#include "chain_error.hpp"
#include "parser.hpp"

namespace wcc::chain
{
    using Wei = boost::multiprecision::cpp_int;

    inline constexpr std::uint64_t BASE_TRANSACTION_GAS = 21000;
    inline constexpr std::uint64_t ZERO_BYTE_GAS = 4;
    inline constexpr std::uint64_t NON_ZERO_BYTE_GAS = 16;

    struct Transaction
    {
        Address to{};
        Wei value = 0;
        std::uint64_t gas = 0;
        Wei gas_price = 0;
        std::vector<std::uint8_t> data;
        std::uint64_t nonce = 0;

        /**
         * @brief gas * gas_price
         */
        Wei calculateFee() const;

        /**
         * @brief keccak256 over the textual concatenation of to, value, gas, gas price, hex data and nonce.
         *
         * Identifies the transaction locally. It is not the hash of the signed RLP envelope.
         */
        evmc::bytes32 hash() const;

        std::string hashHex() const;
    };

    struct Log
    {
        Address address{};
        std::vector<evmc::bytes32> topics;
        std::vector<std::uint8_t> data;
        std::uint64_t block_number = 0;
        evmc::bytes32 block_hash{};
        evmc::bytes32 transaction_hash{};
        std::uint64_t transaction_index = 0;
        std::uint64_t log_index = 0;
        bool removed = false;
    };

    struct TransactionReceipt
    {
        evmc::bytes32 transaction_hash{};
        std::uint64_t block_number = 0;
        evmc::bytes32 block_hash{};
        std::uint64_t transaction_index = 0;
        Address from{};
        std::optional<Address> to;
        std::uint64_t gas_used = 0;
        std::uint64_t cumulative_gas_used = 0;
        std::uint64_t status = 0;
        std::optional<Address> contract_address;
        std::vector<Log> logs;

        bool succeeded() const;
    };

    /**
     * @brief Intrinsic gas of a plain call: 21000 plus 4 per zero byte and 16 per non-zero byte of data.
     */
    Result<std::uint64_t> estimateGas(const std::vector<std::uint8_t> & data, const Wei & value = 0);

    Result<std::uint64_t> estimateGas(const std::string & data_hex, const Wei & value = 0);

    /**
     * @brief Fixed 20 gwei.
     */
    Wei suggestGasPrice();

    Result<Transaction> createTransaction(const Address & to, const Wei & value, std::vector<std::uint8_t> data);

    Result<Transaction> createTransaction(const std::string & to, const Wei & value, std::vector<std::uint8_t> data);
}

namespace wcc::parse
{
    /**
     * @brief Parses a JSON-RPC log object.
     */
    template<>
    Result<chain::Log> parseFromJson(json json, use_json_t);

    template<>
    Result<json> parseToJson(chain::Log log, use_json_t);

    /**
     * @brief Parses a JSON-RPC transaction receipt object, logs included.
     */
    template<>
    Result<chain::TransactionReceipt> parseFromJson(json json, use_json_t);

    template<>
    Result<json> parseToJson(chain::Transaction transaction, use_json_t);
}
