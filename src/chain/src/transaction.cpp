#include "transaction.hpp"

#include <format>

#include <spdlog/spdlog.h>

#include "crypto.hpp"
#include "hex.hpp"

namespace wcc::chain
{
    Wei Transaction::calculateFee() const
    {
        return Wei(gas) * gas_price;
    }

    evmc::bytes32 Transaction::hash() const
    {
        const std::string preimage = std::format("{}{}{}{}{}{}",
            addressToHex(to),
            value.str(),
            gas,
            gas_price.str(),
            utils::toHex(data, false),
            nonce);

        return crypto::keccak256(preimage);
    }

    std::string Transaction::hashHex() const
    {
        return utils::toHex(hash(), true);
    }

    bool TransactionReceipt::succeeded() const
    {
        return status == 1;
    }

    Result<std::uint64_t> estimateGas(const std::vector<std::uint8_t> & data, const Wei & value)
    {
        if(value < 0)
        {
            return std::unexpected(Error{Error::Kind::INVALID_VALUE, std::format("negative value {}", value.str())});
        }

        std::uint64_t gas = BASE_TRANSACTION_GAS;
        for(const std::uint8_t byte : data)
        {
            gas += (byte == 0) ? ZERO_BYTE_GAS : NON_ZERO_BYTE_GAS;
        }
        return gas;
    }

    Result<std::uint64_t> estimateGas(const std::string & data_hex, const Wei & value)
    {
        const auto data = utils::fromHex(data_hex);
        if(!data)
        {
            return std::unexpected(Error{Error::Kind::INVALID_HEX, std::format("invalid call data '{}'", data_hex)});
        }
        return estimateGas(*data, value);
    }

    Wei suggestGasPrice()
    {
        return Wei(20'000'000'000ULL);
    }

    Result<Transaction> createTransaction(const Address & to, const Wei & value, std::vector<std::uint8_t> data)
    {
        const auto gas_res = estimateGas(data, value);
        if(!gas_res)
        {
            return std::unexpected(gas_res.error());
        }

        Transaction transaction;
        transaction.to = to;
        transaction.value = value;
        transaction.gas = *gas_res;
        transaction.gas_price = suggestGasPrice();
        transaction.data = std::move(data);
        transaction.nonce = 0;

        spdlog::debug("Created transaction to {} : value {}, gas {}", addressToHex(to), value.str(), transaction.gas);
        return transaction;
    }

    Result<Transaction> createTransaction(const std::string & to, const Wei & value, std::vector<std::uint8_t> data)
    {
        const auto address = parseAddress(to);
        if(!address)
        {
            return std::unexpected(Error{Error::Kind::INVALID_ADDRESS, std::format("invalid recipient '{}'", to)});
        }
        return createTransaction(*address, value, std::move(data));
    }
}

namespace wcc::parse
{
    namespace
    {
        bool _isAbsent(const json & object, const std::string & key)
        {
            const auto it = object.find(key);
            return it == object.end() || it->is_null();
        }

        Result<std::uint64_t> _optionalQuantity(const json & object, const std::string & key)
        {
            if(_isAbsent(object, key))
            {
                return 0;
            }
            return parseQuantity(object.at(key), key);
        }

        Result<evmc::bytes32> _optionalWord(const json & object, const std::string & key)
        {
            if(_isAbsent(object, key))
            {
                return evmc::bytes32{};
            }
            return parseWord(object.at(key), key);
        }

        Result<std::optional<chain::Address>> _optionalAddress(const json & object, const std::string & key)
        {
            if(_isAbsent(object, key))
            {
                return std::optional<chain::Address>{};
            }

            const auto address_res = parseAddress(object.at(key), key);
            if(!address_res)
            {
                return std::unexpected(address_res.error());
            }
            return std::optional<chain::Address>{*address_res};
        }
    }

    template<>
    Result<chain::Log> parseFromJson(json log_json, use_json_t)
    {
        if(!log_json.is_object())
        {
            return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, "log must be an object"});
        }

        chain::Log log;

        const auto address_field = requireField(log_json, "address");
        if(!address_field) return std::unexpected(address_field.error());
        const auto address_res = parseAddress(*address_field, "address");
        if(!address_res) return std::unexpected(address_res.error());
        log.address = *address_res;

        const auto topics_field = requireField(log_json, "topics");
        if(!topics_field) return std::unexpected(topics_field.error());
        if(!topics_field->is_array())
        {
            return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, "'topics' must be an array"});
        }
        for(const auto & topic : *topics_field)
        {
            const auto topic_res = parseWord(topic, "topics");
            if(!topic_res) return std::unexpected(topic_res.error());
            log.topics.push_back(*topic_res);
        }

        const auto data_field = requireField(log_json, "data");
        if(!data_field) return std::unexpected(data_field.error());
        auto data_res = parseHexData(*data_field, "data");
        if(!data_res) return std::unexpected(data_res.error());
        log.data = std::move(*data_res);

        // pending logs carry null block coordinates
        const auto block_number_res = _optionalQuantity(log_json, "blockNumber");
        if(!block_number_res) return std::unexpected(block_number_res.error());
        log.block_number = *block_number_res;

        const auto block_hash_res = _optionalWord(log_json, "blockHash");
        if(!block_hash_res) return std::unexpected(block_hash_res.error());
        log.block_hash = *block_hash_res;

        const auto tx_hash_res = _optionalWord(log_json, "transactionHash");
        if(!tx_hash_res) return std::unexpected(tx_hash_res.error());
        log.transaction_hash = *tx_hash_res;

        const auto tx_index_res = _optionalQuantity(log_json, "transactionIndex");
        if(!tx_index_res) return std::unexpected(tx_index_res.error());
        log.transaction_index = *tx_index_res;

        const auto log_index_res = _optionalQuantity(log_json, "logIndex");
        if(!log_index_res) return std::unexpected(log_index_res.error());
        log.log_index = *log_index_res;

        if(!_isAbsent(log_json, "removed"))
        {
            if(!log_json.at("removed").is_boolean())
            {
                return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, "'removed' must be a bool"});
            }
            log.removed = log_json.at("removed").get<bool>();
        }

        return log;
    }

    template<>
    Result<json> parseToJson(chain::Log log, use_json_t)
    {
        json json_obj = json::object();
        json_obj["address"] = chain::addressToHex(log.address);

        json_obj["topics"] = json::array();
        for(const auto & topic : log.topics)
        {
            json_obj["topics"].push_back(utils::toHex(topic, true));
        }

        json_obj["data"] = utils::toHex(log.data, true);
        json_obj["blockNumber"] = toQuantity(log.block_number);
        json_obj["blockHash"] = utils::toHex(log.block_hash, true);
        json_obj["transactionHash"] = utils::toHex(log.transaction_hash, true);
        json_obj["transactionIndex"] = toQuantity(log.transaction_index);
        json_obj["logIndex"] = toQuantity(log.log_index);
        json_obj["removed"] = log.removed;
        return json_obj;
    }

    template<>
    Result<chain::TransactionReceipt> parseFromJson(json receipt_json, use_json_t)
    {
        if(!receipt_json.is_object())
        {
            return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, "receipt must be an object"});
        }

        chain::TransactionReceipt receipt;

        const auto hash_field = requireField(receipt_json, "transactionHash");
        if(!hash_field) return std::unexpected(hash_field.error());
        const auto hash_res = parseWord(*hash_field, "transactionHash");
        if(!hash_res) return std::unexpected(hash_res.error());
        receipt.transaction_hash = *hash_res;

        const auto block_number_field = requireField(receipt_json, "blockNumber");
        if(!block_number_field) return std::unexpected(block_number_field.error());
        const auto block_number_res = parseQuantity(*block_number_field, "blockNumber");
        if(!block_number_res) return std::unexpected(block_number_res.error());
        receipt.block_number = *block_number_res;

        const auto block_hash_res = _optionalWord(receipt_json, "blockHash");
        if(!block_hash_res) return std::unexpected(block_hash_res.error());
        receipt.block_hash = *block_hash_res;

        const auto tx_index_res = _optionalQuantity(receipt_json, "transactionIndex");
        if(!tx_index_res) return std::unexpected(tx_index_res.error());
        receipt.transaction_index = *tx_index_res;

        const auto from_field = requireField(receipt_json, "from");
        if(!from_field) return std::unexpected(from_field.error());
        const auto from_res = parseAddress(*from_field, "from");
        if(!from_res) return std::unexpected(from_res.error());
        receipt.from = *from_res;

        const auto to_res = _optionalAddress(receipt_json, "to");
        if(!to_res) return std::unexpected(to_res.error());
        receipt.to = *to_res;

        const auto gas_used_field = requireField(receipt_json, "gasUsed");
        if(!gas_used_field) return std::unexpected(gas_used_field.error());
        const auto gas_used_res = parseQuantity(*gas_used_field, "gasUsed");
        if(!gas_used_res) return std::unexpected(gas_used_res.error());
        receipt.gas_used = *gas_used_res;

        const auto cumulative_res = _optionalQuantity(receipt_json, "cumulativeGasUsed");
        if(!cumulative_res) return std::unexpected(cumulative_res.error());
        receipt.cumulative_gas_used = *cumulative_res;

        const auto status_res = _optionalQuantity(receipt_json, "status");
        if(!status_res) return std::unexpected(status_res.error());
        receipt.status = *status_res;

        const auto contract_res = _optionalAddress(receipt_json, "contractAddress");
        if(!contract_res) return std::unexpected(contract_res.error());
        receipt.contract_address = *contract_res;

        if(!_isAbsent(receipt_json, "logs"))
        {
            const json & logs = receipt_json.at("logs");
            if(!logs.is_array())
            {
                return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, "'logs' must be an array"});
            }

            for(const auto & log_json : logs)
            {
                auto log_res = parseFromJson<chain::Log>(log_json, use_json);
                if(!log_res)
                {
                    return std::unexpected(Error{log_res.error().kind, std::format("invalid log: {}", log_res.error().message)});
                }
                receipt.logs.push_back(std::move(*log_res));
            }
        }

        return receipt;
    }

    template<>
    Result<json> parseToJson(chain::Transaction transaction, use_json_t)
    {
        json json_obj = json::object();
        json_obj["to"] = chain::addressToHex(transaction.to);
        json_obj["value"] = transaction.value.str();
        json_obj["gas"] = transaction.gas;
        json_obj["gasPrice"] = transaction.gas_price.str();
        json_obj["data"] = utils::toHex(transaction.data, true);
        json_obj["nonce"] = transaction.nonce;
        json_obj["fee"] = transaction.calculateFee().str();
        json_obj["hash"] = transaction.hashHex();
        return json_obj;
    }
}
