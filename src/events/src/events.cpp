#include "events.hpp"

#include <algorithm>
#include <format>

#include <spdlog/spdlog.h>

#include "abi.hpp"
#include "crypto.hpp"
#include "hex.hpp"
#include "utils.hpp"

namespace wcc::events
{
    namespace
    {
        chain::Result<void> _checkEvent(const Event & event, const Topic & signature, std::size_t min_topics, const char* name)
        {
            if(event.topics.size() < min_topics)
            {
                return std::unexpected(chain::Error{chain::Error::Kind::INSUFFICIENT_TOPICS,
                    std::format("{} needs {} topics, got {}", name, min_topics, event.topics.size())});
            }

            if(event.topics.front() != signature)
            {
                return std::unexpected(chain::Error{chain::Error::Kind::INVALID_VALUE,
                    std::format("topic {} is not a {} event", topicToHex(event.topics.front()), name)});
            }
            return {};
        }

        chain::Result<abi::Value> _decodeDataWord(const Event & event, const abi::TypeTag & type, const char* name)
        {
            const auto values_res = abi::decodeResult({type}, event.data);
            if(!values_res)
            {
                return std::unexpected(chain::Error{chain::Error::Kind::INVALID_VALUE,
                    std::format("{} data: {}", name, values_res.error().message)});
            }
            return values_res->front();
        }

        chain::Result<boost::multiprecision::cpp_int> _decodeAmount(const Event & event, const char* name)
        {
            if(event.data.empty())
            {
                return boost::multiprecision::cpp_int(0);
            }

            const auto value_res = _decodeDataWord(event, abi::tag::uintN(256), name);
            if(!value_res)
            {
                return std::unexpected(value_res.error());
            }
            return std::get<abi::IntValue>(value_res->data).value;
        }
    }

    EventFilter & EventFilter::setFromBlock(std::uint64_t block_number)
    {
        _from_block = block_number;
        return *this;
    }

    EventFilter & EventFilter::setToBlock(std::uint64_t block_number)
    {
        _to_block = block_number;
        return *this;
    }

    EventFilter & EventFilter::setLatestBlock()
    {
        _to_block = BlockTag::LATEST;
        return *this;
    }

    EventFilter & EventFilter::setPendingBlock()
    {
        _to_block = BlockTag::PENDING;
        return *this;
    }

    EventFilter & EventFilter::addAddress(const std::string & address)
    {
        const auto parsed = chain::parseAddress(address);
        if(!parsed)
        {
            spdlog::warn("EventFilter: ignoring invalid address '{}'", address);
            return *this;
        }
        return addAddress(*parsed);
    }

    EventFilter & EventFilter::addAddress(const chain::Address & address)
    {
        _addresses.push_back(address);
        return *this;
    }

    EventFilter & EventFilter::addTopic(const Topic & topic)
    {
        return addIndexedParameter(0, topic);
    }

    EventFilter & EventFilter::addIndexedParameter(std::size_t index, const Topic & topic)
    {
        if(_topics.size() <= index)
        {
            _topics.resize(index + 1);
        }
        _topics[index].push_back(topic);
        return *this;
    }

    bool EventFilter::matches(const Event & event) const
    {
        if(!_addresses.empty() && std::ranges::find(_addresses, event.address) == _addresses.end())
        {
            return false;
        }

        if(_from_block)
        {
            if(const auto * from = std::get_if<std::uint64_t>(&*_from_block); from != nullptr && event.block_number < *from)
            {
                return false;
            }
        }

        if(_to_block)
        {
            if(const auto * to = std::get_if<std::uint64_t>(&*_to_block); to != nullptr && event.block_number > *to)
            {
                return false;
            }
        }

        for(std::size_t i = 0; i < _topics.size(); ++i)
        {
            // every filter position needs a topic, wildcard positions included
            if(i >= event.topics.size())
            {
                return false;
            }

            if(!_topics[i].empty() && std::ranges::find(_topics[i], event.topics[i]) == _topics[i].end())
            {
                return false;
            }
        }

        return true;
    }

    const std::optional<BlockId> & EventFilter::getFromBlock() const
    {
        return _from_block;
    }

    const std::optional<BlockId> & EventFilter::getToBlock() const
    {
        return _to_block;
    }

    const std::vector<chain::Address> & EventFilter::getAddresses() const
    {
        return _addresses;
    }

    const std::vector<std::vector<Topic>> & EventFilter::getTopics() const
    {
        return _topics;
    }

    std::string createEventSignature(const std::string & name, const std::vector<std::string> & param_types)
    {
        return topicToHex(eventTopic(name, param_types));
    }

    Topic eventTopic(const std::string & name, const std::vector<std::string> & param_types)
    {
        std::string signature = name + "(";
        for(std::size_t i = 0; i < param_types.size(); ++i)
        {
            if(i > 0)
            {
                signature += ",";
            }
            signature += param_types[i];
        }
        signature += ")";

        return crypto::constructEventTopic(signature);
    }

    const Topic & transferTopic()
    {
        static const Topic topic = eventTopic("Transfer", {"address", "address", "uint256"});
        return topic;
    }

    const Topic & approvalTopic()
    {
        static const Topic topic = eventTopic("Approval", {"address", "address", "uint256"});
        return topic;
    }

    const Topic & approvalForAllTopic()
    {
        static const Topic topic = eventTopic("ApprovalForAll", {"address", "address", "bool"});
        return topic;
    }

    std::string topicToHex(const Topic & topic)
    {
        return utils::toHex(topic, true);
    }

    chain::Result<TransferEvent> parseTransferEvent(const Event & event)
    {
        const auto check_res = _checkEvent(event, transferTopic(), 3, "Transfer");
        if(!check_res)
        {
            return std::unexpected(check_res.error());
        }

        auto amount_res = _decodeAmount(event, "Transfer");
        if(!amount_res)
        {
            return std::unexpected(amount_res.error());
        }

        return TransferEvent{
            .from = chain::topicWordToAddress(event.topics[1]),
            .to = chain::topicWordToAddress(event.topics[2]),
            .amount = std::move(*amount_res)
        };
    }

    chain::Result<ApprovalEvent> parseApprovalEvent(const Event & event)
    {
        const auto check_res = _checkEvent(event, approvalTopic(), 3, "Approval");
        if(!check_res)
        {
            return std::unexpected(check_res.error());
        }

        auto amount_res = _decodeAmount(event, "Approval");
        if(!amount_res)
        {
            return std::unexpected(amount_res.error());
        }

        return ApprovalEvent{
            .owner = chain::topicWordToAddress(event.topics[1]),
            .spender = chain::topicWordToAddress(event.topics[2]),
            .amount = std::move(*amount_res)
        };
    }

    chain::Result<NFTTransferEvent> parseNFTTransferEvent(const Event & event)
    {
        const auto check_res = _checkEvent(event, transferTopic(), 4, "NFT Transfer");
        if(!check_res)
        {
            return std::unexpected(check_res.error());
        }

        return NFTTransferEvent{
            .from = chain::topicWordToAddress(event.topics[1]),
            .to = chain::topicWordToAddress(event.topics[2]),
            .token_id = abi::wordToUint(event.topics[3].bytes)
        };
    }

    chain::Result<NFTApprovalEvent> parseNFTApprovalEvent(const Event & event)
    {
        const auto check_res = _checkEvent(event, approvalTopic(), 4, "NFT Approval");
        if(!check_res)
        {
            return std::unexpected(check_res.error());
        }

        return NFTApprovalEvent{
            .owner = chain::topicWordToAddress(event.topics[1]),
            .approved = chain::topicWordToAddress(event.topics[2]),
            .token_id = abi::wordToUint(event.topics[3].bytes)
        };
    }

    chain::Result<ApprovalForAllEvent> parseApprovalForAllEvent(const Event & event)
    {
        const auto check_res = _checkEvent(event, approvalForAllTopic(), 3, "ApprovalForAll");
        if(!check_res)
        {
            return std::unexpected(check_res.error());
        }

        const auto approved_res = _decodeDataWord(event, abi::tag::boolean(), "ApprovalForAll");
        if(!approved_res)
        {
            return std::unexpected(approved_res.error());
        }

        return ApprovalForAllEvent{
            .owner = chain::topicWordToAddress(event.topics[1]),
            .operator_address = chain::topicWordToAddress(event.topics[2]),
            .approved = std::get<abi::BoolValue>(approved_res->data).value
        };
    }
}

namespace wcc::parse
{
    namespace
    {
        json _blockIdToJson(const events::BlockId & block)
        {
            return std::visit(utils::Overloaded{
                [](std::uint64_t number) -> json { return toQuantity(number); },
                [](events::BlockTag tag) -> json
                {
                    switch(tag)
                    {
                        case events::BlockTag::EARLIEST : return "earliest";
                        case events::BlockTag::LATEST : return "latest";
                        case events::BlockTag::PENDING : return "pending";
                    }
                    return "latest";
                }
            }, block);
        }
    }

    template<>
    Result<json> parseToJson(events::EventFilter filter, use_json_t)
    {
        json json_obj = json::object();

        if(filter.getFromBlock())
        {
            json_obj["fromBlock"] = _blockIdToJson(*filter.getFromBlock());
        }

        if(filter.getToBlock())
        {
            json_obj["toBlock"] = _blockIdToJson(*filter.getToBlock());
        }

        const auto & addresses = filter.getAddresses();
        if(addresses.size() == 1)
        {
            json_obj["address"] = chain::addressToHex(addresses.front());
        }
        else if(!addresses.empty())
        {
            json_obj["address"] = json::array();
            for(const auto & address : addresses)
            {
                json_obj["address"].push_back(chain::addressToHex(address));
            }
        }

        if(!filter.getTopics().empty())
        {
            json_obj["topics"] = json::array();
            for(const auto & alternatives : filter.getTopics())
            {
                if(alternatives.empty())
                {
                    json_obj["topics"].push_back(nullptr);
                }
                else if(alternatives.size() == 1)
                {
                    json_obj["topics"].push_back(events::topicToHex(alternatives.front()));
                }
                else
                {
                    json topic_options = json::array();
                    for(const auto & topic : alternatives)
                    {
                        topic_options.push_back(events::topicToHex(topic));
                    }
                    json_obj["topics"].push_back(std::move(topic_options));
                }
            }
        }

        return json_obj;
    }
}
