#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "address.hpp"
#include "chain_error.hpp"
#include "transaction.hpp"
#include "parser.hpp"

namespace wcc::events
{
    using Event = chain::Log;
    using Topic = evmc::bytes32;

    enum class BlockTag : std::uint8_t
    {
        EARLIEST = 0,
        LATEST,
        PENDING
    };

    using BlockId = std::variant<std::uint64_t, BlockTag>;

    /**
     * @brief Log filter in the shape of an eth_getLogs request.
     *
     * Topic positions hold alternatives: an empty position matches anything,
     * a non-empty one matches when the event topic equals any of them.
     */
    class EventFilter
    {
        public:
            EventFilter() = default;

            EventFilter & setFromBlock(std::uint64_t block_number);
            EventFilter & setToBlock(std::uint64_t block_number);
            EventFilter & setLatestBlock();
            EventFilter & setPendingBlock();

            /**
             * @brief Adds a contract address. Malformed addresses are ignored with a warning.
             */
            EventFilter & addAddress(const std::string & address);
            EventFilter & addAddress(const chain::Address & address);

            /**
             * @brief Adds an alternative for topic position 0, the event signature.
             */
            EventFilter & addTopic(const Topic & topic);

            /**
             * @brief Adds an alternative for topic position `index`.
             */
            EventFilter & addIndexedParameter(std::size_t index, const Topic & topic);

            bool matches(const Event & event) const;

            const std::optional<BlockId> & getFromBlock() const;
            const std::optional<BlockId> & getToBlock() const;
            const std::vector<chain::Address> & getAddresses() const;
            const std::vector<std::vector<Topic>> & getTopics() const;

        private:
            std::optional<BlockId> _from_block;
            std::optional<BlockId> _to_block;
            std::vector<chain::Address> _addresses;
            std::vector<std::vector<Topic>> _topics;
    };

    /**
     * @brief "0x" + keccak256("name(type1,type2,...)")
     */
    std::string createEventSignature(const std::string & name, const std::vector<std::string> & param_types);

    Topic eventTopic(const std::string & name, const std::vector<std::string> & param_types);

    /**
     * @brief Transfer(address,address,uint256), shared by ERC-20 and ERC-721.
     */
    const Topic & transferTopic();

    /**
     * @brief Approval(address,address,uint256), shared by ERC-20 and ERC-721.
     */
    const Topic & approvalTopic();

    const Topic & approvalForAllTopic();

    std::string topicToHex(const Topic & topic);

    struct TransferEvent
    {
        chain::Address from{};
        chain::Address to{};
        boost::multiprecision::cpp_int amount = 0;
    };

    struct ApprovalEvent
    {
        chain::Address owner{};
        chain::Address spender{};
        boost::multiprecision::cpp_int amount = 0;
    };

    struct NFTTransferEvent
    {
        chain::Address from{};
        chain::Address to{};
        boost::multiprecision::cpp_int token_id = 0;
    };

    struct NFTApprovalEvent
    {
        chain::Address owner{};
        chain::Address approved{};
        boost::multiprecision::cpp_int token_id = 0;
    };

    struct ApprovalForAllEvent
    {
        chain::Address owner{};
        chain::Address operator_address{};
        bool approved = false;
    };

    chain::Result<TransferEvent> parseTransferEvent(const Event & event);
    chain::Result<ApprovalEvent> parseApprovalEvent(const Event & event);
    chain::Result<NFTTransferEvent> parseNFTTransferEvent(const Event & event);
    chain::Result<NFTApprovalEvent> parseNFTApprovalEvent(const Event & event);
    chain::Result<ApprovalForAllEvent> parseApprovalForAllEvent(const Event & event);
}

namespace wcc::parse
{
    /**
     * @brief Renders the filter as an eth_getLogs parameter object.
     */
    template<>
    Result<json> parseToJson(events::EventFilter filter, use_json_t);
}
