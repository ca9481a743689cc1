#pragma once

#include <optional>
#include <cstdint>
#include <string>
#include <vector>

#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

namespace wcc::chain
{
    using Address = evmc::address;

    /**
     * @brief "0x" followed by exactly 40 hex digits. Mixed case is accepted, no checksum check.
     */
    bool validateAddress(const std::string & address);

    std::optional<chain::Address> parseAddress(const std::string & address);

    /**
     * @brief Lowercase "0x"-prefixed form.
     */
    std::string addressToHex(const chain::Address & address);

    std::optional<chain::Address> readAddressWord(const std::uint8_t* data, std::size_t data_size, std::size_t offset = 0);
    std::optional<chain::Address> readAddressWord(const std::vector<std::uint8_t> & data, std::size_t offset = 0);

    chain::Address topicWordToAddress(const evmc::bytes32 & topic_word);

    evmc::bytes32 addressToTopicWord(const chain::Address & address);
}
