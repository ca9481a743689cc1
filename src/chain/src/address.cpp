#include <cstring>

#include "address.hpp"
#include "hex.hpp"

namespace wcc::chain
{
    bool validateAddress(const std::string & address)
    {
        if(address.size() != 42 || address[0] != '0' || address[1] != 'x')
        {
            return false;
        }
        return utils::isHexDigits(std::string_view(address).substr(2));
    }

    std::optional<chain::Address> parseAddress(const std::string & address)
    {
        if(!validateAddress(address))
        {
            return std::nullopt;
        }

        const auto bytes = utils::fromHex(address);
        if(!bytes || bytes->size() != sizeof(chain::Address::bytes))
        {
            return std::nullopt;
        }

        chain::Address addr{};
        std::memcpy(addr.bytes, bytes->data(), sizeof(addr.bytes));
        return addr;
    }

    std::string addressToHex(const chain::Address & address)
    {
        return utils::toHex(address, true);
    }

    std::optional<chain::Address> readAddressWord(const std::uint8_t* data, std::size_t data_size, std::size_t offset)
    {
        if(data == nullptr || offset > data_size || data_size - offset < 32)
        {
            return std::nullopt;
        }

        chain::Address addr{};
        std::memcpy(addr.bytes, data + offset + 12, 20);
        return addr;
    }

    std::optional<chain::Address> readAddressWord(const std::vector<std::uint8_t> & data, std::size_t offset)
    {
        return readAddressWord(data.data(), data.size(), offset);
    }

    chain::Address topicWordToAddress(const evmc::bytes32 & topic_word)
    {
        chain::Address addr{};
        std::memcpy(addr.bytes, topic_word.bytes + 12, 20);
        return addr;
    }

    evmc::bytes32 addressToTopicWord(const chain::Address & address)
    {
        evmc::bytes32 word{};
        std::memcpy(word.bytes + 12, address.bytes, 20);
        return word;
    }
}
