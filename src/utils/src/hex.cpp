#include "hex.hpp"

#include <algorithm>

namespace wcc::utils
{
    bool hasHexPrefix(std::string_view value)
    {
        return value.size() >= 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'X');
    }

    std::string stripHexPrefix(const std::string & value)
    {
        if(hasHexPrefix(value))
        {
            return value.substr(2);
        }
        return value;
    }

    std::string withHexPrefix(std::string value)
    {
        if(hasHexPrefix(value))
        {
            return value;
        }
        return std::string("0x") + value;
    }

    bool isHexDigits(std::string_view value)
    {
        return std::ranges::all_of(value, [](const char c)
        {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        });
    }

    std::string toHex(const std::uint8_t* data, std::size_t size, bool with_prefix)
    {
        std::string out = with_prefix ? "0x" : "";
        if(data == nullptr || size == 0)
        {
            return out;
        }
        out += evmc::hex(evmc::bytes_view{data, size});
        return out;
    }

    std::string toHex(const Bytes & bytes, bool with_prefix)
    {
        return toHex(bytes.data(), bytes.size(), with_prefix);
    }

    std::string toHex(const evmc::address & address, bool with_prefix)
    {
        return toHex(address.bytes, sizeof(address.bytes), with_prefix);
    }

    std::string toHex(const evmc::bytes32 & word, bool with_prefix)
    {
        return toHex(word.bytes, sizeof(word.bytes), with_prefix);
    }

    std::optional<Bytes> fromHex(const std::string & value)
    {
        const std::string hex = stripHexPrefix(value);
        if(hex.empty())
        {
            return Bytes{};
        }

        if((hex.size() % 2) != 0 || !isHexDigits(hex))
        {
            return std::nullopt;
        }

        const auto decoded = evmc::from_hex(hex);
        if(!decoded)
        {
            return std::nullopt;
        }

        return Bytes(decoded->begin(), decoded->end());
    }
}
