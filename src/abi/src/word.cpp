#include "word.hpp"

#include <cstring>
#include <format>

namespace wcc::abi
{
    namespace
    {
        const BigInt & _twoPow256()
        {
            static const BigInt value = BigInt(1) << 256;
            return value;
        }
    }

    Bytes padTo32(Bytes bytes)
    {
        const std::size_t remainder = bytes.size() % WORD_SIZE;
        if(remainder == 0)
        {
            return bytes;
        }

        bytes.resize(bytes.size() + (WORD_SIZE - remainder), 0);
        return bytes;
    }

    Result<void> checkIntegerRange(const BigInt & value, std::uint16_t bits, bool is_signed)
    {
        if(!is_signed)
        {
            if(value < 0)
            {
                return std::unexpected(Error{Error::Kind::NEGATIVE_VALUE_FOR_UNSIGNED,
                    std::format("negative value {} for uint{}", value.str(), bits)});
            }

            if(value >= (BigInt(1) << bits))
            {
                return std::unexpected(Error{Error::Kind::VALUE_OUT_OF_RANGE,
                    std::format("value {} does not fit uint{}", value.str(), bits)});
            }
            return {};
        }

        const BigInt limit = BigInt(1) << (bits - 1);
        if(value >= limit || value < -limit)
        {
            return std::unexpected(Error{Error::Kind::VALUE_OUT_OF_RANGE,
                std::format("value {} does not fit int{}", value.str(), bits)});
        }
        return {};
    }

    Result<Word> intToWord(const BigInt & value, bool is_signed)
    {
        const auto range_res = checkIntegerRange(value, 256, is_signed);
        if(!range_res)
        {
            return std::unexpected(range_res.error());
        }

        // two's complement for negative values
        BigInt remaining = value < 0 ? _twoPow256() + value : value;

        Word word{};
        for(std::size_t i = 0; i < WORD_SIZE; ++i)
        {
            word[WORD_SIZE - 1 - i] = static_cast<std::uint8_t>((remaining & 0xFF).convert_to<unsigned int>());
            remaining >>= 8;
        }
        return word;
    }

    Word sizeToWord(std::size_t value)
    {
        Word word{};
        for(std::size_t i = 0; i < sizeof(std::size_t); ++i)
        {
            word[WORD_SIZE - 1 - i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFu);
        }
        return word;
    }

    BigInt wordToUint(const std::uint8_t* word)
    {
        BigInt value = 0;
        for(std::size_t i = 0; i < WORD_SIZE; ++i)
        {
            value <<= 8;
            value |= word[i];
        }
        return value;
    }

    BigInt wordToUint(const Word & word)
    {
        return wordToUint(word.data());
    }

    BigInt wordToInt(const std::uint8_t* word)
    {
        BigInt value = wordToUint(word);
        if((word[0] & 0x80u) != 0)
        {
            value -= _twoPow256();
        }
        return value;
    }

    BigInt wordToInt(const Word & word)
    {
        return wordToInt(word.data());
    }

    evmc::address addressFromWord(const std::uint8_t* word)
    {
        evmc::address addr{};
        std::memcpy(addr.bytes, word + 12, 20);
        return addr;
    }

    evmc::address addressFromWord(const Word & word)
    {
        return addressFromWord(word.data());
    }

    std::optional<std::size_t> readWordAsSizeT(const std::uint8_t* data, std::size_t data_size, std::size_t offset)
    {
        if(data == nullptr || offset > data_size || data_size - offset < WORD_SIZE)
        {
            return std::nullopt;
        }

        std::size_t value = 0;

        constexpr std::size_t prefix = WORD_SIZE - sizeof(std::size_t);
        for(std::size_t i = 0; i < prefix; ++i)
        {
            if(data[offset + i] != 0)
            {
                return std::nullopt;
            }
        }

        for(std::size_t i = prefix; i < WORD_SIZE; ++i)
        {
            value = (value << 8) | data[offset + i];
        }

        return value;
    }
}
