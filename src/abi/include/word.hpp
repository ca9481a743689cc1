#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

#include "abi_error.hpp"
#include "value.hpp"

namespace wcc::abi
{
    inline constexpr std::size_t WORD_SIZE = 32;

    using Word = std::array<std::uint8_t, WORD_SIZE>;

    /**
     * @brief Right-pads with zero bytes up to the next multiple of 32.
     * Input already aligned (including empty input) is returned unchanged.
     */
    Bytes padTo32(Bytes bytes);

    /**
     * @brief Big-endian 32-byte representation of an integer.
     *
     * Signed values use two's complement, sign-extended to 32 bytes.
     * Fails with VALUE_OUT_OF_RANGE when the value does not fit 256 bits and with
     * NEGATIVE_VALUE_FOR_UNSIGNED for a negative unsigned value.
     */
    Result<Word> intToWord(const BigInt & value, bool is_signed);

    /**
     * @brief Checks that the value fits a uintN / intN of the given width.
     */
    Result<void> checkIntegerRange(const BigInt & value, std::uint16_t bits, bool is_signed);

    Word sizeToWord(std::size_t value);

    BigInt wordToUint(const std::uint8_t* word);
    BigInt wordToUint(const Word & word);

    BigInt wordToInt(const std::uint8_t* word);
    BigInt wordToInt(const Word & word);

    /**
     * @brief Low 20 bytes of a word. The 12 leading bytes are ignored.
     */
    evmc::address addressFromWord(const std::uint8_t* word);
    evmc::address addressFromWord(const Word & word);

    std::optional<std::size_t> readWordAsSizeT(const std::uint8_t* data, std::size_t data_size, std::size_t offset);
}
