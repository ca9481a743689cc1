#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

namespace wcc::utils
{
    using Bytes = std::vector<std::uint8_t>;

    bool hasHexPrefix(std::string_view value);

    std::string stripHexPrefix(const std::string & value);

    std::string withHexPrefix(std::string value);

    /**
     * @brief Checks that every character is a hex digit. Prefix is not accepted here.
     */
    bool isHexDigits(std::string_view value);

    /**
     * @brief Encodes bytes as lowercase hex.
     *
     * @param with_prefix prepend "0x" when true
     */
    std::string toHex(const std::uint8_t* data, std::size_t size, bool with_prefix = true);
    std::string toHex(const Bytes & bytes, bool with_prefix = true);
    std::string toHex(const evmc::address & address, bool with_prefix = true);
    std::string toHex(const evmc::bytes32 & word, bool with_prefix = true);

    /**
     * @brief Decodes a hex string with an optional "0x" / "0X" prefix.
     *
     * An empty payload ("" or "0x") decodes to an empty vector.
     * Odd length or non-hex characters yield std::nullopt.
     */
    std::optional<Bytes> fromHex(const std::string & value);
}
