#pragma once

#include <cstdint>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

#include "parse_error.hpp"

namespace wcc::units
{
    using BigInt = boost::multiprecision::cpp_int;

    inline constexpr unsigned int ETHER_DECIMALS = 18;
    inline constexpr unsigned int GWEI_DECIMALS = 9;

    BigInt pow10(unsigned int exponent);

    const BigInt & weiPerEther();
    const BigInt & weiPerGwei();

    /**
     * @brief Converts a decimal amount string into base units.
     *
     * Accepts an optional leading '-', digits and at most one '.'.
     * Fractional digits beyond `decimals` are truncated, not rounded.
     */
    parse::Result<BigInt> parseUnits(const std::string & amount, unsigned int decimals);

    /**
     * @brief Exact decimal rendering of base units. Trailing fractional zeros are trimmed
     * and whole numbers carry no '.'.
     */
    std::string formatUnits(const BigInt & amount, unsigned int decimals);

    /**
     * @brief Decimal rendering with exactly `places` fractional digits, rounded half away from zero.
     */
    std::string formatFixed(const BigInt & amount, unsigned int decimals, unsigned int places);

    parse::Result<BigInt> parseEther(const std::string & amount);
    parse::Result<BigInt> parseGwei(const std::string & amount);

    std::string formatEther(const BigInt & wei, unsigned int places);
    std::string formatGwei(const BigInt & wei, unsigned int places);
}
