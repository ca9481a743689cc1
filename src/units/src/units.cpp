#include "units.hpp"

#include <algorithm>
#include <format>

namespace wcc::units
{
    namespace
    {
        bool _isDigits(const std::string & value)
        {
            return std::ranges::all_of(value, [](const char c){ return c >= '0' && c <= '9'; });
        }

        BigInt _fromDigits(const std::string & digits)
        {
            // cpp_int treats a leading zero as an octal prefix
            const auto first = digits.find_first_not_of('0');
            if(first == std::string::npos)
            {
                return 0;
            }
            return BigInt(digits.substr(first));
        }
    }

    BigInt pow10(unsigned int exponent)
    {
        return boost::multiprecision::pow(BigInt(10), exponent);
    }

    const BigInt & weiPerEther()
    {
        static const BigInt value = pow10(ETHER_DECIMALS);
        return value;
    }

    const BigInt & weiPerGwei()
    {
        static const BigInt value = pow10(GWEI_DECIMALS);
        return value;
    }

    parse::Result<BigInt> parseUnits(const std::string & amount, unsigned int decimals)
    {
        const bool negative = !amount.empty() && amount.front() == '-';
        const std::string body = negative ? amount.substr(1) : amount;

        const auto dot = body.find('.');
        if(dot != std::string::npos && body.find('.', dot + 1) != std::string::npos)
        {
            return std::unexpected(parse::Error{parse::Error::Kind::INVALID_VALUE, std::format("invalid amount format '{}'", amount)});
        }

        const std::string integer_part = body.substr(0, dot);
        std::string fractional_part = (dot == std::string::npos) ? "" : body.substr(dot + 1);

        if((integer_part.empty() && fractional_part.empty()) || !_isDigits(integer_part) || !_isDigits(fractional_part))
        {
            return std::unexpected(parse::Error{parse::Error::Kind::INVALID_VALUE, std::format("invalid amount '{}'", amount)});
        }

        if(fractional_part.size() > decimals)
        {
            fractional_part.resize(decimals);
        }
        fractional_part.append(decimals - fractional_part.size(), '0');

        const BigInt value = _fromDigits(integer_part + fractional_part);
        return negative ? BigInt(-value) : value;
    }

    std::string formatUnits(const BigInt & amount, unsigned int decimals)
    {
        if(amount < 0)
        {
            return "-" + formatUnits(BigInt(-amount), decimals);
        }

        const BigInt divisor = pow10(decimals);
        const BigInt integer_part = amount / divisor;
        const BigInt remainder = amount % divisor;

        if(remainder == 0)
        {
            return integer_part.str();
        }

        std::string fractional = remainder.str();
        fractional.insert(0, decimals - fractional.size(), '0');
        fractional.erase(fractional.find_last_not_of('0') + 1);

        return integer_part.str() + "." + fractional;
    }

    std::string formatFixed(const BigInt & amount, unsigned int decimals, unsigned int places)
    {
        const bool negative = amount < 0;
        const BigInt magnitude = negative ? BigInt(-amount) : amount;

        const BigInt divisor = pow10(decimals);
        const BigInt scaled = magnitude * pow10(places);

        BigInt quotient = scaled / divisor;
        const BigInt remainder = scaled % divisor;
        if(remainder * 2 >= divisor && remainder != 0)
        {
            ++quotient;
        }

        std::string digits = quotient.str();
        if(digits.size() <= places)
        {
            digits.insert(0, places + 1 - digits.size(), '0');
        }

        std::string out = (negative && quotient != 0) ? "-" : "";
        out += digits.substr(0, digits.size() - places);
        if(places > 0)
        {
            out += "." + digits.substr(digits.size() - places);
        }
        return out;
    }

    parse::Result<BigInt> parseEther(const std::string & amount)
    {
        return parseUnits(amount, ETHER_DECIMALS);
    }

    parse::Result<BigInt> parseGwei(const std::string & amount)
    {
        return parseUnits(amount, GWEI_DECIMALS);
    }

    std::string formatEther(const BigInt & wei, unsigned int places)
    {
        return formatFixed(wei, ETHER_DECIMALS, places);
    }

    std::string formatGwei(const BigInt & wei, unsigned int places)
    {
        return formatFixed(wei, GWEI_DECIMALS, places);
    }
}
