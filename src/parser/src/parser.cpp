#include "parser.hpp"

#include <algorithm>
#include <cstring>
#include <format>

#include "hex.hpp"

namespace wcc::parse
{
    namespace
    {
        bool _isDecimalDigits(const std::string & value)
        {
            return !value.empty() && std::ranges::all_of(value, [](const char c){ return c >= '0' && c <= '9'; });
        }
    }

    Result<json> parseJsonString(const std::string & text)
    {
        json parsed = json::parse(text, nullptr, false);
        if(parsed.is_discarded())
        {
            return std::unexpected(Error{Error::Kind::INVALID_VALUE, "malformed JSON"});
        }
        return parsed;
    }

    Result<json> requireField(const json & object, const std::string & key)
    {
        if(!object.is_object())
        {
            return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, std::format("expected an object holding '{}'", key)});
        }

        const auto it = object.find(key);
        if(it == object.end())
        {
            return std::unexpected(Error{Error::Kind::MISSING_FIELD, std::format("missing field '{}'", key)});
        }
        return *it;
    }

    Result<std::string> parseString(const json & value, const std::string & field)
    {
        if(!value.is_string())
        {
            return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, std::format("'{}' must be a string", field)});
        }
        return value.get<std::string>();
    }

    Result<std::uint64_t> parseQuantity(const json & value, const std::string & field)
    {
        if(value.is_number_unsigned())
        {
            return value.get<std::uint64_t>();
        }

        if(value.is_number_integer())
        {
            return std::unexpected(Error{Error::Kind::OUT_OF_RANGE, std::format("'{}' must not be negative", field)});
        }

        const auto str_res = parseString(value, field);
        if(!str_res)
        {
            return std::unexpected(str_res.error());
        }

        if(!utils::hasHexPrefix(*str_res) || str_res->size() == 2 || !utils::isHexDigits(std::string_view(*str_res).substr(2)))
        {
            return std::unexpected(Error{Error::Kind::INVALID_VALUE, std::format("'{}' is not a hex quantity: {}", field, *str_res)});
        }

        const std::string digits = str_res->substr(2);
        const auto first = digits.find_first_not_of('0');
        if(first != std::string::npos && digits.size() - first > 16)
        {
            return std::unexpected(Error{Error::Kind::OUT_OF_RANGE, std::format("'{}' does not fit 64 bits", field)});
        }

        return std::stoull(digits, nullptr, 16);
    }

    std::string toQuantity(std::uint64_t value)
    {
        return std::format("0x{:x}", value);
    }

    Result<evmc::address> parseAddress(const json & value, const std::string & field)
    {
        const auto str_res = parseString(value, field);
        if(!str_res)
        {
            return std::unexpected(str_res.error());
        }

        const auto bytes = utils::fromHex(*str_res);
        if(!utils::hasHexPrefix(*str_res) || !bytes || bytes->size() != sizeof(evmc::address::bytes))
        {
            return std::unexpected(Error{Error::Kind::INVALID_VALUE, std::format("'{}' is not an address: {}", field, *str_res)});
        }

        evmc::address address{};
        std::memcpy(address.bytes, bytes->data(), sizeof(address.bytes));
        return address;
    }

    Result<evmc::bytes32> parseWord(const json & value, const std::string & field)
    {
        const auto str_res = parseString(value, field);
        if(!str_res)
        {
            return std::unexpected(str_res.error());
        }

        const auto bytes = utils::fromHex(*str_res);
        if(!bytes || bytes->size() != sizeof(evmc::bytes32::bytes))
        {
            return std::unexpected(Error{Error::Kind::INVALID_VALUE, std::format("'{}' is not a 32-byte word: {}", field, *str_res)});
        }

        evmc::bytes32 word{};
        std::memcpy(word.bytes, bytes->data(), sizeof(word.bytes));
        return word;
    }

    Result<std::vector<std::uint8_t>> parseHexData(const json & value, const std::string & field)
    {
        const auto str_res = parseString(value, field);
        if(!str_res)
        {
            return std::unexpected(str_res.error());
        }

        auto bytes = utils::fromHex(*str_res);
        if(!bytes)
        {
            return std::unexpected(Error{Error::Kind::INVALID_VALUE, std::format("'{}' is not hex data", field)});
        }
        return std::move(*bytes);
    }

    Result<boost::multiprecision::cpp_int> parseInteger(const std::string & text)
    {
        if(utils::hasHexPrefix(text))
        {
            const std::string digits = text.substr(2);
            if(digits.empty() || !utils::isHexDigits(digits))
            {
                return std::unexpected(Error{Error::Kind::INVALID_VALUE, std::format("invalid hex integer '{}'", text)});
            }
            return boost::multiprecision::cpp_int("0x" + digits);
        }

        const bool negative = !text.empty() && text.front() == '-';
        const std::string digits = negative ? text.substr(1) : text;
        if(!_isDecimalDigits(digits))
        {
            return std::unexpected(Error{Error::Kind::INVALID_VALUE, std::format("invalid integer '{}'", text)});
        }

        // cpp_int reads a leading zero as an octal prefix
        const auto first = digits.find_first_not_of('0');
        const boost::multiprecision::cpp_int value(first == std::string::npos ? std::string("0") : digits.substr(first));
        return negative ? boost::multiprecision::cpp_int(-value) : value;
    }
}
