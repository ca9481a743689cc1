#pragma once

#include <cstdint>
#include <string>
#include <expected>
#include <format>

namespace wcc::abi
{
    struct Error
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,

            ARITY_MISMATCH,
            INVALID_ADDRESS,
            VALUE_OUT_OF_RANGE,
            NEGATIVE_VALUE_FOR_UNSIGNED,
            VALUE_TYPE_MISMATCH,
            UNSUPPORTED_TYPE,

            TRUNCATED_DATA,
            EMPTY_DATA,
            SELECTOR_MISMATCH,

            INVALID_SIGNATURE_FORMAT
        };

        Kind kind = Kind::UNKNOWN;
        std::string message = "";
    };

    template<class T>
    using Result = std::expected<T, Error>;
}

template <>
struct std::formatter<wcc::abi::Error::Kind> : std::formatter<std::string> {
    auto format(const wcc::abi::Error::Kind & err, format_context& ctx) const {
        switch(err)
        {
            case wcc::abi::Error::Kind::ARITY_MISMATCH : return formatter<string>::format("Arity mismatch", ctx);
            case wcc::abi::Error::Kind::INVALID_ADDRESS : return formatter<string>::format("Invalid address", ctx);
            case wcc::abi::Error::Kind::VALUE_OUT_OF_RANGE : return formatter<string>::format("Value out of range", ctx);
            case wcc::abi::Error::Kind::NEGATIVE_VALUE_FOR_UNSIGNED : return formatter<string>::format("Negative value for unsigned", ctx);
            case wcc::abi::Error::Kind::VALUE_TYPE_MISMATCH : return formatter<string>::format("Value type mismatch", ctx);
            case wcc::abi::Error::Kind::UNSUPPORTED_TYPE : return formatter<string>::format("Unsupported type", ctx);

            case wcc::abi::Error::Kind::TRUNCATED_DATA : return formatter<string>::format("Truncated data", ctx);
            case wcc::abi::Error::Kind::EMPTY_DATA : return formatter<string>::format("Empty data", ctx);
            case wcc::abi::Error::Kind::SELECTOR_MISMATCH : return formatter<string>::format("Selector mismatch", ctx);

            case wcc::abi::Error::Kind::INVALID_SIGNATURE_FORMAT : return formatter<string>::format("Invalid signature format", ctx);

            default:  return formatter<string>::format("Unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
