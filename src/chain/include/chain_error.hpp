#pragma once

#include <cstdint>
#include <string>
#include <expected>
#include <format>

namespace wcc::chain
{
    struct Error
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,

            INVALID_ADDRESS,
            INVALID_HEX,
            INSUFFICIENT_TOPICS,
            INVALID_VALUE
        };

        Kind kind = Kind::UNKNOWN;
        std::string message = "";
    };

    template<class T>
    using Result = std::expected<T, Error>;
}

template <>
struct std::formatter<wcc::chain::Error::Kind> : std::formatter<std::string> {
    auto format(const wcc::chain::Error::Kind & err, format_context& ctx) const {
        switch(err)
        {
            case wcc::chain::Error::Kind::INVALID_ADDRESS : return formatter<string>::format("Invalid address", ctx);
            case wcc::chain::Error::Kind::INVALID_HEX : return formatter<string>::format("Invalid hex", ctx);
            case wcc::chain::Error::Kind::INSUFFICIENT_TOPICS : return formatter<string>::format("Insufficient topics", ctx);
            case wcc::chain::Error::Kind::INVALID_VALUE : return formatter<string>::format("Invalid value", ctx);

            default:  return formatter<string>::format("Unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
