#pragma once

#include <cstdint>
#include <string>
#include <expected>
#include <format>

namespace wcc::parse
{
    /**
     * @brief Failure while turning text or JSON (arguments, amounts, logs, config files) into typed values.
     */
    struct Error
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN         = 0U,

            INVALID_VALUE   = 1U,   // malformed text, bad hex, unreadable file
            OUT_OF_RANGE    = 2U,   // well formed but does not fit the target
            TYPE_MISMATCH   = 3U,   // wrong JSON type
            MISSING_FIELD   = 4U    // required object key absent
        };

        Kind kind = Kind::UNKNOWN;
        std::string message = "";
    };

    template<class T>
    using Result = std::expected<T, Error>;
}

template <>
struct std::formatter<wcc::parse::Error::Kind> : std::formatter<std::string> {
    auto format(const wcc::parse::Error::Kind & err, format_context& ctx) const {
        using Kind = wcc::parse::Error::Kind;
        switch(err)
        {
            case Kind::INVALID_VALUE : return formatter<string>::format("Invalid value", ctx);
            case Kind::OUT_OF_RANGE  : return formatter<string>::format("Value out of range", ctx);
            case Kind::TYPE_MISMATCH : return formatter<string>::format("JSON type mismatch", ctx);
            case Kind::MISSING_FIELD : return formatter<string>::format("Missing field", ctx);

            default:  return formatter<string>::format("Unknown parse error", ctx);
        }
    }
};
