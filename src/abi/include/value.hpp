#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

namespace wcc::abi
{
    using Bytes = std::vector<std::uint8_t>;
    using BigInt = boost::multiprecision::cpp_int;

    struct Value;

    /**
     * @brief Raw address bytes. Must hold exactly 20 bytes to be encodable.
     */
    struct AddressValue
    {
        Bytes raw;

        static AddressValue fromAddress(const evmc::address & address);

        std::optional<evmc::address> toAddress() const;

        bool operator==(const AddressValue &) const = default;
    };

    struct IntValue
    {
        BigInt value;

        bool operator==(const IntValue & other) const;
    };

    struct BoolValue
    {
        bool value = false;

        bool operator==(const BoolValue &) const = default;
    };

    struct StringValue
    {
        std::string value;

        bool operator==(const StringValue &) const = default;
    };

    struct BytesValue
    {
        Bytes value;

        bool operator==(const BytesValue &) const = default;
    };

    struct ArrayValue
    {
        std::vector<Value> elements;

        bool operator==(const ArrayValue & other) const;
    };

    struct Value
    {
        using Variant = std::variant<AddressValue, IntValue, BoolValue, StringValue, BytesValue, ArrayValue>;

        Variant data;

        bool operator==(const Value & other) const = default;
    };

    namespace val
    {
        Value address(const evmc::address & address);
        Value address(Bytes raw);
        Value integer(BigInt value);
        Value boolean(bool value);
        Value string(std::string value);
        Value bytes(Bytes value);
        Value array(std::vector<Value> elements);
    }

    /**
     * @brief Short name of the held alternative, used in diagnostics.
     */
    std::string describe(const Value & value);
}
