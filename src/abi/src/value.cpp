#include "value.hpp"

#include <algorithm>

#include "utils.hpp"

namespace wcc::abi
{
    AddressValue AddressValue::fromAddress(const evmc::address & address)
    {
        return AddressValue{Bytes(address.bytes, address.bytes + sizeof(address.bytes))};
    }

    std::optional<evmc::address> AddressValue::toAddress() const
    {
        if(raw.size() != sizeof(evmc::address::bytes))
        {
            return std::nullopt;
        }

        evmc::address address{};
        std::ranges::copy(raw, address.bytes);
        return address;
    }

    bool IntValue::operator==(const IntValue & other) const
    {
        return value == other.value;
    }

    bool ArrayValue::operator==(const ArrayValue & other) const
    {
        return elements == other.elements;
    }

    namespace val
    {
        Value address(const evmc::address & address)
        {
            return Value{AddressValue::fromAddress(address)};
        }

        Value address(Bytes raw)
        {
            return Value{AddressValue{std::move(raw)}};
        }

        Value integer(BigInt value)
        {
            return Value{IntValue{std::move(value)}};
        }

        Value boolean(bool value)
        {
            return Value{BoolValue{value}};
        }

        Value string(std::string value)
        {
            return Value{StringValue{std::move(value)}};
        }

        Value bytes(Bytes value)
        {
            return Value{BytesValue{std::move(value)}};
        }

        Value array(std::vector<Value> elements)
        {
            return Value{ArrayValue{std::move(elements)}};
        }
    }

    std::string describe(const Value & value)
    {
        return std::visit(utils::Overloaded{
            [](const AddressValue &) -> std::string { return "address"; },
            [](const IntValue &) -> std::string { return "integer"; },
            [](const BoolValue &) -> std::string { return "bool"; },
            [](const StringValue &) -> std::string { return "string"; },
            [](const BytesValue &) -> std::string { return "bytes"; },
            [](const ArrayValue &) -> std::string { return "array"; }
        }, value.data);
    }
}
