#include "value_json.hpp"

#include <format>

#include "hex.hpp"
#include "utils.hpp"

namespace wcc::parse
{
    namespace
    {
        Result<abi::Value> _parseIntegerValue(const json & value)
        {
            if(value.is_number_unsigned())
            {
                return abi::val::integer(abi::BigInt(value.get<std::uint64_t>()));
            }

            if(value.is_number_integer())
            {
                return abi::val::integer(abi::BigInt(value.get<std::int64_t>()));
            }

            if(!value.is_string())
            {
                return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, std::format("expected an integer, got {}", value.type_name())});
            }

            auto integer_res = parseInteger(value.get<std::string>());
            if(!integer_res)
            {
                return std::unexpected(integer_res.error());
            }
            return abi::val::integer(std::move(*integer_res));
        }

        Result<abi::Value> _parseBoolValue(const json & value)
        {
            if(value.is_boolean())
            {
                return abi::val::boolean(value.get<bool>());
            }

            if(value.is_string())
            {
                const std::string text = utils::toLower(value.get<std::string>());
                if(text == "true") return abi::val::boolean(true);
                if(text == "false") return abi::val::boolean(false);
            }

            return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, std::format("expected a bool, got {}", value.dump())});
        }

        Result<abi::Bytes> _parseHexValue(const json & value, const char* what)
        {
            if(!value.is_string())
            {
                return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, std::format("expected {} as hex string, got {}", what, value.type_name())});
            }

            auto bytes = utils::fromHex(value.get<std::string>());
            if(!bytes)
            {
                return std::unexpected(Error{Error::Kind::INVALID_VALUE, std::format("invalid hex for {}: {}", what, value.get<std::string>())});
            }
            return std::move(*bytes);
        }

        Result<abi::Value> _parseArrayValue(const abi::ArrayType & type, const json & value)
        {
            if(!value.is_array())
            {
                return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, std::format("expected an array, got {}", value.type_name())});
            }

            if(type.element == nullptr)
            {
                return std::unexpected(Error{Error::Kind::INVALID_VALUE, "array type without element type"});
            }

            std::vector<abi::Value> elements;
            elements.reserve(value.size());
            for(const json & element : value)
            {
                auto element_res = parseValue(*type.element, element);
                if(!element_res)
                {
                    return std::unexpected(element_res.error());
                }
                elements.push_back(std::move(*element_res));
            }
            return abi::val::array(std::move(elements));
        }
    }

    Result<abi::Value> parseValue(const abi::TypeTag & type, const json & value)
    {
        return std::visit(utils::Overloaded{
            [&](const abi::AddressType &) -> Result<abi::Value>
            {
                // length is left to the encoder, the prefix is not optional
                if(value.is_string() && !utils::hasHexPrefix(value.get<std::string>()))
                {
                    return std::unexpected(Error{Error::Kind::INVALID_VALUE,
                        std::format("address must start with 0x: {}", value.get<std::string>())});
                }

                auto bytes_res = _parseHexValue(value, "address");
                if(!bytes_res)
                {
                    return std::unexpected(bytes_res.error());
                }
                return abi::val::address(std::move(*bytes_res));
            },
            [&](const abi::UintType &) { return _parseIntegerValue(value); },
            [&](const abi::IntType &) { return _parseIntegerValue(value); },
            [&](const abi::BoolType &) { return _parseBoolValue(value); },
            [&](const abi::StringType &) -> Result<abi::Value>
            {
                if(!value.is_string())
                {
                    return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, std::format("expected a string, got {}", value.type_name())});
                }
                return abi::val::string(value.get<std::string>());
            },
            [&](const abi::BytesType &) -> Result<abi::Value>
            {
                auto bytes_res = _parseHexValue(value, "bytes");
                if(!bytes_res)
                {
                    return std::unexpected(bytes_res.error());
                }
                return abi::val::bytes(std::move(*bytes_res));
            },
            [&](const abi::ArrayType & t) { return _parseArrayValue(t, value); }
        }, type.kind);
    }

    Result<std::vector<abi::Value>> parseValues(const std::vector<abi::TypeTag> & types, const json & values)
    {
        if(!values.is_array())
        {
            return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, "arguments must be a JSON array"});
        }

        if(values.size() != types.size())
        {
            return std::unexpected(Error{Error::Kind::INVALID_VALUE,
                std::format("expected {} arguments, got {}", types.size(), values.size())});
        }

        std::vector<abi::Value> out;
        out.reserve(types.size());
        for(std::size_t i = 0; i < types.size(); ++i)
        {
            auto value_res = parseValue(types[i], values[i]);
            if(!value_res)
            {
                return std::unexpected(Error{value_res.error().kind,
                    std::format("argument {} ({}): {}", i, abi::toString(types[i]), value_res.error().message)});
            }
            out.push_back(std::move(*value_res));
        }
        return out;
    }

    json valueToJson(const abi::Value & value)
    {
        return std::visit(utils::Overloaded{
            [](const abi::AddressValue & v) -> json { return utils::toHex(v.raw, true); },
            [](const abi::IntValue & v) -> json { return v.value.str(); },
            [](const abi::BoolValue & v) -> json { return v.value; },
            [](const abi::StringValue & v) -> json { return v.value; },
            [](const abi::BytesValue & v) -> json { return utils::toHex(v.value, true); },
            [](const abi::ArrayValue & v) -> json
            {
                json out = json::array();
                for(const abi::Value & element : v.elements)
                {
                    out.push_back(valueToJson(element));
                }
                return out;
            }
        }, value.data);
    }
}
