#include "type_tag.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

#include <spdlog/spdlog.h>

#include "utils.hpp"

namespace wcc::abi
{
    namespace
    {
        bool _isIdentifierChar(const char c)
        {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        }

        Result<std::uint16_t> _parseIntegerBits(const std::string & name, const std::string & digits)
        {
            if(digits.empty())
            {
                return static_cast<std::uint16_t>(256);
            }

            unsigned int bits = 0;
            const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), bits);
            if(ec != std::errc{} || ptr != digits.data() + digits.size())
            {
                return std::unexpected(Error{Error::Kind::UNSUPPORTED_TYPE, std::format("unsupported type '{}'", name)});
            }

            if(bits > 256 || !isValidIntegerBits(static_cast<std::uint16_t>(bits)))
            {
                return std::unexpected(Error{Error::Kind::UNSUPPORTED_TYPE, std::format("invalid integer width in '{}'", name)});
            }

            return static_cast<std::uint16_t>(bits);
        }
    }

    bool ArrayType::operator==(const ArrayType & other) const
    {
        if(element == nullptr || other.element == nullptr)
        {
            return element == other.element;
        }
        return *element == *other.element;
    }

    namespace tag
    {
        TypeTag address()
        {
            return TypeTag{AddressType{}};
        }

        TypeTag uintN(std::uint16_t bits)
        {
            return TypeTag{UintType{bits}};
        }

        TypeTag intN(std::uint16_t bits)
        {
            return TypeTag{IntType{bits}};
        }

        TypeTag boolean()
        {
            return TypeTag{BoolType{}};
        }

        TypeTag string()
        {
            return TypeTag{StringType{}};
        }

        TypeTag bytes()
        {
            return TypeTag{BytesType{}};
        }

        TypeTag array(TypeTag element)
        {
            return TypeTag{ArrayType{std::make_shared<TypeTag>(std::move(element))}};
        }
    }

    bool isValidIntegerBits(std::uint16_t bits)
    {
        return bits >= 8 && bits <= 256 && (bits % 8) == 0;
    }

    bool isDynamic(const TypeTag & type)
    {
        return std::visit(utils::Overloaded{
            [](const AddressType &) { return false; },
            [](const UintType &)    { return false; },
            [](const IntType &)     { return false; },
            [](const BoolType &)    { return false; },
            [](const StringType &)  { return true; },
            [](const BytesType &)   { return true; },
            [](const ArrayType &)   { return true; }
        }, type.kind);
    }

    std::string toString(const TypeTag & type)
    {
        return std::visit(utils::Overloaded{
            [](const AddressType &) -> std::string { return "address"; },
            [](const UintType & t) -> std::string { return std::format("uint{}", t.bits); },
            [](const IntType & t) -> std::string { return std::format("int{}", t.bits); },
            [](const BoolType &) -> std::string { return "bool"; },
            [](const StringType &) -> std::string { return "string"; },
            [](const BytesType &) -> std::string { return "bytes"; },
            [](const ArrayType & t) -> std::string
            {
                if(t.element == nullptr)
                {
                    return "[]";
                }
                return toString(*t.element) + "[]";
            }
        }, type.kind);
    }

    Result<TypeTag> parseTypeTag(const std::string & name)
    {
        if(name.empty())
        {
            return std::unexpected(Error{Error::Kind::INVALID_SIGNATURE_FORMAT, "empty type name"});
        }

        if(name.size() > 2 && name.ends_with("[]"))
        {
            auto element_res = parseTypeTag(name.substr(0, name.size() - 2));
            if(!element_res)
            {
                return std::unexpected(element_res.error());
            }
            return tag::array(std::move(*element_res));
        }

        if(name.front() == '(' || name.back() == ']')
        {
            spdlog::debug("parseTypeTag: tuples and fixed-size arrays are not supported : {}", name);
            return std::unexpected(Error{Error::Kind::UNSUPPORTED_TYPE, std::format("unsupported type '{}'", name)});
        }

        if(!std::ranges::all_of(name, _isIdentifierChar))
        {
            return std::unexpected(Error{Error::Kind::INVALID_SIGNATURE_FORMAT, std::format("malformed type name '{}'", name)});
        }

        if(name == "address") return tag::address();
        if(name == "bool") return tag::boolean();
        if(name == "string") return tag::string();
        if(name == "bytes") return tag::bytes();

        if(name.starts_with("uint"))
        {
            const auto bits_res = _parseIntegerBits(name, name.substr(4));
            if(!bits_res)
            {
                return std::unexpected(bits_res.error());
            }
            return tag::uintN(*bits_res);
        }

        if(name.starts_with("int"))
        {
            const auto bits_res = _parseIntegerBits(name, name.substr(3));
            if(!bits_res)
            {
                return std::unexpected(bits_res.error());
            }
            return tag::intN(*bits_res);
        }

        return std::unexpected(Error{Error::Kind::UNSUPPORTED_TYPE, std::format("unsupported type '{}'", name)});
    }
}
