#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>

#include "abi_error.hpp"

namespace wcc::abi
{
    struct TypeTag;

    struct AddressType
    {
        bool operator==(const AddressType &) const = default;
    };

    struct UintType
    {
        std::uint16_t bits = 256;
        bool operator==(const UintType &) const = default;
    };

    struct IntType
    {
        std::uint16_t bits = 256;
        bool operator==(const IntType &) const = default;
    };

    struct BoolType
    {
        bool operator==(const BoolType &) const = default;
    };

    struct StringType
    {
        bool operator==(const StringType &) const = default;
    };

    struct BytesType
    {
        bool operator==(const BytesType &) const = default;
    };

    /**
     * @brief Dynamic-length array `T[]`. Fixed-length arrays are not modelled.
     */
    struct ArrayType
    {
        std::shared_ptr<const TypeTag> element;
        bool operator==(const ArrayType & other) const;
    };

    /**
     * @brief Wire type of a single parameter.
     *
     * Closed set of alternatives. Consumers visit it with an exhaustive
     * visitor so that adding an alternative breaks every switch-site at compile time.
     */
    struct TypeTag
    {
        using Variant = std::variant<AddressType, UintType, IntType, BoolType, StringType, BytesType, ArrayType>;

        Variant kind;

        bool operator==(const TypeTag & other) const = default;
    };

    namespace tag
    {
        TypeTag address();
        TypeTag uintN(std::uint16_t bits = 256);
        TypeTag intN(std::uint16_t bits = 256);
        TypeTag boolean();
        TypeTag string();
        TypeTag bytes();
        TypeTag array(TypeTag element);
    }

    /**
     * @brief Integer widths must be a multiple of 8 in [8, 256].
     */
    bool isValidIntegerBits(std::uint16_t bits);

    /**
     * @brief String, bytes and every array are dynamic, the rest is static.
     */
    bool isDynamic(const TypeTag & type);

    /**
     * @brief Canonical lowercase name used in signatures, e.g. "uint256[]".
     */
    std::string toString(const TypeTag & type);

    /**
     * @brief Parses a canonical type name.
     *
     * "uint" and "int" are accepted as aliases of the 256-bit forms.
     * Known but unmodelled types (bytesN, T[N], tuples) fail with UNSUPPORTED_TYPE,
     * malformed input with INVALID_SIGNATURE_FORMAT.
     */
    Result<TypeTag> parseTypeTag(const std::string & name);
}
