#pragma once

#include <string>
#include <vector>

#include "abi_error.hpp"
#include "type_tag.hpp"
#include "value.hpp"
#include "word.hpp"
#include "crypto.hpp"

namespace wcc::abi
{
    struct Param
    {
        std::string name;
        TypeTag type;
    };

    /**
     * @brief selector ++ head ++ tail, exactly as built by encodeCall.
     */
    struct EncodedCall
    {
        crypto::Selector selector{};
        std::vector<Word> head;
        Bytes tail;

        /**
         * @brief head ++ tail, the argument block that decodeResult consumes.
         */
        Bytes argumentBytes() const;

        Bytes bytes() const;

        /**
         * @brief "0x" + hex(selector ++ head ++ tail)
         */
        std::string hex() const;

        /**
         * @brief 8 lowercase hex characters, no prefix.
         */
        std::string selectorHex() const;
    };

    /**
     * @brief name(type1,type2,...) with canonical type names, no spaces and no parameter names.
     */
    std::string canonicalSignature(const std::string & name, const std::vector<Param> & params);

    /**
     * @brief Encodes a single value against its wire type.
     *
     * Arrays are encoded as a length word followed by the inline concatenation of
     * their element encodings. No per-element offset table is written, so arrays
     * of dynamic elements do not follow the general nested layout.
     */
    Result<Bytes> encodeValue(const TypeTag & type, const Value & value);

    Result<EncodedCall> encodeCall(const std::string & name, const std::vector<Param> & params, const std::vector<Value> & values);
}
