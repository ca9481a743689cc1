#pragma once

#include <vector>

#include "abi_error.hpp"
#include "type_tag.hpp"
#include "value.hpp"

namespace wcc::abi
{
    /**
     * @brief Decodes one value whose head word sits at head_offset.
     *
     * Static types (address, uintN, bool) are read from the head word itself.
     * For string the head word is an offset into data pointing at a length word
     * followed by the content. Other types fail with UNSUPPORTED_TYPE.
     */
    Result<Value> decodeValue(const TypeTag & type, const std::uint8_t* data, std::size_t data_size, std::size_t head_offset);

    /**
     * @brief Decodes an argument block (no selector) against an ordered list of types.
     */
    Result<std::vector<Value>> decodeResult(const std::vector<TypeTag> & types, const Bytes & data);
}
