#pragma once

#include <vector>

#include "parser.hpp"
#include "abi.hpp"

namespace wcc::parse
{
    /**
     * @brief Builds an abi::Value of the given wire type from its JSON form.
     *
     * address and bytes are hex strings, integers are JSON numbers or decimal / "0x" hex
     * strings, bool is a JSON bool, string is a JSON string, arrays are JSON arrays.
     * Address byte length is not checked here, the encoder rejects anything but 20 bytes.
     */
    Result<abi::Value> parseValue(const abi::TypeTag & type, const json & value);

    Result<std::vector<abi::Value>> parseValues(const std::vector<abi::TypeTag> & types, const json & values);

    /**
     * @brief Integers are rendered as decimal strings so that 256-bit values survive.
     */
    json valueToJson(const abi::Value & value);
}
