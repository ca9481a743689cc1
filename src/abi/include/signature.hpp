#pragma once

#include <string>
#include <vector>

#include "abi_error.hpp"
#include "encoder.hpp"

namespace wcc::abi
{
    struct Function
    {
        std::string name;
        std::vector<Param> inputs;
        std::vector<Param> outputs;

        std::string signature() const;

        crypto::Selector selector() const;

        Result<EncodedCall> encode(const std::vector<Value> & values) const;

        std::vector<TypeTag> inputTypes() const;
        std::vector<TypeTag> outputTypes() const;
    };

    /**
     * @brief Parses "name(type1,type2,...)" into a Function.
     *
     * Whitespace around type names is tolerated, parameters are named param0, param1, ...
     */
    Result<Function> parseSignature(const std::string & signature);

    /**
     * @brief Parses a comma separated type list such as "address,uint256".
     */
    Result<std::vector<TypeTag>> parseTypeList(const std::string & types);

    /**
     * @brief Checks the 4-byte selector of calldata against the function and decodes its arguments.
     */
    Result<std::vector<Value>> decodeCall(const Function & function, const Bytes & calldata);
}
