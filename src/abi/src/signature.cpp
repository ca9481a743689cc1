#include "signature.hpp"

#include <algorithm>
#include <format>
#include <regex>

#include <spdlog/spdlog.h>

#include "decoder.hpp"
#include "hex.hpp"

namespace wcc::abi
{
    namespace
    {
        std::string _trim(const std::string & value)
        {
            const auto first = value.find_first_not_of(" \t");
            if(first == std::string::npos)
            {
                return "";
            }
            const auto last = value.find_last_not_of(" \t");
            return value.substr(first, last - first + 1);
        }

        std::vector<TypeTag> _types(const std::vector<Param> & params)
        {
            std::vector<TypeTag> types;
            types.reserve(params.size());
            for(const Param & param : params)
            {
                types.push_back(param.type);
            }
            return types;
        }
    }

    std::string Function::signature() const
    {
        return canonicalSignature(name, inputs);
    }

    crypto::Selector Function::selector() const
    {
        return crypto::constructSelector(signature());
    }

    Result<EncodedCall> Function::encode(const std::vector<Value> & values) const
    {
        return encodeCall(name, inputs, values);
    }

    std::vector<TypeTag> Function::inputTypes() const
    {
        return _types(inputs);
    }

    std::vector<TypeTag> Function::outputTypes() const
    {
        return _types(outputs);
    }

    Result<std::vector<TypeTag>> parseTypeList(const std::string & types)
    {
        std::vector<TypeTag> out;
        if(_trim(types).empty())
        {
            return out;
        }

        std::size_t start = 0;
        while(true)
        {
            const std::size_t comma = types.find(',', start);
            const std::string item = _trim(types.substr(start, comma == std::string::npos ? std::string::npos : comma - start));

            if(item.empty())
            {
                return std::unexpected(Error{Error::Kind::INVALID_SIGNATURE_FORMAT,
                    std::format("empty type in list '{}'", types)});
            }

            auto type_res = parseTypeTag(item);
            if(!type_res)
            {
                return std::unexpected(type_res.error());
            }
            out.push_back(std::move(*type_res));

            if(comma == std::string::npos)
            {
                break;
            }
            start = comma + 1;
        }

        return out;
    }

    Result<Function> parseSignature(const std::string & signature)
    {
        static const std::regex signature_regex(R"(^(\w+)\((.*)\)$)");

        std::smatch match;
        const std::string trimmed = _trim(signature);
        if(!std::regex_match(trimmed, match, signature_regex))
        {
            spdlog::debug("parseSignature: malformed signature '{}'", signature);
            return std::unexpected(Error{Error::Kind::INVALID_SIGNATURE_FORMAT,
                std::format("malformed signature '{}'", signature)});
        }

        auto types_res = parseTypeList(match[2].str());
        if(!types_res)
        {
            return std::unexpected(types_res.error());
        }

        Function function;
        function.name = match[1].str();
        function.inputs.reserve(types_res->size());
        for(std::size_t i = 0; i < types_res->size(); ++i)
        {
            function.inputs.push_back(Param{std::format("param{}", i), std::move((*types_res)[i])});
        }

        return function;
    }

    Result<std::vector<Value>> decodeCall(const Function & function, const Bytes & calldata)
    {
        const crypto::Selector expected = function.selector();
        if(calldata.size() < expected.size())
        {
            return std::unexpected(Error{Error::Kind::TRUNCATED_DATA,
                std::format("calldata shorter than a selector ({} bytes)", calldata.size())});
        }

        if(!std::equal(expected.begin(), expected.end(), calldata.begin()))
        {
            return std::unexpected(Error{Error::Kind::SELECTOR_MISMATCH,
                std::format("selector {} does not match {} ({})",
                    utils::toHex(calldata.data(), expected.size()), function.signature(),
                    utils::toHex(expected.data(), expected.size()))});
        }

        if(function.inputs.empty())
        {
            return std::vector<Value>{};
        }

        return decodeResult(function.inputTypes(), Bytes(calldata.begin() + expected.size(), calldata.end()));
    }
}
