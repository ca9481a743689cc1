#include "encoder.hpp"

#include <algorithm>
#include <format>

#include <spdlog/spdlog.h>

#include "hex.hpp"
#include "utils.hpp"

namespace wcc::abi
{
    namespace
    {
        void _append(Bytes & out, const Word & word)
        {
            out.insert(out.end(), word.begin(), word.end());
        }

        Error _typeMismatch(const TypeTag & type, const Value & value)
        {
            return Error{Error::Kind::VALUE_TYPE_MISMATCH,
                std::format("cannot encode {} as {}", describe(value), toString(type))};
        }

        Result<Bytes> _encodeAddress(const Value & value, const TypeTag & type)
        {
            const auto * address = std::get_if<AddressValue>(&value.data);
            if(address == nullptr)
            {
                return std::unexpected(_typeMismatch(type, value));
            }

            if(address->raw.size() != sizeof(evmc::address::bytes))
            {
                return std::unexpected(Error{Error::Kind::INVALID_ADDRESS,
                    std::format("address must be 20 bytes, got {}", address->raw.size())});
            }

            Bytes encoded(WORD_SIZE, 0);
            std::ranges::copy(address->raw, encoded.begin() + 12); // Right-align in last 20 bytes
            return encoded;
        }

        Result<Bytes> _encodeInteger(const Value & value, const TypeTag & type, std::uint16_t bits, bool is_signed)
        {
            const auto * integer = std::get_if<IntValue>(&value.data);
            if(integer == nullptr)
            {
                return std::unexpected(_typeMismatch(type, value));
            }

            if(!isValidIntegerBits(bits))
            {
                return std::unexpected(Error{Error::Kind::UNSUPPORTED_TYPE, std::format("invalid integer width {}", bits)});
            }

            const auto range_res = checkIntegerRange(integer->value, bits, is_signed);
            if(!range_res)
            {
                return std::unexpected(range_res.error());
            }

            const auto word_res = intToWord(integer->value, is_signed);
            if(!word_res)
            {
                return std::unexpected(word_res.error());
            }
            return Bytes(word_res->begin(), word_res->end());
        }

        Result<Bytes> _encodeBool(const Value & value, const TypeTag & type)
        {
            const auto * boolean = std::get_if<BoolValue>(&value.data);
            if(boolean == nullptr)
            {
                return std::unexpected(_typeMismatch(type, value));
            }

            Bytes encoded(WORD_SIZE, 0);
            encoded[WORD_SIZE - 1] = boolean->value ? 0x01 : 0x00;
            return encoded;
        }

        Bytes _encodeLengthPrefixed(const std::uint8_t* data, std::size_t size)
        {
            const Bytes content = padTo32(Bytes(data, data + size));

            Bytes encoded;
            encoded.reserve(WORD_SIZE + content.size());

            _append(encoded, sizeToWord(size));
            encoded.insert(encoded.end(), content.begin(), content.end());
            return encoded;
        }

        Result<Bytes> _encodeString(const Value & value, const TypeTag & type)
        {
            const auto * str = std::get_if<StringValue>(&value.data);
            if(str == nullptr)
            {
                return std::unexpected(_typeMismatch(type, value));
            }

            return _encodeLengthPrefixed(reinterpret_cast<const std::uint8_t*>(str->value.data()), str->value.size());
        }

        Result<Bytes> _encodeBytes(const Value & value, const TypeTag & type)
        {
            const auto * bytes = std::get_if<BytesValue>(&value.data);
            if(bytes == nullptr)
            {
                return std::unexpected(_typeMismatch(type, value));
            }

            return _encodeLengthPrefixed(bytes->value.data(), bytes->value.size());
        }

        Result<Bytes> _encodeArray(const Value & value, const TypeTag & type, const ArrayType & array_type)
        {
            const auto * array = std::get_if<ArrayValue>(&value.data);
            if(array == nullptr)
            {
                return std::unexpected(_typeMismatch(type, value));
            }

            if(array_type.element == nullptr)
            {
                return std::unexpected(Error{Error::Kind::UNSUPPORTED_TYPE, "array without element type"});
            }

            Bytes encoded;
            _append(encoded, sizeToWord(array->elements.size()));

            for(const Value & element : array->elements)
            {
                const auto element_res = encodeValue(*array_type.element, element);
                if(!element_res)
                {
                    return std::unexpected(element_res.error());
                }
                encoded.insert(encoded.end(), element_res->begin(), element_res->end());
            }
            return encoded;
        }
    }

    Bytes EncodedCall::argumentBytes() const
    {
        Bytes out;
        out.reserve(head.size() * WORD_SIZE + tail.size());
        for(const Word & word : head)
        {
            _append(out, word);
        }
        out.insert(out.end(), tail.begin(), tail.end());
        return out;
    }

    Bytes EncodedCall::bytes() const
    {
        Bytes out(selector.begin(), selector.end());
        const Bytes args = argumentBytes();
        out.insert(out.end(), args.begin(), args.end());
        return out;
    }

    std::string EncodedCall::hex() const
    {
        return utils::toHex(bytes(), true);
    }

    std::string EncodedCall::selectorHex() const
    {
        return utils::toHex(selector.data(), selector.size(), false);
    }

    std::string canonicalSignature(const std::string & name, const std::vector<Param> & params)
    {
        std::string signature = name + "(";
        for(std::size_t i = 0; i < params.size(); ++i)
        {
            if(i > 0)
            {
                signature += ",";
            }
            signature += toString(params[i].type);
        }
        signature += ")";
        return signature;
    }

    Result<Bytes> encodeValue(const TypeTag & type, const Value & value)
    {
        return std::visit(utils::Overloaded{
            [&](const AddressType &) { return _encodeAddress(value, type); },
            [&](const UintType & t)  { return _encodeInteger(value, type, t.bits, false); },
            [&](const IntType & t)   { return _encodeInteger(value, type, t.bits, true); },
            [&](const BoolType &)    { return _encodeBool(value, type); },
            [&](const StringType &)  { return _encodeString(value, type); },
            [&](const BytesType &)   { return _encodeBytes(value, type); },
            [&](const ArrayType & t) { return _encodeArray(value, type, t); }
        }, type.kind);
    }

    Result<EncodedCall> encodeCall(const std::string & name, const std::vector<Param> & params, const std::vector<Value> & values)
    {
        if(params.size() != values.size())
        {
            return std::unexpected(Error{Error::Kind::ARITY_MISMATCH,
                std::format("{} expects {} arguments, got {}", name, params.size(), values.size())});
        }

        const std::string signature = canonicalSignature(name, params);

        // first pass: classify and encode every argument
        std::vector<bool> dynamic;
        std::vector<Bytes> encoded;
        dynamic.reserve(params.size());
        encoded.reserve(params.size());

        for(std::size_t i = 0; i < params.size(); ++i)
        {
            auto value_res = encodeValue(params[i].type, values[i]);
            if(!value_res)
            {
                spdlog::debug("encodeCall {}: argument {} rejected: {}", signature, i, value_res.error().message);
                return std::unexpected(value_res.error());
            }

            dynamic.push_back(isDynamic(params[i].type));
            encoded.push_back(std::move(*value_res));
        }

        EncodedCall call;
        call.selector = crypto::constructSelector(signature);
        call.head.reserve(params.size());

        // second pass: head words and tail payloads
        std::size_t tail_offset = WORD_SIZE * params.size();
        for(std::size_t i = 0; i < params.size(); ++i)
        {
            if(!dynamic[i])
            {
                Word word{};
                std::ranges::copy(encoded[i], word.begin());
                call.head.push_back(word);
                continue;
            }

            call.head.push_back(sizeToWord(tail_offset));
            call.tail.insert(call.tail.end(), encoded[i].begin(), encoded[i].end());
            tail_offset += encoded[i].size();
        }

        spdlog::debug("encodeCall {} : head {} words, tail {} bytes", signature, call.head.size(), call.tail.size());
        return call;
    }
}
