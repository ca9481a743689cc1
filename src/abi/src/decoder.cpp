#include "decoder.hpp"

#include <format>

#include <spdlog/spdlog.h>

#include "word.hpp"
#include "utils.hpp"

namespace wcc::abi
{
    namespace
    {
        Error _truncated(std::size_t offset, std::size_t needed, std::size_t data_size)
        {
            return Error{Error::Kind::TRUNCATED_DATA,
                std::format("need {} bytes at offset {}, data has {}", needed, offset, data_size)};
        }

        Error _unsupported(const TypeTag & type)
        {
            return Error{Error::Kind::UNSUPPORTED_TYPE, std::format("decoding {} is not supported", toString(type))};
        }

        Result<Value> _decodeString(const std::uint8_t* data, std::size_t data_size, std::size_t head_offset)
        {
            const auto offset_res = readWordAsSizeT(data, data_size, head_offset);
            if(!offset_res)
            {
                return std::unexpected(Error{Error::Kind::TRUNCATED_DATA,
                    std::format("invalid string offset word at {}", head_offset)});
            }

            const std::size_t string_offset = *offset_res;
            const auto length_res = readWordAsSizeT(data, data_size, string_offset);
            if(!length_res)
            {
                return std::unexpected(_truncated(string_offset, WORD_SIZE, data_size));
            }

            const std::size_t length = *length_res;
            const std::size_t content_offset = string_offset + WORD_SIZE;
            if(length > data_size - content_offset)
            {
                return std::unexpected(_truncated(content_offset, length, data_size));
            }

            return val::string(std::string(reinterpret_cast<const char*>(data + content_offset), length));
        }
    }

    Result<Value> decodeValue(const TypeTag & type, const std::uint8_t* data, std::size_t data_size, std::size_t head_offset)
    {
        if(data == nullptr || head_offset > data_size || data_size - head_offset < WORD_SIZE)
        {
            return std::unexpected(_truncated(head_offset, WORD_SIZE, data_size));
        }

        const std::uint8_t* word = data + head_offset;

        return std::visit(utils::Overloaded{
            [&](const AddressType &) -> Result<Value> { return val::address(addressFromWord(word)); },
            [&](const UintType &) -> Result<Value> { return val::integer(wordToUint(word)); },
            [&](const BoolType &) -> Result<Value> { return val::boolean(word[WORD_SIZE - 1] != 0); },
            [&](const StringType &) -> Result<Value> { return _decodeString(data, data_size, head_offset); },
            [&](const IntType &) -> Result<Value> { return std::unexpected(_unsupported(type)); },
            [&](const BytesType &) -> Result<Value> { return std::unexpected(_unsupported(type)); },
            [&](const ArrayType &) -> Result<Value> { return std::unexpected(_unsupported(type)); }
        }, type.kind);
    }

    Result<std::vector<Value>> decodeResult(const std::vector<TypeTag> & types, const Bytes & data)
    {
        if(data.empty())
        {
            return std::unexpected(Error{Error::Kind::EMPTY_DATA, "no data to decode"});
        }

        std::vector<Value> values;
        values.reserve(types.size());

        std::size_t head_offset = 0;
        for(const TypeTag & type : types)
        {
            auto value_res = decodeValue(type, data.data(), data.size(), head_offset);
            if(!value_res)
            {
                spdlog::debug("decodeResult: {} at offset {} failed: {}", toString(type), head_offset, value_res.error().message);
                return std::unexpected(value_res.error());
            }

            values.push_back(std::move(*value_res));
            head_offset += WORD_SIZE;
        }

        return values;
    }
}
