#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
using json = nlohmann::json;

#include <boost/multiprecision/cpp_int.hpp>

#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

#include "parse_error.hpp"

namespace wcc::parse
{
    /**
     * @brief A tag type to select the nlohmann::json conversions.
     */
    struct use_json_t{};

    static constexpr use_json_t use_json{};

    /**
     * @brief Converts a JSON object to a T.
     *
     * @tparam T The record type.
     * @param json The JSON object to convert.
     */
    template<class T>
    Result<T> parseFromJson(json json, use_json_t);

    /**
     * @brief Converts a T to a JSON object.
     *
     * @tparam T The record type.
     * @param message The record to convert.
     */
    template<class T>
    Result<json> parseToJson(T message, use_json_t);

    /**
     * @brief Parses text into a JSON document without throwing.
     */
    Result<json> parseJsonString(const std::string & text);

    Result<json> requireField(const json & object, const std::string & key);

    Result<std::string> parseString(const json & value, const std::string & field);

    /**
     * @brief JSON-RPC quantity: "0x"-prefixed hex string or a plain unsigned JSON number.
     */
    Result<std::uint64_t> parseQuantity(const json & value, const std::string & field);

    std::string toQuantity(std::uint64_t value);

    Result<evmc::address> parseAddress(const json & value, const std::string & field);

    Result<evmc::bytes32> parseWord(const json & value, const std::string & field);

    Result<std::vector<std::uint8_t>> parseHexData(const json & value, const std::string & field);

    /**
     * @brief Parses a decimal integer with an optional leading '-', or a "0x" hex integer.
     */
    Result<boost::multiprecision::cpp_int> parseInteger(const std::string & text);
}
