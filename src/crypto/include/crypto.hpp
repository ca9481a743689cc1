#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <string>
#include <vector>

#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

namespace wcc::crypto
{
    using Selector = std::array<std::uint8_t, 4>;

    evmc::bytes32 keccak256(const std::uint8_t* data, std::size_t size);

    evmc::bytes32 keccak256(const std::string & data);

    /**
     * @brief First four bytes of keccak256(signature).
     */
    Selector constructSelector(const std::string & signature);

    evmc::bytes32 constructEventTopic(const std::string & signature);

    std::optional<std::vector<evmc::bytes32>> decodeTopicWords(const std::vector<std::string> & topics_hex);

    struct KeyError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,

            INVALID_PRIVATE_KEY,
            SIGNING_ERROR
        } kind = Kind::UNKNOWN;

        std::string message = "";
    };

    using PrivateKey = std::array<std::uint8_t, 32>;

    struct PublicKey
    {
        evmc::bytes32 x{};
        evmc::bytes32 y{};
    };

    /**
     * @brief Accepts 64 hex characters with an optional "0x" prefix.
     */
    bool validatePrivateKey(const std::string & private_key_hex);

    std::expected<PrivateKey, KeyError> parsePrivateKey(const std::string & private_key_hex);

    std::expected<PublicKey, KeyError> privateKeyToPublicKey(const PrivateKey & private_key);

    /**
     * @brief Derives the account address: keccak256 of the uncompressed secp256k1
     * public key (without the 0x04 tag), last 20 bytes.
     */
    std::expected<evmc::address, KeyError> privateKeyToAddress(const PrivateKey & private_key);

    std::expected<evmc::address, KeyError> privateKeyToAddress(const std::string & private_key_hex);

    std::expected<PrivateKey, KeyError> generatePrivateKey();
}

template <>
struct std::formatter<wcc::crypto::KeyError::Kind> : std::formatter<std::string> {
    auto format(const wcc::crypto::KeyError::Kind & err, format_context& ctx) const {
        switch(err)
        {
            case wcc::crypto::KeyError::Kind::INVALID_PRIVATE_KEY : return formatter<string>::format("Invalid private key", ctx);
            case wcc::crypto::KeyError::Kind::SIGNING_ERROR : return formatter<string>::format("Signing error", ctx);

            default:  return formatter<string>::format("Unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
