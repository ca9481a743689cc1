#include "crypto.hpp"

#include <algorithm>
#include <cstring>
#include <random>

#include <ethash/keccak.hpp>
#include <secp256k1.h>
#include <spdlog/spdlog.h>

#include "hex.hpp"

namespace wcc::crypto
{
    namespace
    {
        std::expected<std::array<std::uint8_t, 65>, KeyError> _serializePublicKey(const PrivateKey & private_key)
        {
            secp256k1_context* ctx = secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
            if(ctx == nullptr)
            {
                return std::unexpected(KeyError{
                    .kind = KeyError::Kind::SIGNING_ERROR,
                    .message = "Failed to create secp256k1 context"
                });
            }

            secp256k1_pubkey pubkey{};
            const int pubkey_ok = secp256k1_ec_pubkey_create(ctx, &pubkey, private_key.data());
            if(pubkey_ok != 1)
            {
                secp256k1_context_destroy(ctx);
                return std::unexpected(KeyError{
                    .kind = KeyError::Kind::INVALID_PRIVATE_KEY,
                    .message = "Private key is outside of the secp256k1 curve order"
                });
            }

            std::array<std::uint8_t, 65> serialized_pubkey{};
            std::size_t pubkey_size = serialized_pubkey.size();
            if(secp256k1_ec_pubkey_serialize(
                ctx,
                serialized_pubkey.data(),
                &pubkey_size,
                &pubkey,
                SECP256K1_EC_UNCOMPRESSED) != 1 || pubkey_size != serialized_pubkey.size())
            {
                secp256k1_context_destroy(ctx);
                return std::unexpected(KeyError{
                    .kind = KeyError::Kind::SIGNING_ERROR,
                    .message = "Failed to serialize public key"
                });
            }

            secp256k1_context_destroy(ctx);
            return serialized_pubkey;
        }
    }

    evmc::bytes32 keccak256(const std::uint8_t* data, std::size_t size)
    {
        const ethash::hash256 hash = ethash::keccak256(data, size);
        evmc::bytes32 out{};
        std::memcpy(out.bytes, hash.bytes, sizeof(out.bytes));
        return out;
    }

    evmc::bytes32 keccak256(const std::string & data)
    {
        return keccak256(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
    }

    Selector constructSelector(const std::string & signature)
    {
        const evmc::bytes32 hash = keccak256(signature);
        Selector selector{};
        std::copy(hash.bytes, hash.bytes + selector.size(), selector.begin());
        return selector;
    }

    evmc::bytes32 constructEventTopic(const std::string & signature)
    {
        return keccak256(signature);
    }

    std::optional<std::vector<evmc::bytes32>> decodeTopicWords(const std::vector<std::string> & topics_hex)
    {
        if(topics_hex.empty())
        {
            return std::nullopt;
        }

        std::vector<evmc::bytes32> topic_words;
        topic_words.reserve(topics_hex.size());
        for(const std::string & topic_hex : topics_hex)
        {
            const auto topic_bytes = utils::fromHex(topic_hex);
            if(!topic_bytes || topic_bytes->size() != sizeof(evmc::bytes32::bytes))
            {
                return std::nullopt;
            }

            evmc::bytes32 topic_word{};
            std::copy(topic_bytes->begin(), topic_bytes->end(), topic_word.bytes);
            topic_words.push_back(topic_word);
        }

        return topic_words;
    }

    bool validatePrivateKey(const std::string & private_key_hex)
    {
        const std::string hex = utils::stripHexPrefix(private_key_hex);
        return hex.size() == 64 && utils::isHexDigits(hex);
    }

    std::expected<PrivateKey, KeyError> parsePrivateKey(const std::string & private_key_hex)
    {
        if(!validatePrivateKey(private_key_hex))
        {
            return std::unexpected(KeyError{
                .kind = KeyError::Kind::INVALID_PRIVATE_KEY,
                .message = "private key must be a 32-byte hex value"
            });
        }

        const auto bytes_res = utils::fromHex(private_key_hex);
        if(!bytes_res || bytes_res->size() != 32)
        {
            return std::unexpected(KeyError{
                .kind = KeyError::Kind::INVALID_PRIVATE_KEY,
                .message = "private key must be a 32-byte hex value"
            });
        }

        PrivateKey key{};
        std::copy(bytes_res->begin(), bytes_res->end(), key.begin());
        return key;
    }

    std::expected<PublicKey, KeyError> privateKeyToPublicKey(const PrivateKey & private_key)
    {
        const auto serialized_res = _serializePublicKey(private_key);
        if(!serialized_res)
        {
            return std::unexpected(serialized_res.error());
        }

        // 0x04 || X || Y
        PublicKey public_key{};
        std::memcpy(public_key.x.bytes, serialized_res->data() + 1, 32);
        std::memcpy(public_key.y.bytes, serialized_res->data() + 33, 32);
        return public_key;
    }

    std::expected<evmc::address, KeyError> privateKeyToAddress(const PrivateKey & private_key)
    {
        const auto serialized_res = _serializePublicKey(private_key);
        if(!serialized_res)
        {
            return std::unexpected(serialized_res.error());
        }

        const evmc::bytes32 hash = keccak256(serialized_res->data() + 1, serialized_res->size() - 1);
        evmc::address out{};
        std::memcpy(out.bytes, hash.bytes + 12, 20);
        return out;
    }

    std::expected<evmc::address, KeyError> privateKeyToAddress(const std::string & private_key_hex)
    {
        const auto key_res = parsePrivateKey(private_key_hex);
        if(!key_res)
        {
            return std::unexpected(key_res.error());
        }
        return privateKeyToAddress(*key_res);
    }

    std::expected<PrivateKey, KeyError> generatePrivateKey()
    {
        secp256k1_context* ctx = secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
        if(ctx == nullptr)
        {
            return std::unexpected(KeyError{
                .kind = KeyError::Kind::SIGNING_ERROR,
                .message = "Failed to create secp256k1 context"
            });
        }

        std::random_device rd;
        std::uniform_int_distribution<unsigned int> dist(0, 255);

        static constexpr int MAX_ATTEMPTS = 16;
        for(int attempt = 0; attempt < MAX_ATTEMPTS; ++attempt)
        {
            PrivateKey key{};
            std::ranges::generate(key, [&]() { return static_cast<std::uint8_t>(dist(rd)); });

            if(secp256k1_ec_seckey_verify(ctx, key.data()) == 1)
            {
                secp256k1_context_destroy(ctx);
                return key;
            }
            spdlog::debug("generatePrivateKey: candidate rejected by secp256k1, retrying");
        }

        secp256k1_context_destroy(ctx);
        return std::unexpected(KeyError{
            .kind = KeyError::Kind::SIGNING_ERROR,
            .message = "Failed to generate a valid private key"
        });
    }
}
