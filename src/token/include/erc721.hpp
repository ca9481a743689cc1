#pragma once

#include <string>
#include <string_view>

#include "abi.hpp"
#include "address.hpp"
#include "transaction.hpp"

namespace wcc::token
{
    inline constexpr std::string_view ERC721_TRANSFER_FROM_SELECTOR            = "23b872dd";
    inline constexpr std::string_view ERC721_SAFE_TRANSFER_FROM_SELECTOR       = "42842e0e";
    inline constexpr std::string_view ERC721_SAFE_TRANSFER_FROM_DATA_SELECTOR  = "b88d4fde";
    inline constexpr std::string_view ERC721_APPROVE_SELECTOR                  = "095ea7b3";
    inline constexpr std::string_view ERC721_SET_APPROVAL_FOR_ALL_SELECTOR     = "a22cb465";
    inline constexpr std::string_view ERC721_OWNER_OF_SELECTOR                 = "6352211e";
    inline constexpr std::string_view ERC721_BALANCE_OF_SELECTOR               = "70a08231";
    inline constexpr std::string_view ERC721_GET_APPROVED_SELECTOR             = "081812fc";
    inline constexpr std::string_view ERC721_IS_APPROVED_FOR_ALL_SELECTOR      = "e985e9c5";
    inline constexpr std::string_view ERC721_TOKEN_URI_SELECTOR                = "c87b56dd";
    inline constexpr std::string_view ERC721_NAME_SELECTOR                     = "06fdde03";
    inline constexpr std::string_view ERC721_SYMBOL_SELECTOR                   = "95d89b41";

    struct ERC721Token
    {
        chain::Address address{};
        std::string name;
        std::string symbol;

        abi::Result<abi::EncodedCall> encodeTransferFrom(const chain::Address & from, const chain::Address & to, const abi::BigInt & token_id) const;

        /**
         * @brief safeTransferFrom(address,address,uint256) when data is empty,
         * safeTransferFrom(address,address,uint256,bytes) otherwise.
         */
        abi::Result<abi::EncodedCall> encodeSafeTransferFrom(const chain::Address & from, const chain::Address & to,
            const abi::BigInt & token_id, const abi::Bytes & data = {}) const;

        abi::Result<abi::EncodedCall> encodeApprove(const chain::Address & to, const abi::BigInt & token_id) const;
        abi::Result<abi::EncodedCall> encodeSetApprovalForAll(const chain::Address & operator_address, bool approved) const;
        abi::Result<abi::EncodedCall> encodeOwnerOf(const abi::BigInt & token_id) const;
        abi::Result<abi::EncodedCall> encodeBalanceOf(const chain::Address & owner) const;
        abi::Result<abi::EncodedCall> encodeGetApproved(const abi::BigInt & token_id) const;
        abi::Result<abi::EncodedCall> encodeIsApprovedForAll(const chain::Address & owner, const chain::Address & operator_address) const;
        abi::Result<abi::EncodedCall> encodeTokenURI(const abi::BigInt & token_id) const;

        /**
         * @brief Decodes the address returned by ownerOf / getApproved.
         */
        abi::Result<chain::Address> decodeOwnerOfResult(const abi::Bytes & data) const;

        chain::Result<chain::Transaction> callTransaction(const abi::EncodedCall & call) const;
    };
}
