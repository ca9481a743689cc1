#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "abi.hpp"
#include "address.hpp"
#include "transaction.hpp"
#include "parse_error.hpp"

namespace wcc::token
{
    inline constexpr std::string_view ERC20_TRANSFER_SELECTOR      = "a9059cbb";
    inline constexpr std::string_view ERC20_TRANSFER_FROM_SELECTOR = "23b872dd";
    inline constexpr std::string_view ERC20_APPROVE_SELECTOR       = "095ea7b3";
    inline constexpr std::string_view ERC20_BALANCE_OF_SELECTOR    = "70a08231";
    inline constexpr std::string_view ERC20_ALLOWANCE_SELECTOR     = "dd62ed3e";
    inline constexpr std::string_view ERC20_TOTAL_SUPPLY_SELECTOR  = "18160ddd";
    inline constexpr std::string_view ERC20_NAME_SELECTOR          = "06fdde03";
    inline constexpr std::string_view ERC20_SYMBOL_SELECTOR        = "95d89b41";
    inline constexpr std::string_view ERC20_DECIMALS_SELECTOR      = "313ce567";

    /**
     * @brief Call data builders for a fungible token contract.
     */
    struct ERC20Token
    {
        chain::Address address{};
        std::string name;
        std::string symbol;
        std::uint8_t decimals = 18;

        abi::Result<abi::EncodedCall> encodeTransfer(const chain::Address & to, const abi::BigInt & amount) const;
        abi::Result<abi::EncodedCall> encodeTransferFrom(const chain::Address & from, const chain::Address & to, const abi::BigInt & amount) const;
        abi::Result<abi::EncodedCall> encodeApprove(const chain::Address & spender, const abi::BigInt & amount) const;
        abi::Result<abi::EncodedCall> encodeBalanceOf(const chain::Address & owner) const;
        abi::Result<abi::EncodedCall> encodeAllowance(const chain::Address & owner, const chain::Address & spender) const;
        abi::Result<abi::EncodedCall> encodeTotalSupply() const;
        abi::Result<abi::EncodedCall> encodeName() const;
        abi::Result<abi::EncodedCall> encodeSymbol() const;
        abi::Result<abi::EncodedCall> encodeDecimals() const;

        /**
         * @brief Decodes a single uint256 return value (balanceOf, allowance, totalSupply, decimals).
         */
        abi::Result<abi::BigInt> decodeUintResult(const abi::Bytes & data) const;

        /**
         * @brief Decodes a single string return value (name, symbol).
         */
        abi::Result<std::string> decodeStringResult(const abi::Bytes & data) const;

        /**
         * @brief Base units rendered with the token decimals.
         */
        std::string formatAmount(const abi::BigInt & amount) const;

        parse::Result<abi::BigInt> parseAmount(const std::string & amount) const;

        /**
         * @brief Zero-value transaction to the token contract carrying the call data.
         */
        chain::Result<chain::Transaction> callTransaction(const abi::EncodedCall & call) const;
    };
}
