#include "erc20.hpp"

#include <spdlog/spdlog.h>

#include "units.hpp"

namespace wcc::token
{
    abi::Result<abi::EncodedCall> ERC20Token::encodeTransfer(const chain::Address & to, const abi::BigInt & amount) const
    {
        return abi::encodeCall("transfer",
            {{"to", abi::tag::address()}, {"amount", abi::tag::uintN(256)}},
            {abi::val::address(to), abi::val::integer(amount)});
    }

    abi::Result<abi::EncodedCall> ERC20Token::encodeTransferFrom(const chain::Address & from, const chain::Address & to, const abi::BigInt & amount) const
    {
        return abi::encodeCall("transferFrom",
            {{"from", abi::tag::address()}, {"to", abi::tag::address()}, {"amount", abi::tag::uintN(256)}},
            {abi::val::address(from), abi::val::address(to), abi::val::integer(amount)});
    }

    abi::Result<abi::EncodedCall> ERC20Token::encodeApprove(const chain::Address & spender, const abi::BigInt & amount) const
    {
        return abi::encodeCall("approve",
            {{"spender", abi::tag::address()}, {"amount", abi::tag::uintN(256)}},
            {abi::val::address(spender), abi::val::integer(amount)});
    }

    abi::Result<abi::EncodedCall> ERC20Token::encodeBalanceOf(const chain::Address & owner) const
    {
        return abi::encodeCall("balanceOf", {{"owner", abi::tag::address()}}, {abi::val::address(owner)});
    }

    abi::Result<abi::EncodedCall> ERC20Token::encodeAllowance(const chain::Address & owner, const chain::Address & spender) const
    {
        return abi::encodeCall("allowance",
            {{"owner", abi::tag::address()}, {"spender", abi::tag::address()}},
            {abi::val::address(owner), abi::val::address(spender)});
    }

    abi::Result<abi::EncodedCall> ERC20Token::encodeTotalSupply() const
    {
        return abi::encodeCall("totalSupply", {}, {});
    }

    abi::Result<abi::EncodedCall> ERC20Token::encodeName() const
    {
        return abi::encodeCall("name", {}, {});
    }

    abi::Result<abi::EncodedCall> ERC20Token::encodeSymbol() const
    {
        return abi::encodeCall("symbol", {}, {});
    }

    abi::Result<abi::EncodedCall> ERC20Token::encodeDecimals() const
    {
        return abi::encodeCall("decimals", {}, {});
    }

    abi::Result<abi::BigInt> ERC20Token::decodeUintResult(const abi::Bytes & data) const
    {
        const auto values_res = abi::decodeResult({abi::tag::uintN(256)}, data);
        if(!values_res)
        {
            return std::unexpected(values_res.error());
        }
        return std::get<abi::IntValue>(values_res->front().data).value;
    }

    abi::Result<std::string> ERC20Token::decodeStringResult(const abi::Bytes & data) const
    {
        const auto values_res = abi::decodeResult({abi::tag::string()}, data);
        if(!values_res)
        {
            return std::unexpected(values_res.error());
        }
        return std::get<abi::StringValue>(values_res->front().data).value;
    }

    std::string ERC20Token::formatAmount(const abi::BigInt & amount) const
    {
        return units::formatUnits(amount, decimals);
    }

    parse::Result<abi::BigInt> ERC20Token::parseAmount(const std::string & amount) const
    {
        return units::parseUnits(amount, decimals);
    }

    chain::Result<chain::Transaction> ERC20Token::callTransaction(const abi::EncodedCall & call) const
    {
        spdlog::debug("{} call 0x{} to {}", symbol, call.selectorHex(), chain::addressToHex(address));
        return chain::createTransaction(address, 0, call.bytes());
    }
}
