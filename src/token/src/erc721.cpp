#include "erc721.hpp"

#include <spdlog/spdlog.h>

namespace wcc::token
{
    abi::Result<abi::EncodedCall> ERC721Token::encodeTransferFrom(const chain::Address & from, const chain::Address & to, const abi::BigInt & token_id) const
    {
        return abi::encodeCall("transferFrom",
            {{"from", abi::tag::address()}, {"to", abi::tag::address()}, {"tokenId", abi::tag::uintN(256)}},
            {abi::val::address(from), abi::val::address(to), abi::val::integer(token_id)});
    }

    abi::Result<abi::EncodedCall> ERC721Token::encodeSafeTransferFrom(const chain::Address & from, const chain::Address & to,
        const abi::BigInt & token_id, const abi::Bytes & data) const
    {
        if(data.empty())
        {
            return abi::encodeCall("safeTransferFrom",
                {{"from", abi::tag::address()}, {"to", abi::tag::address()}, {"tokenId", abi::tag::uintN(256)}},
                {abi::val::address(from), abi::val::address(to), abi::val::integer(token_id)});
        }

        return abi::encodeCall("safeTransferFrom",
            {{"from", abi::tag::address()}, {"to", abi::tag::address()}, {"tokenId", abi::tag::uintN(256)}, {"data", abi::tag::bytes()}},
            {abi::val::address(from), abi::val::address(to), abi::val::integer(token_id), abi::val::bytes(data)});
    }

    abi::Result<abi::EncodedCall> ERC721Token::encodeApprove(const chain::Address & to, const abi::BigInt & token_id) const
    {
        return abi::encodeCall("approve",
            {{"to", abi::tag::address()}, {"tokenId", abi::tag::uintN(256)}},
            {abi::val::address(to), abi::val::integer(token_id)});
    }

    abi::Result<abi::EncodedCall> ERC721Token::encodeSetApprovalForAll(const chain::Address & operator_address, bool approved) const
    {
        return abi::encodeCall("setApprovalForAll",
            {{"operator", abi::tag::address()}, {"approved", abi::tag::boolean()}},
            {abi::val::address(operator_address), abi::val::boolean(approved)});
    }

    abi::Result<abi::EncodedCall> ERC721Token::encodeOwnerOf(const abi::BigInt & token_id) const
    {
        return abi::encodeCall("ownerOf", {{"tokenId", abi::tag::uintN(256)}}, {abi::val::integer(token_id)});
    }

    abi::Result<abi::EncodedCall> ERC721Token::encodeBalanceOf(const chain::Address & owner) const
    {
        return abi::encodeCall("balanceOf", {{"owner", abi::tag::address()}}, {abi::val::address(owner)});
    }

    abi::Result<abi::EncodedCall> ERC721Token::encodeGetApproved(const abi::BigInt & token_id) const
    {
        return abi::encodeCall("getApproved", {{"tokenId", abi::tag::uintN(256)}}, {abi::val::integer(token_id)});
    }

    abi::Result<abi::EncodedCall> ERC721Token::encodeIsApprovedForAll(const chain::Address & owner, const chain::Address & operator_address) const
    {
        return abi::encodeCall("isApprovedForAll",
            {{"owner", abi::tag::address()}, {"operator", abi::tag::address()}},
            {abi::val::address(owner), abi::val::address(operator_address)});
    }

    abi::Result<abi::EncodedCall> ERC721Token::encodeTokenURI(const abi::BigInt & token_id) const
    {
        return abi::encodeCall("tokenURI", {{"tokenId", abi::tag::uintN(256)}}, {abi::val::integer(token_id)});
    }

    abi::Result<chain::Address> ERC721Token::decodeOwnerOfResult(const abi::Bytes & data) const
    {
        const auto values_res = abi::decodeResult({abi::tag::address()}, data);
        if(!values_res)
        {
            return std::unexpected(values_res.error());
        }

        const auto owner = std::get<abi::AddressValue>(values_res->front().data).toAddress();
        if(!owner)
        {
            return std::unexpected(abi::Error{abi::Error::Kind::INVALID_ADDRESS, "decoded owner is not 20 bytes"});
        }
        return *owner;
    }

    chain::Result<chain::Transaction> ERC721Token::callTransaction(const abi::EncodedCall & call) const
    {
        spdlog::debug("{} call 0x{} to {}", symbol, call.selectorHex(), chain::addressToHex(address));
        return chain::createTransaction(address, 0, call.bytes());
    }
}
