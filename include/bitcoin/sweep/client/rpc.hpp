/**
 * Copyright (c) 2011-2025 libbitcoin developers (see AUTHORS)
 *
 * This file is part of libbitcoin.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#ifndef LIBBITCOIN_SWEEP_CLIENT_RPC_HPP
#define LIBBITCOIN_SWEEP_CLIENT_RPC_HPP

#include <nlohmann/json.hpp>
#include <bitcoin/sweep/client/types.hpp>
#include <bitcoin/sweep/define.hpp>

/// JSON-RPC 2.0 message helpers for an ethereum-style node.
/// These are stateless and thread safe.

namespace libbitcoin {
namespace sweep {
namespace rpc {

/// Parsed websocket endpoint, ws://host[:port][/path] or wss://...
struct BCS_API endpoint
{
    bool secure{};
    std::string host{};
    std::string port{};
    std::string target{};
};

/// A parsed inbound message.
struct BCS_API message
{
    enum class kind
    {
        invalid,
        response,
        notification
    };

    kind type{ kind::invalid };

    /// Response correlation.
    uint64_t id{};

    /// Response error (rpc_rejected) with the node's error message.
    code ec{};
    std::string reason{};

    /// Notification subscription id.
    std::string subscription{};

    /// Response result or notification payload.
    nlohmann::json result{};
};

/// Method names.
constexpr auto get_transaction_by_hash = "eth_getTransactionByHash";
constexpr auto get_balance = "eth_getBalance";
constexpr auto gas_price = "eth_gasPrice";
constexpr auto subscribe = "eth_subscribe";
constexpr auto subscription = "eth_subscription";
constexpr auto chain_id = "eth_chainId";
constexpr auto get_transaction_count = "eth_getTransactionCount";
constexpr auto send_raw_transaction = "eth_sendRawTransaction";
constexpr auto new_pending_transactions = "newPendingTransactions";

/// Parse ws[s]://host[:port][/path], false if not a websocket endpoint.
BCS_API bool parse_endpoint(endpoint& out, const std::string& text) NOEXCEPT;

/// Decode a 0x prefixed hex quantity of at most 256 bits.
BCS_API bool decode_quantity(amount& out, const std::string& text) NOEXCEPT;

/// Encode a quantity as minimal 0x prefixed lower case hex.
BCS_API std::string encode_quantity(const amount& value) NOEXCEPT;

/// Serialize a request.
BCS_API std::string make_request(uint64_t id, const std::string& method,
    const nlohmann::json& params) NOEXCEPT;

/// Classify and parse an inbound text frame.
BCS_API message parse_message(const std::string& text) NOEXCEPT;

/// Parse a transaction result, success with nullptr for a null result.
BCS_API code parse_transaction(transaction::cptr& out,
    const nlohmann::json& result) NOEXCEPT;

/// Parse a quantity result.
BCS_API code parse_quantity(amount& out,
    const nlohmann::json& result) NOEXCEPT;

/// Parse a quantity result that must fit 64 bits (chain id, nonce).
BCS_API code parse_number(uint64_t& out,
    const nlohmann::json& result) NOEXCEPT;

/// Parse a string result (transaction hash or subscription id).
BCS_API code parse_string(std::string& out,
    const nlohmann::json& result) NOEXCEPT;

} // namespace rpc
} // namespace sweep
} // namespace libbitcoin

#endif
