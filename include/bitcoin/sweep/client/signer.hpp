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
#ifndef LIBBITCOIN_SWEEP_CLIENT_SIGNER_HPP
#define LIBBITCOIN_SWEEP_CLIENT_SIGNER_HPP

#include <bitcoin/sweep/client/types.hpp>
#include <bitcoin/sweep/define.hpp>

/// Local signing of legacy (EIP-155) value transfers.
/// These are stateless and thread safe.

namespace libbitcoin {
namespace sweep {
namespace signer {

/// Keccak-256 (pre-standard sha3) digest.
BCS_API system::hash_digest keccak256(const system::data_chunk& data) NOEXCEPT;

/// Parse 64 hex digits, optionally 0x prefixed, as a private key.
BCS_API bool parse_secret(system::ec_secret& out,
    const std::string& text) NOEXCEPT;

/// Parse a 0x prefixed 40 hex digit account address of any case.
BCS_API bool parse_address(system::short_hash& out,
    const std::string& text) NOEXCEPT;

/// Derive the lower case 0x prefixed account address of a private key.
BCS_API bool to_address(std::string& out,
    const system::ec_secret& secret) NOEXCEPT;

/// The RLP encoding signed for a legacy transfer on the chain.
BCS_API system::data_chunk signing_payload(const transfer& value,
    const system::short_hash& to, uint64_t nonce, uint64_t chain_id) NOEXCEPT;

/// Sign the transfer, out is the 0x prefixed raw transaction.
BCS_API code sign_transfer(std::string& out, const transfer& value,
    uint64_t nonce, uint64_t chain_id,
    const system::ec_secret& secret) NOEXCEPT;

} // namespace signer
} // namespace sweep
} // namespace libbitcoin

#endif
