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
#include <bitcoin/sweep/client/signer.hpp>

#include <algorithm>
#include <iterator>
#include <ethash/keccak.hpp>
#include <bitcoin/system.hpp>
#include <bitcoin/sweep/client/types.hpp>
#include <bitcoin/sweep/define.hpp>

namespace libbitcoin {
namespace sweep {
namespace signer {

using namespace system;

constexpr auto hex_prefix = "0x";

// RLP prefix offsets and the longest length carried in the prefix itself.
constexpr uint8_t string_offset = 0x80;
constexpr uint8_t list_offset = 0xc0;
constexpr size_t short_length = 55;

// EIP-155 v = chain_id * 2 + 35 + recovery id.
constexpr uint64_t replay_offset = 35;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

hash_digest keccak256(const data_chunk& data) NOEXCEPT
{
    const auto hash = ethash::keccak256(data.data(), data.size());
    hash_digest out{};
    std::copy(std::begin(hash.bytes), std::end(hash.bytes), out.begin());
    return out;
}

// keys
// ----------------------------------------------------------------------------

static bool has_prefix(const std::string& text) NOEXCEPT
{
    return text.size() >= 2u && text.at(0) == '0' &&
        (text.at(1) == 'x' || text.at(1) == 'X');
}

bool parse_secret(ec_secret& out, const std::string& text) NOEXCEPT
{
    const auto digits = has_prefix(text) ? text.substr(2) : text;
    if (digits.size() != 2u * ec_secret_size)
        return false;

    ec_secret secret{};
    if (!decode_base16(secret, ascii_to_lower(digits)))
        return false;

    out = secret;
    return true;
}

bool parse_address(short_hash& out, const std::string& text) NOEXCEPT
{
    if (!has_prefix(text) || text.size() != 2u + 2u * short_hash_size)
        return false;

    short_hash address{};
    if (!decode_base16(address, ascii_to_lower(text.substr(2))))
        return false;

    out = address;
    return true;
}

bool to_address(std::string& out, const ec_secret& secret) NOEXCEPT
{
    ec_uncompressed point{};
    if (!secret_to_public(point, secret))
        return false;

    // The low 20 bytes of the hash of the point without its 0x04 prefix.
    const data_chunk key(std::next(point.begin()), point.end());
    const auto hash = keccak256(key);
    const data_chunk address(std::prev(hash.end(), short_hash_size),
        hash.end());

    out = hex_prefix + encode_base16(address);
    return true;
}

// rlp
// ----------------------------------------------------------------------------

static void append_length(data_chunk& out, size_t length,
    uint8_t offset) NOEXCEPT
{
    if (length <= short_length)
    {
        out.push_back(static_cast<uint8_t>(offset + length));
        return;
    }

    data_chunk size{};
    for (auto value = length; value != 0u; value >>= 8)
        size.insert(size.begin(), static_cast<uint8_t>(value & 0xffu));

    out.push_back(static_cast<uint8_t>(offset + short_length + size.size()));
    out.insert(out.end(), size.begin(), size.end());
}

static void append_bytes(data_chunk& out, const data_chunk& item) NOEXCEPT
{
    // A single byte below the string offset is its own encoding.
    if (item.size() == 1u && item.front() < string_offset)
    {
        out.push_back(item.front());
        return;
    }

    append_length(out, item.size(), string_offset);
    out.insert(out.end(), item.begin(), item.end());
}

// Minimal big endian, zero is empty.
static void append_integer(data_chunk& out, amount value) NOEXCEPT
{
    data_chunk bytes{};
    for (; value != 0; value >>= 8)
        bytes.insert(bytes.begin(), static_cast<uint8_t>(value & 0xff));

    append_bytes(out, bytes);
}

static data_chunk to_list(const data_chunk& items) NOEXCEPT
{
    data_chunk out{};
    append_length(out, items.size(), list_offset);
    out.insert(out.end(), items.begin(), items.end());
    return out;
}

static data_chunk trim(const data_chunk& value) NOEXCEPT
{
    const auto first = std::find_if(value.begin(), value.end(),
        [](uint8_t byte) NOEXCEPT { return byte != 0u; });

    return data_chunk(first, value.end());
}

// nonce, gasPrice, gas, to, value, data
static data_chunk transfer_fields(const transfer& value, const short_hash& to,
    uint64_t nonce) NOEXCEPT
{
    data_chunk out{};
    append_integer(out, nonce);
    append_integer(out, value.gas_price);
    append_integer(out, value.gas_limit);
    append_bytes(out, data_chunk(to.begin(), to.end()));
    append_integer(out, value.value);
    append_bytes(out, {});
    return out;
}

// transfers
// ----------------------------------------------------------------------------

data_chunk signing_payload(const transfer& value, const short_hash& to,
    uint64_t nonce, uint64_t chain_id) NOEXCEPT
{
    auto fields = transfer_fields(value, to, nonce);
    append_integer(fields, chain_id);
    append_integer(fields, 0);
    append_integer(fields, 0);
    return to_list(fields);
}

code sign_transfer(std::string& out, const transfer& value, uint64_t nonce,
    uint64_t chain_id, const ec_secret& secret) NOEXCEPT
{
    short_hash to{};
    if (!parse_address(to, value.to))
        return error::invalid_address;

    const auto hash = keccak256(signing_payload(value, to, nonce, chain_id));

    recoverable_signature signature{};
    if (!ecdsa::sign_recoverable(signature, secret, hash))
        return error::invalid_credential;

    // Compact signature is r then s, big endian.
    const auto& compact = signature.signature;
    const auto middle = std::next(compact.begin(), ec_secret_size);
    const amount recovery{ signature.recovery_id };

    auto fields = transfer_fields(value, to, nonce);
    append_integer(fields, amount{ chain_id } * 2u + replay_offset + recovery);
    append_bytes(fields, trim(data_chunk(compact.begin(), middle)));
    append_bytes(fields, trim(data_chunk(middle, compact.end())));

    out = hex_prefix + encode_base16(to_list(fields));
    return error::success;
}

BC_POP_WARNING()

} // namespace signer
} // namespace sweep
} // namespace libbitcoin
