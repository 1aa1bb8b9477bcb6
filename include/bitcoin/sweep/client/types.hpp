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
#ifndef LIBBITCOIN_SWEEP_CLIENT_TYPES_HPP
#define LIBBITCOIN_SWEEP_CLIENT_TYPES_HPP

#include <memory>
#include <bitcoin/sweep/define.hpp>

namespace libbitcoin {
namespace sweep {

/// A resolved pending transaction, never mutated after construction.
struct BCS_API transaction
{
    typedef std::shared_ptr<const transaction> cptr;

    pending_id hash{};
    std::string from{};

    /// Recipient as reported by the chain (empty for contract creation).
    std::string to{};
    amount value{};
};

/// A single legacy value transfer.
struct BCS_API transfer
{
    std::string to{};
    amount value{};
    uint64_t gas_limit{};
    amount gas_price{};
};

/// Chain client completion handlers.
typedef std::function<void(const code&, const transaction::cptr&)>
    transaction_handler;
typedef std::function<void(const code&, const amount&)> amount_handler;
typedef std::function<void(const code&, const std::string&)> transfer_handler;
typedef std::function<void(const code&, const pending_id&)> pending_handler;

} // namespace sweep
} // namespace libbitcoin

#endif
