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
#ifndef LIBBITCOIN_SWEEP_ERROR_HPP
#define LIBBITCOIN_SWEEP_ERROR_HPP

#include <bitcoin/system.hpp>
#include <bitcoin/sweep/version.hpp>

namespace libbitcoin {
namespace sweep {

/// Alias system code.
/// std::error_code "sweep" category holds sweep::error::error_t.
typedef std::error_code code;

namespace error {

/// Chain client failures are normalized to the error codes below.
/// Insufficient balance codes are control signals, not faults.
enum error_t : uint8_t
{
    /// general
    success,
    service_stopped,

    /// configuration
    missing_configuration,
    invalid_endpoint,
    invalid_credential,
    invalid_address,

    /// resolution
    transaction_unavailable,
    transaction_not_found,

    /// sweep
    balance_below_dust,
    balance_below_fee,
    transfer_failed,

    /// transport (terminal)
    subscription_closed,
    subscription_failed,

    /// rpc
    rpc_malformed,
    rpc_rejected,
    rpc_unexpected
};

// No current need for error_code equivalence mapping.
DECLARE_ERROR_T_CODE_CATEGORY(error);

} // namespace error
} // namespace sweep
} // namespace libbitcoin

DECLARE_STD_ERROR_REGISTRATION(bc::sweep::error::error)

#endif
