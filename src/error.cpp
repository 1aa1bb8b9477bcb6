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
#include <bitcoin/sweep/error.hpp>

#include <bitcoin/system.hpp>

namespace libbitcoin {
namespace sweep {
namespace error {

DEFINE_ERROR_T_MESSAGE_MAP(error)
{
    // general
    { success, "success" },
    { service_stopped, "service stopped" },

    // configuration
    { missing_configuration, "missing required configuration" },
    { invalid_endpoint, "invalid endpoint" },
    { invalid_credential, "invalid credential" },
    { invalid_address, "invalid address" },

    // resolution
    { transaction_unavailable, "transaction unavailable" },
    { transaction_not_found, "transaction not found" },

    // sweep
    { balance_below_dust, "balance below dust threshold" },
    { balance_below_fee, "balance below transfer fee" },
    { transfer_failed, "transfer failed" },

    // transport
    { subscription_closed, "subscription closed" },
    { subscription_failed, "subscription failed" },

    // rpc
    { rpc_malformed, "malformed rpc message" },
    { rpc_rejected, "rpc request rejected" },
    { rpc_unexpected, "unexpected rpc result" }
};

DEFINE_ERROR_T_CATEGORY(error, "sweep", "sweep code")

} // namespace error
} // namespace sweep
} // namespace libbitcoin
