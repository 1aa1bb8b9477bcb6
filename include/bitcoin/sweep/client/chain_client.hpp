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
#ifndef LIBBITCOIN_SWEEP_CLIENT_CHAIN_CLIENT_HPP
#define LIBBITCOIN_SWEEP_CLIENT_CHAIN_CLIENT_HPP

#include <bitcoin/sweep/client/types.hpp>
#include <bitcoin/sweep/define.hpp>

namespace libbitcoin {
namespace sweep {

/// Abstract chain access consumed by the sweeper.
/// Methods are thread safe. Handlers are invoked on a client thread, never on
/// the caller's strand, and each request handler is invoked exactly once.
class BCS_API chain_client
{
public:
    DELETE_COPY_MOVE(chain_client);

    virtual ~chain_client() NOEXCEPT = default;

    /// Connect, handler invoked once connected or failed.
    virtual void start(result_handler&& handler) NOEXCEPT = 0;

    /// Disconnect, outstanding requests complete with service_stopped.
    virtual void stop() NOEXCEPT = 0;

    /// Look up a transaction, success with nullptr if not (yet) visible.
    virtual void get_transaction(const pending_id& id,
        transaction_handler&& handler) NOEXCEPT = 0;

    /// Current balance of the address.
    virtual void get_balance(const std::string& address,
        amount_handler&& handler) NOEXCEPT = 0;

    /// Current fee price per unit of gas.
    virtual void get_gas_price(amount_handler&& handler) NOEXCEPT = 0;

    /// Sign and submit a transfer from the monitored account, handler
    /// receives the submitted transaction id.
    virtual void send_transaction(const transfer& value,
        transfer_handler&& handler) NOEXCEPT = 0;

    /// Handler is invoked once per observed pending transaction id, until it
    /// is invoked once with a transport failure code (terminal).
    virtual void subscribe_pending(pending_handler&& handler) NOEXCEPT = 0;

protected:
    chain_client() NOEXCEPT = default;
};

} // namespace sweep
} // namespace libbitcoin

#endif
