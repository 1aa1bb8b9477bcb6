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
#ifndef LIBBITCOIN_SWEEP_FETCHER_HPP
#define LIBBITCOIN_SWEEP_FETCHER_HPP

#include <atomic>
#include <bitcoin/network.hpp>
#include <bitcoin/sweep/client/chain_client.hpp>
#include <bitcoin/sweep/define.hpp>
#include <bitcoin/sweep/utility/rate_gate.hpp>

namespace libbitcoin {
namespace sweep {

/// Resolve pending transaction ids through the chain client.
/// A failed lookup, or one that finds nothing (propagation lag), is retried
/// after base * 2^attempt until the attempt budget is spent, and then reported
/// as transaction_not_found. Completion is on the owner's strand.
class BCS_API fetcher
  : public network::reporter
{
public:
    DELETE_COPY_MOVE_DESTRUCT(fetcher);

    fetcher(chain_client& client, const network::logger& log,
        network::asio::strand& strand, size_t attempts,
        const duration& base) NOEXCEPT;

    /// Resolve the id (requires strand).
    virtual void fetch(const pending_id& id,
        transaction_handler&& handler) NOEXCEPT;

    /// Cancel a pending backoff, its fetch completes with operation_canceled.
    virtual void stop() NOEXCEPT;

    /// Delay following the failure of the zero-based attempt.
    virtual duration backoff(size_t attempt) const NOEXCEPT;

    /// Number of lookups issued over the lifetime of the instance.
    size_t lookups() const NOEXCEPT;

protected:
    /// Bind a method (use BIND).
    template <class Derived, typename Method, typename... Args>
    auto bind(Method&& method, Args&&... args) NOEXCEPT
    {
        return BIND_THIS(method, args);
    }

    /// Post a method to the owner's strand (use POST).
    template <class Derived, typename Method, typename... Args>
    auto post(Method&& method, Args&&... args) NOEXCEPT
    {
        return boost::asio::post(strand_, BIND_THIS(method, args));
    }

    virtual void do_attempt(const pending_id& id, size_t attempt,
        const transaction_handler& handler) NOEXCEPT;
    virtual void handle_transaction(const code& ec,
        const transaction::cptr& tx, const pending_id& id, size_t attempt,
        const transaction_handler& handler) NOEXCEPT;
    virtual void do_transaction(const code& ec, const transaction::cptr& tx,
        const pending_id& id, size_t attempt,
        const transaction_handler& handler) NOEXCEPT;
    virtual void handle_backoff(const code& ec, const pending_id& id,
        size_t attempt, const transaction_handler& handler) NOEXCEPT;

    bool stranded() const NOEXCEPT;

private:
    // These are thread safe.
    chain_client& client_;
    network::asio::strand& strand_;
    const size_t attempts_;
    const duration base_;
    std::atomic<size_t> lookups_{};

    // This is protected by strand.
    rate_gate gate_;
};

} // namespace sweep
} // namespace libbitcoin

#endif
