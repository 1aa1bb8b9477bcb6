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
#ifndef LIBBITCOIN_SWEEP_WORKERS_WORKER_SWEEP_HPP
#define LIBBITCOIN_SWEEP_WORKERS_WORKER_SWEEP_HPP

#include <bitcoin/sweep/client/chain_client.hpp>
#include <bitcoin/sweep/define.hpp>
#include <bitcoin/sweep/utility/sweep_queue.hpp>
#include <bitcoin/sweep/workers/worker.hpp>

namespace libbitcoin {
namespace sweep {

class sweeper;

/// Drain the sweep queue, transferring the monitored balance less the
/// transfer fee to the destination, one submission per queued detection.
/// A balance at or below dust, or not exceeding the fee, ends the cycle and
/// leaves the queue intact for a later detection.
class BCS_API worker_sweep
  : public worker
{
public:
    DELETE_COPY_MOVE_DESTRUCT(worker_sweep);

    worker_sweep(sweeper& node) NOEXCEPT;

    code start() NOEXCEPT override;
    void stopping(const code& ec) NOEXCEPT override;

    /// Queue the detected id and activate a drain cycle (thread safe).
    virtual void enqueue(const pending_id& id) NOEXCEPT;

    /// Set out to balance - price * gas, false if that is not positive.
    static bool sweepable(amount& out, const amount& balance,
        const amount& price, uint64_t gas) NOEXCEPT;

protected:
    virtual void do_enqueue(const pending_id& id) NOEXCEPT;
    virtual void do_activate() NOEXCEPT;
    virtual void do_next() NOEXCEPT;
    virtual void handle_balance(const code& ec,
        const amount& balance) NOEXCEPT;
    virtual void do_balance(const code& ec, const amount& balance) NOEXCEPT;
    virtual void handle_price(const code& ec, const amount& price,
        const amount& balance) NOEXCEPT;
    virtual void do_price(const code& ec, const amount& price,
        const amount& balance) NOEXCEPT;
    virtual void handle_transfer(const code& ec, const std::string& hash,
        const amount& value) NOEXCEPT;
    virtual void do_transfer(const code& ec, const std::string& hash,
        const amount& value) NOEXCEPT;
    virtual void do_failed(const code& ec) NOEXCEPT;
    virtual void do_advance() NOEXCEPT;
    virtual void handle_pace(const code& ec) NOEXCEPT;
    virtual void do_deferred(const code& reason) NOEXCEPT;
    virtual void do_idle() NOEXCEPT;

private:
    void do_stopping(const code& ec) NOEXCEPT;

    // These are thread safe.
    const std::string monitored_;
    const std::string destination_;
    const uint64_t gas_limit_;
    const amount dust_;

    // This is protected by strand.
    sweep_queue queue_;
};

} // namespace sweep
} // namespace libbitcoin

#endif
