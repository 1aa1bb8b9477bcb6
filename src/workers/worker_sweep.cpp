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
#include <bitcoin/sweep/workers/worker_sweep.hpp>

#include <bitcoin/system.hpp>
#include <bitcoin/sweep/client/chain_client.hpp>
#include <bitcoin/sweep/define.hpp>
#include <bitcoin/sweep/sweeper.hpp>
#include <bitcoin/sweep/workers/worker.hpp>

namespace libbitcoin {
namespace sweep {

#define CLASS worker_sweep

using namespace system;
using namespace std::placeholders;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

worker_sweep::worker_sweep(sweeper& node) NOEXCEPT
  : worker(node),
    monitored_(node.config().sweep.monitored()),
    destination_(node.config().sweep.destination_address),
    gas_limit_(node.config().sweep.gas_limit),
    dust_(node.config().sweep.dust_threshold)
{
}

// start/stop
// ----------------------------------------------------------------------------

code worker_sweep::start() NOEXCEPT
{
    return error::success;
}

void worker_sweep::stopping(const code& ec) NOEXCEPT
{
    POST(do_stopping, ec);
}

// private
void worker_sweep::do_stopping(const code&) NOEXCEPT
{
    BC_ASSERT(stranded());
    gate().stop();
}

// ingest
// ----------------------------------------------------------------------------

void worker_sweep::enqueue(const pending_id& id) NOEXCEPT
{
    POST(do_enqueue, id);
}

void worker_sweep::do_enqueue(const pending_id& id) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (closed())
        return;

    queue_.push(id);
    do_activate();
}

// drain cycle
// ----------------------------------------------------------------------------

void worker_sweep::do_activate() NOEXCEPT
{
    BC_ASSERT(stranded());
    if (!begin())
        return;

    do_next();
}

void worker_sweep::do_next() NOEXCEPT
{
    BC_ASSERT(stranded());
    if (closed())
    {
        end();
        return;
    }

    if (queue_.empty())
    {
        do_idle();
        return;
    }

    client().get_balance(monitored_, BIND(handle_balance, _1, _2));
}

// Chain client completes on its own thread.
void worker_sweep::handle_balance(const code& ec,
    const amount& balance) NOEXCEPT
{
    POST(do_balance, ec, balance);
}

void worker_sweep::do_balance(const code& ec, const amount& balance) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (closed())
    {
        end();
        return;
    }

    if (ec)
    {
        do_failed(ec);
        return;
    }

    if (balance <= dust_)
    {
        LOGN("Balance (" << balance << ") at or below dust (" << dust_
            << "), sweep deferred.");
        do_deferred(error::balance_below_dust);
        return;
    }

    client().get_gas_price(BIND(handle_price, _1, _2, balance));
}

void worker_sweep::handle_price(const code& ec, const amount& price,
    const amount& balance) NOEXCEPT
{
    POST(do_price, ec, price, balance);
}

void worker_sweep::do_price(const code& ec, const amount& price,
    const amount& balance) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (closed())
    {
        end();
        return;
    }

    if (ec)
    {
        do_failed(ec);
        return;
    }

    amount value{};
    if (!sweepable(value, balance, price, gas_limit_))
    {
        LOGN("Balance (" << balance << ") does not cover fee at price ("
            << price << "), sweep deferred.");
        do_deferred(error::balance_below_fee);
        return;
    }

    const transfer request{ destination_, value, gas_limit_, price };
    client().send_transaction(request,
        BIND(handle_transfer, _1, _2, value));
}

void worker_sweep::handle_transfer(const code& ec, const std::string& hash,
    const amount& value) NOEXCEPT
{
    POST(do_transfer, ec, hash, value);
}

void worker_sweep::do_transfer(const code& ec, const std::string& hash,
    const amount& value) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (closed())
    {
        end();
        return;
    }

    if (ec)
    {
        do_failed(ec);
        return;
    }

    LOGN("Swept (" << value << ") to [" << destination_ << "] in [" << hash
        << "].");
    fire(events::sweep_submitted, queue_.size());
    do_advance();
}

// The detection is consumed whether or not the transfer was submitted.
void worker_sweep::do_failed(const code& ec) NOEXCEPT
{
    BC_ASSERT(stranded());
    LOGR("Sweep of detection [" << queue_.front() << "] failed, "
        << ec.message());
    fire(events::sweep_failed, queue_.size());
    do_advance();
}

void worker_sweep::do_advance() NOEXCEPT
{
    BC_ASSERT(stranded());
    queue_.pop();
    gate().sleep(settings().sweep_pace(), BIND(handle_pace, _1));
}

void worker_sweep::handle_pace(const code& ec) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (ec)
    {
        end();
        return;
    }

    do_next();
}

void worker_sweep::do_deferred(const code& reason) NOEXCEPT
{
    BC_ASSERT(stranded());
    LOGV("Sweep deferred with (" << queue_.size() << ") queued, "
        << reason.message());
    fire(events::sweep_deferred, queue_.size());
    do_idle();
}

void worker_sweep::do_idle() NOEXCEPT
{
    BC_ASSERT(stranded());
    end();
    LOGV("Sweep idle after (" << cycles() << ") cycles.");
    fire(events::sweep_idle, cycles());
}

// fee
// ----------------------------------------------------------------------------

bool worker_sweep::sweepable(amount& out, const amount& balance,
    const amount& price, uint64_t gas) NOEXCEPT
{
    // Guard the product against overflow.
    if (!is_zero(gas) && price > balance / gas)
        return false;

    const amount fee = price * gas;
    if (fee >= balance)
        return false;

    out = balance - fee;
    return true;
}

BC_POP_WARNING()

} // namespace sweep
} // namespace libbitcoin
