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
#include <bitcoin/sweep/workers/worker_detect.hpp>

#include <bitcoin/system.hpp>
#include <bitcoin/sweep/client/chain_client.hpp>
#include <bitcoin/sweep/define.hpp>
#include <bitcoin/sweep/sweeper.hpp>
#include <bitcoin/sweep/workers/worker.hpp>

namespace libbitcoin {
namespace sweep {

#define CLASS worker_detect

using namespace system;
using namespace std::placeholders;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

worker_detect::worker_detect(sweeper& node) NOEXCEPT
  : worker(node),
    monitored_(node.config().sweep.monitored()),
    queue_(node.config().sweep.ingest_capacity_()),
    fetcher_(node.client(), node.log, strand(),
        node.config().sweep.retry_attempts_(),
        node.config().sweep.retry_base())
{
}

// start/stop
// ----------------------------------------------------------------------------

code worker_detect::start() NOEXCEPT
{
    return error::success;
}

void worker_detect::stopping(const code& ec) NOEXCEPT
{
    POST(do_stopping, ec);
}

// private
void worker_detect::do_stopping(const code&) NOEXCEPT
{
    BC_ASSERT(stranded());
    fetcher_.stop();
    gate().stop();
}

// ingest
// ----------------------------------------------------------------------------

void worker_detect::enqueue(const pending_id& id) NOEXCEPT
{
    POST(do_enqueue, id);
}

void worker_detect::do_enqueue(const pending_id& id) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (closed())
        return;

    // Push and activation are one strand step, so no id is stranded.
    if (queue_.push(id))
    {
        LOGV("Ingest queue full, oldest pending transaction evicted.");
        fire(events::pending_evicted, queue_.capacity());
    }

    fire(events::pending_queued, queue_.size());

    do_activate();
}

// drain cycle
// ----------------------------------------------------------------------------

void worker_detect::do_activate() NOEXCEPT
{
    BC_ASSERT(stranded());
    if (!begin())
        return;

    const auto earliest = last_start_ + settings().detect_interval();
    if (started_ && clock::now() < earliest)
    {
        gate().wait_until(earliest, BIND(do_begin, _1));
        return;
    }

    do_begin(error::success);
}

void worker_detect::do_begin(const code& ec) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (ec || closed())
    {
        end();
        return;
    }

    started_ = true;
    last_start_ = clock::now();
    do_next();
}

void worker_detect::do_next() NOEXCEPT
{
    BC_ASSERT(stranded());
    if (closed())
    {
        end();
        return;
    }

    pending_id id{};
    if (!queue_.pop(id))
    {
        do_idle();
        return;
    }

    fetcher_.fetch(id, BIND(handle_fetch, _1, _2, id));
}

// Fetcher completes on this strand.
void worker_detect::handle_fetch(const code& ec, const transaction::cptr& tx,
    const pending_id& id) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (closed() || ec == error::service_stopped ||
        ec == network::error::operation_canceled)
    {
        end();
        return;
    }

    if (ec)
    {
        LOGN("Pending transaction [" << id << "] skipped, " << ec.message());
        fire(events::transaction_missing, queue_.size());
    }
    else
    {
        fire(events::transaction_resolved, queue_.size());
        if (is_monitored(*tx))
        {
            LOGN("Incoming transfer [" << id << "] of (" << tx->value
                << ") from [" << tx->from << "].");
            fire(events::transaction_detected, queue_.size());
            node().detected(id);
        }
    }

    gate().sleep(settings().detect_pace(), BIND(handle_pace, _1));
}

void worker_detect::handle_pace(const code& ec) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (ec)
    {
        end();
        return;
    }

    do_next();
}

void worker_detect::do_idle() NOEXCEPT
{
    BC_ASSERT(stranded());
    end();
    LOGV("Detection idle after (" << cycles() << ") cycles.");
    fire(events::detect_idle, cycles());
}

// filter
// ----------------------------------------------------------------------------

bool worker_detect::is_monitored(const transaction& tx) const NOEXCEPT
{
    return !tx.to.empty() && ascii_to_lower(tx.to) == monitored_;
}

BC_POP_WARNING()

} // namespace sweep
} // namespace libbitcoin
