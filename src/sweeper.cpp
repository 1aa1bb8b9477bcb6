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
#include <bitcoin/sweep/sweeper.hpp>

#include <utility>
#include <bitcoin/network.hpp>
#include <bitcoin/sweep/client/chain_client.hpp>
#include <bitcoin/sweep/define.hpp>
#include <bitcoin/sweep/workers/workers.hpp>

namespace libbitcoin {
namespace sweep {

using namespace system;
using namespace network;
using namespace std::placeholders;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

sweeper::sweeper(chain_client& client, const configuration& configuration,
    const logger& log) NOEXCEPT
  : reporter(log),
    config_(configuration),
    client_(client),
    threadpool_(configuration.sweep.threads_()),
    strand_(threadpool_.service().get_executor()),
    worker_sweep_(*this),
    worker_detect_(*this)
{
}

sweeper::~sweeper() NOEXCEPT
{
    close();
}

// Sequences.
// ----------------------------------------------------------------------------

void sweeper::start(result_handler&& handler) NOEXCEPT
{
    code ec{};
    if (((ec = worker_sweep_.start())) ||
        ((ec = worker_detect_.start())))
    {
        handler(ec);
        return;
    }

    client_.start(std::bind(&sweeper::handle_started,
        this, _1, std::move(handler)));
}

void sweeper::handle_started(const code& ec,
    const result_handler& handler) NOEXCEPT
{
    if (ec)
    {
        LOGF("Chain client failed to start, " << ec.message());
        handler(ec);
        return;
    }

    client_.subscribe_pending(std::bind(&sweeper::handle_pending,
        this, _1, _2));

    LOGN("Monitoring [" << config_.sweep.monitored() << "] for transfers.");
    handler(error::success);
}

void sweeper::subscribe_close(result_handler&& handler) NOEXCEPT
{
    boost::asio::post(strand_,
        std::bind(&sweeper::do_subscribe_close,
            this, std::move(handler)));
}

// private
void sweeper::do_subscribe_close(const result_handler& handler) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (faulted_)
    {
        handler(fault_);
        return;
    }

    close_handler_ = handler;
}

void sweeper::close() NOEXCEPT
{
    if (closed_.exchange(true))
        return;

    // Outstanding client requests complete with service_stopped.
    client_.stop();

    boost::asio::post(strand_,
        std::bind(&sweeper::do_close, this));

    threadpool_.stop();
    if (!threadpool_.join())
    {
        LOGF("Sweeper threadpool failed to join.");
    }

    worker_detect_.stop();
    worker_sweep_.stop();
}

// private
void sweeper::do_close() NOEXCEPT
{
    BC_ASSERT(stranded());

    // Cancel pacing and backoff waits.
    worker_detect_.stopping(error::service_stopped);
    worker_sweep_.stopping(error::service_stopped);

    // Close subscriber is released without fault.
    if (close_handler_)
    {
        close_handler_(error::service_stopped);
        close_handler_ = {};
    }
}

// Handoffs.
// ----------------------------------------------------------------------------

void sweeper::handle_pending(const code& ec, const pending_id& id) NOEXCEPT
{
    if (ec)
    {
        if (closed())
            return;

        LOGF("Pending transaction subscription lost, " << ec.message());
        fault(ec);
        return;
    }

    pending(id);
}

void sweeper::pending(const pending_id& id) NOEXCEPT
{
    worker_detect_.enqueue(id);
}

void sweeper::detected(const pending_id& id) NOEXCEPT
{
    worker_sweep_.enqueue(id);
}

void sweeper::fault(const code& ec) NOEXCEPT
{
    boost::asio::post(strand_,
        std::bind(&sweeper::do_fault,
            this, ec));
}

// private
void sweeper::do_fault(const code& ec) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (faulted_)
        return;

    faulted_ = true;
    fault_ = ec;

    if (close_handler_)
    {
        close_handler_(ec);
        close_handler_ = {};
    }
}

// Properties.
// ----------------------------------------------------------------------------

const configuration& sweeper::config() const NOEXCEPT
{
    return config_;
}

chain_client& sweeper::client() const NOEXCEPT
{
    return client_;
}

asio::io_context& sweeper::service() NOEXCEPT
{
    return threadpool_.service();
}

bool sweeper::closed() const NOEXCEPT
{
    return closed_.load();
}

size_t sweeper::detect_cycles() const NOEXCEPT
{
    return worker_detect_.cycles();
}

size_t sweeper::sweep_cycles() const NOEXCEPT
{
    return worker_sweep_.cycles();
}

bool sweeper::stranded() const NOEXCEPT
{
    return strand_.running_in_this_thread();
}

BC_POP_WARNING()

} // namespace sweep
} // namespace libbitcoin
