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
#ifndef LIBBITCOIN_SWEEP_WORKERS_WORKER_HPP
#define LIBBITCOIN_SWEEP_WORKERS_WORKER_HPP

#include <atomic>
#include <bitcoin/network.hpp>
#include <bitcoin/sweep/client/chain_client.hpp>
#include <bitcoin/sweep/configuration.hpp>
#include <bitcoin/sweep/define.hpp>
#include <bitcoin/sweep/utility/rate_gate.hpp>

namespace libbitcoin {
namespace sweep {

class sweeper;

/// Abstract base for single-flight queue draining workers.
/// Each worker operates on its own strand, implemented here, so that a long
/// drain (or its pacing) never blocks the other worker or ingestion. A drain
/// cycle is activated only when no cycle is running, and a cycle runs until
/// its queue is empty (or it exits early), which returns the worker to idle.
class BCS_API worker
  : public network::reporter
{
public:
    DELETE_COPY_MOVE_DESTRUCT(worker);

    /// Should be called before the client is started.
    virtual code start() NOEXCEPT = 0;

    /// Override to capture non-blocking stopping.
    virtual void stopping(const code& ec) NOEXCEPT;

    /// Override to capture blocking stop.
    virtual void stop() NOEXCEPT;

    /// Number of drain cycles started (thread safe).
    size_t cycles() const NOEXCEPT;

protected:
    /// Abstract base class protected construct.
    worker(sweeper& node) NOEXCEPT;

    /// Binders.
    /// -----------------------------------------------------------------------

    /// Bind a method (use BIND).
    template <class Derived, typename Method, typename... Args>
    auto bind(Method&& method, Args&&... args) NOEXCEPT
    {
        return BIND_THIS(method, args);
    }

    /// Post a method to worker strand (use POST).
    template <class Derived, typename Method, typename... Args>
    auto post(Method&& method, Args&&... args) NOEXCEPT
    {
        return boost::asio::post(strand(), BIND_THIS(method, args));
    }

    /// Drain state (requires strand).
    /// -----------------------------------------------------------------------

    /// Enter a drain cycle, false if one is already running.
    virtual bool begin() NOEXCEPT;

    /// Leave the drain cycle.
    virtual void end() NOEXCEPT;

    /// A drain cycle is running.
    virtual bool running() const NOEXCEPT;

    /// Methods.
    /// -----------------------------------------------------------------------

    /// Sweeper is closed and its threadpool may still be joining.
    virtual bool closed() const NOEXCEPT;

    /// Stop the sweeper (terminal).
    virtual code fault(const code& ec) NOEXCEPT;

    /// Strand.
    /// -----------------------------------------------------------------------

    /// The worker's strand (on the sweeper threadpool).
    virtual network::asio::strand& strand() NOEXCEPT;

    /// True if the current thread is on the worker strand.
    virtual bool stranded() const NOEXCEPT;

    /// Pacing gate on the worker strand.
    virtual rate_gate& gate() NOEXCEPT;

    /// Properties.
    /// -----------------------------------------------------------------------

    /// Sweep configuration settings.
    const sweep::settings& settings() const NOEXCEPT;

    /// Thread safe chain client.
    chain_client& client() const NOEXCEPT;

    /// The owning sweeper.
    sweeper& node() const NOEXCEPT;

private:
    // These are thread safe.
    sweeper& node_;
    network::asio::strand strand_;
    std::atomic<size_t> cycles_{};

    // These are protected by strand.
    rate_gate gate_;
    bool running_{};
};

} // namespace sweep
} // namespace libbitcoin

#endif
