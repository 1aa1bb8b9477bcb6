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
#ifndef LIBBITCOIN_SWEEP_SWEEPER_HPP
#define LIBBITCOIN_SWEEP_SWEEPER_HPP

#include <atomic>
#include <memory>
#include <bitcoin/network.hpp>
#include <bitcoin/sweep/client/chain_client.hpp>
#include <bitcoin/sweep/configuration.hpp>
#include <bitcoin/sweep/define.hpp>
#include <bitcoin/sweep/workers/workers.hpp>

namespace libbitcoin {
namespace sweep {

/// Thread safe pending transaction sweeper.
/// Pending ids from the client subscription feed the detection worker, which
/// hands matching ids to the sweep worker. Both workers run on strands of the
/// sweeper threadpool. Loss of the subscription is terminal and is reported
/// once to the close subscriber.
class BCS_API sweeper
  : public network::reporter
{
public:
    typedef std::shared_ptr<sweeper> ptr;

    DELETE_COPY_MOVE(sweeper);

    /// Construct an instance.
    sweeper(chain_client& client, const configuration& configuration,
        const network::logger& log) NOEXCEPT;

    /// Close and join.
    virtual ~sweeper() NOEXCEPT;

    /// Sequences.
    /// -----------------------------------------------------------------------

    /// Start workers, connect the client and subscribe to pending ids.
    virtual void start(result_handler&& handler) NOEXCEPT;

    /// Handler is invoked once with the terminal fault code, if any.
    virtual void subscribe_close(result_handler&& handler) NOEXCEPT;

    /// Stop client and workers, and join threads (must not be pool thread).
    virtual void close() NOEXCEPT;

    /// Handoffs (thread safe).
    /// -----------------------------------------------------------------------

    /// Ingest an observed pending transaction id.
    virtual void pending(const pending_id& id) NOEXCEPT;

    /// Forward a detected transfer to the sweep worker.
    virtual void detected(const pending_id& id) NOEXCEPT;

    /// Report a terminal fault to the close subscriber.
    virtual void fault(const code& ec) NOEXCEPT;

    /// Properties.
    /// -----------------------------------------------------------------------

    /// Configuration for all services.
    virtual const configuration& config() const NOEXCEPT;

    /// Thread safe chain client.
    virtual chain_client& client() const NOEXCEPT;

    /// The sweeper threadpool service.
    virtual network::asio::io_context& service() NOEXCEPT;

    /// The sweeper is closed (or closing).
    virtual bool closed() const NOEXCEPT;

    /// Drain cycles started by the detection worker.
    virtual size_t detect_cycles() const NOEXCEPT;

    /// Drain cycles started by the sweep worker.
    virtual size_t sweep_cycles() const NOEXCEPT;

protected:
    virtual void handle_started(const code& ec,
        const result_handler& handler) NOEXCEPT;
    virtual void handle_pending(const code& ec,
        const pending_id& id) NOEXCEPT;

    /// True if the current thread is on the sweeper strand.
    bool stranded() const NOEXCEPT;

private:
    void do_subscribe_close(const result_handler& handler) NOEXCEPT;
    void do_fault(const code& ec) NOEXCEPT;
    void do_close() NOEXCEPT;

    // These are thread safe.
    const configuration& config_;
    chain_client& client_;
    network::threadpool threadpool_;
    network::asio::strand strand_;
    std::atomic_bool closed_{};

    // Workers are constructed after the threadpool (strands).
    worker_sweep worker_sweep_;
    worker_detect worker_detect_;

    // These are protected by strand.
    result_handler close_handler_{};
    code fault_{};
    bool faulted_{};
};

} // namespace sweep
} // namespace libbitcoin

#endif
