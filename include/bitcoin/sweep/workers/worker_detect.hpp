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
#ifndef LIBBITCOIN_SWEEP_WORKERS_WORKER_DETECT_HPP
#define LIBBITCOIN_SWEEP_WORKERS_WORKER_DETECT_HPP

#include <bitcoin/sweep/client/chain_client.hpp>
#include <bitcoin/sweep/define.hpp>
#include <bitcoin/sweep/fetcher.hpp>
#include <bitcoin/sweep/utility/ingest_queue.hpp>
#include <bitcoin/sweep/workers/worker.hpp>

namespace libbitcoin {
namespace sweep {

class sweeper;

/// Drain the ingest queue, resolving each pending id and forwarding those
/// that pay the monitored address to the sweep worker.
/// Cycle starts are separated by at least the detect interval and lookups
/// within a cycle are separated by the detect pace.
class BCS_API worker_detect
  : public worker
{
public:
    DELETE_COPY_MOVE_DESTRUCT(worker_detect);

    worker_detect(sweeper& node) NOEXCEPT;

    code start() NOEXCEPT override;
    void stopping(const code& ec) NOEXCEPT override;

    /// Queue the pending id and activate a drain cycle (thread safe).
    virtual void enqueue(const pending_id& id) NOEXCEPT;

    /// True if the transaction pays the monitored address (case insensitive).
    virtual bool is_monitored(const transaction& tx) const NOEXCEPT;

protected:
    virtual void do_enqueue(const pending_id& id) NOEXCEPT;
    virtual void do_activate() NOEXCEPT;
    virtual void do_begin(const code& ec) NOEXCEPT;
    virtual void do_next() NOEXCEPT;
    virtual void handle_fetch(const code& ec, const transaction::cptr& tx,
        const pending_id& id) NOEXCEPT;
    virtual void handle_pace(const code& ec) NOEXCEPT;
    virtual void do_idle() NOEXCEPT;

private:
    void do_stopping(const code& ec) NOEXCEPT;

    // This is thread safe.
    const std::string monitored_;

    // These are protected by strand.
    ingest_queue queue_;
    fetcher fetcher_;
    time_point last_start_{};
    bool started_{};
};

} // namespace sweep
} // namespace libbitcoin

#endif
