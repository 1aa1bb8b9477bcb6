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
#ifndef LIBBITCOIN_SWEEP_EVENTS_HPP
#define LIBBITCOIN_SWEEP_EVENTS_HPP

#include <bitcoin/system.hpp>
#include <bitcoin/sweep/error.hpp>

namespace libbitcoin {
namespace sweep {

/// Reporting events.
enum events : uint8_t
{
    /// Ingestion.
    pending_queued,       // pending id pushed (ingest queue size)
    pending_evicted,      // oldest pending id dropped on overflow

    /// Detection.
    transaction_resolved, // pending id resolved to a transaction
    transaction_missing,  // pending id not resolved within retry budget
    transaction_detected, // resolved recipient is the monitored address
    detect_idle,          // detection drain cycle complete (cycle count)

    /// Sweep.
    sweep_submitted,      // transfer accepted by chain client
    sweep_failed,         // transfer rejected or balance/fee read failed
    sweep_deferred,       // balance below dust or fee, drain stopped
    sweep_idle            // sweep drain cycle complete (cycle count)
};

} // namespace sweep
} // namespace libbitcoin

#endif
