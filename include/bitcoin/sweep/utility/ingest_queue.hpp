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
#ifndef LIBBITCOIN_SWEEP_UTILITY_INGEST_QUEUE_HPP
#define LIBBITCOIN_SWEEP_UTILITY_INGEST_QUEUE_HPP

#include <bitcoin/sweep/define.hpp>

namespace libbitcoin {
namespace sweep {

/// A bounded queue of pending transaction ids, oldest first.
/// When full the oldest id is dropped to admit the newest, so the queue holds
/// the most recent pending activity. Not thread safe (protect by strand).
class BCS_API ingest_queue
{
public:
    DEFAULT_COPY_MOVE_DESTRUCT(ingest_queue);

    /// Capacity is clamped to one.
    ingest_queue(size_t capacity) NOEXCEPT;

    /// Append the id, true if the oldest id was evicted to make room.
    bool push(pending_id id) NOEXCEPT;

    /// Remove the oldest id into out, false if empty.
    bool pop(pending_id& out) NOEXCEPT;

    /// The queue contains no entries.
    bool empty() const NOEXCEPT;

    /// The number of retained ids.
    size_t size() const NOEXCEPT;

    /// The maximum number of retained ids.
    size_t capacity() const NOEXCEPT;

private:
    boost::circular_buffer<pending_id> buffer_;
};

} // namespace sweep
} // namespace libbitcoin

#endif
