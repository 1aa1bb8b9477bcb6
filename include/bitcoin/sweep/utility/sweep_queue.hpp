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
#ifndef LIBBITCOIN_SWEEP_UTILITY_SWEEP_QUEUE_HPP
#define LIBBITCOIN_SWEEP_UTILITY_SWEEP_QUEUE_HPP

#include <deque>
#include <bitcoin/sweep/define.hpp>

namespace libbitcoin {
namespace sweep {

/// Detected transfers awaiting a sweep attempt, oldest first.
/// Entries count sweep opportunities, the swept value is read from the chain.
/// Not thread safe (protect by strand).
class BCS_API sweep_queue
{
public:
    DEFAULT_COPY_MOVE_DESTRUCT(sweep_queue);

    sweep_queue() = default;

    /// Append the triggering id.
    void push(pending_id id) NOEXCEPT;

    /// Discard the oldest entry, false if empty.
    bool pop() NOEXCEPT;

    /// The oldest entry (queue must not be empty).
    const pending_id& front() const NOEXCEPT;

    bool empty() const NOEXCEPT;
    size_t size() const NOEXCEPT;

private:
    std::deque<pending_id> queue_{};
};

} // namespace sweep
} // namespace libbitcoin

#endif
