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
#include <bitcoin/sweep/utility/ingest_queue.hpp>

#include <algorithm>
#include <utility>
#include <bitcoin/sweep/define.hpp>

namespace libbitcoin {
namespace sweep {

using namespace system;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

ingest_queue::ingest_queue(size_t capacity) NOEXCEPT
  : buffer_(std::max<size_t>(capacity, one))
{
}

// circular_buffer overwrites the front element when full.
bool ingest_queue::push(pending_id id) NOEXCEPT
{
    const auto evict = buffer_.full();
    buffer_.push_back(std::move(id));
    return evict;
}

bool ingest_queue::pop(pending_id& out) NOEXCEPT
{
    if (buffer_.empty())
        return false;

    out = std::move(buffer_.front());
    buffer_.pop_front();
    return true;
}

bool ingest_queue::empty() const NOEXCEPT
{
    return buffer_.empty();
}

size_t ingest_queue::size() const NOEXCEPT
{
    return buffer_.size();
}

size_t ingest_queue::capacity() const NOEXCEPT
{
    return buffer_.capacity();
}

BC_POP_WARNING()

} // namespace sweep
} // namespace libbitcoin
