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
#include <bitcoin/sweep/utility/sweep_queue.hpp>

#include <utility>
#include <bitcoin/sweep/define.hpp>

namespace libbitcoin {
namespace sweep {

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

void sweep_queue::push(pending_id id) NOEXCEPT
{
    queue_.push_back(std::move(id));
}

bool sweep_queue::pop() NOEXCEPT
{
    if (queue_.empty())
        return false;

    queue_.pop_front();
    return true;
}

const pending_id& sweep_queue::front() const NOEXCEPT
{
    BC_ASSERT(!queue_.empty());
    return queue_.front();
}

bool sweep_queue::empty() const NOEXCEPT
{
    return queue_.empty();
}

size_t sweep_queue::size() const NOEXCEPT
{
    return queue_.size();
}

BC_POP_WARNING()

} // namespace sweep
} // namespace libbitcoin
