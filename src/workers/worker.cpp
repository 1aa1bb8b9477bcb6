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
#include <bitcoin/sweep/workers/worker.hpp>

#include <bitcoin/network.hpp>
#include <bitcoin/sweep/client/chain_client.hpp>
#include <bitcoin/sweep/configuration.hpp>
#include <bitcoin/sweep/define.hpp>
#include <bitcoin/sweep/sweeper.hpp>

namespace libbitcoin {
namespace sweep {

using namespace system;
using namespace network;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

worker::worker(sweeper& node) NOEXCEPT
  : reporter(node.log),
    node_(node),
    strand_(node.service().get_executor()),
    gate_(node.log, strand_)
{
}

// Methods.
// ----------------------------------------------------------------------------

void worker::stopping(const code&) NOEXCEPT
{
}

void worker::stop() NOEXCEPT
{
}

size_t worker::cycles() const NOEXCEPT
{
    return cycles_.load(std::memory_order_relaxed);
}

bool worker::closed() const NOEXCEPT
{
    return node_.closed();
}

code worker::fault(const code& ec) NOEXCEPT
{
    node_.fault(ec);
    return ec;
}

// Drain state.
// ----------------------------------------------------------------------------

bool worker::begin() NOEXCEPT
{
    BC_ASSERT(stranded());
    if (running_)
        return false;

    running_ = true;
    cycles_.fetch_add(one, std::memory_order_relaxed);
    return true;
}

void worker::end() NOEXCEPT
{
    BC_ASSERT(stranded());
    running_ = false;
}

bool worker::running() const NOEXCEPT
{
    BC_ASSERT(stranded());
    return running_;
}

// Strand.
// ----------------------------------------------------------------------------

asio::strand& worker::strand() NOEXCEPT
{
    return strand_;
}

bool worker::stranded() const NOEXCEPT
{
    return strand_.running_in_this_thread();
}

rate_gate& worker::gate() NOEXCEPT
{
    return gate_;
}

// Properties.
// ----------------------------------------------------------------------------

const sweep::settings& worker::settings() const NOEXCEPT
{
    return node_.config().sweep;
}

chain_client& worker::client() const NOEXCEPT
{
    return node_.client();
}

sweeper& worker::node() const NOEXCEPT
{
    return node_;
}

BC_POP_WARNING()

} // namespace sweep
} // namespace libbitcoin
