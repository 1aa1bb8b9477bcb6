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
#include <bitcoin/sweep/fetcher.hpp>

#include <algorithm>
#include <bitcoin/network.hpp>
#include <bitcoin/sweep/client/chain_client.hpp>
#include <bitcoin/sweep/define.hpp>

namespace libbitcoin {
namespace sweep {

#define CLASS fetcher

using namespace system;
using namespace std::placeholders;

// Shifts beyond this would overflow any meaningful delay.
constexpr size_t maximum_exponent = 32;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

fetcher::fetcher(chain_client& client, const network::logger& log,
    network::asio::strand& strand, size_t attempts,
    const duration& base) NOEXCEPT
  : reporter(log),
    client_(client),
    strand_(strand),
    attempts_(std::max<size_t>(attempts, one)),
    base_(base),
    gate_(log, strand)
{
}

void fetcher::fetch(const pending_id& id,
    transaction_handler&& handler) NOEXCEPT
{
    BC_ASSERT(stranded());
    do_attempt(id, zero, std::move(handler));
}

void fetcher::stop() NOEXCEPT
{
    BC_ASSERT(stranded());
    gate_.stop();
}

duration fetcher::backoff(size_t attempt) const NOEXCEPT
{
    const auto exponent = std::min(attempt, maximum_exponent);
    return base_ * (uint64_t{ 1 } << exponent);
}

size_t fetcher::lookups() const NOEXCEPT
{
    return lookups_.load(std::memory_order_relaxed);
}

// attempts
// ----------------------------------------------------------------------------

void fetcher::do_attempt(const pending_id& id, size_t attempt,
    const transaction_handler& handler) NOEXCEPT
{
    BC_ASSERT(stranded());
    lookups_.fetch_add(one, std::memory_order_relaxed);
    client_.get_transaction(id,
        BIND(handle_transaction, _1, _2, id, attempt, handler));
}

// Chain client completes on its own thread.
void fetcher::handle_transaction(const code& ec, const transaction::cptr& tx,
    const pending_id& id, size_t attempt,
    const transaction_handler& handler) NOEXCEPT
{
    POST(do_transaction, ec, tx, id, attempt, handler);
}

void fetcher::do_transaction(const code& ec, const transaction::cptr& tx,
    const pending_id& id, size_t attempt,
    const transaction_handler& handler) NOEXCEPT
{
    BC_ASSERT(stranded());

    if (!ec && tx)
    {
        handler(error::success, tx);
        return;
    }

    // Client shutdown is not retried.
    if (ec == error::service_stopped)
    {
        handler(ec, {});
        return;
    }

    // Absent is treated as transient (not yet propagated to the client).
    const auto reason = ec ? ec : code{ error::transaction_unavailable };
    const auto next = add1(attempt);

    if (next >= attempts_)
    {
        LOGN("Transaction [" << id << "] unresolved after (" << next
            << ") attempts, " << reason.message());
        handler(error::transaction_not_found, {});
        return;
    }

    const auto delay = backoff(attempt);
    LOGV("Transaction [" << id << "] attempt (" << next << ") failed, "
        << reason.message() << ", retry in "
        << std::chrono::duration_cast<network::milliseconds>(delay).count()
        << " ms.");

    gate_.sleep(delay, BIND(handle_backoff, _1, id, next, handler));
}

void fetcher::handle_backoff(const code& ec, const pending_id& id,
    size_t attempt, const transaction_handler& handler) NOEXCEPT
{
    BC_ASSERT(stranded());

    if (ec)
    {
        handler(ec, {});
        return;
    }

    do_attempt(id, attempt, handler);
}

bool fetcher::stranded() const NOEXCEPT
{
    return strand_.running_in_this_thread();
}

BC_POP_WARNING()

} // namespace sweep
} // namespace libbitcoin
