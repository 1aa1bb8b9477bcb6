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
#include <bitcoin/sweep/utility/rate_gate.hpp>

#include <memory>
#include <utility>
#include <bitcoin/network.hpp>
#include <bitcoin/sweep/define.hpp>

namespace libbitcoin {
namespace sweep {

using namespace network;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

rate_gate::rate_gate(const logger& log, asio::strand& strand) NOEXCEPT
  : timer_(std::make_shared<deadline>(log, strand))
{
}

void rate_gate::sleep(const duration& span, result_handler&& handler) NOEXCEPT
{
    // Deadline expiry may be reported as operation_timeout.
    timer_->start([handler = std::move(handler)](const code& ec) NOEXCEPT
    {
        handler(ec == network::error::operation_timeout ? code{} : ec);
    }, span);
}

void rate_gate::wait_until(const time_point& earliest,
    result_handler&& handler) NOEXCEPT
{
    const auto now = steady_clock::now();
    sleep(earliest > now ? earliest - now : duration::zero(),
        std::move(handler));
}

void rate_gate::stop() NOEXCEPT
{
    timer_->stop();
}

BC_POP_WARNING()

} // namespace sweep
} // namespace libbitcoin
