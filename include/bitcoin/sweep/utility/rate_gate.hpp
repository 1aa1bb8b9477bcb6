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
#ifndef LIBBITCOIN_SWEEP_UTILITY_RATE_GATE_HPP
#define LIBBITCOIN_SWEEP_UTILITY_RATE_GATE_HPP

#include <bitcoin/network.hpp>
#include <bitcoin/sweep/define.hpp>

namespace libbitcoin {
namespace sweep {

/// Non-blocking suspension on a strand.
/// Completion is posted to the strand, other strands remain responsive.
/// Expiry completes with success, stop completes with operation_canceled.
/// Not thread safe (call from the strand).
class BCS_API rate_gate
{
public:
    DELETE_COPY_MOVE(rate_gate);

    rate_gate(const network::logger& log,
        network::asio::strand& strand) NOEXCEPT;

    /// Complete the handler after the span has elapsed.
    void sleep(const duration& span, result_handler&& handler) NOEXCEPT;

    /// Complete the handler once the time point has passed.
    void wait_until(const time_point& earliest,
        result_handler&& handler) NOEXCEPT;

    /// Cancel any pending wait, call on the strand.
    void stop() NOEXCEPT;

private:
    network::deadline::ptr timer_;
};

} // namespace sweep
} // namespace libbitcoin

#endif
