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
#ifndef LIBBITCOIN_SWEEP_DEFINE_HPP
#define LIBBITCOIN_SWEEP_DEFINE_HPP

/// Standard includes (do not include directly).
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <boost/circular_buffer.hpp>

/// Pulls in common /sweep headers (excluding settings/config/parser/sweeper).
#include <bitcoin/sweep/events.hpp>

/// Now we use the generic helper definitions above to define BCS_API
/// and BCS_INTERNAL. BCS_API is used for the public API symbols. It either DLL
/// imports or DLL exports (or does nothing for static build) BCS_INTERNAL is
/// used for non-api symbols.
#if defined BCS_STATIC
    #define BCS_API
    #define BCS_INTERNAL
#elif defined BCS_DLL
    #define BCS_API      BC_HELPER_DLL_EXPORT
    #define BCS_INTERNAL BC_HELPER_DLL_LOCAL
#else
    #define BCS_API      BC_HELPER_DLL_IMPORT
    #define BCS_INTERNAL BC_HELPER_DLL_LOCAL
#endif

/// For common types below.
#include <bitcoin/network.hpp>

namespace libbitcoin {
namespace sweep {

/// Alias system code.
typedef std::error_code code;

/// Completion types.
typedef network::result_handler result_handler;

/// Chain value types.
/// Balances, fee prices and transfer values are 256 bit base units (wei).
using amount = system::uint256_t;
using pending_id = std::string;

/// Timing types.
using clock = network::steady_clock;
using duration = clock::duration;
using time_point = clock::time_point;

} // namespace sweep
} // namespace libbitcoin

#endif

// define.hpp is the common include for /sweep.
// All non-sweep headers include define.hpp.
// Sweep inclusions are chained as follows.

// version        : <generated>
// error          : version
// events         : error
// define         : events

// Other directory common includes are not internally chained.
// Each header includes only its required common headers.

// settings       : define
// configuration  : define settings
// parser         : define configuration
// /utility       : define
// /client        : define configuration
// fetcher        : define /client /utility
// /workers       : define configuration  [forward: sweeper]
// sweeper        : define /client /workers
