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
#include <bitcoin/sweep/settings.hpp>

#include <algorithm>
#include <filesystem>
#include <bitcoin/network.hpp>

using namespace bc::system;
using namespace bc::network;

namespace libbitcoin {
namespace log {

// Log states default to network compiled states or explicit false.
settings::settings() NOEXCEPT
  : application{ levels::application_defined },
    news{ levels::news_defined },
    remote{ levels::remote_defined },
    fault{ levels::fault_defined },
    verbose{ false /*levels::verbose_defined*/ }
{
}

std::filesystem::path settings::log_file() const NOEXCEPT
{
    BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)
    return path / "bs.log";
    BC_POP_WARNING()
}

std::filesystem::path settings::events_file() const NOEXCEPT
{
    BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)
    return path / "events.log";
    BC_POP_WARNING()
}

} // namespace log

namespace sweep {

// 0.0001 ether in wei.
constexpr uint64_t default_dust_threshold = 100'000'000'000'000;

settings::settings() NOEXCEPT
  : threads{ 1 },
    ingest_capacity{ 100 },
    retry_attempts{ 5 },
    retry_base_milliseconds{ 1'500 },
    detect_interval_milliseconds{ 2'000 },
    detect_pace_milliseconds{ 500 },
    sweep_pace_milliseconds{ 1'000 },
    request_timeout_seconds{ 30 },
    gas_limit{ 21'000 },
    dust_threshold{ default_dust_threshold }
{
}

size_t settings::threads_() const NOEXCEPT
{
    return std::max<size_t>(threads, one);
}

size_t settings::ingest_capacity_() const NOEXCEPT
{
    return std::max<size_t>(ingest_capacity, one);
}

size_t settings::retry_attempts_() const NOEXCEPT
{
    return std::max<size_t>(retry_attempts, one);
}

duration settings::retry_base() const NOEXCEPT
{
    return network::milliseconds(retry_base_milliseconds);
}

duration settings::detect_interval() const NOEXCEPT
{
    return network::milliseconds(detect_interval_milliseconds);
}

duration settings::detect_pace() const NOEXCEPT
{
    return network::milliseconds(detect_pace_milliseconds);
}

duration settings::sweep_pace() const NOEXCEPT
{
    return network::milliseconds(sweep_pace_milliseconds);
}

duration settings::request_timeout() const NOEXCEPT
{
    return network::seconds(request_timeout_seconds);
}

std::string settings::monitored() const NOEXCEPT
{
    return ascii_to_lower(monitored_address);
}

string_list settings::missing() const NOEXCEPT
{
    BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)
    string_list names{};
    if (credential.empty()) names.push_back("credential");
    if (monitored_address.empty()) names.push_back("monitored_address");
    if (destination_address.empty()) names.push_back("destination_address");
    if (endpoint.empty()) names.push_back("endpoint");
    return names;
    BC_POP_WARNING()
}

} // namespace sweep
} // namespace libbitcoin
