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
#ifndef LIBBITCOIN_SWEEP_SETTINGS_HPP
#define LIBBITCOIN_SWEEP_SETTINGS_HPP

#include <filesystem>
#include <bitcoin/sweep/define.hpp>

namespace libbitcoin {
namespace log {

/// [log] settings.
class BCS_API settings
{
public:
    DEFAULT_COPY_MOVE_DESTRUCT(settings);

    settings() NOEXCEPT;

    bool application;
    bool news;
    bool remote;
    bool fault;
    bool verbose;

    std::filesystem::path path;

    virtual std::filesystem::path log_file() const NOEXCEPT;
    virtual std::filesystem::path events_file() const NOEXCEPT;
};

} // namespace log

namespace sweep {

/// [sweep] settings.
class BCS_API settings
{
public:
    DEFAULT_COPY_MOVE_DESTRUCT(settings);

    settings() NOEXCEPT;

    /// Required (no defaults).
    std::string credential;
    std::string monitored_address;
    std::string destination_address;
    std::string endpoint;

    /// Properties.
    uint32_t threads;
    uint32_t ingest_capacity;
    uint32_t retry_attempts;
    uint32_t retry_base_milliseconds;
    uint32_t detect_interval_milliseconds;
    uint32_t detect_pace_milliseconds;
    uint32_t sweep_pace_milliseconds;
    uint32_t request_timeout_seconds;
    uint64_t gas_limit;
    amount dust_threshold;

    /// Helpers.
    virtual size_t threads_() const NOEXCEPT;
    virtual size_t ingest_capacity_() const NOEXCEPT;
    virtual size_t retry_attempts_() const NOEXCEPT;
    virtual duration retry_base() const NOEXCEPT;
    virtual duration detect_interval() const NOEXCEPT;
    virtual duration detect_pace() const NOEXCEPT;
    virtual duration sweep_pace() const NOEXCEPT;
    virtual duration request_timeout() const NOEXCEPT;

    /// Monitored address in canonical (lower) case.
    virtual std::string monitored() const NOEXCEPT;

    /// Names of required settings that are not set (empty if complete).
    virtual system::string_list missing() const NOEXCEPT;
};

} // namespace sweep
} // namespace libbitcoin

#endif
