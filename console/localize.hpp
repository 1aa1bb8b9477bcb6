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
#ifndef LIBBITCOIN_SWEEP_LOCALIZE_HPP
#define LIBBITCOIN_SWEEP_LOCALIZE_HPP

/// Localizable messages.

namespace libbitcoin {
namespace sweep {

// --settings
#define BS_SETTINGS_MESSAGE \
    "These are the configuration settings that can be set."
#define BS_INFORMATION_MESSAGE \
    "Sweeps incoming transfers from a monitored account to a destination."

// --version
#define BS_VERSION_MESSAGE \
    "\nVersion Information\n" \
    "----------------------------\n" \
    "libbitcoin-sweep:      %1%\n" \
    "libbitcoin-network:    %2%\n" \
    "libbitcoin-system:     %3%"

// run
#define BS_LOG_DIRECTORY_FAILURE \
    "Failed to create log directory %1%, %2%."
#define BS_LOG_INITIALIZE_FAILURE \
    "Failed to initialize logging."
#define BS_USING_CONFIG_FILE \
    "Using config file: %1%"
#define BS_USING_DEFAULT_CONFIG \
    "Using default configuration settings."
#define BS_MISSING_SETTING \
    "Required setting [%1%] is not configured."
#define BS_CONFIGURATION \
    "Monitoring [%1%] sweeping to [%2%] via [%3%]."
#define BS_SWEEPER_STARTING \
    "Please wait while the sweeper is starting..."
#define BS_SWEEPER_START_FAIL \
    "Sweeper failed to start with error, %1%."
#define BS_SWEEPER_STARTED \
    "Sweeper is started."
#define BS_SWEEPER_INTERRUPT \
    "Press CTRL-C to stop the sweeper."
#define BS_SWEEPER_STOPPING \
    "Please wait while the sweeper is stopping..."
#define BS_SWEEPER_STOP_CODE \
    "Sweeper stopped with code, %1%."
#define BS_SWEEPER_STOPPED \
    "Sweeper stopped successfully."

#define BS_LOG_HEADER \
    "====================== startup ======================="
#define BS_SWEEPER_FOOTER \
    "====================== shutdown ======================"

} // namespace sweep
} // namespace libbitcoin

#endif
