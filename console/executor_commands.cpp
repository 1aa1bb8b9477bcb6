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
#include "executor.hpp"
#include "localize.hpp"

#include <iostream>
#include <boost/format.hpp>
#include <bitcoin/sweep.hpp>

namespace libbitcoin {
namespace sweep {

using system::config::printer;

// for --help only
const std::string executor::name_{ "bs" };

// Command line options.
// ----------------------------------------------------------------------------

// --[h]elp
int executor::do_help()
{
    log_.stop();
    printer help(metadata_.load_options(), name_, BS_INFORMATION_MESSAGE);
    help.initialize();
    help.commandline(output_);
    return result::clean;
}

// --[s]ettings
int executor::do_settings()
{
    log_.stop();
    printer print(metadata_.load_settings(), name_, BS_SETTINGS_MESSAGE);
    print.initialize();
    print.settings(output_);
    return result::clean;
}

// --[v]ersion
int executor::do_version()
{
    log_.stop();
    dump_version();
    return result::clean;
}

// Menu selection.
// ----------------------------------------------------------------------------

int executor::menu()
{
    const auto& config = metadata_.configured;

    if (config.help)
        return do_help();

    // Order below matches help output (alphabetical), so that first option is
    // executed in the case where multiple options are parsed.

    if (config.settings)
        return do_settings();

    if (config.version)
        return do_version();

    return do_run();
}

} // namespace sweep
} // namespace libbitcoin
