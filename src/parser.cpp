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
#include <bitcoin/sweep/parser.hpp>

#include <iostream>
#include <bitcoin/system.hpp>
#include <bitcoin/network.hpp>
#include <bitcoin/sweep/configuration.hpp>

std::filesystem::path config_default_path() NOEXCEPT
{
    return { "libbitcoin/bs.cfg" };
}

namespace libbitcoin {
namespace sweep {

using namespace bc::system;
using namespace bc::system::config;
using namespace boost::program_options;

// Initialize configuration using compiled defaults.
parser::parser() NOEXCEPT
  : configured()
{
}

// Initialize configuration by copying the given instance.
parser::parser(const configuration& defaults) NOEXCEPT
  : configured(defaults)
{
}

options_metadata parser::load_options() THROWS
{
    options_metadata description("options");
    description.add_options()
    (
        BS_CONFIG_VARIABLE ",c",
        value<std::filesystem::path>(&configured.file),
        "Specify path to a configuration settings file."
    )
    (
        BS_HELP_VARIABLE ",h",
        value<bool>(&configured.help)->
            default_value(false)->zero_tokens(),
        "Display command line options."
    )
    (
        BS_SETTINGS_VARIABLE ",s",
        value<bool>(&configured.settings)->
            default_value(false)->zero_tokens(),
        "Display all configuration settings."
    )
    (
        BS_VERSION_VARIABLE ",v",
        value<bool>(&configured.version)->
            default_value(false)->zero_tokens(),
        "Display version information."
    );

    return description;
}

arguments_metadata parser::load_arguments() THROWS
{
    arguments_metadata description;
    return description
        .add(BS_CONFIG_VARIABLE, 1);
}

options_metadata parser::load_environment() THROWS
{
    options_metadata description("environment");
    description.add_options()
    (
        // For some reason po requires this to be a lower case name.
        // The case must match the other declarations for it to compose.
        // This composes with the cmdline options and inits to default path.
        BS_CONFIG_VARIABLE,
        value<std::filesystem::path>(&configured.file)->composing()
            ->default_value(config_default_path()),
        "The path to the configuration settings file."
    )
    (
        BS_CREDENTIAL_VARIABLE,
        value<std::string>(&configured.sweep.credential),
        "The hex private key of the monitored account, used for signing."
    )
    (
        BS_MONITORED_VARIABLE,
        value<std::string>(&configured.sweep.monitored_address),
        "The account watched for incoming transfers."
    )
    (
        BS_DESTINATION_VARIABLE,
        value<std::string>(&configured.sweep.destination_address),
        "The account that receives swept balances."
    )
    (
        BS_ENDPOINT_VARIABLE,
        value<std::string>(&configured.sweep.endpoint),
        "The websocket endpoint of the chain client."
    );

    return description;
}

options_metadata parser::load_settings() THROWS
{
    options_metadata description("settings");
    description.add_options()

    /* [log] */
    (
        "log.application",
        value<bool>(&configured.log.application),
        "Enable application logging, defaults to true."
    )
    (
        "log.news",
        value<bool>(&configured.log.news),
        "Enable news logging, defaults to true."
    )
    (
        "log.remote",
        value<bool>(&configured.log.remote),
        "Enable remote fault logging, defaults to true."
    )
    (
        "log.fault",
        value<bool>(&configured.log.fault),
        "Enable fault logging, defaults to true."
    )
    (
        "log.verbose",
        value<bool>(&configured.log.verbose),
        "Enable verbose logging, defaults to false."
    )
    (
        "log.path",
        value<std::filesystem::path>(&configured.log.path),
        "The log files directory, defaults to empty."
    )

    /* [sweep] */
    (
        "sweep.credential",
        value<std::string>(&configured.sweep.credential),
        "The hex private key of the monitored account, used for signing, required."
    )
    (
        "sweep.monitored_address",
        value<std::string>(&configured.sweep.monitored_address),
        "The account watched for incoming transfers, required."
    )
    (
        "sweep.destination_address",
        value<std::string>(&configured.sweep.destination_address),
        "The account that receives swept balances, required."
    )
    (
        "sweep.endpoint",
        value<std::string>(&configured.sweep.endpoint),
        "The ws:// or wss:// endpoint of the chain client, required."
    )
    (
        "sweep.threads",
        value<uint32_t>(&configured.sweep.threads),
        "The number of threads in the worker threadpool, defaults to 1."
    )
    (
        "sweep.ingest_capacity",
        value<uint32_t>(&configured.sweep.ingest_capacity),
        "The maximum number of retained pending transactions, defaults to 100."
    )
    (
        "sweep.retry_attempts",
        value<uint32_t>(&configured.sweep.retry_attempts),
        "The number of attempts to resolve a pending transaction, defaults to 5."
    )
    (
        "sweep.retry_base_milliseconds",
        value<uint32_t>(&configured.sweep.retry_base_milliseconds),
        "The first retry delay, doubled on each further retry, defaults to 1500."
    )
    (
        "sweep.detect_interval_milliseconds",
        value<uint32_t>(&configured.sweep.detect_interval_milliseconds),
        "The minimum time between detection cycle starts, defaults to 2000."
    )
    (
        "sweep.detect_pace_milliseconds",
        value<uint32_t>(&configured.sweep.detect_pace_milliseconds),
        "The delay between pending transaction resolutions, defaults to 500."
    )
    (
        "sweep.sweep_pace_milliseconds",
        value<uint32_t>(&configured.sweep.sweep_pace_milliseconds),
        "The delay between sweep attempts, defaults to 1000."
    )
    (
        "sweep.request_timeout_seconds",
        value<uint32_t>(&configured.sweep.request_timeout_seconds),
        "The time limit for chain client connection, defaults to 30."
    )
    (
        "sweep.gas_limit",
        value<uint64_t>(&configured.sweep.gas_limit),
        "The gas limit of a sweep transfer, defaults to 21000."
    )
    (
        "sweep.dust_threshold",
        value<amount>(&configured.sweep.dust_threshold),
        "The balance at or below which no sweep is attempted, defaults to 100000000000000 (0.0001 ether)."
    );

    return description;
}

static void apply_environment(std::string& member,
    const boost::program_options::variables_map& variables,
    const std::string& name) THROWS
{
    const auto value = variables.find(name);
    if (value != variables.end() && !value->second.defaulted())
        member = value->second.as<std::string>();
}

bool parser::parse(int argc, const char* argv[], std::ostream& error) THROWS
{
    try
    {
        auto file = false;
        variables_map variables;
        load_command_variables(variables, argc, argv);
        load_environment_variables(variables, BS_ENVIRONMENT_VARIABLE_PREFIX);

        // Don't load config file if any of these options are specified.
        if (!get_option(variables, BS_VERSION_VARIABLE) &&
            !get_option(variables, BS_SETTINGS_VARIABLE) &&
            !get_option(variables, BS_HELP_VARIABLE))
        {
            // Returns true if the settings were loaded from a file.
            file = load_configuration_variables(variables, BS_CONFIG_VARIABLE);
        }

        // Update bound variables in metadata.settings.
        notify(variables);

        // Environment takes precedence over the config file.
        auto& sweep = configured.sweep;
        apply_environment(sweep.credential, variables, BS_CREDENTIAL_VARIABLE);
        apply_environment(sweep.monitored_address, variables,
            BS_MONITORED_VARIABLE);
        apply_environment(sweep.destination_address, variables,
            BS_DESTINATION_VARIABLE);
        apply_environment(sweep.endpoint, variables, BS_ENDPOINT_VARIABLE);

        // Clear the config file path if it wasn't used.
        if (!file)
            configured.file.clear();
    }
    catch (const boost::program_options::error& e)
    {
        // This is obtained from boost, which circumvents our localization.
        error << format_invalid_parameter(e.what()) << std::endl;
        return false;
    }

    return true;
}

} // namespace sweep
} // namespace libbitcoin
