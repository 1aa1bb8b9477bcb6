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
#include "test.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace bc::network;

BOOST_AUTO_TEST_SUITE(configuration_tests)

BOOST_AUTO_TEST_CASE(configuration__construct__default__expected)
{
    const sweep::configuration instance{};

    BOOST_REQUIRE(instance.file.empty());
    BOOST_REQUIRE(!instance.help);
    BOOST_REQUIRE(!instance.settings);
    BOOST_REQUIRE(!instance.version);

    BOOST_REQUIRE_EQUAL(instance.log.application, levels::application_defined);
    BOOST_REQUIRE_EQUAL(instance.log.news, levels::news_defined);
    BOOST_REQUIRE_EQUAL(instance.log.remote, levels::remote_defined);
    BOOST_REQUIRE_EQUAL(instance.log.fault, levels::fault_defined);
    BOOST_REQUIRE_EQUAL(instance.log.verbose, false /*levels::verbose_defined*/);
    BOOST_REQUIRE_EQUAL(instance.log.log_file(), "bs.log");
    BOOST_REQUIRE_EQUAL(instance.log.events_file(), "events.log");
    BOOST_REQUIRE_EQUAL(instance.log.path, "");

    BOOST_REQUIRE_EQUAL(instance.sweep.gas_limit, 21'000u);
    BOOST_REQUIRE_EQUAL(instance.sweep.missing().size(), 4u);
}

BOOST_AUTO_TEST_CASE(parser__parse__settings_option__settings_set)
{
    sweep::parser instance{};
    const char* argv[] = { "bs", "--settings" };
    std::ostringstream error{};
    BOOST_REQUIRE(instance.parse(2, argv, error));
    BOOST_REQUIRE(instance.configured.settings);
    BOOST_REQUIRE(!instance.configured.help);
}

BOOST_AUTO_TEST_CASE(parser__parse__unknown_option__false)
{
    sweep::parser instance{};
    const char* argv[] = { "bs", "--bogus" };
    std::ostringstream error{};
    BOOST_REQUIRE(!instance.parse(2, argv, error));
    BOOST_REQUIRE(!error.str().empty());
}

BOOST_AUTO_TEST_CASE(parser__parse__environment_and_file__environment_precedence)
{
    const auto path = std::filesystem::temp_directory_path() /
        "bs_environment_precedence.cfg";

    {
        std::ofstream file(path);
        file << "[sweep]\n"
            << "credential = file_credential\n"
            << "monitored_address = 0xfile\n"
            << "endpoint = ws://file:8546\n"
            << "gas_limit = 42000\n";
    }

    BOOST_REQUIRE_EQUAL(::setenv("BS_CREDENTIAL", "environment_credential", 1), 0);
    BOOST_REQUIRE_EQUAL(::setenv("BS_ENDPOINT", "ws://environment:8546", 1), 0);

    sweep::parser instance{};
    const auto config = path.string();
    const char* argv[] = { "bs", "--config", config.c_str() };
    std::ostringstream error{};
    const auto result = instance.parse(3, argv, error);

    ::unsetenv("BS_CREDENTIAL");
    ::unsetenv("BS_ENDPOINT");
    std::filesystem::remove(path);

    BOOST_REQUIRE(result);
    BOOST_REQUIRE_EQUAL(instance.configured.file, path);
    BOOST_REQUIRE_EQUAL(instance.configured.sweep.credential, "environment_credential");
    BOOST_REQUIRE_EQUAL(instance.configured.sweep.endpoint, "ws://environment:8546");
    BOOST_REQUIRE_EQUAL(instance.configured.sweep.monitored_address, "0xfile");
    BOOST_REQUIRE_EQUAL(instance.configured.sweep.gas_limit, 42'000u);
}

BOOST_AUTO_TEST_CASE(parser__parse__environment_only__environment_values)
{
    BOOST_REQUIRE_EQUAL(::setenv("BS_DESTINATION_ADDRESS", "0xdestination", 1), 0);

    sweep::parser instance{};
    const char* argv[] = { "bs", "--settings" };
    std::ostringstream error{};
    const auto result = instance.parse(2, argv, error);
    ::unsetenv("BS_DESTINATION_ADDRESS");

    BOOST_REQUIRE(result);
    BOOST_REQUIRE_EQUAL(instance.configured.sweep.destination_address, "0xdestination");
}

BOOST_AUTO_TEST_SUITE_END()
