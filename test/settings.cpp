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

BOOST_AUTO_TEST_SUITE(settings_tests)

using namespace bc::network;

// [log]

BOOST_AUTO_TEST_CASE(settings__log__default_context__expected)
{
    const log::settings log{};
    BOOST_REQUIRE_EQUAL(log.application, levels::application_defined);
    BOOST_REQUIRE_EQUAL(log.news, levels::news_defined);
    BOOST_REQUIRE_EQUAL(log.remote, levels::remote_defined);
    BOOST_REQUIRE_EQUAL(log.fault, levels::fault_defined);
    BOOST_REQUIRE_EQUAL(log.verbose, false /*levels::verbose_defined*/);
    BOOST_REQUIRE_EQUAL(log.path, "");
    BOOST_REQUIRE_EQUAL(log.log_file(), "bs.log");
    BOOST_REQUIRE_EQUAL(log.events_file(), "events.log");
}

BOOST_AUTO_TEST_CASE(settings__log__path__files_within_path)
{
    log::settings log{};
    log.path = "logs";
    BOOST_REQUIRE_EQUAL(log.log_file(), std::filesystem::path("logs") / "bs.log");
    BOOST_REQUIRE_EQUAL(log.events_file(), std::filesystem::path("logs") / "events.log");
}

// [sweep]

BOOST_AUTO_TEST_CASE(settings__sweep__default_context__expected)
{
    const sweep::settings sweep{};
    BOOST_REQUIRE(sweep.credential.empty());
    BOOST_REQUIRE(sweep.monitored_address.empty());
    BOOST_REQUIRE(sweep.destination_address.empty());
    BOOST_REQUIRE(sweep.endpoint.empty());
    BOOST_REQUIRE_EQUAL(sweep.threads, 1u);
    BOOST_REQUIRE_EQUAL(sweep.ingest_capacity, 100u);
    BOOST_REQUIRE_EQUAL(sweep.retry_attempts, 5u);
    BOOST_REQUIRE_EQUAL(sweep.retry_base_milliseconds, 1'500u);
    BOOST_REQUIRE_EQUAL(sweep.detect_interval_milliseconds, 2'000u);
    BOOST_REQUIRE_EQUAL(sweep.detect_pace_milliseconds, 500u);
    BOOST_REQUIRE_EQUAL(sweep.sweep_pace_milliseconds, 1'000u);
    BOOST_REQUIRE_EQUAL(sweep.request_timeout_seconds, 30u);
    BOOST_REQUIRE_EQUAL(sweep.gas_limit, 21'000u);
    BOOST_REQUIRE_EQUAL(sweep.dust_threshold, amount{ 100'000'000'000'000u });
}

BOOST_AUTO_TEST_CASE(settings__sweep__default_helpers__expected)
{
    const sweep::settings sweep{};
    BOOST_REQUIRE_EQUAL(sweep.threads_(), 1u);
    BOOST_REQUIRE_EQUAL(sweep.ingest_capacity_(), 100u);
    BOOST_REQUIRE_EQUAL(sweep.retry_attempts_(), 5u);
    BOOST_REQUIRE(sweep.retry_base() == milliseconds(1'500));
    BOOST_REQUIRE(sweep.detect_interval() == milliseconds(2'000));
    BOOST_REQUIRE(sweep.detect_pace() == milliseconds(500));
    BOOST_REQUIRE(sweep.sweep_pace() == milliseconds(1'000));
    BOOST_REQUIRE(sweep.request_timeout() == seconds(30));
}

BOOST_AUTO_TEST_CASE(settings__sweep__zero_counts__clamped_to_one)
{
    sweep::settings sweep{};
    sweep.threads = 0;
    sweep.ingest_capacity = 0;
    sweep.retry_attempts = 0;
    BOOST_REQUIRE_EQUAL(sweep.threads_(), 1u);
    BOOST_REQUIRE_EQUAL(sweep.ingest_capacity_(), 1u);
    BOOST_REQUIRE_EQUAL(sweep.retry_attempts_(), 1u);
}

BOOST_AUTO_TEST_CASE(settings__monitored__mixed_case__lower_case)
{
    sweep::settings sweep{};
    sweep.monitored_address = "0xAbCdEF";
    BOOST_REQUIRE_EQUAL(sweep.monitored(), "0xabcdef");
}

BOOST_AUTO_TEST_CASE(settings__missing__default__all_required)
{
    const sweep::settings sweep{};
    const auto missing = sweep.missing();
    BOOST_REQUIRE_EQUAL(missing.size(), 4u);
    BOOST_REQUIRE_EQUAL(missing.at(0), "credential");
    BOOST_REQUIRE_EQUAL(missing.at(1), "monitored_address");
    BOOST_REQUIRE_EQUAL(missing.at(2), "destination_address");
    BOOST_REQUIRE_EQUAL(missing.at(3), "endpoint");
}

BOOST_AUTO_TEST_CASE(settings__missing__destination_only__destination)
{
    auto sweep = test::make_configuration().sweep;
    sweep.destination_address.clear();
    const auto missing = sweep.missing();
    BOOST_REQUIRE_EQUAL(missing.size(), 1u);
    BOOST_REQUIRE_EQUAL(missing.front(), "destination_address");
}

BOOST_AUTO_TEST_CASE(settings__missing__complete__empty)
{
    const auto sweep = test::make_configuration().sweep;
    BOOST_REQUIRE(sweep.missing().empty());
}

BOOST_AUTO_TEST_SUITE_END()
