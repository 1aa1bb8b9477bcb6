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
#include "../test.hpp"

BOOST_AUTO_TEST_SUITE(signer_tests)

// Signed example transaction from EIP-155.
constexpr auto example_key =
    "0x4646464646464646464646464646464646464646464646464646464646464646";
constexpr auto example_to = "0x3535353535353535353535353535353535353535";
constexpr auto example_payload =
    "ec098504a817c800825208943535353535353535353535353535353535353535880de0"
    "b6b3a764000080018080";
constexpr auto example_hash =
    "daf5a779ae972f972197303d7b574746c7ef83eadac0f2791ad23db92e4c8e53";
constexpr auto example_signed =
    "0xf86c098504a817c800825208943535353535353535353535353535353535353535880"
    "de0b6b3a76400008025a028ef61340bd939bc2195fe537567866003e1a15d3c71ff63e1"
    "590620aa636276a067cbe9d8997f761aecb703304b3800ccf555c9f3dc64214b297fb1"
    "966a3b6d83";

static transfer example_transfer() NOEXCEPT
{
    // One ether at 20 gwei.
    return
    {
        example_to,
        amount{ 1'000'000'000'000'000'000ull },
        21'000,
        amount{ 20'000'000'000ull }
    };
}

// keccak256

BOOST_AUTO_TEST_CASE(signer__keccak256__empty__expected)
{
    BOOST_REQUIRE_EQUAL(system::encode_base16(signer::keccak256({})),
        "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

// parse_secret

BOOST_AUTO_TEST_CASE(signer__parse_secret__prefixed_and_bare__expected)
{
    system::ec_secret out{};
    BOOST_REQUIRE(signer::parse_secret(out, example_key));
    BOOST_REQUIRE(out.front() == 0x46);
    BOOST_REQUIRE(out.back() == 0x46);

    BOOST_REQUIRE(signer::parse_secret(out, std::string(63, '0') + "A"));
    BOOST_REQUIRE(out.front() == 0x00);
    BOOST_REQUIRE(out.back() == 0x0a);
}

BOOST_AUTO_TEST_CASE(signer__parse_secret__invalid__false_unchanged)
{
    system::ec_secret out{};
    out.front() = 7;
    BOOST_REQUIRE(!signer::parse_secret(out, ""));
    BOOST_REQUIRE(!signer::parse_secret(out, "passphrase"));
    BOOST_REQUIRE(!signer::parse_secret(out, "0x" + std::string(62, '1')));
    BOOST_REQUIRE(!signer::parse_secret(out, "0x" + std::string(66, '1')));
    BOOST_REQUIRE(!signer::parse_secret(out, "0x" + std::string(63, '1') + "g"));
    BOOST_REQUIRE(out.front() == 7);
}

// parse_address

BOOST_AUTO_TEST_CASE(signer__parse_address__mixed_case__expected)
{
    system::short_hash out{};
    BOOST_REQUIRE(signer::parse_address(out, test::destination));
    BOOST_REQUIRE_EQUAL(system::encode_base16(out),
        "00000000000000000000000000000000deadbeef");
}

BOOST_AUTO_TEST_CASE(signer__parse_address__invalid__false)
{
    system::short_hash out{};
    BOOST_REQUIRE(!signer::parse_address(out, ""));
    BOOST_REQUIRE(!signer::parse_address(out, std::string(40, '1')));
    BOOST_REQUIRE(!signer::parse_address(out, "0x" + std::string(38, '1')));
    BOOST_REQUIRE(!signer::parse_address(out, "0x" + std::string(42, '1')));
    BOOST_REQUIRE(!signer::parse_address(out, "0x" + std::string(39, '1') + "z"));
}

// to_address

BOOST_AUTO_TEST_CASE(signer__to_address__key_one__expected)
{
    system::ec_secret secret{};
    secret.back() = 1;
    std::string out{};
    BOOST_REQUIRE(signer::to_address(out, secret));
    BOOST_REQUIRE_EQUAL(out, "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
}

BOOST_AUTO_TEST_CASE(signer__to_address__zero_key__false)
{
    std::string out{};
    BOOST_REQUIRE(!signer::to_address(out, system::ec_secret{}));
}

// signing_payload

BOOST_AUTO_TEST_CASE(signer__signing_payload__example__expected_encoding_and_hash)
{
    system::short_hash to{};
    BOOST_REQUIRE(signer::parse_address(to, example_to));

    const auto payload = signer::signing_payload(example_transfer(), to, 9, 1);
    BOOST_REQUIRE_EQUAL(system::encode_base16(payload), example_payload);
    BOOST_REQUIRE_EQUAL(system::encode_base16(signer::keccak256(payload)), example_hash);
}

BOOST_AUTO_TEST_CASE(signer__signing_payload__zero_nonce_and_value__empty_strings)
{
    system::short_hash to{};
    const transfer value{ example_to, 0, 21'000, 1 };
    const auto payload = signer::signing_payload(value, to, 0, 1);

    // [0x80, 0x01, 0x825208, 0x94 + 20 zeros, 0x80, 0x80, 0x01, 0x80, 0x80]
    BOOST_REQUIRE_EQUAL(payload.size(), 32u);
    BOOST_REQUIRE(payload.at(0) == 0xdf);
    BOOST_REQUIRE(payload.at(1) == 0x80);
    BOOST_REQUIRE(payload.at(2) == 0x01);
}

// sign_transfer

BOOST_AUTO_TEST_CASE(signer__sign_transfer__example__expected_raw_transaction)
{
    system::ec_secret secret{};
    BOOST_REQUIRE(signer::parse_secret(secret, example_key));

    std::string out{};
    BOOST_REQUIRE(!signer::sign_transfer(out, example_transfer(), 9, 1, secret));
    BOOST_REQUIRE_EQUAL(out, example_signed);
}

BOOST_AUTO_TEST_CASE(signer__sign_transfer__invalid_recipient__invalid_address)
{
    system::ec_secret secret{};
    BOOST_REQUIRE(signer::parse_secret(secret, example_key));

    auto value = example_transfer();
    value.to = "0x1234";
    std::string out{};
    BOOST_REQUIRE(signer::sign_transfer(out, value, 9, 1, secret) ==
        error::invalid_address);
    BOOST_REQUIRE(out.empty());
}

BOOST_AUTO_TEST_CASE(signer__sign_transfer__zero_key__invalid_credential)
{
    std::string out{};
    BOOST_REQUIRE(signer::sign_transfer(out, example_transfer(), 9, 1,
        system::ec_secret{}) == error::invalid_credential);
    BOOST_REQUIRE(out.empty());
}

BOOST_AUTO_TEST_SUITE_END()
