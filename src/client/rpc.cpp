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
#include <bitcoin/sweep/client/rpc.hpp>

#include <algorithm>
#include <limits>
#include <memory>
#include <sstream>
#include <nlohmann/json.hpp>
#include <bitcoin/system.hpp>
#include <bitcoin/sweep/client/types.hpp>
#include <bitcoin/sweep/define.hpp>

namespace libbitcoin {
namespace sweep {
namespace rpc {

using namespace system;
using json = nlohmann::json;

constexpr auto version = "2.0";
constexpr auto hex_prefix = "0x";
constexpr size_t maximum_quantity_digits = 64;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

// endpoint
// ----------------------------------------------------------------------------

static bool is_port(const std::string& text) NOEXCEPT
{
    return !text.empty() && text.size() <= 5u &&
        std::all_of(text.begin(), text.end(), [](char character) NOEXCEPT
        {
            return character >= '0' && character <= '9';
        });
}

bool parse_endpoint(endpoint& out, const std::string& text) NOEXCEPT
{
    const auto lower = ascii_to_lower(text);
    std::string rest{};

    if (lower.starts_with("wss://"))
    {
        out.secure = true;
        out.port = "443";
        rest = text.substr(6);
    }
    else if (lower.starts_with("ws://"))
    {
        out.secure = false;
        out.port = "80";
        rest = text.substr(5);
    }
    else
    {
        return false;
    }

    const auto slash = rest.find('/');
    const auto authority = rest.substr(zero, slash);
    out.target = (slash == std::string::npos) ? "/" : rest.substr(slash);

    // Bracketed ipv6 literal.
    auto colon = std::string::npos;
    if (authority.starts_with("["))
    {
        const auto close = authority.find(']');
        if (close == std::string::npos)
            return false;

        out.host = authority.substr(one, sub1(close));
        if (add1(close) < authority.size())
        {
            if (authority.at(add1(close)) != ':')
                return false;

            colon = add1(close);
        }
    }
    else
    {
        colon = authority.rfind(':');
        out.host = authority.substr(zero, colon);
    }

    if (colon != std::string::npos)
    {
        out.port = authority.substr(add1(colon));
        if (!is_port(out.port))
            return false;
    }

    return !out.host.empty();
}

// quantities
// ----------------------------------------------------------------------------

static bool is_hex_digit(char character) NOEXCEPT
{
    return (character >= '0' && character <= '9') ||
        (character >= 'a' && character <= 'f') ||
        (character >= 'A' && character <= 'F');
}

bool decode_quantity(amount& out, const std::string& text) NOEXCEPT
{
    if (text.size() < 3u || text.at(0) != '0' ||
        (text.at(1) != 'x' && text.at(1) != 'X'))
        return false;

    const auto digits = text.substr(2);
    if (digits.size() > maximum_quantity_digits ||
        !std::all_of(digits.begin(), digits.end(), is_hex_digit))
        return false;

    // Prefix and digits are validated, so construction cannot throw.
    out = amount{ hex_prefix + ascii_to_lower(digits) };
    return true;
}

std::string encode_quantity(const amount& value) NOEXCEPT
{
    std::ostringstream out{};
    out << hex_prefix << std::hex << std::nouppercase << value;
    return out.str();
}

// requests
// ----------------------------------------------------------------------------

std::string make_request(uint64_t id, const std::string& method,
    const json& params) NOEXCEPT
{
    const json request
    {
        { "jsonrpc", version },
        { "id", id },
        { "method", method },
        { "params", params }
    };

    // Invalid utf8 is replaced (dump does not throw).
    return request.dump(-1, ' ', false, json::error_handler_t::replace);
}

// responses
// ----------------------------------------------------------------------------

static bool get_string(std::string& out, const json& object,
    const char* name) NOEXCEPT
{
    const auto value = object.find(name);
    if (value == object.end() || !value->is_string())
        return false;

    out = value->get<std::string>();
    return true;
}

message parse_message(const std::string& text) NOEXCEPT
{
    message out{};
    const auto document = json::parse(text, nullptr, false);
    if (document.is_discarded() || !document.is_object())
        return out;

    const auto method = document.find("method");
    if (method != document.end())
    {
        if (!method->is_string() || method->get<std::string>() != subscription)
            return out;

        const auto params = document.find("params");
        if (params == document.end() || !params->is_object())
            return out;

        const auto id = params->find("subscription");
        const auto result = params->find("result");
        if (id == params->end() || !id->is_string() ||
            result == params->end())
            return out;

        out.type = message::kind::notification;
        out.subscription = id->get<std::string>();
        out.result = *result;
        return out;
    }

    const auto id = document.find("id");
    if (id == document.end() || !id->is_number_unsigned())
        return out;

    out.id = id->get<uint64_t>();

    const auto fault = document.find("error");
    if (fault != document.end() && !fault->is_null())
    {
        out.type = message::kind::response;
        out.ec = error::rpc_rejected;

        if (fault->is_object())
            get_string(out.reason, *fault, "message");

        return out;
    }

    const auto result = document.find("result");
    if (result == document.end())
        return out;

    out.type = message::kind::response;
    out.result = *result;
    return out;
}

code parse_transaction(transaction::cptr& out, const json& result) NOEXCEPT
{
    if (result.is_null())
    {
        out.reset();
        return error::success;
    }

    if (!result.is_object())
        return error::rpc_unexpected;

    auto tx = std::make_shared<transaction>();
    std::string value{};

    if (!get_string(tx->hash, result, "hash") ||
        !get_string(tx->from, result, "from") ||
        !get_string(value, result, "value") ||
        !decode_quantity(tx->value, value))
        return error::rpc_unexpected;

    // Contract creation has a null recipient.
    const auto to = result.find("to");
    if (to != result.end() && !to->is_null())
    {
        if (!to->is_string())
            return error::rpc_unexpected;

        tx->to = to->get<std::string>();
    }

    out = tx;
    return error::success;
}

code parse_quantity(amount& out, const json& result) NOEXCEPT
{
    if (!result.is_string() || !decode_quantity(out, result.get<std::string>()))
        return error::rpc_unexpected;

    return error::success;
}

code parse_number(uint64_t& out, const json& result) NOEXCEPT
{
    amount value{};
    if (const auto ec = parse_quantity(value, result))
        return ec;

    if (value > std::numeric_limits<uint64_t>::max())
        return error::rpc_unexpected;

    out = static_cast<uint64_t>(value);
    return error::success;
}

code parse_string(std::string& out, const json& result) NOEXCEPT
{
    if (!result.is_string())
        return error::rpc_unexpected;

    out = result.get<std::string>();
    return error::success;
}

BC_POP_WARNING()

} // namespace rpc
} // namespace sweep
} // namespace libbitcoin
