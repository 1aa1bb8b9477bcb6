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
#include <bitcoin/sweep/client/rpc_client.hpp>

#include <utility>
#include <nlohmann/json.hpp>
#include <bitcoin/network.hpp>
#include <bitcoin/sweep/client/chain_client.hpp>
#include <bitcoin/sweep/client/rpc.hpp>
#include <bitcoin/sweep/client/signer.hpp>
#include <bitcoin/sweep/client/websocket.hpp>
#include <bitcoin/sweep/define.hpp>

namespace libbitcoin {
namespace sweep {

#define CLASS rpc_client

using namespace system;
using namespace network;
using namespace std::placeholders;
using json = nlohmann::json;

// One thread services the connection.
constexpr size_t client_threads = 1;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

rpc_client::rpc_client(const sweep::settings& settings,
    const logger& log) NOEXCEPT
  : reporter(log),
    settings_(settings),
    threadpool_(client_threads),
    strand_(threadpool_.service().get_executor()),
    context_(boost::asio::ssl::context::tls_client)
{
    boost::system::error_code ec{};
    context_.set_default_verify_paths(ec);
    if (ec)
    {
        LOGF("Certificate authorities not loaded, " << ec.message());
    }
}

rpc_client::~rpc_client() NOEXCEPT
{
    stop();
}

// start/stop
// ----------------------------------------------------------------------------

void rpc_client::start(result_handler&& handler) NOEXCEPT
{
    POST(do_start, std::move(handler));
}

void rpc_client::do_start(const result_handler& handler) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (stopped_)
    {
        handler(error::service_stopped);
        return;
    }

    rpc::endpoint endpoint{};
    if (!rpc::parse_endpoint(endpoint, settings_.endpoint))
    {
        LOGF("Invalid endpoint [" << settings_.endpoint << "].");
        handler(error::invalid_endpoint);
        return;
    }

    if (!signer::parse_secret(secret_, settings_.credential) ||
        !signer::to_address(sender_, secret_))
    {
        LOGF("Invalid credential, expected a hex private key.");
        handler(error::invalid_credential);
        return;
    }

    if (sender_ != settings_.monitored())
    {
        LOGF("Credential account [" << sender_ << "] is not the monitored "
            "account [" << settings_.monitored() << "].");
        handler(error::invalid_credential);
        return;
    }

    short_hash destination{};
    if (!signer::parse_address(destination,
        settings_.destination_address))
    {
        LOGF("Invalid destination address ["
            << settings_.destination_address << "].");
        handler(error::invalid_address);
        return;
    }

    LOGN("Connecting to [" << endpoint.host << ":" << endpoint.port
        << endpoint.target << "].");

    socket_ = websocket::create(strand_, endpoint, context_,
        settings_.request_timeout());
    socket_->connect(BIND(handle_connect, _1, handler));
}

void rpc_client::handle_connect(const code& ec,
    const result_handler& handler) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (stopped_)
    {
        handler(error::service_stopped);
        return;
    }

    if (ec)
    {
        LOGF("Connection failed, " << ec.message());
        socket_->close();
        handler(error::subscription_failed);
        return;
    }

    LOGN("Connected.");
    connected_ = true;
    do_read();
    do_write();
    handler(error::success);
}

void rpc_client::stop() NOEXCEPT
{
    if (joined_.exchange(true))
        return;

    POST(do_stop, error::service_stopped);
    threadpool_.stop();
    if (!threadpool_.join())
    {
        LOGF("Client threadpool failed to join.");
    }
}

// Terminal, all completions are invoked once.
void rpc_client::do_stop(const code& ec) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (stopped_)
        return;

    stopped_ = true;
    connected_ = false;
    if (socket_)
        socket_->close();

    outbox_.clear();
    auto requests = std::move(requests_);
    requests_.clear();
    for (const auto& request: requests)
        request.second(ec, {});

    if (subscriber_)
    {
        const auto subscriber = std::move(subscriber_);
        subscriber_ = {};
        subscriber(ec, {});
    }
}

// requests
// ----------------------------------------------------------------------------

void rpc_client::request(const std::string& method, const json& params,
    json_handler&& handler) NOEXCEPT
{
    POST(do_request, method, params, std::move(handler));
}

void rpc_client::do_request(const std::string& method, const json& params,
    const json_handler& handler) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (stopped_)
    {
        handler(error::service_stopped, {});
        return;
    }

    const auto id = ++identifier_;
    requests_.emplace(id, handler);
    outbox_.push_back(rpc::make_request(id, method, params));
    LOGV("Request (" << id << ") " << method << ".");

    // Requests made while connecting are written once connected.
    if (connected_)
        do_write();
}

void rpc_client::do_write() NOEXCEPT
{
    BC_ASSERT(stranded());
    if (writing_ || outbox_.empty())
        return;

    writing_ = true;
    socket_->write(outbox_.front(), BIND(handle_write, _1));
}

void rpc_client::handle_write(const code& ec) NOEXCEPT
{
    BC_ASSERT(stranded());
    writing_ = false;
    if (stopped_)
        return;

    if (ec)
    {
        LOGF("Connection write failed, " << ec.message());
        do_stop(error::subscription_closed);
        return;
    }

    outbox_.pop_front();
    do_write();
}

void rpc_client::do_read() NOEXCEPT
{
    BC_ASSERT(stranded());
    socket_->read(BIND(handle_read, _1, _2));
}

void rpc_client::handle_read(const code& ec, const std::string& text) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (stopped_)
        return;

    if (ec)
    {
        LOGF("Connection lost, " << ec.message());
        do_stop(error::subscription_closed);
        return;
    }

    do_message(text);
    do_read();
}

void rpc_client::do_message(const std::string& text) NOEXCEPT
{
    BC_ASSERT(stranded());
    const auto message = rpc::parse_message(text);

    switch (message.type)
    {
        case rpc::message::kind::response:
        {
            const auto it = requests_.find(message.id);
            if (it == requests_.end())
            {
                LOGV("Response (" << message.id << ") not correlated.");
                return;
            }

            const auto handler = std::move(it->second);
            requests_.erase(it);

            if (message.ec)
            {
                LOGR("Request (" << message.id << ") rejected, "
                    << message.reason);
                handler(message.ec, {});
                return;
            }

            handler(error::success, message.result);
            return;
        }
        case rpc::message::kind::notification:
        {
            if (!subscriber_ || message.subscription != subscription_)
                return;

            pending_id id{};
            if (const auto ec = rpc::parse_string(id, message.result))
            {
                LOGV("Pending notification ignored, " << ec.message());
                return;
            }

            subscriber_(error::success, id);
            return;
        }
        default:
        {
            LOGV("Message ignored, " << code{ error::rpc_malformed }.message());
            return;
        }
    }
}

// subscription
// ----------------------------------------------------------------------------

void rpc_client::subscribe_pending(pending_handler&& handler) NOEXCEPT
{
    POST(do_subscribe_pending, std::move(handler));
}

void rpc_client::do_subscribe_pending(const pending_handler& handler) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (stopped_)
    {
        handler(error::service_stopped, {});
        return;
    }

    subscriber_ = handler;
    do_request(rpc::subscribe, json::array({ rpc::new_pending_transactions }),
        BIND(handle_subscribe, _1, _2));
}

void rpc_client::handle_subscribe(const code& ec, const json& result) NOEXCEPT
{
    BC_ASSERT(stranded());
    if (stopped_)
        return;

    auto fault{ ec };
    if (!fault)
        fault = rpc::parse_string(subscription_, result);

    if (fault)
    {
        LOGF("Pending transaction subscription failed, " << fault.message());
        do_stop(error::subscription_failed);
        return;
    }

    LOGN("Subscribed to pending transactions [" << subscription_ << "].");
}

// chain_client
// ----------------------------------------------------------------------------

void rpc_client::get_transaction(const pending_id& id,
    transaction_handler&& handler) NOEXCEPT
{
    request(rpc::get_transaction_by_hash, json::array({ id }),
        BIND(handle_transaction, _1, _2, std::move(handler)));
}

void rpc_client::get_balance(const std::string& address,
    amount_handler&& handler) NOEXCEPT
{
    request(rpc::get_balance, json::array({ address, "latest" }),
        BIND(handle_amount, _1, _2, std::move(handler)));
}

void rpc_client::get_gas_price(amount_handler&& handler) NOEXCEPT
{
    request(rpc::gas_price, json::array(),
        BIND(handle_amount, _1, _2, std::move(handler)));
}

void rpc_client::send_transaction(const transfer& value,
    transfer_handler&& handler) NOEXCEPT
{
    POST(do_send, value, std::move(handler));
}

void rpc_client::do_send(const transfer& value,
    const transfer_handler& handler) NOEXCEPT
{
    BC_ASSERT(stranded());

    // The chain id is read once per connection.
    if (is_zero(chain_id_))
    {
        do_request(rpc::chain_id, json::array(),
            BIND(handle_chain_id, _1, _2, value, handler));
        return;
    }

    do_request(rpc::get_transaction_count, json::array({ sender_, "pending" }),
        BIND(handle_nonce, _1, _2, value, handler));
}

void rpc_client::handle_chain_id(const code& ec, const json& result,
    const transfer& value, const transfer_handler& handler) NOEXCEPT
{
    BC_ASSERT(stranded());
    auto fault{ ec };
    if (!fault)
        fault = rpc::parse_number(chain_id_, result);

    if (!fault && is_zero(chain_id_))
        fault = error::rpc_unexpected;

    if (fault)
    {
        LOGR("Chain id unavailable, " << fault.message());
        handler(fault, {});
        return;
    }

    LOGN("Signing for chain (" << chain_id_ << ").");
    do_send(value, handler);
}

void rpc_client::handle_nonce(const code& ec, const json& result,
    const transfer& value, const transfer_handler& handler) NOEXCEPT
{
    BC_ASSERT(stranded());
    uint64_t nonce{};
    auto fault{ ec };
    if (!fault)
        fault = rpc::parse_number(nonce, result);

    if (fault)
    {
        LOGR("Account nonce unavailable, " << fault.message());
        handler(fault, {});
        return;
    }

    std::string raw{};
    if (const auto signing = signer::sign_transfer(raw, value, nonce,
        chain_id_, secret_))
    {
        LOGF("Transfer signing failed, " << signing.message());
        handler(signing, {});
        return;
    }

    LOGV("Submitting transfer with nonce (" << nonce << ").");
    do_request(rpc::send_raw_transaction, json::array({ raw }),
        BIND(handle_transfer, _1, _2, handler));
}

void rpc_client::handle_transaction(const code& ec, const json& result,
    const transaction_handler& handler) NOEXCEPT
{
    if (ec)
    {
        handler(ec, {});
        return;
    }

    transaction::cptr tx{};
    const auto parsed = rpc::parse_transaction(tx, result);
    handler(parsed, tx);
}

void rpc_client::handle_amount(const code& ec, const json& result,
    const amount_handler& handler) NOEXCEPT
{
    if (ec)
    {
        handler(ec, {});
        return;
    }

    amount value{};
    const auto parsed = rpc::parse_quantity(value, result);
    handler(parsed, value);
}

void rpc_client::handle_transfer(const code& ec, const json& result,
    const transfer_handler& handler) NOEXCEPT
{
    if (ec)
    {
        handler(ec == error::rpc_rejected ?
            code{ error::transfer_failed } : ec, {});
        return;
    }

    std::string hash{};
    const auto parsed = rpc::parse_string(hash, result);
    handler(parsed, hash);
}

bool rpc_client::stranded() const NOEXCEPT
{
    return strand_.running_in_this_thread();
}

BC_POP_WARNING()

} // namespace sweep
} // namespace libbitcoin
