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
#ifndef LIBBITCOIN_SWEEP_CLIENT_RPC_CLIENT_HPP
#define LIBBITCOIN_SWEEP_CLIENT_RPC_CLIENT_HPP

#include <atomic>
#include <deque>
#include <unordered_map>
#include <boost/asio/ssl.hpp>
#include <nlohmann/json.hpp>
#include <bitcoin/network.hpp>
#include <bitcoin/sweep/client/chain_client.hpp>
#include <bitcoin/sweep/client/websocket.hpp>
#include <bitcoin/sweep/define.hpp>
#include <bitcoin/sweep/settings.hpp>

namespace libbitcoin {
namespace sweep {

/// JSON-RPC 2.0 chain client over a single websocket connection.
/// Requests are correlated by id and written one at a time. Transfers are
/// signed locally with the credential (private key) of the monitored
/// account and submitted as raw transactions. Connection loss
/// is terminal: outstanding requests complete with subscription_closed and
/// the pending subscriber is notified once. There is no reconnect.
class BCS_API rpc_client
  : public chain_client,
    public network::reporter
{
public:
    typedef std::function<void(const code&, const nlohmann::json&)>
        json_handler;

    DELETE_COPY_MOVE(rpc_client);

    rpc_client(const sweep::settings& settings,
        const network::logger& log) NOEXCEPT;

    /// Stop and join.
    ~rpc_client() NOEXCEPT override;

    /// chain_client.
    /// -----------------------------------------------------------------------

    void start(result_handler&& handler) NOEXCEPT override;
    void stop() NOEXCEPT override;
    void get_transaction(const pending_id& id,
        transaction_handler&& handler) NOEXCEPT override;
    void get_balance(const std::string& address,
        amount_handler&& handler) NOEXCEPT override;
    void get_gas_price(amount_handler&& handler) NOEXCEPT override;
    void send_transaction(const transfer& value,
        transfer_handler&& handler) NOEXCEPT override;
    void subscribe_pending(pending_handler&& handler) NOEXCEPT override;

protected:
    /// Bind a method (use BIND).
    template <class Derived, typename Method, typename... Args>
    auto bind(Method&& method, Args&&... args) NOEXCEPT
    {
        return BIND_THIS(method, args);
    }

    /// Post a method to client strand (use POST).
    template <class Derived, typename Method, typename... Args>
    auto post(Method&& method, Args&&... args) NOEXCEPT
    {
        return boost::asio::post(strand_, BIND_THIS(method, args));
    }

    /// Issue a request, handler invoked on the client strand (thread safe).
    virtual void request(const std::string& method,
        const nlohmann::json& params, json_handler&& handler) NOEXCEPT;

    virtual void do_start(const result_handler& handler) NOEXCEPT;
    virtual void handle_connect(const code& ec,
        const result_handler& handler) NOEXCEPT;
    virtual void do_request(const std::string& method,
        const nlohmann::json& params, const json_handler& handler) NOEXCEPT;
    virtual void do_write() NOEXCEPT;
    virtual void handle_write(const code& ec) NOEXCEPT;
    virtual void do_read() NOEXCEPT;
    virtual void handle_read(const code& ec, const std::string& text) NOEXCEPT;
    virtual void do_message(const std::string& text) NOEXCEPT;
    virtual void do_subscribe_pending(const pending_handler& handler) NOEXCEPT;
    virtual void handle_subscribe(const code& ec,
        const nlohmann::json& result) NOEXCEPT;
    virtual void do_stop(const code& ec) NOEXCEPT;

    /// Transfer signing sequence: chain id (once), nonce, signed submit.
    virtual void do_send(const transfer& value,
        const transfer_handler& handler) NOEXCEPT;
    virtual void handle_chain_id(const code& ec, const nlohmann::json& result,
        const transfer& value, const transfer_handler& handler) NOEXCEPT;
    virtual void handle_nonce(const code& ec, const nlohmann::json& result,
        const transfer& value, const transfer_handler& handler) NOEXCEPT;

    /// Result parsers.
    virtual void handle_transaction(const code& ec,
        const nlohmann::json& result,
        const transaction_handler& handler) NOEXCEPT;
    virtual void handle_amount(const code& ec, const nlohmann::json& result,
        const amount_handler& handler) NOEXCEPT;
    virtual void handle_transfer(const code& ec, const nlohmann::json& result,
        const transfer_handler& handler) NOEXCEPT;

    bool stranded() const NOEXCEPT;

private:
    // These are thread safe.
    const sweep::settings& settings_;
    network::threadpool threadpool_;
    network::asio::strand strand_;
    boost::asio::ssl::context context_;
    std::atomic_bool joined_{};

    // These are protected by strand.
    websocket::ptr socket_{};
    std::unordered_map<uint64_t, json_handler> requests_{};
    std::deque<std::string> outbox_{};
    pending_handler subscriber_{};
    std::string subscription_{};
    system::ec_secret secret_{};
    std::string sender_{};
    uint64_t chain_id_{};
    uint64_t identifier_{};
    bool connected_{};
    bool writing_{};
    bool stopped_{};
};

} // namespace sweep
} // namespace libbitcoin

#endif
