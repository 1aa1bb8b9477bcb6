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
#ifndef LIBBITCOIN_SWEEP_CLIENT_WEBSOCKET_HPP
#define LIBBITCOIN_SWEEP_CLIENT_WEBSOCKET_HPP

#include <memory>
#include <boost/asio/ssl.hpp>
#include <bitcoin/network.hpp>
#include <bitcoin/sweep/client/rpc.hpp>
#include <bitcoin/sweep/define.hpp>

namespace libbitcoin {
namespace sweep {

/// A text frame websocket connection (ws or wss) bound to a strand.
/// Methods must be called on the strand and handlers complete on it.
/// One read and one write may be outstanding at a time.
class BCS_API websocket
{
public:
    typedef std::shared_ptr<websocket> ptr;
    typedef std::function<void(const code&, const std::string&)> read_handler;

    DELETE_COPY_MOVE_DESTRUCT(websocket);

    /// Construct a secure or plain connection according to the endpoint.
    static ptr create(network::asio::strand& strand,
        const rpc::endpoint& endpoint, boost::asio::ssl::context& context,
        const duration& timeout) NOEXCEPT;

    /// Resolve, connect, secure (wss) and upgrade, within timeout.
    virtual void connect(result_handler&& handler) NOEXCEPT = 0;

    /// Write a text frame.
    virtual void write(const std::string& text,
        result_handler&& handler) NOEXCEPT = 0;

    /// Read a text frame.
    virtual void read(read_handler&& handler) NOEXCEPT = 0;

    /// Cancel outstanding operations and close the socket.
    virtual void close() NOEXCEPT = 0;

protected:
    websocket() NOEXCEPT = default;
};

} // namespace sweep
} // namespace libbitcoin

#endif
