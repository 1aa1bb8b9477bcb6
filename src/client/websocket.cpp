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
#include <bitcoin/sweep/client/websocket.hpp>

#include <memory>
#include <type_traits>
#include <utility>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <bitcoin/network.hpp>
#include <bitcoin/sweep/client/rpc.hpp>
#include <bitcoin/sweep/define.hpp>

namespace libbitcoin {
namespace sweep {

namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace ws = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;
using boost_code = boost::system::error_code;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

template <bool Secure>
class connection final
  : public websocket,
    public std::enable_shared_from_this<connection<Secure>>
{
public:
    using layer = std::conditional_t<Secure,
        beast::ssl_stream<beast::tcp_stream>, beast::tcp_stream>;
    using stream = ws::stream<layer>;

    connection(network::asio::strand& strand, const rpc::endpoint& endpoint,
        ssl::context& context, const duration& timeout) NOEXCEPT
      : endpoint_(endpoint),
        timeout_(timeout),
        resolver_(strand)
    {
        if constexpr (Secure)
            stream_ = std::make_unique<stream>(strand, context);
        else
            stream_ = std::make_unique<stream>(strand);
    }

    void connect(result_handler&& handler) NOEXCEPT override
    {
        resolver_.async_resolve(endpoint_.host, endpoint_.port,
            [self = this->shared_from_this(), handler = std::move(handler)](
                const boost_code& ec,
                const tcp::resolver::results_type& results) NOEXCEPT
            {
                self->handle_resolve(ec, results, handler);
            });
    }

    void write(const std::string& text,
        result_handler&& handler) NOEXCEPT override
    {
        // The buffer must outlive the operation.
        write_buffer_ = text;
        stream_->text(true);
        stream_->async_write(boost::asio::buffer(write_buffer_),
            [self = this->shared_from_this(), handler = std::move(handler)](
                const boost_code& ec, size_t) NOEXCEPT
            {
                handler(ec);
            });
    }

    void read(read_handler&& handler) NOEXCEPT override
    {
        stream_->async_read(read_buffer_,
            [self = this->shared_from_this(), handler = std::move(handler)](
                const boost_code& ec, size_t) NOEXCEPT
            {
                self->handle_read(ec, handler);
            });
    }

    void close() NOEXCEPT override
    {
        boost_code ignore{};
        resolver_.cancel();
        beast::get_lowest_layer(*stream_).socket().close(ignore);
    }

private:
    void handle_resolve(const boost_code& ec,
        const tcp::resolver::results_type& results,
        const result_handler& handler) NOEXCEPT
    {
        if (ec)
        {
            handler(ec);
            return;
        }

        beast::get_lowest_layer(*stream_).expires_after(timeout_);
        beast::get_lowest_layer(*stream_).async_connect(results,
            [self = this->shared_from_this(), handler](const boost_code& ec,
                const tcp::endpoint&) NOEXCEPT
            {
                self->handle_connect(ec, handler);
            });
    }

    void handle_connect(const boost_code& ec,
        const result_handler& handler) NOEXCEPT
    {
        if (ec)
        {
            handler(ec);
            return;
        }

        if constexpr (Secure)
        {
            auto& tls = stream_->next_layer();

            // Server name indication precedes the handshake.
            if (!SSL_set_tlsext_host_name(tls.native_handle(),
                endpoint_.host.c_str()))
            {
                handler(boost_code{ static_cast<int>(::ERR_get_error()),
                    boost::asio::error::get_ssl_category() });
                return;
            }

            tls.set_verify_mode(ssl::verify_peer);
            tls.set_verify_callback(ssl::host_name_verification(
                endpoint_.host));

            tls.async_handshake(ssl::stream_base::client,
                [self = this->shared_from_this(), handler](
                    const boost_code& ec) NOEXCEPT
                {
                    self->handle_secure(ec, handler);
                });
        }
        else
        {
            handle_secure(ec, handler);
        }
    }

    void handle_secure(const boost_code& ec,
        const result_handler& handler) NOEXCEPT
    {
        if (ec)
        {
            handler(ec);
            return;
        }

        // The websocket stream applies its own timeouts.
        beast::get_lowest_layer(*stream_).expires_never();
        stream_->set_option(ws::stream_base::timeout::suggested(
            beast::role_type::client));

        stream_->async_handshake(endpoint_.host + ":" + endpoint_.port,
            endpoint_.target,
            [self = this->shared_from_this(), handler](
                const boost_code& ec) NOEXCEPT
            {
                handler(ec);
            });
    }

    void handle_read(const boost_code& ec,
        const read_handler& handler) NOEXCEPT
    {
        if (ec)
        {
            handler(ec, {});
            return;
        }

        const auto text = beast::buffers_to_string(read_buffer_.data());
        read_buffer_.consume(read_buffer_.size());
        handler(error::success, text);
    }

    const rpc::endpoint endpoint_;
    const duration timeout_;
    tcp::resolver resolver_;
    std::unique_ptr<stream> stream_{};
    beast::flat_buffer read_buffer_{};
    std::string write_buffer_{};
};

websocket::ptr websocket::create(network::asio::strand& strand,
    const rpc::endpoint& endpoint, ssl::context& context,
    const duration& timeout) NOEXCEPT
{
    if (endpoint.secure)
        return std::make_shared<connection<true>>(strand, endpoint, context,
            timeout);

    return std::make_shared<connection<false>>(strand, endpoint, context,
        timeout);
}

BC_POP_WARNING()

} // namespace sweep
} // namespace libbitcoin
