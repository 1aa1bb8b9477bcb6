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
#ifndef LIBBITCOIN_SWEEP_EXECUTOR_HPP
#define LIBBITCOIN_SWEEP_EXECUTOR_HPP

#include <atomic>
#include <future>
#include <iostream>
#include <unordered_map>
#include <bitcoin/sweep.hpp>

namespace libbitcoin {
namespace sweep {

class executor
{
public:
    DELETE_COPY(executor);

    /// Process exit codes.
    enum result : int
    {
        clean = 0,
        configuration_failure = 1,
        transport_failure = 2
    };

    executor(parser& metadata, std::istream&, std::ostream& output,
        std::ostream& error);

    /// Invoke the menu command indicated by the metadata.
    int menu();

private:
    void logger(const auto& message) const;
    void stopper(const auto& message);

    static void initialize_stop() NOEXCEPT;
    static void stop(const system::code& ec);
    static void handle_stop(int code);
    static int exit_code(const system::code& ec) NOEXCEPT;

    void handle_started(const system::code& ec);
    void handle_closed(const system::code& ec);

    // Command line options.
    int do_help();
    int do_settings();
    int do_version();
    int do_run();

    void dump_version() const;
    bool check_configuration() const;

    system::ofstream create_log_sink() const;
    system::ofstream create_event_sink() const;
    void subscribe_log(std::ostream& sink);
    void subscribe_events(std::ostream& sink);

    static const std::string name_;
    static const std::unordered_map<uint8_t, std::string> fired_;
    static std::promise<system::code> stopping_;

    parser& metadata_;
    std::shared_ptr<rpc_client> client_{};
    sweeper::ptr sweeper_{};
    std::promise<system::code> stopped_{};

    std::ostream& output_;
    network::logger log_{};
    std_array<std::atomic_bool, add1(network::levels::verbose)> toggle_{};
};

} // namespace sweep
} // namespace libbitcoin

#endif
