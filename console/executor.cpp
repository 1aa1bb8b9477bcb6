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
#include "executor.hpp"
#include "localize.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <functional>
#include <future>
#include <iostream>
#include <mutex>
#include <boost/format.hpp>
#include <bitcoin/sweep.hpp>

// This file is an ad-hoc user interface wrapper on the sweeper.

namespace libbitcoin {
namespace sweep {

using boost::format;
using namespace network;
using namespace system;
using namespace std::chrono;
using namespace std::placeholders;

const std::unordered_map<uint8_t, std::string> executor::fired_
{
    { events::pending_queued,       "pending_queued......." },
    { events::pending_evicted,      "pending_evicted......" },
    { events::transaction_resolved, "transaction_resolved." },
    { events::transaction_missing,  "transaction_missing.." },
    { events::transaction_detected, "transaction_detected." },
    { events::detect_idle,          "detect_idle.........." },
    { events::sweep_submitted,      "sweep_submitted......" },
    { events::sweep_failed,         "sweep_failed........." },
    { events::sweep_deferred,       "sweep_deferred......." },
    { events::sweep_idle,           "sweep_idle..........." }
};

// non-const member static (global for blocking interrupt handling).
std::promise<code> executor::stopping_{};

executor::executor(parser& metadata, std::istream&, std::ostream& output,
    std::ostream&)
  : metadata_(metadata),
    output_(output)
{
    const auto& log = metadata.configured.log;
    toggle_.at(levels::application) = log.application;
    toggle_.at(levels::news) = log.news;
    toggle_.at(levels::remote) = log.remote;
    toggle_.at(levels::fault) = log.fault;
    toggle_.at(levels::verbose) = log.verbose;

    // Capture <ctrl-c>.
    initialize_stop();
}

// Utility.
// ----------------------------------------------------------------------------

void executor::logger(const auto& message) const
{
    if (log_.stopped())
        output_ << message << std::endl;
    else
        log_.write(levels::application) << message << std::endl;
};

void executor::stopper(const auto& message)
{
    log_.stop(message, levels::application);
    stopped_.get_future().wait();
}

// emit version information for libbitcoin libraries
void executor::dump_version() const
{
    logger(format(BS_VERSION_MESSAGE)
        % LIBBITCOIN_SWEEP_VERSION
        % LIBBITCOIN_NETWORK_VERSION
        % LIBBITCOIN_SYSTEM_VERSION);
}

// Each missing required setting is reported.
bool executor::check_configuration() const
{
    const auto& configured = metadata_.configured;
    if (configured.file.empty())
        logger(BS_USING_DEFAULT_CONFIG);
    else
        logger(format(BS_USING_CONFIG_FILE) % configured.file);

    const auto missing = configured.sweep.missing();
    for (const auto& name: missing)
        logger(format(BS_MISSING_SETTING) % name);

    if (!missing.empty())
        return false;

    logger(format(BS_CONFIGURATION) % configured.sweep.monitored() %
        configured.sweep.destination_address % configured.sweep.endpoint);
    return true;
}

// Run.
// ----------------------------------------------------------------------------

system::ofstream executor::create_log_sink() const
{
    // Standard file name, within the [log].path directory.
    return { metadata_.configured.log.log_file(), std::ios_base::app };
}

system::ofstream executor::create_event_sink() const
{
    // Standard file name, within the [log].path directory.
    return { metadata_.configured.log.events_file(), std::ios_base::app };
}

void executor::subscribe_log(std::ostream& sink)
{
    log_.subscribe_messages([&](const code& ec, uint8_t level, time_t time,
        const std::string& message)
    {
        if (level >= toggle_.size())
        {
            sink    << "Invalid log [" << serialize(level) << "] : " << message;
            output_ << "Invalid log [" << serialize(level) << "] : " << message;
            output_.flush();
            return true;
        }

        // Write only selected logs.
        if (!ec && !toggle_.at(level))
            return true;

        const auto prefix = format_zulu_time(time) + "." +
            serialize(level) + " ";

        if (ec)
        {
            sink << prefix << message << std::endl;
            output_ << prefix << message << std::endl;
            sink << prefix << BS_SWEEPER_FOOTER << std::endl;
            output_ << prefix << BS_SWEEPER_FOOTER << std::endl;
            stopped_.set_value(ec);
            return false;
        }
        else
        {
            sink << prefix << message;
            output_ << prefix << message;
            output_.flush();
            return true;
        }
    });
}

void executor::subscribe_events(std::ostream& sink)
{
    log_.subscribe_events([&sink, start = logger::now()](const code& ec,
        uint8_t event_, uint64_t value, const logger::time& point)
    {
        if (ec) return false;
        const auto time = duration_cast<seconds>(point - start).count();
        sink << fired_.at(event_) << " " << value << " " << time << std::endl;
        return true;
    });
}

int executor::do_run()
{
    const auto& configured = metadata_.configured;
    if (!configured.log.path.empty())
    {
        std::error_code ec{};
        std::filesystem::create_directories(configured.log.path, ec);
        if (ec)
        {
            logger(format(BS_LOG_DIRECTORY_FAILURE) % configured.log.path %
                ec.message());
            return result::configuration_failure;
        }
    }

    // Hold sinks in scope for the length of the run.
    auto log = create_log_sink();
    auto events = create_event_sink();
    if (!log || !events)
    {
        logger(BS_LOG_INITIALIZE_FAILURE);
        return result::configuration_failure;
    }

    subscribe_log(log);
    subscribe_events(events);
    logger(BS_LOG_HEADER);
    dump_version();

    // Nothing is created without a complete configuration.
    if (!check_configuration())
    {
        stopper(BS_SWEEPER_STOPPED);
        return result::configuration_failure;
    }

    // Create client and sweeper.
    client_ = std::make_shared<rpc_client>(configured.sweep, log_);
    sweeper_ = std::make_shared<sweeper>(*client_, configured, log_);
    sweeper_->subscribe_close(std::bind(&executor::handle_closed, this, _1));

    // Start client, subscription and workers.
    logger(BS_SWEEPER_STARTING);
    sweeper_->start(std::bind(&executor::handle_started, this, _1));

    // Wait on signal to stop sweeper (<ctrl-c>), or on a terminal fault.
    const auto ec = stopping_.get_future().get();
    logger(BS_SWEEPER_STOPPING);

    // Queued work is abandoned.
    sweeper_->close();
    sweeper_.reset();
    client_.reset();

    if (ec)
        logger(format(BS_SWEEPER_STOP_CODE) % ec.message());

    stopper(BS_SWEEPER_STOPPED);
    return exit_code(ec);
}

// ----------------------------------------------------------------------------

void executor::handle_started(const code& ec)
{
    if (ec)
    {
        logger(format(BS_SWEEPER_START_FAIL) % ec.message());
        stop(ec);
        return;
    }

    logger(BS_SWEEPER_STARTED);
    logger(BS_SWEEPER_INTERRUPT);
}

void executor::handle_closed(const code& ec)
{
    // Released by close without fault.
    if (ec == error::service_stopped)
        return;

    // Signal stop (simulates <ctrl-c>).
    stop(ec);
}

int executor::exit_code(const code& ec) NOEXCEPT
{
    if (!ec || ec == error::service_stopped)
        return result::clean;

    if (ec == error::invalid_endpoint ||
        ec == error::invalid_credential ||
        ec == error::invalid_address ||
        ec == error::missing_configuration)
        return result::configuration_failure;

    return result::transport_failure;
}

// Stop signal.
// ----------------------------------------------------------------------------

void executor::initialize_stop() NOEXCEPT
{
    std::signal(SIGINT, handle_stop);
    std::signal(SIGTERM, handle_stop);
}

void executor::handle_stop(int)
{
    initialize_stop();
    stop(error::success);
}

// Manage the race between console stop and sweeper stop.
void executor::stop(const code& ec)
{
    static std::once_flag stop_mutex;
    std::call_once(stop_mutex, [&]()
    {
        stopping_.set_value(ec);
    });
}

} // namespace sweep
} // namespace libbitcoin
