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
#include "mocks.hpp"

#include <algorithm>
#include <future>
#include <memory>
#include <utility>
#include <bitcoin/sweep.hpp>

namespace libbitcoin {
namespace sweep {
namespace test {

using namespace system;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

configuration make_configuration() NOEXCEPT
{
    configuration config{};
    config.sweep.credential = "0x" + std::string(64, '1');
    config.sweep.monitored_address = monitored;
    config.sweep.destination_address = destination;
    config.sweep.endpoint = "ws://127.0.0.1:8546";
    config.sweep.threads = 2;
    config.sweep.retry_attempts = 3;
    config.sweep.retry_base_milliseconds = 1;
    config.sweep.detect_interval_milliseconds = 0;
    config.sweep.detect_pace_milliseconds = 0;
    config.sweep.sweep_pace_milliseconds = 0;
    config.sweep.dust_threshold = 0;
    return config;
}

// mock_client
// ----------------------------------------------------------------------------

void mock_client::set_start(const code& ec) NOEXCEPT
{
    std::lock_guard<std::mutex> lock(mutex_);
    start_ = ec;
}

void mock_client::script(const pending_id& id, const std::string& to,
    const outcomes& failures) NOEXCEPT
{
    std::lock_guard<std::mutex> lock(mutex_);
    scripts_[id] = { to, failures, zero };
}

void mock_client::set_balance(const amount& value) NOEXCEPT
{
    std::lock_guard<std::mutex> lock(mutex_);
    balance_ = value;
}

void mock_client::set_balance_error(const code& ec) NOEXCEPT
{
    std::lock_guard<std::mutex> lock(mutex_);
    balance_error_ = ec;
}

void mock_client::set_gas_price(const amount& value) NOEXCEPT
{
    std::lock_guard<std::mutex> lock(mutex_);
    gas_price_ = value;
}

void mock_client::fail_sends(size_t count) NOEXCEPT
{
    std::lock_guard<std::mutex> lock(mutex_);
    send_failures_ = count;
}

void mock_client::drain_on_send(bool value) NOEXCEPT
{
    std::lock_guard<std::mutex> lock(mutex_);
    drain_ = value;
}

void mock_client::hold(bool value) NOEXCEPT
{
    std::lock_guard<std::mutex> lock(mutex_);
    hold_ = value;
}

void mock_client::hold_balances(bool value) NOEXCEPT
{
    std::lock_guard<std::mutex> lock(mutex_);
    hold_balances_ = value;
}

void mock_client::release() NOEXCEPT
{
    std::vector<held_lookup> held{};
    held_balances balances{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::swap(held, held_);
        std::swap(balances, held_balances_);
    }

    for (const auto& lookup: held)
        complete(lookup.first, lookup.second);

    for (const auto& handler: balances)
        complete(handler);
}

void mock_client::notify(const pending_id& id) NOEXCEPT
{
    pending_handler subscriber{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriber = subscriber_;
    }

    if (subscriber)
        subscriber(error::success, id);
}

void mock_client::drop(const code& ec) NOEXCEPT
{
    pending_handler subscriber{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::swap(subscriber, subscriber_);
    }

    if (subscriber)
        subscriber(ec, {});
}

// Observation.
// ----------------------------------------------------------------------------

std::vector<mock_client::lookup> mock_client::lookups() const NOEXCEPT
{
    std::lock_guard<std::mutex> lock(mutex_);
    return lookups_;
}

size_t mock_client::lookups(const pending_id& id) const NOEXCEPT
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::count_if(lookups_.begin(), lookups_.end(),
        [&](const lookup& item) NOEXCEPT { return item.id == id; });
}

std::vector<transfer> mock_client::sends() const NOEXCEPT
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sends_;
}

size_t mock_client::balance_reads() const NOEXCEPT
{
    std::lock_guard<std::mutex> lock(mutex_);
    return balance_reads_;
}

size_t mock_client::held() const NOEXCEPT
{
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.size();
}

bool mock_client::subscribed() const NOEXCEPT
{
    std::lock_guard<std::mutex> lock(mutex_);
    return !!subscriber_;
}

bool mock_client::stopped() const NOEXCEPT
{
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
}

template <typename Predicate>
bool mock_client::wait(Predicate&& predicate) const NOEXCEPT
{
    std::unique_lock<std::mutex> lock(mutex_);
    return condition_.wait_for(lock, timeout, std::forward<Predicate>(predicate));
}

bool mock_client::wait_lookups(size_t count) const NOEXCEPT
{
    return wait([&]() NOEXCEPT { return lookups_.size() >= count; });
}

bool mock_client::wait_sends(size_t count) const NOEXCEPT
{
    return wait([&]() NOEXCEPT { return sends_.size() >= count; });
}

bool mock_client::wait_held(size_t count) const NOEXCEPT
{
    return wait([&]() NOEXCEPT { return held_.size() >= count; });
}

bool mock_client::wait_held_balances(size_t count) const NOEXCEPT
{
    return wait([&]() NOEXCEPT { return held_balances_.size() >= count; });
}

bool mock_client::wait_subscribed() const NOEXCEPT
{
    return wait([&]() NOEXCEPT { return !!subscriber_; });
}

// chain_client.
// ----------------------------------------------------------------------------

void mock_client::start(result_handler&& handler) NOEXCEPT
{
    code ec{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ec = start_;
    }

    handler(ec);
}

void mock_client::stop() NOEXCEPT
{
    pending_handler subscriber{};
    std::vector<held_lookup> held{};
    held_balances balances{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        std::swap(subscriber, subscriber_);
        std::swap(held, held_);
        std::swap(balances, held_balances_);
    }

    for (const auto& lookup: held)
        lookup.second(error::service_stopped, {});

    for (const auto& handler: balances)
        handler(error::service_stopped, {});

    if (subscriber)
        subscriber(error::service_stopped, {});

    condition_.notify_all();
}

void mock_client::get_transaction(const pending_id& id,
    transaction_handler&& handler) NOEXCEPT
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lookups_.push_back({ id, clock::now() });

        if (hold_)
        {
            held_.emplace_back(id, std::move(handler));
            condition_.notify_all();
            return;
        }
    }

    condition_.notify_all();
    complete(id, handler);
}

void mock_client::complete(const pending_id& id,
    const transaction_handler& handler) NOEXCEPT
{
    code ec{};
    transaction::cptr tx{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = scripts_.find(id);
        if (it != scripts_.end())
        {
            auto& script = it->second;
            if (script.served < script.failures.size())
            {
                ec = script.failures.at(script.served++);
            }
            else
            {
                tx = std::make_shared<const transaction>(transaction
                {
                    id, stranger, script.to, amount{ 42 }
                });
            }
        }
    }

    handler(ec, tx);
}

void mock_client::get_balance(const std::string&,
    amount_handler&& handler) NOEXCEPT
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++balance_reads_;

        if (hold_balances_)
        {
            held_balances_.push_back(std::move(handler));
            condition_.notify_all();
            return;
        }
    }

    complete(handler);
}

void mock_client::complete(const amount_handler& handler) NOEXCEPT
{
    code ec{};
    amount balance{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ec = balance_error_;
        balance = balance_;
    }

    handler(ec, balance);
}

void mock_client::get_gas_price(amount_handler&& handler) NOEXCEPT
{
    amount price{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        price = gas_price_;
    }

    handler(error::success, price);
}

void mock_client::send_transaction(const transfer& value,
    transfer_handler&& handler) NOEXCEPT
{
    code ec{};
    std::string hash{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sends_.push_back(value);
        if (!is_zero(send_failures_))
        {
            --send_failures_;
            ec = error::transfer_failed;
        }
        else
        {
            hash = "0x" + std::to_string(++sent_);

            if (drain_)
            {
                const auto spent = value.value +
                    value.gas_price * value.gas_limit;
                balance_ = balance_ > spent ? balance_ - spent : amount{ 0 };
            }
        }
    }

    condition_.notify_all();
    handler(ec, hash);
}

void mock_client::subscribe_pending(pending_handler&& handler) NOEXCEPT
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriber_ = std::move(handler);
    }

    condition_.notify_all();
}

// event_recorder
// ----------------------------------------------------------------------------

void event_recorder::subscribe(network::logger& log) NOEXCEPT
{
    log.subscribe_events([this](const code& ec, uint8_t event_,
        uint64_t value, const network::logger::time&)
    {
        if (ec)
            return false;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++counts_[event_];
            values_[event_] = value;
        }

        condition_.notify_all();
        return true;
    });
}

size_t event_recorder::count(uint8_t event_) const NOEXCEPT
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counts_.find(event_);
    return it == counts_.end() ? zero : it->second;
}

uint64_t event_recorder::last(uint8_t event_) const NOEXCEPT
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = values_.find(event_);
    return it == values_.end() ? zero : it->second;
}

bool event_recorder::wait(uint8_t event_, size_t count) const NOEXCEPT
{
    std::unique_lock<std::mutex> lock(mutex_);
    return condition_.wait_for(lock, timeout, [&]() NOEXCEPT
    {
        const auto it = counts_.find(event_);
        return it != counts_.end() && it->second >= count;
    });
}

// sweeper_fixture
// ----------------------------------------------------------------------------

sweeper_fixture::sweeper_fixture(const configuration& configuration) NOEXCEPT
  : config(configuration),
    instance(client, config, log)
{
    events.subscribe(log);
}

sweeper_fixture::~sweeper_fixture() NOEXCEPT
{
    instance.close();
    log.stop();
}

code sweeper_fixture::start() NOEXCEPT
{
    std::promise<code> started{};
    instance.start([&](const code& ec) NOEXCEPT
    {
        started.set_value(ec);
    });

    return started.get_future().get();
}

BC_POP_WARNING()

} // namespace test
} // namespace sweep
} // namespace libbitcoin
