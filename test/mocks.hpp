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
#ifndef LIBBITCOIN_SWEEP_TEST_MOCKS_HPP
#define LIBBITCOIN_SWEEP_TEST_MOCKS_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <unordered_map>
#include <vector>
#include <bitcoin/sweep.hpp>

namespace libbitcoin {
namespace sweep {
namespace test {

using namespace std::chrono_literals;

constexpr auto timeout = 5s;

constexpr auto monitored = "0xAbCdEf0000000000000000000000000000000001";
constexpr auto destination = "0x00000000000000000000000000000000DeAdBeEf";
constexpr auto stranger = "0x1111111111111111111111111111111111111111";

/// Complete configuration with negligible pacing.
configuration make_configuration() NOEXCEPT;

/// Scripted in-memory chain client.
/// Completions are invoked on the calling thread unless lookups are held.
class mock_client
  : public chain_client
{
public:
    typedef std::vector<code> outcomes;

    struct lookup
    {
        pending_id id;
        clock::time_point time;
    };

    /// Scripting.
    /// -----------------------------------------------------------------------

    /// Start completes with the code.
    void set_start(const code& ec) NOEXCEPT;

    /// Lookups of id complete with each outcome in turn (success is absent),
    /// then with the transaction to the recipient. Unscripted ids are absent.
    void script(const pending_id& id, const std::string& to,
        const outcomes& failures={}) NOEXCEPT;

    void set_balance(const amount& value) NOEXCEPT;
    void set_balance_error(const code& ec) NOEXCEPT;
    void set_gas_price(const amount& value) NOEXCEPT;

    /// The next count sends fail.
    void fail_sends(size_t count) NOEXCEPT;

    /// Successful sends reduce the balance by value and fee (floor zero).
    void drain_on_send(bool value) NOEXCEPT;

    /// Hold lookup completions until released.
    void hold(bool value) NOEXCEPT;

    /// Hold balance read completions until released.
    void hold_balances(bool value) NOEXCEPT;

    /// Complete held lookups and balance reads.
    void release() NOEXCEPT;

    /// Subscription.
    /// -----------------------------------------------------------------------

    /// Deliver a pending id to the subscriber.
    void notify(const pending_id& id) NOEXCEPT;

    /// Terminate the subscription with the code.
    void drop(const code& ec) NOEXCEPT;

    /// Observation.
    /// -----------------------------------------------------------------------

    std::vector<lookup> lookups() const NOEXCEPT;
    size_t lookups(const pending_id& id) const NOEXCEPT;
    std::vector<transfer> sends() const NOEXCEPT;
    size_t balance_reads() const NOEXCEPT;
    size_t held() const NOEXCEPT;
    bool subscribed() const NOEXCEPT;
    bool stopped() const NOEXCEPT;

    /// Block until the count is reached, false on timeout.
    bool wait_lookups(size_t count) const NOEXCEPT;
    bool wait_sends(size_t count) const NOEXCEPT;
    bool wait_held(size_t count) const NOEXCEPT;
    bool wait_held_balances(size_t count) const NOEXCEPT;
    bool wait_subscribed() const NOEXCEPT;

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

private:
    struct scripted
    {
        std::string to;
        outcomes failures;
        size_t served;
    };

    typedef std::pair<pending_id, transaction_handler> held_lookup;
    typedef std::vector<amount_handler> held_balances;

    template <typename Predicate>
    bool wait(Predicate&& predicate) const NOEXCEPT;

    void complete(const pending_id& id,
        const transaction_handler& handler) NOEXCEPT;
    void complete(const amount_handler& handler) NOEXCEPT;

    mutable std::mutex mutex_{};
    mutable std::condition_variable condition_{};

    code start_{};
    std::unordered_map<pending_id, scripted> scripts_{};
    amount balance_{};
    code balance_error_{};
    amount gas_price_{};
    size_t send_failures_{};
    bool drain_{};
    bool hold_{};
    bool hold_balances_{};
    bool stopped_{};
    std::vector<held_lookup> held_{};
    held_balances held_balances_{};
    std::vector<lookup> lookups_{};
    std::vector<transfer> sends_{};
    size_t balance_reads_{};
    size_t sent_{};
    pending_handler subscriber_{};
};

/// Counts logger events by type.
class event_recorder
{
public:
    /// Subscribe before any event is fired.
    void subscribe(network::logger& log) NOEXCEPT;

    size_t count(uint8_t event_) const NOEXCEPT;
    uint64_t last(uint8_t event_) const NOEXCEPT;

    /// Block until the event has fired count times, false on timeout.
    bool wait(uint8_t event_, size_t count) const NOEXCEPT;

private:
    mutable std::mutex mutex_{};
    mutable std::condition_variable condition_{};
    std::unordered_map<uint8_t, size_t> counts_{};
    std::unordered_map<uint8_t, uint64_t> values_{};
};

/// Sweeper over a mock client, with recorded events.
struct sweeper_fixture
{
    sweeper_fixture(const configuration& configuration=
        make_configuration()) NOEXCEPT;

    /// Close the sweeper and stop the logger.
    ~sweeper_fixture() NOEXCEPT;

    /// Start the sweeper and wait for its completion.
    code start() NOEXCEPT;

    network::logger log{};
    event_recorder events{};
    mock_client client{};
    const configuration config;
    sweeper instance;
};

} // namespace test
} // namespace sweep
} // namespace libbitcoin

#endif
