///////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2014-2025 libbitcoin-sweep developers (see COPYING).
//
//        GENERATED SOURCE CODE, DO NOT EDIT EXCEPT EXPERIMENTALLY
//
///////////////////////////////////////////////////////////////////////////////
#ifndef LIBBITCOIN_SWEEP_HPP
#define LIBBITCOIN_SWEEP_HPP

/**
 * API Users: Include only this header. Direct use of other headers is fragile
 * and unsupported as header organization is subject to change.
 *
 * Maintainers: Do not include this header internal to this library.
 */

#include <bitcoin/network.hpp>
#include <bitcoin/sweep/configuration.hpp>
#include <bitcoin/sweep/define.hpp>
#include <bitcoin/sweep/error.hpp>
#include <bitcoin/sweep/events.hpp>
#include <bitcoin/sweep/fetcher.hpp>
#include <bitcoin/sweep/parser.hpp>
#include <bitcoin/sweep/settings.hpp>
#include <bitcoin/sweep/sweeper.hpp>
#include <bitcoin/sweep/version.hpp>
#include <bitcoin/sweep/client/chain_client.hpp>
#include <bitcoin/sweep/client/rpc.hpp>
#include <bitcoin/sweep/client/rpc_client.hpp>
#include <bitcoin/sweep/client/signer.hpp>
#include <bitcoin/sweep/client/types.hpp>
#include <bitcoin/sweep/client/websocket.hpp>
#include <bitcoin/sweep/utility/ingest_queue.hpp>
#include <bitcoin/sweep/utility/rate_gate.hpp>
#include <bitcoin/sweep/utility/sweep_queue.hpp>
#include <bitcoin/sweep/workers/worker.hpp>
#include <bitcoin/sweep/workers/worker_detect.hpp>
#include <bitcoin/sweep/workers/worker_sweep.hpp>
#include <bitcoin/sweep/workers/workers.hpp>

#endif
