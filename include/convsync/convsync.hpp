#ifndef CONVSYNC_CONVSYNC_HPP
#define CONVSYNC_CONVSYNC_HPP

/**
 * @file convsync.hpp
 * @brief Umbrella header: gateway and client components.
 */

#include <convsync/errors.hpp>
#include <convsync/types.hpp>
#include <convsync/protocol.hpp>
#include <convsync/config.hpp>

// server side
#include <convsync/MessageStore.hpp>
#include <convsync/SqliteMessageStore.hpp>
#include <convsync/Metrics.hpp>
#include <convsync/SyncGateway.hpp>
#include <convsync/dispatcher.hpp>
#include <convsync/server.hpp>
#include <convsync/HttpApi.hpp>
#include <convsync/App.hpp>

// client side
#include <convsync/Backoff.hpp>
#include <convsync/timer.hpp>
#include <convsync/LivenessMonitor.hpp>
#include <convsync/KeyValueStorage.hpp>
#include <convsync/LocalCache.hpp>
#include <convsync/MergeEngine.hpp>
#include <convsync/ConnectionManager.hpp>
#include <convsync/WsTransport.hpp>
#include <convsync/SyncClient.hpp>

#endif // CONVSYNC_CONVSYNC_HPP
