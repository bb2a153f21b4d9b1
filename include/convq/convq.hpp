// ============================================================================
// convq/convq.hpp - Main Include Header
// ============================================================================
//
// This convenience header includes the complete convq library.
// For smaller builds, include individual headers as needed.
//
// USAGE:
// ------
//   #include <convq/convq.hpp>
//   using namespace convq;
//
// ============================================================================

#pragma once

// Core primitives
#include "convq/core/backoff.hpp"
#include "convq/core/check.hpp"
#include "convq/core/clock.hpp"
#include "convq/core/defer.hpp"
#include "convq/core/detached_task.hpp"
#include "convq/core/error.hpp"
#include "convq/core/logging.hpp"
#include "convq/core/result.hpp"
#include "convq/core/settings.hpp"
#include "convq/core/sync_wait.hpp"
#include "convq/core/task.hpp"

// Executors and timers
#include "convq/io/executor.hpp"
#include "convq/io/libuv_executor.hpp"
#include "convq/io/periodic_timer.hpp"
#include "convq/io/timer.hpp"

// Networking
#include "convq/io/tcp.hpp"

// Engine
#include "convq/engine/admission_controller.hpp"
#include "convq/engine/conversion_task.hpp"
#include "convq/engine/engine_error.hpp"
#include "convq/engine/event.hpp"
#include "convq/engine/output_estimator.hpp"
#include "convq/engine/space_accountant.hpp"
#include "convq/engine/space_types.hpp"
#include "convq/engine/storage_probe.hpp"
#include "convq/engine/task_registry.hpp"
#include "convq/engine/task_status.hpp"
#include "convq/engine/task_store.hpp"

// Broadcast hub
#include "convq/hub/broadcast_hub.hpp"
#include "convq/hub/groups.hpp"
#include "convq/hub/outbox.hpp"

// Transport
#include "convq/net/connection_manager.hpp"
#include "convq/net/line_framer.hpp"
#include "convq/net/protocol.hpp"
#include "convq/net/reconnecting_client.hpp"
#include "convq/net/request_handler.hpp"

// Service
#include "convq/service/engine_config.hpp"
#include "convq/service/engine_context.hpp"
#include "convq/service/event_router.hpp"
#include "convq/service/request_dispatcher.hpp"
#include "convq/service/space_monitor.hpp"
