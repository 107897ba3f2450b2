// This is the single entry point for the cmdrelay library.
// Include this file to get access to the core public API.

#pragma once

// Options and core data types
#include "cmdrelay/core/options.hpp"
#include "cmdrelay/core/options_json.hpp"
#include "cmdrelay/core/types.hpp"
#include "cmdrelay/core/util/error_types.hpp"
#include "cmdrelay/core/util/logger.hpp"

// Wire framing and payload codecs
#include "cmdrelay/core/codec/frame_codec.hpp"
#include "cmdrelay/core/protocol/json_payload_codec.hpp"
#include "cmdrelay/core/protocol/msgpack_payload_codec.hpp"

// Transport core
#include "cmdrelay/core/session/tcp_device_session.hpp"
#include "cmdrelay/core/cache/idempotency_cache.hpp"
#include "cmdrelay/core/queue/command_queue.hpp"
#include "cmdrelay/core/engine/retry_engine.hpp"

// Observability
#include "cmdrelay/core/observability/metrics_registry.hpp"
#include "cmdrelay/core/observability/async_observer.hpp"

// Public interfaces for extension
#include "cmdrelay/core/interfaces/IBackoffStrategy.hpp"
#include "cmdrelay/core/strategies/capped_backoff.hpp"
#include "cmdrelay/core/strategies/jittered_backoff.hpp"
#include "cmdrelay/core/interfaces/idevice_session.hpp"
#include "cmdrelay/core/interfaces/ipayload_codec.hpp"
#include "cmdrelay/core/interfaces/irelay_observer.hpp"
