#pragma once

/// @file rsk.hpp
/// @brief Aggregate header for the resilience kit.

#include "rsk/version.hpp"

#include "rsk/foundation/clock.hpp"
#include "rsk/foundation/config_manager.hpp"
#include "rsk/foundation/event_loop.hpp"
#include "rsk/foundation/future.hpp"
#include "rsk/foundation/kit_logger.hpp"
#include "rsk/foundation/kit_result.hpp"
#include "rsk/foundation/service_locator.hpp"
#include "rsk/foundation/timeout.hpp"

#include "rsk/resilience/batch.hpp"
#include "rsk/resilience/circuit_breaker.hpp"
#include "rsk/resilience/concurrency_pool.hpp"
#include "rsk/resilience/rate_limiter.hpp"
#include "rsk/resilience/resilient_executor.hpp"
#include "rsk/resilience/retry_executor.hpp"
#include "rsk/resilience/throttle.hpp"
#include "rsk/resilience/ttl_cache.hpp"

#include "rsk/stream/change_stream.hpp"
#include "rsk/stream/connection_hub.hpp"
#include "rsk/stream/data_streamer.hpp"
#include "rsk/stream/health_check_stream.hpp"
#include "rsk/stream/metrics_stream.hpp"
#include "rsk/stream/search_stream.hpp"
#include "rsk/stream/stream_channel.hpp"
#include "rsk/stream/stream_hub.hpp"

#include "rsk/toolkit_context.hpp"
#include "rsk/toolkit_settings.hpp"
