#pragma once

/**
 * @file profiling.h
 * @brief Profiling support using Tracy profiler
 *
 * Wrapper macros for Tracy that compile to nothing when TRACY_ENABLE is not defined.
 */

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>

// Zone macros
#define TAGFLOW_ZONE_SCOPED() ZoneScoped
#define TAGFLOW_ZONE_SCOPED_N(name) ZoneScopedN(name)
#define TAGFLOW_ZONE_SCOPED_NC(name, color) ZoneScopedNC(name, color)
#define TAGFLOW_ZONE_TEXT(txt, size) ZoneText(txt, size)

// Thread naming
#define TAGFLOW_SET_THREAD_NAME(name) tracy::SetThreadName(name)

// Plot values
#define TAGFLOW_PLOT(name, val) TracyPlot(name, val)

#define TAGFLOW_DB_ZONE(operation) TAGFLOW_ZONE_SCOPED_NC("DbBridge::" operation, 0x0080FF)

#define TAGFLOW_EXECUTOR_QUEUE_PLOT(size) TAGFLOW_PLOT("ExecutorPending", static_cast<int64_t>(size))

#else
// No-op macros when profiling is disabled
#define TAGFLOW_ZONE_SCOPED()
#define TAGFLOW_ZONE_SCOPED_N(name)
#define TAGFLOW_ZONE_SCOPED_NC(name, color)
#define TAGFLOW_ZONE_TEXT(txt, size)

#define TAGFLOW_SET_THREAD_NAME(name)

#define TAGFLOW_PLOT(name, val)

#define TAGFLOW_DB_ZONE(operation)
#define TAGFLOW_EXECUTOR_QUEUE_PLOT(size)

#endif // TRACY_ENABLE
