#pragma once

/**
 * @file profiling.h
 * @brief Profiling support using Tracy profiler
 *
 * Wrapper macros for Tracy that compile to nothing when TRACY_ENABLE is not defined.
 */

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>

#define VECSTORE_ZONE_SCOPED() ZoneScoped
#define VECSTORE_ZONE_SCOPED_N(name) ZoneScopedN(name)
#define VECSTORE_PLOT(name, val) TracyPlot(name, val)

#define VECSTORE_VECTOR_SEARCH_ZONE(k)                                                             \
    VECSTORE_ZONE_SCOPED_N("Vector::Search");                                                      \
    VECSTORE_PLOT("SearchK", static_cast<int64_t>(k))

#else

#define VECSTORE_ZONE_SCOPED()
#define VECSTORE_ZONE_SCOPED_N(name)
#define VECSTORE_PLOT(name, val)
#define VECSTORE_VECTOR_SEARCH_ZONE(k)

#endif
