#pragma once

#include <page_turner/import/int_types.hpp>

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Metrics
// ~~~~~~~
//
/** \brief Set to 1 to collect scheduler counters (see ScheduleMetrics); when 0, all counters
 * compile down to no-ops.
 */
#define PAGE_TURNER_ENABLE_METRICS 1

#if !(PAGE_TURNER_ENABLE_METRICS == 0 || PAGE_TURNER_ENABLE_METRICS == 1)
#error PAGE_TURNER_ENABLE_METRICS must be 0 or 1
#endif

namespace page_turner {

/** \brief Default stack size for the tasks that run fetches on behalf of a look-ahead stream.
 */
constexpr usize kDefaultFetchTaskStackSize = 512 * 1024;

/** \brief Fetch tasks are never given less stack than this, whatever the environment says.
 */
constexpr usize kMinFetchTaskStackSize = 64 * 1024;

}  // namespace page_turner
