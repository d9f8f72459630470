#pragma once

#include <page_turner/import/status.hpp>

namespace page_turner {

/** \brief Status codes owned by page_turner.
 *
 * Errors returned by a PageFetcher pass through every stream unchanged; these codes are only
 * used for conditions the library itself detects.
 */
enum struct StatusCode {
  kOk = 0,

  /** \brief A PageFetcher threw an exception instead of returning a Status.
   */
  kFetchException = 1,

  /** \brief A fetch task was skipped because its stream was halted before the task ran.
   */
  kFetchAbandoned = 2,
};

/** \brief Registers StatusCode with batteries; safe to call many times, from any thread.
 */
bool initialize_status_codes();

/** \brief Returns a Status for the given code, registering page_turner's codes if necessary.
 */
Status make_status(StatusCode code);

}  // namespace page_turner
