#pragma once

#include <page_turner/import/int_types.hpp>
#include <page_turner/import/optional.hpp>

#include <batteries/case_of.hpp>
#include <batteries/strong_typedef.hpp>

#include <ostream>
#include <variant>

namespace page_turner {

/** \brief No cap on the number of requests a RequestSequence produces.
 */
struct NoLimit {
};

/** \brief Caps the number of requests a RequestSequence produces.
 */
BATT_STRONG_TYPEDEF(usize, MaxPages);

/** \brief Caps how many requests a look-ahead stream will ever issue, independent of what any
 * response says.
 *
 * If the number of pages is known in advance, pass MaxPages{n} to a look-ahead stream to avoid
 * querying past the last existing page.
 */
using Limit = std::variant<NoLimit, MaxPages>;

/** \brief Returns the maximum number of requests allowed by `limit`, or None if unbounded.
 */
inline Optional<usize> max_pages_of(const Limit& limit)
{
  return batt::case_of(
      limit,
      [](const NoLimit&) -> Optional<usize> {
        return None;
      },
      [](const MaxPages& max_pages) -> Optional<usize> {
        return max_pages.value();
      });
}

std::ostream& operator<<(std::ostream& out, const NoLimit&);

}  // namespace page_turner
