#pragma once

#include <page_turner/import/int_types.hpp>
#include <page_turner/import/logging.hpp>

#include <batteries/async/task.hpp>

#include <algorithm>
#include <ostream>
#include <vector>

namespace page_turner {

/** \brief Prints a set of sequence indices in ascending order, e.g. `{3, 4, 7}`; used to trace the
 * in-flight set of a look-ahead stream.
 */
struct DumpIndices {
  std::vector<usize> indices;

  template <typename Range>
  static DumpIndices of(const Range& range)
  {
    DumpIndices dump;
    for (const auto& index : range) {
      dump.indices.emplace_back(index);
    }
    std::sort(dump.indices.begin(), dump.indices.end());
    return dump;
  }
};

inline std::ostream& operator<<(std::ostream& out, const DumpIndices& t)
{
  out << "{";
  bool first = true;
  for (usize index : t.indices) {
    if (!first) {
      out << ", ";
    }
    first = false;
    out << index;
  }
  return out << "}";
}

#define PAGE_TURNER_DEBUG_LOG_ON(expr)                                                             \
  LOG(INFO) << "[page_turner thread:" << ::batt::this_thread_id() << "] " << expr

// #define PAGE_TURNER_DEBUG_LOG_ENABLE

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
#ifdef PAGE_TURNER_DEBUG_LOG_ENABLE

#define PAGE_TURNER_DEBUG_LOG PAGE_TURNER_DEBUG_LOG_ON

#else  //+++++++++++-+-+--+----- --- -- -  -  -   -

#define PAGE_TURNER_DEBUG_LOG(expr)                                                                \
  if (false)                                                                                       \
  LOG(INFO) << ""

#endif
//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -

}  // namespace page_turner
