#pragma once

#include <page_turner/config.hpp>
//

#include <batteries/metrics/metric_collectors.hpp>

#include <ostream>

namespace page_turner {

template <typename T>
struct NullCountMetric {
  NullCountMetric() noexcept
  {
  }

  NullCountMetric(T) noexcept
  {
  }

  template <typename D>
  void add(D) noexcept
  {
  }

  T load() const noexcept
  {
    return {};
  }

  void reset() noexcept
  {
  }
};

template <typename T>
inline std::ostream& operator<<(std::ostream& out, const NullCountMetric<T>&) noexcept
{
  return out << "(disabled)";
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

#if PAGE_TURNER_ENABLE_METRICS

using ::batt::CountMetric;

#else

template <typename T>
using CountMetric = NullCountMetric<T>;

#endif

}  // namespace page_turner
