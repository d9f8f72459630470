#pragma once

#include <batteries/suppress.hpp>

BATT_SUPPRESS_IF_GCC("-Wsuggest-override")
//
#include <glog/logging.h>
//
BATT_UNSUPPRESS()

namespace page_turner {

// Use `SetVLOGLevel("pages_ahead*", 1)` to trace scheduler steps for a single module.
//
using google::SetVLOGLevel;

}  // namespace page_turner
