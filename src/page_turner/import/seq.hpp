#pragma once

#include <batteries/seq.hpp>

namespace page_turner {

namespace seq = batt::seq;
using batt::as_seq;

}  // namespace page_turner
