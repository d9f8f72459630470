#pragma once

#include <batteries/int_types.hpp>

namespace page_turner {

namespace int_types {

using namespace ::batt::int_types;

}  // namespace int_types

using namespace int_types;

}  // namespace page_turner
