#pragma once

#include <batteries/optional.hpp>

namespace page_turner {

using ::batt::make_optional;
using ::batt::None;
using ::batt::NoneType;
using ::batt::Optional;

}  // namespace page_turner
