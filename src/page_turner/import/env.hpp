#pragma once

#include <batteries/env.hpp>

namespace page_turner {

using batt::getenv_as;

}  // namespace page_turner
