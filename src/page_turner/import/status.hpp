#pragma once

#include <batteries/status.hpp>

namespace page_turner {

using batt::OkStatus;
using batt::RemoveStatusOr;
using batt::Status;
using batt::StatusOr;

}  // namespace page_turner
