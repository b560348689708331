#pragma once

#include <cstdint>

namespace outflow::model {

// Amounts are minor currency units (paise).
using Money = std::int64_t;

using Quantity = std::int64_t;

} // namespace outflow::model
