#pragma once

#include <string>

namespace outflow::util {

// Random RFC4122 version 4 UUID in canonical text form. Used for every
// engine-assigned id: requests, movements, reservations, approvals,
// installations and cost breakdowns.
std::string GenerateId();

} // namespace outflow::util
