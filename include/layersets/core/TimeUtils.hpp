#pragma once

#include <chrono>
#include <string>

namespace LS {

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:30:00.250Z.
auto formatTimestamp(std::chrono::system_clock::time_point tp) -> std::string;

auto currentTimestamp() -> std::string;

} // namespace LS
