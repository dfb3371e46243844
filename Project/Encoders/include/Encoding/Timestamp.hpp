#pragma once

#include <chrono>
#include <string>

#include "Logging.hpp"

namespace Encoders {

class ValueEncoderContext;

// UTC, millisecond precision: 2019-03-14T09:26:53.589Z. Years outside 0000-9999
// have no four-digit form and raise EncodingException.
ENCODERS_API std::string FormatTimestamp(const std::chrono::sys_time<std::chrono::milliseconds>& time);
ENCODERS_API std::string FormatTimestamp(const std::chrono::system_clock::time_point& time);

// Value encoder registered by default for std::chrono::system_clock::time_point.
ENCODERS_API void EncodeTimestamp(const std::chrono::system_clock::time_point& time, ValueEncoderContext& context);

}
