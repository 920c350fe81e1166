#pragma once

#include <optional>
#include <string>

#include "common/Types.h"

namespace replaybt {
namespace utils {

// Epoch values below 1e11 are treated as seconds and scaled to milliseconds.
TimestampMs toMsTimestamp(long long ts);

// Accepts epoch seconds/milliseconds or "YYYY-MM-DD[( |T)HH:MM[:SS]]" (UTC).
std::optional<TimestampMs> parseTimestamp(const std::string& text);

// "YYYY-MM-DD HH:MM:SS" (UTC)
std::string formatTimestamp(TimestampMs ts);

} // namespace utils
} // namespace replaybt
