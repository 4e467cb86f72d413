#pragma once

#include <ktree/core/types.h>

#include <cstdint>
#include <string>

namespace ktree {

/**
 * Format a time point as an ISO 8601 UTC timestamp with millisecond precision.
 * Format: 2025-10-01T14:30:00.123Z
 */
std::string formatIso8601(TimePoint tp);

// formatIso8601(system_clock::now())
std::string isoTimestampNow();

// Milliseconds since the Unix epoch, used as the move disambiguator
std::int64_t epochMillisNow();

} // namespace ktree
