// ZKRANGE - Time Utilities
// Copyright (c) 2024 ZKRANGE Developers
// MIT License
//
// Clock used for verification event timestamps, with mock time for tests.

#ifndef ZKRANGE_UTIL_TIME_H
#define ZKRANGE_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace zkrange {
namespace util {

// ============================================================================
// Type Aliases
// ============================================================================

using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;
using SystemClock = std::chrono::system_clock;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Get current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

/// Get current Unix timestamp in milliseconds (mock time when enabled)
int64_t GetTimeMillis();

// ============================================================================
// Formatting
// ============================================================================

/// Format a Unix timestamp as ISO 8601 UTC (e.g. 2024-01-02T03:04:05Z)
std::string FormatISO8601(int64_t timestamp);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Freeze the clock; starts at the current time unless SetMockTime was called
void EnableMockTime();

/// Return to the system clock
void DisableMockTime();

bool IsMockTimeEnabled();

/// Set mock time in Unix seconds
void SetMockTime(int64_t timestamp);

/// Advance mock time
void AdvanceMockTime(Seconds duration);

} // namespace util
} // namespace zkrange

#endif // ZKRANGE_UTIL_TIME_H
