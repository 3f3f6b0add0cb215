// REVGUARD - Time Utilities
// Copyright (c) 2024 REVGUARD Developers
// MIT License
//
// Ledger clock. Maturity dates and report timestamps read GetTime(), which
// the simulator and the tests drive through the mock clock.

#ifndef REVGUARD_UTIL_TIME_H
#define REVGUARD_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace revguard {
namespace util {

using Seconds = std::chrono::seconds;

constexpr int64_t SECONDS_PER_DAY = 24 * 60 * 60;

/// Unix time in seconds; the mock clock when it is enabled
int64_t GetTime();

/// "2024-01-15T10:30:00Z"
std::string FormatTimestamp(int64_t timestamp);

// ============================================================================
// Mock Clock
// ============================================================================

/// Freeze GetTime() at the mock clock. An unset clock starts at wall time.
void EnableMockTime();

void DisableMockTime();

bool IsMockTimeEnabled();

void SetMockTime(int64_t timestamp);

/// Move the mock clock forward (or back, for a negative duration)
void AdvanceMockTime(Seconds duration);

} // namespace util
} // namespace revguard

#endif // REVGUARD_UTIL_TIME_H
