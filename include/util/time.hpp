// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace dagsync {
namespace util {

/**
 * Mockable time system for testing
 *
 * Inspired by Bitcoin Core's time mocking system, this allows tests to
 * control time passage without waiting for real time to elapse.
 *
 * Usage:
 * - Production code calls GetTime()/GetTimeMillis() instead of direct system calls
 * - Tests call SetMockTime() to control the current time
 * - When mock time is 0 (default), time functions return real system time
 */

// Current Unix time in seconds (mock time if set)
int64_t GetTime();

// Current Unix time in milliseconds (mock time * 1000 if set)
// DAG node and gossip message timestamps use this resolution.
int64_t GetTimeMillis();

/**
 * Get current time as steady clock time point
 * Returns mock time if set, otherwise returns real steady clock time
 *
 * Note: When mock time is active, steady clock is simulated using the mock
 * value
 */
std::chrono::steady_clock::time_point GetSteadyTime();

/**
 * Set mock time for testing
 *
 * @param time Unix timestamp in seconds (0 to disable mocking)
 *
 * Time does not advance automatically while mocked - tests must call
 * SetMockTime() again.
 */
void SetMockTime(int64_t time);

// Returns 0 if mock time is disabled
int64_t GetMockTime();

/**
 * Format a Unix timestamp as a human-readable UTC string
 * Example: FormatTime(1729868000) -> "2024-10-25 14:53:20 UTC"
 */
std::string FormatTime(int64_t unix_time);

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;
  MockTimeScope(MockTimeScope&&) = delete;
  MockTimeScope& operator=(MockTimeScope&&) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace dagsync
