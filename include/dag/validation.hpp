// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace dagsync {
namespace dag {

/**
 * Validation state - tracks why a DAG node was rejected
 * Simplified from Bitcoin Core's BlockValidationState
 *
 * INVALID covers every recoverable rejection (duplicate, stale timestamp,
 * missing parent, cycle, bad signature).
 */
class ValidationState {
public:
  enum class Result {
    VALID,
    INVALID
  };

  ValidationState() : result_(Result::VALID) {}

  bool IsValid() const { return result_ == Result::VALID; }
  bool IsInvalid() const { return result_ == Result::INVALID; }

  bool Invalid(const std::string &reject_reason,
               const std::string &debug_message = "") {
    result_ = Result::INVALID;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  const std::string& GetRejectReason() const { return reject_reason_; }
  const std::string& GetDebugMessage() const { return debug_message_; }

private:
  Result result_;
  std::string reject_reason_;
  std::string debug_message_;
};

// Reject reasons reported by DAGManager::AddNode
namespace reject {
inline constexpr const char *DUPLICATE_NODE = "duplicate-node";
inline constexpr const char *TIME_TOO_FAR = "time-too-far";
inline constexpr const char *MISSING_PARENT = "missing-parent";
inline constexpr const char *DUPLICATE_PARENT = "duplicate-parent";
inline constexpr const char *CYCLE = "cycle";
inline constexpr const char *PARENT_TIME_ORDER = "parent-time-order";
inline constexpr const char *MISSING_SIGNATURE = "missing-signature";
inline constexpr const char *BAD_SIGNATURE = "bad-signature";
} // namespace reject

} // namespace dag
} // namespace dagsync
