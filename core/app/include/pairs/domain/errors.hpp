#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace pairs {

// -----------------------------------------------------------------------------
// BacktestError — root of the backtester's exception hierarchy
// -----------------------------------------------------------------------------
//
// @brief  Thrown for failures that make a run meaningless: invalid
//         configuration or malformed signal input.
//
// @details
// Conditions that are part of normal trading (NaN z-score, rejected entry,
// closing a pair that is not open) are NOT errors and never throw. Anything
// deriving from BacktestError terminates the run before simulation starts.
// -----------------------------------------------------------------------------
class BacktestError : public std::runtime_error {
 public:
  explicit BacktestError(const std::string& msg) : std::runtime_error(msg) {}
};

// Invalid configuration value or config file content.
class ConfigError : public BacktestError {
 public:
  explicit ConfigError(const std::string& msg)
      : BacktestError("Config Error: " + msg) {}
};

// -----------------------------------------------------------------------------
// SignalValidationError
// -----------------------------------------------------------------------------
// Missing column, malformed row or out-of-range field in the signal stream.
// Carries the date, pair and field so the offending input can be located.
// Any of the three may be empty when it does not apply (e.g. a missing
// column has no date).
// -----------------------------------------------------------------------------
class SignalValidationError : public BacktestError {
 public:
  SignalValidationError(std::string date, std::string pair_id,
                        std::string field, const std::string& detail)
      : BacktestError(formatMessage(date, pair_id, field, detail)),
        date_(std::move(date)),
        pair_id_(std::move(pair_id)),
        field_(std::move(field)) {}

  const std::string& date() const { return date_; }
  const std::string& pairId() const { return pair_id_; }
  const std::string& field() const { return field_; }

 private:
  static std::string formatMessage(const std::string& date,
                                   const std::string& pair_id,
                                   const std::string& field,
                                   const std::string& detail) {
    std::string msg = "Signal Error: " + detail;
    if (!field.empty()) msg += " [field=" + field + "]";
    if (!pair_id.empty()) msg += " [pair=" + pair_id + "]";
    if (!date.empty()) msg += " [date=" + date + "]";
    return msg;
  }

  std::string date_;
  std::string pair_id_;
  std::string field_;
};

}  // namespace pairs
