#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace planid::core {

enum class ErrorCode : std::uint8_t {
  kNone = 0,
  kInvalidSequence = 1,
  kUnresolvedDependency = 2,
  kUnknownPlan = 3,
  kInvalidSessionFormat = 4,
  // Informational: reported with ok == true.
  kEmptyTree = 5,
  kUnknownSession = 6,
  kRetiredPlan = 7,
  kMalformedPayload = 8,
  kUnknownCommand = 9,
};

template <typename TValue>
struct Result {
  bool ok = false;
  TValue value{};
  ErrorCode code = ErrorCode::kNone;
  std::string error{};
};

template <typename TValue>
Result<TValue> make_ok(TValue value) {
  Result<TValue> result;
  result.ok = true;
  result.value = std::move(value);
  return result;
}

template <typename TValue>
Result<TValue> make_error(ErrorCode code, std::string message) {
  Result<TValue> result;
  result.code = code;
  result.error = std::move(message);
  return result;
}

inline const char* to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::kNone:
    return "None";
  case ErrorCode::kInvalidSequence:
    return "InvalidSequence";
  case ErrorCode::kUnresolvedDependency:
    return "UnresolvedDependency";
  case ErrorCode::kUnknownPlan:
    return "UnknownPlan";
  case ErrorCode::kInvalidSessionFormat:
    return "InvalidSessionFormat";
  case ErrorCode::kEmptyTree:
    return "EmptyTree";
  case ErrorCode::kUnknownSession:
    return "UnknownSession";
  case ErrorCode::kRetiredPlan:
    return "RetiredPlan";
  case ErrorCode::kMalformedPayload:
    return "MalformedPayload";
  case ErrorCode::kUnknownCommand:
    return "UnknownCommand";
  }
  return "Unknown";
}

}  // namespace planid::core
