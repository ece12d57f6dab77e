#pragma once

#include <optional>
#include <string>
#include <utility>

namespace nb::notes {

enum class OperationStatus {
  kOk,
  kNotFound,        // the note named by the call does not exist
  kFolderNotFound,  // a folder named by the call does not exist
  kFailed           // the command could not run or answered outside its protocol
};

// Payload for operations that only report completion
struct Done {};

/**
 * @brief Closed result of one notes operation
 *
 * Exactly one of: Ok with a payload, NotFound, FolderNotFound, or Failed with a
 * generic reason. Failure reasons never carry interpreter diagnostics.
 */
template <typename T>
class OperationResult {
 public:
  static OperationResult ok(T value) {
    return OperationResult(OperationStatus::kOk, std::move(value), {});
  }

  static OperationResult notFound() {
    return OperationResult(OperationStatus::kNotFound, std::nullopt, {});
  }

  static OperationResult folderNotFound() {
    return OperationResult(OperationStatus::kFolderNotFound, std::nullopt, {});
  }

  static OperationResult failed(std::string reason) {
    return OperationResult(OperationStatus::kFailed, std::nullopt, std::move(reason));
  }

  OperationStatus status() const { return status_; }
  bool isOk() const { return status_ == OperationStatus::kOk; }

  // Only valid when isOk()
  const T& value() const { return *value_; }
  T& value() { return *value_; }

  // Failure reason, or a fixed description of the other non-ok states
  std::string message() const {
    switch (status_) {
      case OperationStatus::kOk:
        return {};
      case OperationStatus::kNotFound:
        return "Note not found";
      case OperationStatus::kFolderNotFound:
        return "Specified folder not found";
      case OperationStatus::kFailed:
        return reason_;
    }
    return reason_;
  }

 private:
  OperationResult(OperationStatus status, std::optional<T> value, std::string reason)
      : status_(status), value_(std::move(value)), reason_(std::move(reason)) {}

  OperationStatus status_;
  std::optional<T> value_;
  std::string reason_;
};

}  // namespace nb::notes
