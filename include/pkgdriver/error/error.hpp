#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace pkgdriver {

/**
 * @brief Failure kinds surfaced by loading and resolution
 */
enum class DriverErrorCode {
  // A package JSON, list or Go source file could not be opened
  FileNotFound,

  // A Go source header could not be parsed
  ParseFailed,

  // Package JSON is malformed or lacks required fields
  InvalidPackage,

  // The path resolver threw while rewriting a node
  PathResolutionFailed,
};

/**
 * @brief Error value carried in std::expected by the package driver
 */
class DriverError {
 public:
  DriverError(DriverErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  [[nodiscard]] auto code() const -> DriverErrorCode { return code_; }

  // "<default message>: <details>", or the default message alone
  [[nodiscard]] auto message() const -> const std::string& { return message_; }

  static auto GetDefaultMessage(DriverErrorCode code) -> std::string_view {
    switch (code) {
      case DriverErrorCode::FileNotFound:
        return "File not found";
      case DriverErrorCode::ParseFailed:
        return "Failed to parse file";
      case DriverErrorCode::InvalidPackage:
        return "Invalid package record";
      case DriverErrorCode::PathResolutionFailed:
        return "Path resolution failed";
    }
    return "Unknown error";
  }

  static auto Make(DriverErrorCode code, std::string_view details = "")
      -> DriverError {
    std::string message(GetDefaultMessage(code));
    if (!details.empty()) {
      message += ": ";
      message += details;
    }
    return {code, std::move(message)};
  }

  static auto Unexpected(DriverErrorCode code, std::string_view details = "")
      -> std::unexpected<DriverError> {
    return std::unexpected<DriverError>(Make(code, details));
  }

 private:
  DriverErrorCode code_;
  std::string message_;
};

}  // namespace pkgdriver
