#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/common.h>

#include "omd/common.hpp"

namespace omd::util {

// Error severity levels
enum class ErrorSeverity {
  kInfo,     // Informational messages
  kWarning,  // Note skipped, batch continues
  kError,    // Operation failed
  kCritical  // Nothing could be processed
};

// Where an error happened
struct ErrorContext {
  std::string file_path;          // Note or config file being processed
  std::string operation;          // Operation being performed
  std::chrono::system_clock::time_point timestamp;

  ErrorContext() : timestamp(std::chrono::system_clock::now()) {}

  ErrorContext& withFile(const std::string& path) {
    file_path = path;
    return *this;
  }

  ErrorContext& withOperation(const std::string& op) {
    operation = op;
    return *this;
  }
};

// Error with context and severity
class ContextualError {
 public:
  ContextualError(ErrorCode code, std::string message, ErrorSeverity severity = ErrorSeverity::kError)
      : code_(code), message_(std::move(message)), severity_(severity) {}

  ContextualError(ErrorCode code, std::string message, ErrorContext context,
                  ErrorSeverity severity = ErrorSeverity::kError)
      : code_(code), message_(std::move(message)), context_(std::move(context)), severity_(severity) {}

  // Wraps a plain Result error
  ContextualError(const Error& error, ErrorContext context,
                  ErrorSeverity severity = ErrorSeverity::kError)
      : ContextualError(error.code(), error.message(), std::move(context), severity) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }
  const std::optional<ErrorContext>& context() const { return context_; }
  ErrorSeverity severity() const { return severity_; }

  // "code: message (during op) [file: path]"
  std::string fullDescription() const;

 private:
  ErrorCode code_;
  std::string message_;
  std::optional<ErrorContext> context_;
  ErrorSeverity severity_;
};

// Routes reported errors to the installed logger and formats them for users
class ErrorHandler {
 public:
  static ErrorHandler& instance();

  // Hands the error to the logger callback, if one is installed
  void report(const ContextualError& error) const;

  void setErrorLogger(std::function<void(const ContextualError&)> logger);

  // Plain text (colored when `color` is set) or a JSON object
  std::string formatUserError(const ContextualError& error, bool json_format = false,
                              bool color = false) const;

  std::string formatLogError(const ContextualError& error) const;

 private:
  ErrorHandler() = default;
  std::function<void(const ContextualError&)> error_logger_;
};

// Installs the spdlog default logger (stderr, plus a rotating file under
// the XDG data directory when `log_to_file` is set) and connects it to
// ErrorHandler.
void setupErrorHandling(spdlog::level::level_enum level = spdlog::level::warn,
                        bool log_to_file = false);

// Parses "trace".."off"; anything else is ErrorCode::kInvalidArgument
Result<spdlog::level::level_enum> logLevelFromString(const std::string& name);

}  // namespace omd::util
