#include "omd/util/error_handler.hpp"

#include <sstream>

#include <nlohmann/json.hpp>

namespace omd::util {

std::string ContextualError::fullDescription() const {
  std::ostringstream oss;
  oss << errorCodeToString(code_) << ": " << message_;

  if (context_) {
    if (!context_->operation.empty()) {
      oss << " (during " << context_->operation << ")";
    }
    if (!context_->file_path.empty()) {
      oss << " [file: " << context_->file_path << "]";
    }
  }
  return oss.str();
}

ErrorHandler& ErrorHandler::instance() {
  static ErrorHandler instance_;
  return instance_;
}

void ErrorHandler::report(const ContextualError& error) const {
  if (error_logger_) {
    error_logger_(error);
  }
}

void ErrorHandler::setErrorLogger(std::function<void(const ContextualError&)> logger) {
  error_logger_ = std::move(logger);
}

std::string ErrorHandler::formatUserError(const ContextualError& error, bool json_format,
                                          bool color) const {
  if (json_format) {
    nlohmann::json error_json;
    error_json["error"] = true;
    error_json["code"] = std::string(errorCodeToString(error.code()));
    error_json["message"] = error.message();

    if (error.context()) {
      const auto& ctx = *error.context();
      if (!ctx.file_path.empty()) {
        error_json["file"] = ctx.file_path;
      }
      if (!ctx.operation.empty()) {
        error_json["operation"] = ctx.operation;
      }
    }
    return error_json.dump();
  }

  const char* color_code = "";
  const char* severity_text = "";
  switch (error.severity()) {
    case ErrorSeverity::kInfo:
      color_code = "\033[36m";
      severity_text = "Info";
      break;
    case ErrorSeverity::kWarning:
      color_code = "\033[33m";
      severity_text = "Warning";
      break;
    case ErrorSeverity::kError:
      color_code = "\033[31m";
      severity_text = "Error";
      break;
    case ErrorSeverity::kCritical:
      color_code = "\033[35m";
      severity_text = "Critical";
      break;
  }

  std::ostringstream oss;
  if (color) {
    oss << color_code << severity_text << "\033[0m";
  } else {
    oss << severity_text;
  }
  oss << ": " << error.message();

  if (error.context() && !error.context()->file_path.empty()) {
    oss << "\n  File: " << error.context()->file_path;
  }

  switch (error.code()) {
    case ErrorCode::kInvalidFrontmatter:
      oss << "\n  Suggestion: Fix the YAML between the '---' lines; the note was left untouched";
      break;
    case ErrorCode::kFileNotFound:
    case ErrorCode::kDirectoryNotFound:
      oss << "\n  Suggestion: Check that the path exists";
      break;
    case ErrorCode::kConfigError:
      oss << "\n  Suggestion: Check the configuration file (see 'omd --help')";
      break;
    default:
      break;
  }
  return oss.str();
}

std::string ErrorHandler::formatLogError(const ContextualError& error) const {
  std::ostringstream oss;
  switch (error.severity()) {
    case ErrorSeverity::kInfo: oss << "INFO"; break;
    case ErrorSeverity::kWarning: oss << "WARN"; break;
    case ErrorSeverity::kError: oss << "ERROR"; break;
    case ErrorSeverity::kCritical: oss << "CRITICAL"; break;
  }
  oss << " " << error.fullDescription();
  return oss.str();
}

}  // namespace omd::util
