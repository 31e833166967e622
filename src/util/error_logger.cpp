#include "omd/util/error_handler.hpp"

#include <algorithm>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "omd/util/filesystem.hpp"
#include "omd/util/xdg.hpp"

namespace omd::util {

namespace {

void logContextualError(const ContextualError& error) {
  auto message = ErrorHandler::instance().formatLogError(error);
  switch (error.severity()) {
    case ErrorSeverity::kInfo:
      spdlog::info("{}", message);
      break;
    case ErrorSeverity::kWarning:
      spdlog::warn("{}", message);
      break;
    case ErrorSeverity::kError:
      spdlog::error("{}", message);
      break;
    case ErrorSeverity::kCritical:
      spdlog::critical("{}", message);
      break;
  }
}

}  // namespace

void setupErrorHandling(spdlog::level::level_enum level, bool log_to_file) {
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_level(level);
  std::vector<spdlog::sink_ptr> sinks = {console_sink};

  std::string file_error;
  if (log_to_file) {
    auto log_dir = Xdg::logDir();
    auto created = FileSystem::createDirectories(log_dir);
    if (created.has_value()) {
      try {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (log_dir / "error.log").string(), 1024 * 1024 * 5, 3);  // 5MB files, 3 backups
        file_sink->set_level(spdlog::level::debug);
        sinks.push_back(file_sink);
      } catch (const spdlog::spdlog_ex& e) {
        file_error = e.what();
      }
    } else {
      file_error = created.error().message();
    }
  }

  auto logger = std::make_shared<spdlog::logger>("omd", sinks.begin(), sinks.end());
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
  logger->set_level(log_to_file ? std::min(level, spdlog::level::debug) : level);
  spdlog::set_default_logger(logger);

  if (!file_error.empty()) {
    spdlog::warn("File logging disabled: {}", file_error);
  }

  ErrorHandler::instance().setErrorLogger(logContextualError);
}

Result<spdlog::level::level_enum> logLevelFromString(const std::string& name) {
  auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to "off"
  if (level == spdlog::level::off && name != "off") {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Unknown log level: " + name));
  }
  return level;
}

}  // namespace omd::util
