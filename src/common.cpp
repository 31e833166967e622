#include "omd/common.hpp"

#include <sstream>

namespace omd {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kFileReadError:
      return "File read error";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kDirectoryNotFound:
      return "Directory not found";
    case ErrorCode::kDirectoryCreateError:
      return "Directory create error";
    case ErrorCode::kInvalidFrontmatter:
      return "Invalid frontmatter";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kInvalidState:
      return "Invalid state";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
#ifdef OMD_VERSION_BUILD
  return Version{OMD_VERSION_MAJOR, OMD_VERSION_MINOR, OMD_VERSION_PATCH, OMD_VERSION_BUILD};
#else
  return Version{OMD_VERSION_MAJOR, OMD_VERSION_MINOR, OMD_VERSION_PATCH, ""};
#endif
}

}  // namespace omd
