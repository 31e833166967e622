#pragma once

#include <filesystem>
#include <string>

namespace omd::util {

// XDG Base Directory Specification utilities
class Xdg {
 public:
  // ~/.local/share/omd
  static std::filesystem::path dataHome();

  // ~/.config/omd
  static std::filesystem::path configHome();

  static std::filesystem::path configFile();

  static std::filesystem::path logDir();

 private:
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace omd::util
