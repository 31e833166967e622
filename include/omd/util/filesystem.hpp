#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "omd/common.hpp"

namespace omd::util {

// Writes a sibling temp file, then fsyncs and renames it over the target
class AtomicFileWriter {
 public:
  explicit AtomicFileWriter(const std::filesystem::path& target_path);
  ~AtomicFileWriter();

  // Non-copyable, movable
  AtomicFileWriter(const AtomicFileWriter&) = delete;
  AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;
  AtomicFileWriter(AtomicFileWriter&&) = default;
  AtomicFileWriter& operator=(AtomicFileWriter&&) = default;

  Result<void> write(const std::string& content);

  // Rename temp to target
  Result<void> commit();

  // Removes the temp file
  void cancel();

 private:
  std::filesystem::path target_path_;
  std::filesystem::path temp_path_;
  bool committed_;
  bool cancelled_;

  void cleanup();
};

class FileSystem {
 public:
  static Result<void> writeFileAtomic(const std::filesystem::path& path,
                                      const std::string& content);

  static Result<std::string> readFile(const std::filesystem::path& path);

  static Result<void> createDirectories(const std::filesystem::path& path);

  // Regular files below `path`, sorted. An empty extension matches every file.
  static Result<std::vector<std::filesystem::path>> listDirectory(
      const std::filesystem::path& path,
      const std::string& extension_filter = "",
      bool recursive = false);

 private:
  friend class AtomicFileWriter;

  static Result<void> syncPath(const std::filesystem::path& path);
};

}  // namespace omd::util
