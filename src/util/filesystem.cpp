#include "omd/util/filesystem.hpp"

#include <algorithm>
#include <fstream>
#include <random>

#include <fcntl.h>
#include <unistd.h>

namespace omd::util {

AtomicFileWriter::AtomicFileWriter(const std::filesystem::path& target_path)
    : target_path_(target_path), committed_(false), cancelled_(false) {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(100000, 999999);

  temp_path_ = target_path_;
  temp_path_ += ".tmp." + std::to_string(dis(gen));
}

AtomicFileWriter::~AtomicFileWriter() {
  if (!committed_ && !cancelled_) {
    cleanup();
  }
}

Result<void> AtomicFileWriter::write(const std::string& content) {
  if (committed_ || cancelled_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Writer already used"));
  }

  std::ofstream file(temp_path_, std::ios::binary);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot create temporary file: " + temp_path_.string()));
  }

  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  file.close();
  if (!file) {
    cleanup();
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Failed to write temporary file: " + temp_path_.string()));
  }
  return {};
}

Result<void> AtomicFileWriter::commit() {
  if (committed_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Already committed"));
  }
  if (cancelled_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Operation cancelled"));
  }

  auto parent = target_path_.parent_path();
  if (!parent.empty()) {
    auto created = FileSystem::createDirectories(parent);
    if (!created.has_value()) {
      cleanup();
      return created;
    }
  }

  auto synced = FileSystem::syncPath(temp_path_);
  if (!synced.has_value()) {
    cleanup();
    return synced;
  }

  std::error_code ec;
  std::filesystem::rename(temp_path_, target_path_, ec);
  if (ec) {
    cleanup();
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Atomic rename failed: " + ec.message()));
  }
  committed_ = true;

  // Persist the rename itself
  if (!parent.empty()) {
    return FileSystem::syncPath(parent);
  }
  return {};
}

void AtomicFileWriter::cancel() {
  if (!committed_) {
    cancelled_ = true;
    cleanup();
  }
}

void AtomicFileWriter::cleanup() {
  std::error_code ec;
  std::filesystem::remove(temp_path_, ec);
}

Result<void> FileSystem::writeFileAtomic(const std::filesystem::path& path,
                                         const std::string& content) {
  AtomicFileWriter writer(path);

  auto write_result = writer.write(content);
  if (!write_result.has_value()) {
    return write_result;
  }
  return writer.commit();
}

Result<std::string> FileSystem::readFile(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Not a readable file: " + path.string()));
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Cannot open file: " + path.string()));
  }

  file.seekg(0, std::ios::end);
  auto size = file.tellg();
  if (size < 0) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Cannot get file size: " + path.string()));
  }
  file.seekg(0, std::ios::beg);

  std::string content(static_cast<size_t>(size), '\0');
  file.read(content.data(), size);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Read failed: " + path.string()));
  }
  return content;
}

Result<void> FileSystem::createDirectories(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                     "Cannot create directory " + path.string() + ": " +
                                         ec.message()));
  }
  return {};
}

Result<std::vector<std::filesystem::path>> FileSystem::listDirectory(
    const std::filesystem::path& path, const std::string& extension_filter, bool recursive) {
  std::error_code ec;
  if (!std::filesystem::is_directory(path, ec)) {
    return std::unexpected(makeError(ErrorCode::kDirectoryNotFound,
                                     "Not a directory: " + path.string()));
  }

  std::vector<std::filesystem::path> results;
  auto collect = [&](const std::filesystem::directory_entry& entry) {
    std::error_code entry_ec;
    if (entry.is_regular_file(entry_ec) && !entry_ec) {
      if (extension_filter.empty() || entry.path().extension() == extension_filter) {
        results.push_back(entry.path());
      }
    }
  };

  if (recursive) {
    std::filesystem::recursive_directory_iterator it(path, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
      std::error_code entry_ec;
      // Hidden directories (.obsidian, .git, .trash) are skipped
      if (it->is_directory(entry_ec) && it->path().filename().string().starts_with(".")) {
        it.disable_recursion_pending();
        continue;
      }
      collect(*it);
    }
  } else {
    std::filesystem::directory_iterator it(path, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
      collect(*it);
    }
  }
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kDirectoryNotFound,
                                     "Cannot list directory " + path.string() + ": " +
                                         ec.message()));
  }

  std::sort(results.begin(), results.end());
  return results;
}

Result<void> FileSystem::syncPath(const std::filesystem::path& path) {
  int fd = open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot open for sync: " + path.string()));
  }
  int rc = fsync(fd);
  close(fd);
  if (rc < 0) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Sync failed: " + path.string()));
  }
  return {};
}

}  // namespace omd::util
