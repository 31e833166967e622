#pragma once

#include <filesystem>
#include <string>

#include "omd/store/note_store.hpp"

namespace omd::store {

// Notes as plain files on disk
class FilesystemStore : public NoteStore {
 public:
  struct Config {
    std::string extension = ".md";
  };

  FilesystemStore() = default;
  explicit FilesystemStore(Config config);
  ~FilesystemStore() override = default;

  Result<std::vector<std::filesystem::path>> list(
      const std::vector<std::filesystem::path>& roots, bool recursive = true) override;
  Result<core::Note> load(const std::filesystem::path& path,
                          const core::ParseOptions& options = {}) override;
  Result<void> store(core::Note& note) override;

  const Config& config() const { return config_; }

 private:
  Config config_;
};

}  // namespace omd::store
