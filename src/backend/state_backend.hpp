#pragma once

#include <map>
#include <mutex>
#include <string>

#include "backend/backend.hpp"

namespace skillkit::backend {

// In-memory session storage: the default read/write route of a turn.
// Directories are implied by the files below them.
class StateBackend : public Backend {
 public:
  Result<std::vector<FileInfo>> ls(const std::string &path) override;
  Result<std::string> read(const std::string &path) override;
  Result<size_t> write(const std::string &path, const std::string &content) override;
  Result<int> edit(const std::string &path, const std::string &old_str, const std::string &new_str, bool replace_all) override;
  Result<std::vector<std::string>> glob(const std::string &pattern, const std::string &path) override;
  Result<std::vector<GrepMatch>> grep(const std::string &pattern, const std::string &path, const std::string &include) override;

  // Snapshot of all stored files, keyed by normalized path
  std::map<std::string, std::string> files() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> files_;
};

}  // namespace skillkit::backend
