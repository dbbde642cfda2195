#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "backend/backend.hpp"

namespace skillkit::backend {

// Dispatches each operation to the backend with the longest matching route
// prefix. The prefix is stripped before the call and added back to every
// path in the result. Paths matching no route go to the default backend.
class CompositeBackend : public Backend {
 public:
  explicit CompositeBackend(std::shared_ptr<Backend> default_backend);

  // prefix like "/skills/"; a trailing slash is added when missing
  void add_route(std::string prefix, std::shared_ptr<Backend> backend);

  Result<std::vector<FileInfo>> ls(const std::string &path) override;
  Result<std::string> read(const std::string &path) override;
  Result<size_t> write(const std::string &path, const std::string &content) override;
  Result<int> edit(const std::string &path, const std::string &old_str, const std::string &new_str, bool replace_all) override;
  Result<std::vector<std::string>> glob(const std::string &pattern, const std::string &path) override;
  Result<std::vector<GrepMatch>> grep(const std::string &pattern, const std::string &path, const std::string &include) override;

 private:
  struct Route {
    std::string prefix;  // "/skills/"
    std::shared_ptr<Backend> backend;
  };

  struct Target {
    Backend *backend;
    std::string path;    // Path as seen by the backend
    std::string prefix;  // "" for the default backend, else "/skills"
  };

  Target route(const std::string &path) const;

  static std::string with_prefix(const std::string &prefix, const std::string &path);

  std::shared_ptr<Backend> default_;
  std::vector<Route> routes_;  // Longest prefix first
};

}  // namespace skillkit::backend
