#include "backend/composite.hpp"

#include <algorithm>

namespace skillkit::backend {

CompositeBackend::CompositeBackend(std::shared_ptr<Backend> default_backend) : default_(std::move(default_backend)) {}

void CompositeBackend::add_route(std::string prefix, std::shared_ptr<Backend> backend) {
  prefix = normalize_virtual_path(prefix);
  if (prefix != "/") prefix += "/";
  routes_.push_back({std::move(prefix), std::move(backend)});
  std::stable_sort(routes_.begin(), routes_.end(), [](const Route &a, const Route &b) { return a.prefix.size() > b.prefix.size(); });
}

CompositeBackend::Target CompositeBackend::route(const std::string &path) const {
  std::string p = normalize_virtual_path(path);
  for (const auto &r : routes_) {
    // "/skills" addresses the route root just like "/skills/"
    std::string bare = r.prefix.substr(0, r.prefix.size() - 1);
    if (p == bare || p.compare(0, r.prefix.size(), r.prefix) == 0) {
      std::string rest = p == bare ? "/" : "/" + p.substr(r.prefix.size());
      return {r.backend.get(), rest, bare};
    }
  }
  return {default_.get(), p, ""};
}

std::string CompositeBackend::with_prefix(const std::string &prefix, const std::string &path) {
  if (prefix.empty()) return path;
  return path == "/" ? prefix : prefix + path;
}

Result<std::vector<FileInfo>> CompositeBackend::ls(const std::string &path) {
  auto target = route(path);
  auto result = target.backend->ls(target.path);
  if (result.ok()) {
    for (auto &info : *result.value) {
      info.path = with_prefix(target.prefix, info.path);
    }
  }

  // Route roots show up as directories when listing "/"
  if (result.ok() && normalize_virtual_path(path) == "/") {
    for (const auto &r : routes_) {
      std::string bare = r.prefix.substr(0, r.prefix.size() - 1);
      if (bare.empty() || bare.find('/', 1) != std::string::npos) continue;
      auto &entries = *result.value;
      bool listed = std::any_of(entries.begin(), entries.end(), [&](const FileInfo &f) { return f.path == bare; });
      if (!listed) entries.push_back({bare, true, 0});
    }
  }
  return result;
}

Result<std::string> CompositeBackend::read(const std::string &path) {
  auto target = route(path);
  return target.backend->read(target.path);
}

Result<size_t> CompositeBackend::write(const std::string &path, const std::string &content) {
  auto target = route(path);
  return target.backend->write(target.path, content);
}

Result<int> CompositeBackend::edit(const std::string &path, const std::string &old_str, const std::string &new_str, bool replace_all) {
  auto target = route(path);
  return target.backend->edit(target.path, old_str, new_str, replace_all);
}

Result<std::vector<std::string>> CompositeBackend::glob(const std::string &pattern, const std::string &path) {
  auto target = route(path);
  auto result = target.backend->glob(pattern, target.path);
  if (result.ok()) {
    for (auto &p : *result.value) {
      p = with_prefix(target.prefix, p);
    }
  }
  return result;
}

Result<std::vector<GrepMatch>> CompositeBackend::grep(const std::string &pattern, const std::string &path, const std::string &include) {
  auto target = route(path);
  auto result = target.backend->grep(pattern, target.path, include);
  if (result.ok()) {
    for (auto &match : *result.value) {
      match.path = with_prefix(target.prefix, match.path);
    }
  }
  return result;
}

}  // namespace skillkit::backend
