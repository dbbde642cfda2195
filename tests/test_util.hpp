#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "skill/archive.hpp"

namespace skillkit::testing {

// Unique temporary directory, removed on destruction
class TempDir {
 public:
  TempDir() {
    path_ = std::filesystem::temp_directory_path() /
            ("skillkit_test_" + std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())) + "_" +
             std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  const std::filesystem::path &path() const {
    return path_;
  }

  std::string str() const {
    return path_.string();
  }

  // Create a file with content under this temp dir
  std::filesystem::path create_file(const std::string &relative_path, const std::string &content) {
    std::filesystem::path full = path_ / relative_path;
    std::filesystem::create_directories(full.parent_path());
    std::ofstream ofs(full, std::ios::binary);
    ofs << content;
    return full;
  }

 private:
  std::filesystem::path path_;
};

inline std::string read_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

inline std::string skill_md(const std::string &name, const std::string &description, const std::string &extra = "",
                            const std::string &body = "# Instructions\n") {
  return "---\nname: " + name + "\ndescription: " + description + "\n" + extra + "---\n" + body;
}

using ZipFiles = std::vector<std::pair<std::string, std::string>>;

// Build a zip in memory from (entry name, content) pairs; names ending
// in "/" become directories
inline std::string make_zip(const std::filesystem::path &scratch, const ZipFiles &files) {
  auto out = scratch / ("archive_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".zip");
  {
    skill::archive::ZipWriter writer(out);
    for (const auto &[name, content] : files) {
      if (!name.empty() && name.back() == '/') {
        writer.add_directory(name);
      } else {
        writer.add_file(name, content);
      }
    }
    writer.close();
  }
  std::string bytes = read_file(out);
  std::filesystem::remove(out);
  return bytes;
}

}  // namespace skillkit::testing
