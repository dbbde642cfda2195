#include "skill/archive.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <memory>
#include <sstream>

#include "core/error.hpp"

namespace skillkit::skill::archive {

namespace fs = std::filesystem;

namespace {

std::string error_string(::archive *a) {
  const char *msg = archive_error_string(a);
  return msg ? msg : "unknown error";
}

struct ReadArchiveDeleter {
  void operator()(::archive *a) const {
    archive_read_free(a);
  }
};

using ReadArchive = std::unique_ptr<::archive, ReadArchiveDeleter>;

ReadArchive open_zip(const std::string &bytes) {
  ReadArchive a(archive_read_new());
  if (!a) {
    throw IoFailure("Cannot allocate archive reader");
  }
  archive_read_support_format_zip(a.get());
  if (archive_read_open_memory(a.get(), bytes.data(), bytes.size()) != ARCHIVE_OK) {
    throw IoFailure("Not a readable zip archive: " + error_string(a.get()));
  }
  return a;
}

// Returns false at end of archive
bool next_header(::archive *a, archive_entry **entry) {
  int r = archive_read_next_header(a, entry);
  if (r == ARCHIVE_EOF) return false;
  if (r < ARCHIVE_WARN) {
    throw IoFailure("Corrupt zip archive: " + error_string(a));
  }
  return true;
}

EntryType entry_type(archive_entry *entry) {
  switch (archive_entry_filetype(entry)) {
    case AE_IFREG:
      return EntryType::File;
    case AE_IFDIR:
      return EntryType::Directory;
    default:
      return EntryType::Other;
  }
}

std::string normalize_separators(std::string path) {
  std::replace(path.begin(), path.end(), '\\', '/');
  return path;
}

std::vector<std::string> split_segments(const std::string &path) {
  std::vector<std::string> segments;
  std::istringstream iss(path);
  std::string seg;
  while (std::getline(iss, seg, '/')) {
    segments.push_back(seg);
  }
  return segments;
}

}  // namespace

// ============================================================================
// Reading
// ============================================================================

std::vector<ZipEntry> list_entries(const std::string &bytes) {
  auto a = open_zip(bytes);
  std::vector<ZipEntry> entries;
  archive_entry *entry = nullptr;
  while (next_header(a.get(), &entry)) {
    const char *name = archive_entry_pathname(entry);
    entries.push_back({name ? name : "", entry_type(entry)});
    archive_read_data_skip(a.get());
  }
  return entries;
}

void check_entries(const std::vector<ZipEntry> &entries) {
  for (const auto &entry : entries) {
    std::string path = normalize_separators(entry.path);
    if (path.empty()) {
      throw ValidationError("ZIP contains an entry with an empty path");
    }
    if (path[0] == '/' || (path.size() >= 2 && path[1] == ':')) {
      throw ValidationError("ZIP contains an unsafe absolute path: " + entry.path);
    }
    auto segments = split_segments(path);
    if (std::find(segments.begin(), segments.end(), "..") != segments.end()) {
      throw ValidationError("ZIP contains a path traversal segment: " + entry.path);
    }
    if (entry.type == EntryType::Other) {
      throw ValidationError("ZIP contains an unsupported entry type (only files and directories): " + entry.path);
    }
  }
}

void extract(const std::string &bytes, const fs::path &dest) {
  check_entries(list_entries(bytes));

  fs::path root = dest.lexically_normal();
  auto a = open_zip(bytes);
  archive_entry *entry = nullptr;
  while (next_header(a.get(), &entry)) {
    const char *name = archive_entry_pathname(entry);
    std::string rel = normalize_separators(name ? name : "");
    fs::path target = (root / rel).lexically_normal();

    auto check = target.lexically_relative(root);
    if (check.empty() || *check.begin() == "..") {
      throw ValidationError("ZIP entry escapes the extraction directory: " + rel);
    }

    if (entry_type(entry) == EntryType::Directory) {
      fs::create_directories(target);
      continue;
    }

    fs::create_directories(target.parent_path());
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw IoFailure("Cannot create file while extracting: " + target.string());
    }

    char buffer[16384];
    la_ssize_t n = 0;
    while ((n = archive_read_data(a.get(), buffer, sizeof(buffer))) > 0) {
      out.write(buffer, n);
    }
    if (n < 0) {
      throw IoFailure("Failed to read zip entry " + rel + ": " + error_string(a.get()));
    }
    if (!out.good()) {
      throw IoFailure("Failed to write extracted file: " + target.string());
    }
  }
}

// ============================================================================
// ZipWriter
// ============================================================================

ZipWriter::ZipWriter(const fs::path &out) : archive_(archive_write_new()), out_(out) {
  if (!archive_) {
    throw IoFailure("Cannot allocate archive writer");
  }
  if (archive_write_set_format_zip(archive_) != ARCHIVE_OK || archive_write_open_filename(archive_, out.string().c_str()) != ARCHIVE_OK) {
    std::string reason = error_string(archive_);
    archive_write_free(archive_);
    archive_ = nullptr;
    throw IoFailure("Cannot open zip for writing " + out.string() + ": " + reason);
  }
}

ZipWriter::~ZipWriter() {
  if (archive_) {
    archive_write_free(archive_);
  }
}

void ZipWriter::write_entry(const std::string &name, bool is_dir, const std::string &content) {
  if (!archive_) {
    throw IoFailure("Zip writer already closed: " + out_.string());
  }

  std::unique_ptr<archive_entry, decltype(&archive_entry_free)> entry(archive_entry_new(), &archive_entry_free);
  archive_entry_set_pathname(entry.get(), name.c_str());
  archive_entry_set_filetype(entry.get(), is_dir ? AE_IFDIR : AE_IFREG);
  archive_entry_set_perm(entry.get(), is_dir ? 0755 : 0644);
  archive_entry_set_size(entry.get(), is_dir ? 0 : static_cast<la_int64_t>(content.size()));

  if (archive_write_header(archive_, entry.get()) < ARCHIVE_WARN) {
    throw IoFailure("Failed to write zip header for " + name + ": " + error_string(archive_));
  }
  if (!is_dir && !content.empty()) {
    if (archive_write_data(archive_, content.data(), content.size()) < 0) {
      throw IoFailure("Failed to write zip data for " + name + ": " + error_string(archive_));
    }
  }
}

void ZipWriter::add_directory(const std::string &name) {
  write_entry(name, true, "");
}

void ZipWriter::add_file(const std::string &name, const std::string &content) {
  write_entry(name, false, content);
}

void ZipWriter::add_file_from(const std::string &name, const fs::path &source) {
  std::ifstream in(source, std::ios::binary);
  if (!in.is_open()) {
    throw IoFailure("Cannot read file for zip: " + source.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  write_entry(name, false, ss.str());
}

void ZipWriter::close() {
  if (!archive_) return;
  int r = archive_write_close(archive_);
  std::string reason = (r != ARCHIVE_OK) ? error_string(archive_) : "";
  archive_write_free(archive_);
  archive_ = nullptr;
  if (r != ARCHIVE_OK) {
    throw IoFailure("Failed to finish zip " + out_.string() + ": " + reason);
  }
}

void write_directory(const fs::path &source_dir, const std::string &root_name, const fs::path &out) {
  std::vector<fs::path> paths;
  for (const auto &entry : fs::recursive_directory_iterator(source_dir)) {
    paths.push_back(entry.path());
  }
  std::sort(paths.begin(), paths.end());

  ZipWriter writer(out);
  for (const auto &path : paths) {
    std::string arcname = (fs::path(root_name) / path.lexically_relative(source_dir)).generic_string();
    if (fs::is_directory(path)) {
      writer.add_directory(arcname);
    } else if (fs::is_regular_file(path)) {
      writer.add_file_from(arcname, path);
    } else {
      spdlog::warn("Skipping non-regular file during export: {}", path.string());
    }
  }
  writer.close();
}

}  // namespace skillkit::skill::archive
