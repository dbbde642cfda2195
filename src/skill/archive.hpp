#pragma once

#include <filesystem>
#include <string>
#include <vector>

struct archive;

namespace skillkit::skill::archive {

enum class EntryType { File, Directory, Other };

struct ZipEntry {
  std::string path;  // As stored in the archive
  EntryType type = EntryType::File;
};

// List all entries of an in-memory zip. Throws IoFailure if the bytes are
// not a readable zip archive.
std::vector<ZipEntry> list_entries(const std::string &bytes);

// Reject absolute paths, drive letters, ".." segments (with "\" treated as
// a separator) and anything that is neither a file nor a directory.
// Throws ValidationError naming the first offending entry.
void check_entries(const std::vector<ZipEntry> &entries);

// Extract an in-memory zip below dest. Entries are checked first, so a bad
// entry aborts before anything is written.
void extract(const std::string &bytes, const std::filesystem::path &dest);

// Streaming zip writer over libarchive
class ZipWriter {
 public:
  explicit ZipWriter(const std::filesystem::path &out);
  ~ZipWriter();

  ZipWriter(const ZipWriter &) = delete;
  ZipWriter &operator=(const ZipWriter &) = delete;

  void add_directory(const std::string &name);
  void add_file(const std::string &name, const std::string &content);
  void add_file_from(const std::string &name, const std::filesystem::path &source);

  // Finish the archive. Throws IoFailure if the trailer cannot be written.
  void close();

 private:
  void write_entry(const std::string &name, bool is_dir, const std::string &content);

  ::archive *archive_ = nullptr;
  std::filesystem::path out_;
};

// Zip every file and directory below source_dir under "<root_name>/..."
void write_directory(const std::filesystem::path &source_dir, const std::string &root_name, const std::filesystem::path &out);

}  // namespace skillkit::skill::archive
