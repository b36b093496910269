#pragma once

#include <stdint.h>
#include <stdio.h>

#include <phosg/Filesystem.hh>
#include <stdexcept>
#include <string>
#include <vector>

#include "Directory.hh"
#include "NameCatalog.hh"

constexpr size_t EXTRACT_BUFFER_SIZE = 0x8000;

// Creates every directory above path (but not path itself). Existing
// directories are not an error.
void make_parent_directories(const std::string& path);

class ArchiveReader {
public:
  explicit ArchiveReader(const std::string& filename);
  ~ArchiveReader() = default;

  const std::string& filename() const {
    return this->archive_filename;
  }

  // Writes exactly size bytes starting at offset into out. Throws if the
  // archive ends before offset + size.
  void copy_range(FILE* out, uint64_t offset, uint64_t size) const;

  // Creates (or truncates) output_filename and its parent directories, then
  // copies the range into it. On failure the output file may be left empty or
  // partially written.
  void extract(
      const std::string& output_filename, uint64_t offset, uint64_t size) const;

private:
  std::string archive_filename;
  phosg::scoped_fd fd;
};

void extract_archive_slice(
    const std::string& archive_filename,
    const std::string& output_filename,
    uint64_t offset,
    uint64_t size);

class record_extraction_error : public std::runtime_error {
public:
  record_extraction_error(
      size_t index, const std::string& output_path, const std::string& what);

  size_t index;
  std::string output_path;
};

// Extracts every record in order, writing each output path to report (if not
// null) as soon as it's done. Stops at the first failure by throwing
// record_extraction_error; files already written are left in place.
void extract_directory(
    const std::vector<DirectoryRecord>& records,
    const NameCatalog& catalog,
    const std::string& archive_filename,
    const std::string& output_root,
    FILE* report);
