#include "Extract.hh"

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <memory>
#include <phosg/Strings.hh>

#include "OutputPath.hh"

using namespace std;

void make_parent_directories(const string& path) {
  for (size_t slash_pos = path.find('/', 1); slash_pos != string::npos;
       slash_pos = path.find('/', slash_pos + 1)) {
    string dir = path.substr(0, slash_pos);
    if (!mkdir(dir.c_str(), S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH)) {
      continue;
    }
    if (errno != EEXIST) {
      throw runtime_error(phosg::string_printf("cannot create directory %s: %s",
          dir.c_str(), phosg::string_for_error(errno).c_str()));
    }
    struct stat st;
    if (stat(dir.c_str(), &st) || !S_ISDIR(st.st_mode)) {
      throw runtime_error("cannot create directory " + dir + ": a file exists there");
    }
  }
}

ArchiveReader::ArchiveReader(const string& filename)
    : archive_filename(filename),
      fd(filename.c_str(), O_RDONLY) {}

void ArchiveReader::copy_range(FILE* out, uint64_t offset, uint64_t size) const {
  // preadx throws if the archive ends before the requested range does
  while (size > 0) {
    size_t bytes_to_read = min<uint64_t>(size, EXTRACT_BUFFER_SIZE);
    string chunk = phosg::preadx(this->fd, bytes_to_read, offset);
    phosg::fwritex(out, chunk);
    offset += chunk.size();
    size -= chunk.size();
  }
}

void ArchiveReader::extract(
    const string& output_filename, uint64_t offset, uint64_t size) const {
  make_parent_directories(output_filename);
  auto out = phosg::fopen_unique(output_filename, "wb");
  this->copy_range(out.get(), offset, size);
  if (fflush(out.get())) {
    throw runtime_error(phosg::string_printf("cannot write %s: %s",
        output_filename.c_str(), phosg::string_for_error(errno).c_str()));
  }
}

void extract_archive_slice(
    const string& archive_filename,
    const string& output_filename,
    uint64_t offset,
    uint64_t size) {
  ArchiveReader(archive_filename).extract(output_filename, offset, size);
}

record_extraction_error::record_extraction_error(
    size_t index, const string& output_path, const string& what)
    : runtime_error(output_path + ": " + what),
      index(index),
      output_path(output_path) {}

void extract_directory(
    const vector<DirectoryRecord>& records,
    const NameCatalog& catalog,
    const string& archive_filename,
    const string& output_root,
    FILE* report) {
  // Opened on the first record, so an empty directory never touches the
  // archive
  unique_ptr<ArchiveReader> archive;
  for (size_t x = 0; x < records.size(); x++) {
    const auto& rec = records[x];
    string output_path = output_path_for_record(rec, catalog, output_root);
    try {
      if (!archive) {
        archive = make_unique<ArchiveReader>(archive_filename);
      }
      archive->extract(output_path, rec.byte_offset(), rec.size);
    } catch (const exception& e) {
      throw record_extraction_error(x, output_path, e.what());
    }
    if (report) {
      fprintf(report, "%s\n", output_path.c_str());
      fflush(report);
    }
  }
}
