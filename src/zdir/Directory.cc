#include "Directory.hh"

#include <errno.h>
#include <inttypes.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <phosg/Encoding.hh>
#include <phosg/Filesystem.hh>
#include <phosg/Strings.hh>

using namespace std;

size_t record_size_for_format(DirectoryFormat format) {
  return static_cast<size_t>(format);
}

const char* name_for_format(DirectoryFormat format) {
  switch (format) {
    case DirectoryFormat::CANONICAL:
      return "12-byte";
    case DirectoryFormat::EXTENDED:
      return "24-byte";
  }
  throw logic_error("invalid directory format");
}

DirectoryFormat detect_directory_format(uint64_t file_size) {
  if (file_size % record_size_for_format(DirectoryFormat::EXTENDED) == 0) {
    return DirectoryFormat::EXTENDED;
  } else if (file_size % record_size_for_format(DirectoryFormat::CANONICAL) == 0) {
    return DirectoryFormat::CANONICAL;
  }
  throw invalid_format(phosg::string_printf(
      "invalid directory size (0x%" PRIX64 " bytes)", file_size));
}

DirectoryFormat detect_directory_format(const string& filename) {
  struct stat st;
  if (stat(filename.c_str(), &st)) {
    throw runtime_error(phosg::string_printf("cannot stat %s: %s",
        filename.c_str(), phosg::string_for_error(errno).c_str()));
  }
  return detect_directory_format(static_cast<uint64_t>(st.st_size));
}

static void check_directory_size(const string& data, DirectoryFormat format) {
  size_t record_size = record_size_for_format(format);
  if (data.size() % record_size) {
    throw invalid_format(phosg::string_printf(
        "directory size (0x%zX bytes) is not a multiple of %zu",
        data.size(), record_size));
  }
}

vector<DirectoryRecord> parse_directory(const string& data) {
  check_directory_size(data, DirectoryFormat::CANONICAL);

  phosg::StringReader r(data.data(), data.size());
  vector<DirectoryRecord> ret;
  ret.reserve(data.size() / record_size_for_format(DirectoryFormat::CANONICAL));
  while (!r.eof()) {
    auto& rec = ret.emplace_back();
    rec.name_hash = r.get_u32l();
    rec.local_offset = r.get_u32l();
    rec.size = r.get_u32l();
  }
  return ret;
}

vector<ExtendedDirectoryRecord> parse_extended_directory(const string& data) {
  check_directory_size(data, DirectoryFormat::EXTENDED);

  phosg::StringReader r(data.data(), data.size());
  vector<ExtendedDirectoryRecord> ret;
  ret.reserve(data.size() / record_size_for_format(DirectoryFormat::EXTENDED));
  while (!r.eof()) {
    auto& rec = ret.emplace_back();
    rec.name_hash = r.get_u32l();
    rec.archive_id = r.get_u32l();
    rec.local_offset = r.get_u32l();
    rec.total_offset = r.get_u32l();
    rec.size = r.get_u32l();
    rec.checksum = r.get_u32l();
  }
  return ret;
}

vector<DirectoryRecord> load_directory(const string& filename) {
  return parse_directory(phosg::load_file(filename));
}

AnyDirectory load_directory_any(const string& filename) {
  string data = phosg::load_file(filename);
  if (detect_directory_format(data.size()) == DirectoryFormat::EXTENDED) {
    return parse_extended_directory(data);
  }
  return parse_directory(data);
}
