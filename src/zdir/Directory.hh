#pragma once

#include <stdint.h>

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

class invalid_format : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Offsets in the directory are in 2KB blocks
constexpr uint8_t ZDIR_BLOCK_SHIFT = 11;

struct DirectoryRecord {
  uint32_t name_hash;
  uint32_t local_offset; // In blocks; see byte_offset()
  uint32_t size;

  uint64_t byte_offset() const {
    return static_cast<uint64_t>(this->local_offset) << ZDIR_BLOCK_SHIFT;
  }
};

// Used when the data is split across several ZZDATA files. archive_id selects
// the file; nothing extracts from these yet.
struct ExtendedDirectoryRecord {
  uint32_t name_hash;
  uint32_t archive_id;
  uint32_t local_offset;
  uint32_t total_offset;
  uint32_t size;
  uint32_t checksum;
};

enum class DirectoryFormat {
  CANONICAL = 12,
  EXTENDED = 24,
};

size_t record_size_for_format(DirectoryFormat format);
const char* name_for_format(DirectoryFormat format);

// Every multiple of 24 is also a multiple of 12; the extended format wins
// ties. Throws invalid_format if neither record size divides file_size.
DirectoryFormat detect_directory_format(uint64_t file_size);
DirectoryFormat detect_directory_format(const std::string& filename);

std::vector<DirectoryRecord> parse_directory(const std::string& data);
std::vector<ExtendedDirectoryRecord> parse_extended_directory(
    const std::string& data);

// Records are returned in file order, which is also extraction order.
std::vector<DirectoryRecord> load_directory(const std::string& filename);

typedef std::variant<
    std::vector<DirectoryRecord>,
    std::vector<ExtendedDirectoryRecord>>
    AnyDirectory;

AnyDirectory load_directory_any(const std::string& filename);
