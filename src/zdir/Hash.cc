#include "Hash.hh"

using namespace std;

uint32_t zdir_name_hash(const void* data, size_t size) {
  const uint8_t* bytes = reinterpret_cast<const uint8_t*>(data);
  uint32_t hash = 0xFFFFFFFF;
  for (size_t x = 0; x < size; x++) {
    hash = 33 * hash + bytes[x];
  }
  return hash;
}

uint32_t zdir_name_hash(const string& name) {
  return zdir_name_hash(name.data(), name.size());
}
