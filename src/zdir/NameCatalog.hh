#pragma once

#include <stdint.h>

#include <string>
#include <unordered_map>

// Maps zdir_name_hash(path) -> path. When two lines hash to the same value,
// the later line wins.
typedef std::unordered_map<uint32_t, std::string> NameCatalog;

NameCatalog parse_name_catalog(const std::string& text);
NameCatalog load_name_catalog(const std::string& filename);
