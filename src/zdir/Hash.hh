#pragma once

#include <stdint.h>
#include <sys/types.h>

#include <string>

// Filenames in a ZDIR are identified by this hash of their full original path
// (backslash-separated, case preserved). Each byte is treated as unsigned.
uint32_t zdir_name_hash(const void* data, size_t size);
uint32_t zdir_name_hash(const std::string& name);
