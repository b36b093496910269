#pragma once

#include <string>

#include "Directory.hh"
#include "NameCatalog.hh"

constexpr const char* DEFAULT_OUTPUT_ROOT = "EXTRACTED";
constexpr const char* UNKNOWN_NAME_DIR = "__UNKNOWN__";

// Converts a backslash-separated catalog path into a relative path using
// '/'. Empty and "." components are dropped and ".." removes the component
// before it; a ".." with nothing left to remove is dropped, so the result
// never leaves the directory it's joined onto. May return an empty string.
std::string normalize_catalog_path(const std::string& catalog_path);

// Never fails: records whose hash isn't in the catalog go to
// <root>/__UNKNOWN__/<local_offset in hex>.
std::string output_path_for_record(
    const DirectoryRecord& rec,
    const NameCatalog& catalog,
    const std::string& root = DEFAULT_OUTPUT_ROOT);
