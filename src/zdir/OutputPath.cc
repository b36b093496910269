#include "OutputPath.hh"

#include <inttypes.h>

#include <phosg/Strings.hh>
#include <vector>

using namespace std;

string normalize_catalog_path(const string& catalog_path) {
  string slashed = catalog_path;
  for (auto& ch : slashed) {
    if (ch == '\\') {
      ch = '/';
    }
  }

  vector<string> components;
  for (auto& component : phosg::split(slashed, '/')) {
    if (component.empty() || component == ".") {
      continue;
    }
    if (component == "..") {
      // A .. at the top level is dropped, not followed out of the root
      if (!components.empty()) {
        components.pop_back();
      }
      continue;
    }
    components.emplace_back(std::move(component));
  }
  string ret;
  for (const auto& component : components) {
    if (!ret.empty()) {
      ret += '/';
    }
    ret += component;
  }
  return ret;
}

string output_path_for_record(
    const DirectoryRecord& rec,
    const NameCatalog& catalog,
    const string& root) {
  auto it = catalog.find(rec.name_hash);
  if (it != catalog.end()) {
    string normalized = normalize_catalog_path(it->second);
    if (!normalized.empty()) {
      return root + "/" + normalized;
    }
  }
  return phosg::string_printf("%s/%s/%" PRIX32,
      root.c_str(), UNKNOWN_NAME_DIR, rec.local_offset);
}
