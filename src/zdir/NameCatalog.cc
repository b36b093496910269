#include "NameCatalog.hh"

#include <phosg/Filesystem.hh>
#include <phosg/Strings.hh>
#include <vector>

#include "Hash.hh"

using namespace std;

NameCatalog parse_name_catalog(const string& text) {
  vector<string> lines = phosg::split(text, '\n');
  // A terminating newline doesn't start another line
  if (!lines.empty() && lines.back().empty()) {
    lines.pop_back();
  }

  NameCatalog ret;
  for (auto& line : lines) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    uint32_t hash = zdir_name_hash(line);
    ret[hash] = std::move(line);
  }
  return ret;
}

NameCatalog load_name_catalog(const string& filename) {
  return parse_name_catalog(phosg::load_file(filename));
}
