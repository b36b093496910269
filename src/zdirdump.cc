#include <inttypes.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>

#include <phosg/Strings.hh>
#include <string>
#include <vector>

#include "zdir/Directory.hh"
#include "zdir/Extract.hh"
#include "zdir/NameCatalog.hh"
#include "zdir/OutputPath.hh"

using namespace std;

static const char* DEFAULT_NAMES_FILENAME = "files.list";

void print_usage(const char* argv0) {
  const char* progname = strrchr(argv0, '/');
  progname = progname ? (progname + 1) : argv0;
  printf("Usage: %s <ZDIR> <ZZDATA>\n", progname);
  printf("Usage: %s <ZDIR> <ZZDATA0> <ZZDATA1> <ZZDATA2> ...\n", progname);
  printf("Usage: %s <ZDIR> <ZZDATA{0..3}> ...\n", progname);
  printf("\n\
Options:\n\
  -h, --help: Show this message.\n\
  --names=FILE: Read known filenames from FILE, one per line (default:\n\
      %s in the current directory, if it exists).\n\
  --output-dir=DIR: Write extracted files under DIR (default: %s).\n\
  --list: Print the hash, block offset, size and output path of each entry\n\
      instead of extracting anything.\n\
  --detect-format: Check whether the directory uses 12-byte or 24-byte\n\
      records before reading it. Only 12-byte directories can be extracted.\n\
\n", DEFAULT_NAMES_FILENAME, DEFAULT_OUTPUT_ROOT);
}

static bool file_exists(const char* filename) {
  struct stat st;
  return stat(filename, &st) == 0;
}

int main(int argc, char* argv[]) {
  const char* names_filename = nullptr;
  string output_root = DEFAULT_OUTPUT_ROOT;
  bool list_only = false;
  bool detect_format = false;
  vector<const char*> positional_args;
  for (int x = 1; x < argc; x++) {
    if (!strcmp(argv[x], "-h") || !strcmp(argv[x], "--help")) {
      print_usage(argv[0]);
      return 0;
    } else if (!strncmp(argv[x], "--names=", 8)) {
      names_filename = &argv[x][8];
    } else if (!strncmp(argv[x], "--output-dir=", 13)) {
      output_root = &argv[x][13];
      while (output_root.size() > 1 && output_root.back() == '/') {
        output_root.pop_back();
      }
    } else if (!strcmp(argv[x], "--list")) {
      list_only = true;
    } else if (!strcmp(argv[x], "--detect-format")) {
      detect_format = true;
    } else if (argv[x][0] == '-' && argv[x][1] != '\0') {
      fprintf(stderr, "Error: unknown command line option: %s\n", argv[x]);
      return 1;
    } else {
      positional_args.emplace_back(argv[x]);
    }
  }

  if (positional_args.size() < 2) {
    print_usage(argv[0]);
    return 1;
  }
  const char* directory_filename = positional_args[0];
  const char* archive_filename = positional_args[1];
  if (positional_args.size() > 2) {
    fprintf(stderr, "> note: only %s is read; %zu additional archive(s) ignored\n",
        archive_filename, positional_args.size() - 2);
  }

  vector<DirectoryRecord> records;
  try {
    if (detect_format) {
      DirectoryFormat format = detect_directory_format(directory_filename);
      fprintf(stderr, "> format: %s records\n", name_for_format(format));
      auto dir = load_directory_any(directory_filename);
      if (!holds_alternative<vector<DirectoryRecord>>(dir)) {
        throw logic_error("extended directory records are not supported");
      }
      records = std::move(get<vector<DirectoryRecord>>(dir));
    } else {
      records = load_directory(directory_filename);
    }
  } catch (const exception& e) {
    fprintf(stderr, "Error: failed to load headers: %s\n", e.what());
    return 1;
  }
  fprintf(stderr, "> directory: %zu records (%s)\n", records.size(),
      name_for_format(DirectoryFormat::CANONICAL));

  NameCatalog catalog;
  try {
    if (names_filename) {
      catalog = load_name_catalog(names_filename);
    } else if (file_exists(DEFAULT_NAMES_FILENAME)) {
      names_filename = DEFAULT_NAMES_FILENAME;
      catalog = load_name_catalog(names_filename);
    } else {
      fprintf(stderr, "> warning: %s not found; all entries will be unnamed\n",
          DEFAULT_NAMES_FILENAME);
    }
  } catch (const exception& e) {
    fprintf(stderr, "Error: failed to load names: %s\n", e.what());
    return 1;
  }
  if (names_filename) {
    fprintf(stderr, "> names: %zu entries from %s\n", catalog.size(), names_filename);
  }

  if (list_only) {
    for (const auto& rec : records) {
      string output_path = output_path_for_record(rec, catalog, output_root);
      printf("%08" PRIX32 " %08" PRIX32 " %08" PRIX32 " %s\n",
          rec.name_hash, rec.local_offset, rec.size, output_path.c_str());
    }
    return 0;
  }

  try {
    extract_directory(records, catalog, archive_filename, output_root, stdout);
  } catch (const exception& e) {
    fprintf(stderr, "Error: %s\n", e.what());
    return 1;
  }

  return 0;
}
