#include <stdio.h>

#include <phosg/UnitTest.hh>
#include <string>

#include "Hash.hh"
#include "NameCatalog.hh"
#include "OutputPath.hh"

using namespace std;

int main(int, char**) {
  NameCatalog catalog = parse_name_catalog(
      "sound\\test.wav\n"
      "DATA\\CARS\\VIPER\\CAR.VIV\n"
      "plain.txt\n"
      "..\\..\\etc\\passwd\n"
      "\\\\server\\.\\share\\\\file.bin\n"
      "..\\.\n"
      "sound\\old\\..\\new.wav\n");

  fprintf(stderr, "-- path normalization\n");
  expect_eq(string("sound/test.wav"), normalize_catalog_path("sound\\test.wav"));
  expect_eq(string("a/b/c"), normalize_catalog_path("a\\b/c"));
  expect_eq(string("a/b"), normalize_catalog_path("\\a\\\\.\\b\\"));
  expect_eq(string("etc/passwd"), normalize_catalog_path("..\\..\\etc\\passwd"));
  expect_eq(string("b"), normalize_catalog_path("a\\..\\b"));
  expect_eq(string("DATA/b.bin"), normalize_catalog_path("DATA\\x\\y\\..\\..\\b.bin"));
  expect_eq(string("b"), normalize_catalog_path("a\\..\\..\\..\\b"));
  expect_eq(string(""), normalize_catalog_path("a\\.."));
  expect_eq(string(""), normalize_catalog_path(""));
  expect_eq(string(""), normalize_catalog_path("..\\."));

  fprintf(stderr, "-- known names\n");
  {
    DirectoryRecord rec = {zdir_name_hash("sound\\test.wav"), 0, 16};
    expect_eq(string("EXTRACTED/sound/test.wav"), output_path_for_record(rec, catalog));
  }
  {
    DirectoryRecord rec = {zdir_name_hash("DATA\\CARS\\VIPER\\CAR.VIV"), 7, 100};
    expect_eq(string("EXTRACTED/DATA/CARS/VIPER/CAR.VIV"), output_path_for_record(rec, catalog));
    expect_eq(string("out/DATA/CARS/VIPER/CAR.VIV"), output_path_for_record(rec, catalog, "out"));
  }
  {
    DirectoryRecord rec = {zdir_name_hash("plain.txt"), 7, 100};
    expect_eq(string("EXTRACTED/plain.txt"), output_path_for_record(rec, catalog));
  }

  fprintf(stderr, "-- names can't escape the output directory\n");
  {
    DirectoryRecord rec = {zdir_name_hash("..\\..\\etc\\passwd"), 1, 1};
    expect_eq(string("EXTRACTED/etc/passwd"), output_path_for_record(rec, catalog));
  }
  {
    DirectoryRecord rec = {zdir_name_hash("\\\\server\\.\\share\\\\file.bin"), 1, 1};
    expect_eq(string("EXTRACTED/server/share/file.bin"), output_path_for_record(rec, catalog));
  }
  {
    DirectoryRecord rec = {zdir_name_hash("..\\."), 0x3F, 1};
    expect_eq(string("EXTRACTED/__UNKNOWN__/3F"), output_path_for_record(rec, catalog));
  }

  {
    DirectoryRecord rec = {zdir_name_hash("sound\\old\\..\\new.wav"), 1, 1};
    expect_eq(string("EXTRACTED/sound/new.wav"), output_path_for_record(rec, catalog));
  }

  fprintf(stderr, "-- unknown names\n");
  {
    DirectoryRecord rec = {0xDEADBEEF, 0x2A, 16};
    expect(!catalog.count(rec.name_hash));
    expect_eq(string("EXTRACTED/__UNKNOWN__/2A"), output_path_for_record(rec, catalog));
  }
  {
    DirectoryRecord rec = {0xDEADBEEF, 0, 16};
    expect_eq(string("EXTRACTED/__UNKNOWN__/0"), output_path_for_record(rec, catalog));
  }
  {
    DirectoryRecord rec = {0xDEADBEEF, 0x00ABCDEF, 16};
    expect_eq(string("EXTRACTED/__UNKNOWN__/ABCDEF"), output_path_for_record(rec, catalog));
  }
  {
    DirectoryRecord rec = {0xDEADBEEF, 0xFFFFFFFF, 16};
    expect_eq(string("x/__UNKNOWN__/FFFFFFFF"), output_path_for_record(rec, catalog, "x"));
  }
  {
    DirectoryRecord rec = {zdir_name_hash("sound\\test.wav"), 0x2A, 16};
    expect_eq(string("EXTRACTED/__UNKNOWN__/2A"), output_path_for_record(rec, NameCatalog()));
  }

  fprintf(stderr, "All tests passed\n");
  return 0;
}
