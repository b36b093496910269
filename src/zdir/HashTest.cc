#include <stdio.h>

#include <phosg/UnitTest.hh>
#include <string>

#include "Hash.hh"

using namespace std;

int main(int, char**) {
  fprintf(stderr, "-- known values\n");
  expect_eq(0xFFFFFFFFU, zdir_name_hash(""));
  expect_eq(0x00000040U, zdir_name_hash("a"));
  expect_eq(0x000008A2U, zdir_name_hash("ab"));
  expect_eq(0x89EE9D53U, zdir_name_hash("sound/test.wav"));
  expect_eq(0x03CE7A80U, zdir_name_hash("sound\\test.wav"));

  fprintf(stderr, "-- bytes are unsigned\n");
  expect_eq(0x000000DEU, zdir_name_hash("\xFF"));
  const uint8_t high_byte = 0xFF;
  expect_eq(0x000000DEU, zdir_name_hash(&high_byte, 1));

  fprintf(stderr, "-- deterministic and order-sensitive\n");
  string name = "DATA\\CARS\\VIPER\\CAR.VIV";
  expect_eq(zdir_name_hash(name), zdir_name_hash(name));
  expect_eq(zdir_name_hash(name), zdir_name_hash(name.data(), name.size()));
  expect(zdir_name_hash(name) != zdir_name_hash(name + "x"));
  expect(zdir_name_hash("ab") != zdir_name_hash("ba"));
  expect(zdir_name_hash("ab") != zdir_name_hash("AB"));

  fprintf(stderr, "All tests passed\n");
  return 0;
}
