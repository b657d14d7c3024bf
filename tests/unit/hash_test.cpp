#include "internal/util/hash.hpp"

#include "internal/util/errors.hpp"

#include <cassert>
#include <iostream>

namespace {

using modelplan::util::Sha256;
using modelplan::util::Sha256Hex;

void TestKnownDigests() {
  assert(Sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  assert(Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

void TestIncrementalMatchesOneShot() {
  Sha256 hasher;
  hasher.Update("a");
  hasher.Update("bc");
  assert(hasher.HexDigest() == Sha256Hex("abc"));
}

void TestUseAfterDigestIsRejected() {
  Sha256 hasher;
  hasher.Update("abc");
  (void)hasher.HexDigest();

  bool threw = false;
  try {
    hasher.Update("more");
  } catch (const modelplan::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)hasher.HexDigest();
  } catch (const modelplan::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestKnownDigests();
  TestIncrementalMatchesOneShot();
  TestUseAfterDigestIsRejected();

  std::cout << "modelplan_unit_hash: pass\n";
  return 0;
}
