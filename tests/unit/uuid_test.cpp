#include "internal/util/uuid.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>

namespace {

bool IsLowerHex(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

void TestCanonicalVersionFourForm() {
  for (int i = 0; i < 64; ++i) {
    const auto id = fieldwake::util::NewUUIDString();
    assert(id.size() == 36);
    for (std::size_t pos = 0; pos < id.size(); ++pos) {
      if (pos == 8 || pos == 13 || pos == 18 || pos == 23) {
        assert(id[pos] == '-');
      } else {
        assert(IsLowerHex(id[pos]));
      }
    }
    assert(id[14] == '4');
    assert(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
  }
}

void TestIdsDoNotRepeat() {
  std::set<std::string> seen;
  for (int i = 0; i < 1000; ++i) assert(seen.insert(fieldwake::util::NewUUIDString()).second);
}

} // namespace

int main() {
  TestCanonicalVersionFourForm();
  TestIdsDoNotRepeat();

  std::cout << "fieldwake_unit_uuid: pass\n";
  return 0;
}
