#include <cassert>
#include <chrono>
#include <iostream>
#include <set>
#include <string>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

bool IsHex(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

void TestNewIdIsCanonicalV4() {
  std::set<std::string> seen;
  for (int i = 0; i < 1000; ++i) {
    const auto id = buildq::util::NewId();
    assert(id.size() == 36);
    for (std::size_t pos = 0; pos < id.size(); ++pos) {
      if (pos == 8 || pos == 13 || pos == 18 || pos == 23) {
        assert(id[pos] == '-');
      } else {
        assert(IsHex(id[pos]));
      }
    }
    assert(id[14] == '4');
    assert(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
    seen.insert(id);
  }
  assert(seen.size() == 1000);
}

void TestTimestampConversions() {
  const auto tp = buildq::util::FromUnixMillis(1'700'000'000'123);
  assert(buildq::util::ToUnixMillis(tp) == 1'700'000'000'123);
  assert(buildq::util::ToUnixMicros(tp) == 1'700'000'000'123'000);

  const auto ts = buildq::util::ToProto(tp);
  assert(ts.seconds() == 1'700'000'000);
  assert(ts.nanos() == 123'000'000);
  assert(buildq::util::FromProto(ts) == tp);
}

void TestDurationTruncatesToMillis() {
  google::protobuf::Duration d;
  d.set_seconds(2);
  d.set_nanos(999'999);
  assert(buildq::util::ToDuration(d) == std::chrono::milliseconds(2000));

  d.set_seconds(0);
  d.set_nanos(25'000'000);
  assert(buildq::util::ToDuration(d) == std::chrono::milliseconds(25));
}

} // namespace

int main() {
  TestNewIdIsCanonicalV4();
  TestTimestampConversions();
  TestDurationTruncatesToMillis();

  std::cout << "buildq_unit_util: pass\n";
  return 0;
}
