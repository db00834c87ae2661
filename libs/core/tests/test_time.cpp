#include "kj/test.h"
#include "portico/core/time.h"

using namespace portico::core;

namespace {

KJ_TEST("Time: format_iso8601 renders UTC with milliseconds") {
  auto date = kj::UNIX_EPOCH + 1700000000123 * kj::MILLISECONDS;
  KJ_EXPECT(format_iso8601(date) == "2023-11-14T22:13:20.123Z", format_iso8601(date));
  KJ_EXPECT(format_iso8601(kj::UNIX_EPOCH) == "1970-01-01T00:00:00.000Z");
}

KJ_TEST("Time: now_unix_ms follows the calendar clock") {
  auto before = (kj::systemPreciseCalendarClock().now() - kj::UNIX_EPOCH) / kj::MILLISECONDS;
  auto now = now_unix_ms();
  auto after = (kj::systemPreciseCalendarClock().now() - kj::UNIX_EPOCH) / kj::MILLISECONDS;
  KJ_EXPECT(before <= now && now <= after);
}

KJ_TEST("Time: generate_id is epoch-ms, a dash and nine base36 characters") {
  auto start = now_unix_ms();
  auto id = generate_id();

  KJ_IF_SOME(dash, id.findFirst('-')) {
    auto millis = kj::heapString(id.asArray().first(dash)).parseAs<int64_t>();
    KJ_EXPECT(millis >= start);

    auto suffix = id.slice(dash + 1);
    KJ_EXPECT(suffix.size() == 9, id);
    for (char c : suffix) {
      KJ_EXPECT((c >= '0' && c <= '9') || (c >= 'a' && c <= 'z'), id);
    }
  } else {
    KJ_FAIL_EXPECT("id without a dash", id);
  }

  KJ_EXPECT(generate_id() != generate_id());
}

} // namespace
