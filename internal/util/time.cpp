#include "time.hpp"

namespace hosting::util {

TimePoint Now() {
  return Clock::now();
}

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
}

google::protobuf::Duration ToProto(std::chrono::milliseconds d) {
  auto sec   = std::chrono::duration_cast<std::chrono::seconds>(d);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(d - sec);

  google::protobuf::Duration out;
  out.set_seconds(sec.count());
  out.set_nanos(static_cast<int32_t>(nanos.count()));
  return out;
}

uint64_t ToMillis(Clock::duration d) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

} // namespace hosting::util
