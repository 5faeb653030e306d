#include "time.hpp"

namespace claims::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t NowMs() {
  return ToUnixMillis(Now());
}

uint64_t SystemTimeSource::NowMs() const {
  return util::NowMs();
}

} // namespace claims::util
