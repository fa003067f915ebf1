#include "sortfeed/time.hh"

#include <caf/timestamp.hpp>

namespace sortfeed {

void convert(timespan s, double& secs) {
  secs = std::chrono::duration_cast<fractional_seconds>(s).count();
}

void convert(timespan s, std::string& str) {
  if (s == infinite) {
    str = "infinite";
    return;
  }
  str = std::to_string(s.count());
  str += "ns";
}

void convert(timestamp t, std::string& str) {
  str.clear();
  caf::append_timestamp_to_string(str, t);
}

timestamp now() {
  return clock::now();
}

} // namespace sortfeed
