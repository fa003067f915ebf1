#include "sortfeed/event_sink.hh"

namespace sortfeed {

event_sink::~event_sink() {
  // nop
}

} // namespace sortfeed
