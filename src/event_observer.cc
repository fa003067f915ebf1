#include "sortfeed/event_observer.hh"

namespace sortfeed {

event_observer::~event_observer() {}

} // namespace sortfeed
