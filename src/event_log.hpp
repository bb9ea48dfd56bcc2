#pragma once
#include "event_bus.hpp"
#include <vector>

namespace fanrelay {

// Write one std::cerr line per lifecycle event ("[session] ...", "[relay] ...").
// The returned subscriptions detach the log when destroyed.
std::vector<ScopedSubscription> attach_event_log(EventBus& bus);

} // namespace fanrelay
