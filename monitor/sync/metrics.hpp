#pragma once

#include <monitor/satellite/logger.hpp>

#include <string>
#include <vector>

namespace monitor::sync {

#if defined(MONITOR_METRICS)
inline const bool kCollectMetrics = true;
#else
inline const bool kCollectMetrics = false;
#endif

inline const std::vector<std::string> kMetrics{"Acquisitions",
                                               "Conditional acquisitions",
                                               "Predicate checks",
                                               "Failed predicate checks",
                                               "Suspensions",
                                               "Wakeup broadcasts",
                                               "Timeouts",
                                               "Poisonings"};

//////////////////////////////////////////////////////////////////////////////////////////

using Logger = satellite::Logger<kCollectMetrics>;

}  // namespace monitor::sync
