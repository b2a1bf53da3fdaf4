#pragma once

#include <memory>

#include <BaseTracker.hpp>

std::unique_ptr<BaseTracker> make_tracker(const TrackerTarget& target, HttpTransport& transport,
                                          const Policy& policy, Logger& log);
