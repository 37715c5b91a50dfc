#pragma once

#include "scheduler.hpp"
#include "scheduler_context.hpp"

namespace aspawn {

struct SchedulerEpoll {
 public:
  static bee::OrError<Scheduler::ptr> create_direct();

  static bee::OrError<SchedulerContext> create_context();
};

} // namespace aspawn
