#pragma once

#include <functional>

#include "scheduler_context.hpp"
#include "task.hpp"

namespace aspawn {

struct RunScheduler {
 public:
  // Blocks SIGPIPE and creates the epoll scheduler context.
  static bee::OrError<SchedulerContext> create_context();

  // Runs the coroutine returned by fn and drives the loop until it finishes.
  static bee::OrError<> run(std::function<Task<>()>&& fn);

  static bee::OrError<> run(
    std::function<Task<>()>&& fn, SchedulerContext&& ctx);
};

} // namespace aspawn
