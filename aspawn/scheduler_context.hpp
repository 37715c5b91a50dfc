#pragma once

#include "scheduler.hpp"

namespace aspawn {

// Owns the scheduler of the current thread. Only one context may exist at a
// time and it can only be used from the thread that created it.
struct SchedulerContext {
 public:
  ~SchedulerContext();

  SchedulerContext(const SchedulerContext&) = delete;
  SchedulerContext(SchedulerContext&&);

  SchedulerContext& operator=(const SchedulerContext&) = delete;
  SchedulerContext& operator=(SchedulerContext&&) = delete;

  static Scheduler& scheduler();

  static bool is_active();

  static bee::OrError<SchedulerContext> create(Scheduler::ptr&& scheduler);

 private:
  explicit SchedulerContext(Scheduler::ptr&& scheduler);

  Scheduler::ptr _scheduler;
};

template <class F> void schedule(F&& callback)
{
  SchedulerContext::scheduler().schedule(std::forward<F>(callback));
}

template <class F> TimedTaskId after(const bee::Span& span, F&& callback)
{
  return SchedulerContext::scheduler().after(
    span, [callback = std::forward<F>(callback)]() mutable { callback(); });
}

void cancel(TimedTaskId task_id);

bee::OrError<> add_fd(
  const bee::FileDescriptor::shared_ptr& fd, std::function<void()>&& on_ready);

// No-op once the context is gone, so it is safe to call from destructors
// that run during scheduler teardown.
void remove_fd(const bee::FileDescriptor::shared_ptr& fd);

} // namespace aspawn
