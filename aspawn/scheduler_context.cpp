#include "scheduler_context.hpp"

#include <cassert>
#include <stdexcept>
#include <thread>

namespace aspawn {
namespace {

Scheduler*& current_scheduler()
{
  static Scheduler* scheduler = nullptr;
  return scheduler;
}

std::thread::id& owner_thread()
{
  static std::thread::id id;
  return id;
}

} // namespace

Scheduler::~Scheduler() {}

////////////////////////////////////////////////////////////////////////////////
// SchedulerContext
//

SchedulerContext::SchedulerContext(Scheduler::ptr&& scheduler)
    : _scheduler(std::move(scheduler))
{}

SchedulerContext::SchedulerContext(SchedulerContext&& other)
    : _scheduler(std::move(other._scheduler))
{}

SchedulerContext::~SchedulerContext()
{
  if (_scheduler == nullptr) { return; }
  assert(current_scheduler() == _scheduler.get());
  _scheduler->close();
  current_scheduler() = nullptr;
}

bee::OrError<SchedulerContext> SchedulerContext::create(
  Scheduler::ptr&& scheduler)
{
  if (current_scheduler() != nullptr) {
    return bee::Error("A scheduler context already exists");
  }
  current_scheduler() = scheduler.get();
  owner_thread() = std::this_thread::get_id();
  return SchedulerContext(std::move(scheduler));
}

Scheduler& SchedulerContext::scheduler()
{
  auto scheduler = current_scheduler();
  if (scheduler == nullptr) {
    throw std::runtime_error("No scheduler initialized");
  }
  if (std::this_thread::get_id() != owner_thread()) {
    throw std::runtime_error("Scheduler called from the wrong thread");
  }
  return *scheduler;
}

bool SchedulerContext::is_active() { return current_scheduler() != nullptr; }

void cancel(TimedTaskId task_id)
{
  SchedulerContext::scheduler().cancel(task_id);
}

bee::OrError<> add_fd(
  const bee::FileDescriptor::shared_ptr& fd, std::function<void()>&& on_ready)
{
  return SchedulerContext::scheduler().add_fd(fd, std::move(on_ready));
}

void remove_fd(const bee::FileDescriptor::shared_ptr& fd)
{
  if (!SchedulerContext::is_active()) { return; }
  SchedulerContext::scheduler().remove_fd(fd);
}

} // namespace aspawn
