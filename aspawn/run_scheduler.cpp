#include "run_scheduler.hpp"

#include "scheduler_epoll.hpp"

#include "bee/signal.hpp"

using std::function;

namespace aspawn {

bee::OrError<SchedulerContext> RunScheduler::create_context()
{
  bail_unit(bee::Signal::block_signal(bee::SignalCode::SigPipe));
  return SchedulerEpoll::create_context();
}

bee::OrError<> RunScheduler::run(function<Task<>()>&& fn)
{
  bail(ctx, create_context());
  return run(std::move(fn), std::move(ctx));
}

bee::OrError<> RunScheduler::run(
  function<Task<>()>&& fn, SchedulerContext&& ctx)
{
  auto task = fn();
  return ctx.scheduler().wait_until([&]() { return task.done(); });
}

} // namespace aspawn
