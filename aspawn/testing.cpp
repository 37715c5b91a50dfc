#include "testing.hpp"

#include "run_scheduler.hpp"

using std::function;

namespace aspawn {

void run_async_test(function<Task<>()>&& test)
{
  must_unit(RunScheduler::run(std::move(test)));
}

} // namespace aspawn
