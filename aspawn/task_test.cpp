#include <cassert>
#include <string>
#include <vector>

#include "task.hpp"
#include "testing.hpp"

using bee::Span;
using std::string;
using std::vector;

namespace aspawn {
namespace {

Task<string> get_string() { co_return "this is the string"; }

Task<string> get_slow_string()
{
  co_await after(Span::of_seconds(0.05));
  co_return "slow";
}

ASPAWN_TEST(eager_tasks_complete_synchronously)
{
  auto task = get_string();
  assert(task.done());
  auto str = co_await task;
  assert(str == "this is the string");
}

ASPAWN_TEST(awaiting_a_suspended_task)
{
  auto task = get_slow_string();
  assert(!task.done());
  auto str = co_await task;
  assert(str == "slow");
  P("$ and $", co_await get_string(), str);
}

ASPAWN_TEST(void_task)
{
  int calls = 0;
  auto f = [&]() -> Task<> {
    calls++;
    co_return;
  };
  auto g = [&]() -> Task<> { co_await f(); };

  co_await g();
  assert(calls == 1);
}

ASPAWN_TEST(timers_fire_in_deadline_order)
{
  vector<int> order;
  aspawn::after(Span::of_seconds(0.03), [&]() { order.push_back(3); });
  aspawn::after(Span::of_seconds(0.01), [&]() { order.push_back(1); });
  auto id =
    aspawn::after(Span::of_seconds(0.02), [&]() { order.push_back(2); });
  cancel(id);

  co_await after(Span::of_seconds(0.05));
  assert((order == vector<int>{1, 3}));
}

} // namespace
} // namespace aspawn
