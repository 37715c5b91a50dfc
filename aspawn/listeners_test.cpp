#include <cassert>
#include <string>
#include <vector>

#include "listeners.hpp"

#include "bee/format.hpp"
#include "bee/testing.hpp"

using std::string;
using std::vector;

namespace aspawn {
namespace {

TEST(every_listener_sees_the_event)
{
  Listeners<string> listeners;
  vector<string> seen;
  listeners.add([&](const string& s) { seen.push_back("a:" + s); });
  listeners.add([&](const string& s) { seen.push_back("b:" + s); });

  listeners.emit("x");
  listeners.emit("y");

  assert((seen == vector<string>{"a:x", "b:x", "a:y", "b:y"}));
}

TEST(once_fires_once)
{
  Listeners<> listeners;
  int calls = 0;
  listeners.once([&]() { calls++; });
  assert(listeners.size() == 1);

  listeners.emit();
  listeners.emit();

  assert(calls == 1);
  assert(listeners.empty());
}

TEST(remove_by_id)
{
  Listeners<int> listeners;
  int sum = 0;
  auto id = listeners.add([&](int v) { sum += v; });
  listeners.add([&](int v) { sum += 10 * v; });

  assert(listeners.remove(id));
  assert(!listeners.remove(id));

  listeners.emit(2);
  assert(sum == 20);
}

TEST(listener_added_during_emit_waits_for_next_emit)
{
  Listeners<> listeners;
  int late_calls = 0;
  listeners.once([&]() { listeners.add([&]() { late_calls++; }); });

  listeners.emit();
  assert(late_calls == 0);

  listeners.emit();
  assert(late_calls == 1);
}

TEST(listener_removed_during_emit_is_skipped)
{
  Listeners<> listeners;
  vector<string> calls;
  ListenerId second(0);
  listeners.add([&]() {
    calls.push_back("first");
    listeners.remove(second);
  });
  second = listeners.add([&]() { calls.push_back("second"); });
  listeners.add([&]() { calls.push_back("third"); });

  listeners.emit();
  assert((calls == vector<string>{"first", "third"}));
  assert(listeners.size() == 2);
  P("calls: $", calls.size());
}

TEST(clear_during_emit_stops_delivery)
{
  Listeners<int> listeners;
  int calls = 0;
  listeners.add([&](int) {
    calls++;
    listeners.clear();
  });
  listeners.add([&](int) { calls++; });

  listeners.emit(1);
  assert(calls == 1);
  assert(listeners.empty());
}

TEST(once_listener_emitting_again_runs_once)
{
  Listeners<> listeners;
  int calls = 0;
  listeners.once([&]() {
    calls++;
    listeners.emit();
  });

  listeners.emit();
  assert(calls == 1);
}

} // namespace
} // namespace aspawn
