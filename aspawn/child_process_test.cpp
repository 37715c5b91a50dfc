#include <cassert>
#include <cerrno>
#include <optional>
#include <string>
#include <vector>

#include "child_process.hpp"
#include "ivar.hpp"
#include "testing.hpp"

#include "bee/format.hpp"

using std::optional;
using std::string;
using std::vector;

namespace aspawn {
namespace {

struct Termination {
  optional<int> status;
  optional<string> signal;
};

ChildProcess::exit_listener fill_termination(Ivar<Termination>::ptr ivar)
{
  return [ivar](const optional<int>& status, const optional<string>& signal) {
    ivar->fill(Termination{.status = status, .signal = signal});
  };
}

Ivar<Termination>::ptr exited_of(const ChildProcess::ptr& child)
{
  auto ivar = Ivar<Termination>::create();
  child->once_exit(fill_termination(ivar));
  return ivar;
}

Ivar<Termination>::ptr closed_of(const ChildProcess::ptr& child)
{
  auto ivar = Ivar<Termination>::create();
  child->once_close(fill_termination(ivar));
  return ivar;
}

ASPAWN_TEST(events_in_order)
{
  auto child = ChildProcess::spawn("echo", {"hello world"});
  assert(child->pid().has_value());
  assert(child->stdout_stream() != nullptr);

  vector<string> events;
  child->on_spawn([&]() { events.push_back("spawn"); });
  child->on_exit([&](const optional<int>& status, const optional<string>&) {
    events.push_back(F("exit $", status.value_or(-1)));
  });
  child->on_error([&](const LaunchError&) { events.push_back("error"); });

  string output;
  child->stdout_stream()->on_data(
    [&](const string& chunk) { output += chunk; });

  auto done = co_await closed_of(child);
  events.push_back("close");

  assert((events == vector<string>{"spawn", "exit 0", "close"}));
  assert(done.status == 0 && !done.signal.has_value());
  assert(output == "hello world\n");
  assert(child->has_exited());
  assert(child->exit_code() == 0);
  P("$", output);
}

ASPAWN_TEST(launch_error_is_an_event)
{
  auto child = ChildProcess::spawn("aspawn-no-such-program", {});
  assert(!child->pid().has_value());
  assert(child->stdin_stream() == nullptr);
  assert(child->stdout_stream() == nullptr);

  int spawns = 0;
  child->on_spawn([&]() { spawns++; });
  auto error = Ivar<LaunchError>::create();
  child->on_error([error](const LaunchError& e) { error->fill(e); });

  auto e = co_await error;
  assert(e.code == "ENOENT");
  assert(e.error_number == ENOENT);
  assert(e.message == "spawn aspawn-no-such-program ENOENT");
  assert(spawns == 0);
  assert(!child->kill());
}

ASPAWN_TEST(bad_cwd_is_a_launch_error)
{
  auto child = ChildProcess::spawn(
    "true", {}, {.cwd = "/aspawn/does/not/exist"});
  auto error = Ivar<LaunchError>::create();
  child->once_error([error](const LaunchError& e) { error->fill(e); });

  auto e = co_await error;
  assert(e.code == "ENOENT");
}

ASPAWN_TEST(program_is_looked_up_on_the_replacement_path)
{
  auto child = ChildProcess::spawn(
    "echo",
    {"unreachable"},
    {.env = std::map<string, string>{{"PATH", "/aspawn/empty/bin"}}});
  auto error = Ivar<LaunchError>::create();
  child->once_error([error](const LaunchError& e) { error->fill(e); });

  auto e = co_await error;
  assert(e.code == "ENOENT");
  assert(!child->pid().has_value());
  P("$", e.message);
}

ASPAWN_TEST(kill_by_name)
{
  auto child = ChildProcess::spawn("sleep", {"10"});
  auto done = exited_of(child);

  assert(child->kill("SIGKILL"));
  assert(child->killed());
  assert(!child->kill("SIGBOGUS"));

  auto t = co_await done;
  assert(!t.status.has_value());
  assert(t.signal == "SIGKILL");
  assert(child->signal_code() == "SIGKILL");
  assert(!child->kill());
}

ASPAWN_TEST(stdin_reaches_the_child)
{
  auto child = ChildProcess::spawn("cat", {});
  string output;
  child->stdout_stream()->on_data(
    [&](const string& chunk) { output += chunk; });
  auto done = closed_of(child);

  assert(child->stdin_stream()->write("through cat\n"));
  child->stdin_stream()->end();

  auto t = co_await done;
  assert(t.status == 0);
  assert(output == "through cat\n");
}

ASPAWN_TEST(ignored_and_inherited_stdio_have_no_streams)
{
  auto child = ChildProcess::spawn(
    "true",
    {},
    {.stdio = {StdioMode::Ignore, StdioMode::Ignore, StdioMode::Inherit}});
  assert(child->stdin_stream() == nullptr);
  assert(child->stdout_stream() == nullptr);
  assert(child->stderr_stream() == nullptr);

  // Nothing to drain, so close follows exit directly.
  auto t = co_await closed_of(child);
  assert(t.status == 0);
}

ASPAWN_TEST(close_waits_for_outputs)
{
  // The grandchild keeps stdout open after the child exits.
  auto child = ChildProcess::spawn("sh", {"-c", "(sleep 0.2; echo late) &"});
  string output;
  child->stdout_stream()->on_data(
    [&](const string& chunk) { output += chunk; });

  auto exited = exited_of(child);
  auto closed = closed_of(child);

  co_await exited;
  assert(!closed->is_determined());
  assert(output.empty());

  co_await closed;
  assert(output == "late\n");
}

ASPAWN_TEST(close_fires_when_nobody_reads_the_outputs)
{
  auto child = ChildProcess::spawn("sh", {"-c", "echo out; echo err >&2"});
  auto closed = closed_of(child);

  auto t = co_await closed;
  assert(t.status == 0);
  assert(!child->stdout_stream()->has_consumer());
  assert(child->stdout_stream()->is_closed());
  assert(child->stderr_stream()->is_closed());
  P("closed with status $", t.status.value_or(-1));
}

ASPAWN_TEST(exit_leaves_a_consumed_output_alone)
{
  auto child = ChildProcess::spawn("echo", {"kept"});
  string output;
  child->stdout_stream()->on_data(
    [&](const string& chunk) { output += chunk; });
  child->stdout_stream()->pause();

  co_await exited_of(child);
  co_await after(bee::Span::of_seconds(0.01));
  assert(!child->stdout_stream()->is_flowing());
  assert(output.empty());

  auto closed = closed_of(child);
  child->stdout_stream()->resume();
  co_await closed;
  assert(output == "kept\n");
}

ASPAWN_TEST(listener_bookkeeping)
{
  auto child = ChildProcess::spawn("true", {});
  auto id = child->on_exit([](const optional<int>&, const optional<string>&) {
    assert(false && "removed listener called");
  });
  child->once_exit([](const optional<int>&, const optional<string>&) {});
  assert(child->listener_count(ChildEvent::Exit) == 2);

  assert(child->remove_listener(ChildEvent::Exit, id));
  assert(!child->remove_listener(ChildEvent::Exit, id));
  assert(child->listener_count(ChildEvent::Exit) == 1);
  assert(child->listener_count(ChildEvent::Close) == 0);

  co_await exited_of(child);
  assert(child->listener_count(ChildEvent::Exit) == 0);
}

ASPAWN_TEST(manager_releases_reaped_children)
{
  must(manager, ProcessManager::current());
  auto child = ChildProcess::spawn("true", {});
  assert(manager->num_watched() == 1);

  co_await exited_of(child);
  assert(manager->num_watched() == 0);
}

} // namespace
} // namespace aspawn
