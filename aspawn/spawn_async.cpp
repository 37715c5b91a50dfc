#include "spawn_async.hpp"

#include "bee/format.hpp"

using std::nullopt;
using std::optional;
using std::source_location;
using std::string;
using std::vector;

namespace aspawn {
namespace {

string frame_of(const source_location& loc)
{
  return F(
    "    at $ ($:$:$)",
    loc.function_name(),
    loc.file_name(),
    loc.line(),
    loc.column());
}

struct SpawnState {
 public:
  using ptr = std::shared_ptr<SpawnState>;

  string command;
  optional<pid_t> pid;
  bool ignore_stdio;

  string stdout_text;
  string stderr_text;

  // Frames of the spawn_async call, innermost first.
  vector<string> call_site;

  Ivar<SpawnOutcome>::ptr outcome;

  string stitch_stack(
    const string& message,
    const source_location& completion = source_location::current()) const
  {
    string stack = F("Error: $\n$\n    ...", message, frame_of(completion));
    for (const auto& frame : call_site) { stack += "\n" + frame; }
    return stack;
  }

  void settle(SpawnOutcome&& result)
  {
    if (outcome->is_determined()) { return; }
    outcome->fill(std::move(result));
  }

  void on_launch_error(const LaunchError& error)
  {
    settle(SpawnOutcome(SpawnError{
      .kind = SpawnErrorKind::LaunchError,
      .pid = nullopt,
      .stdout_text = stdout_text,
      .stderr_text = stderr_text,
      .status = nullopt,
      .signal = nullopt,
      .code = error.code,
      .message = error.message,
      .stack = stitch_stack(error.message),
    }));
  }

  void on_termination(
    const optional<int>& status, const optional<string>& signal)
  {
    if (status == 0 && !signal.has_value()) {
      settle(SpawnOutcome(SpawnResult{
        .pid = *pid,
        .stdout_text = stdout_text,
        .stderr_text = stderr_text,
        .status = status,
        .signal = nullopt,
      }));
      return;
    }

    SpawnErrorKind kind;
    string message;
    if (signal.has_value()) {
      kind = SpawnErrorKind::SignalTermination;
      message = F("$ exited with signal: $", command, *signal);
    } else {
      kind = SpawnErrorKind::AbnormalExit;
      message = F("$ exited with non-zero code: $", command, *status);
    }

    settle(SpawnOutcome(SpawnError{
      .kind = kind,
      .pid = pid,
      .stdout_text = stdout_text,
      .stderr_text = stderr_text,
      .status = status,
      .signal = signal,
      .code = nullopt,
      .message = message,
      .stack = stitch_stack(message),
    }));
  }
};

} // namespace

////////////////////////////////////////////////////////////////////////////////
// SpawnOptions
//

ChildProcessOptions SpawnOptions::child_options() const
{
  return ChildProcessOptions{.cwd = cwd, .env = env, .stdio = stdio};
}

////////////////////////////////////////////////////////////////////////////////
// SpawnResult / SpawnError
//

std::array<string, 2> SpawnResult::output() const
{
  return {stdout_text, stderr_text};
}

std::array<string, 2> SpawnError::output() const
{
  return {stdout_text, stderr_text};
}

bee::Error SpawnError::to_error() const { return bee::Error(message); }

////////////////////////////////////////////////////////////////////////////////
// SpawnOutcome
//

SpawnOutcome::SpawnOutcome(SpawnResult&& result) : _outcome(std::move(result))
{}

SpawnOutcome::SpawnOutcome(SpawnError&& error) : _outcome(std::move(error)) {}

bool SpawnOutcome::is_error() const
{
  return std::holds_alternative<SpawnError>(_outcome);
}

const SpawnResult& SpawnOutcome::value() const
{
  return std::get<SpawnResult>(_outcome);
}

const SpawnError& SpawnOutcome::error() const
{
  return std::get<SpawnError>(_outcome);
}

bee::OrError<SpawnResult> SpawnOutcome::to_or_error() const
{
  if (is_error()) { return error().to_error(); }
  return value();
}

////////////////////////////////////////////////////////////////////////////////
// SpawnTask
//

SpawnTask::SpawnTask(
  const ChildProcess::ptr& child, const Ivar<SpawnOutcome>::ptr& outcome)
    : _child(child), _outcome(outcome)
{}

Ivar<SpawnOutcome>::Awaiter SpawnTask::operator co_await() const
{
  return Ivar<SpawnOutcome>::Awaiter{.ivar = _outcome};
}

////////////////////////////////////////////////////////////////////////////////
// spawn_async
//

SpawnTask spawn_async(
  const string& command,
  const vector<string>& args,
  const SpawnOptions& options,
  const source_location& caller)
{
  auto state = std::make_shared<SpawnState>();
  state->command = command;
  state->ignore_stdio = options.ignore_stdio;
  state->call_site = {frame_of(source_location::current()), frame_of(caller)};
  state->outcome = Ivar<SpawnOutcome>::create();

  auto child = ChildProcess::spawn(command, args, options.child_options());
  state->pid = child->pid();

  if (!state->ignore_stdio) {
    if (auto& out = child->stdout_stream()) {
      out->on_data(
        [state](const string& chunk) { state->stdout_text += chunk; });
    }
    if (auto& err = child->stderr_stream()) {
      err->on_data(
        [state](const string& chunk) { state->stderr_text += chunk; });
    }
  }

  child->once_error(
    [state](const LaunchError& error) { state->on_launch_error(error); });

  // Without capture, an output pipe may be held open by whoever the caller
  // piped it to, so only the exit is waited for.
  auto on_done = [state](
                   const optional<int>& status, const optional<string>& signal) {
    state->on_termination(status, signal);
  };
  if (state->ignore_stdio) {
    child->once_exit(std::move(on_done));
  } else {
    child->once_close(std::move(on_done));
  }

  return SpawnTask(child, state->outcome);
}

} // namespace aspawn
