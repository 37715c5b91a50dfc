#pragma once

#include <array>
#include <map>
#include <optional>
#include <source_location>
#include <string>
#include <variant>
#include <vector>

#include <sys/types.h>

#include "child_process.hpp"
#include "ivar.hpp"

#include "bee/error.hpp"

namespace aspawn {

struct SpawnOptions {
 public:
  // Output is neither accumulated nor waited for; the result settles on exit.
  bool ignore_stdio = false;

  std::optional<std::string> cwd;
  std::optional<std::map<std::string, std::string>> env;
  std::array<StdioMode, 3> stdio = {
    StdioMode::Pipe, StdioMode::Pipe, StdioMode::Pipe};

  ChildProcessOptions child_options() const;
};

struct SpawnResult {
 public:
  pid_t pid;

  std::string stdout_text;
  std::string stderr_text;

  std::optional<int> status;
  std::optional<std::string> signal;

  // {stdout, stderr}
  std::array<std::string, 2> output() const;
};

enum class SpawnErrorKind {
  LaunchError,
  AbnormalExit,
  SignalTermination,
};

struct SpawnError {
 public:
  SpawnErrorKind kind;

  // Unset for launch errors.
  std::optional<pid_t> pid;

  std::string stdout_text;
  std::string stderr_text;

  std::optional<int> status;
  std::optional<std::string> signal;

  // Launch error code such as "ENOENT".
  std::optional<std::string> code;

  std::string message;

  // The message, the frame that observed the failure, a "    ..." line, then
  // the frames of the spawn_async call.
  std::string stack;

  std::array<std::string, 2> output() const;

  bee::Error to_error() const;
};

struct SpawnOutcome {
 public:
  explicit SpawnOutcome(SpawnResult&& result);
  explicit SpawnOutcome(SpawnError&& error);

  bool is_error() const;

  const SpawnResult& value() const;
  const SpawnError& error() const;

  bee::OrError<SpawnResult> to_or_error() const;

 private:
  std::variant<SpawnResult, SpawnError> _outcome;
};

// Returned by spawn_async. The child handle is usable right away; awaiting
// the task yields the outcome once the process is done. It can be awaited any
// number of times.
struct SpawnTask {
 public:
  SpawnTask(
    const ChildProcess::ptr& child, const Ivar<SpawnOutcome>::ptr& outcome);

  const ChildProcess::ptr& child() const { return _child; }

  bool is_settled() const { return _outcome->is_determined(); }

  Ivar<SpawnOutcome>::Awaiter operator co_await() const;

 private:
  ChildProcess::ptr _child;
  Ivar<SpawnOutcome>::ptr _outcome;
};

SpawnTask spawn_async(
  const std::string& command,
  const std::vector<std::string>& args = {},
  const SpawnOptions& options = {},
  const std::source_location& caller = std::source_location::current());

} // namespace aspawn
