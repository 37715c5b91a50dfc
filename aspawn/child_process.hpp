#pragma once

#include <array>
#include <csignal>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "listeners.hpp"
#include "process_manager.hpp"
#include "stdio_stream.hpp"

#include "bee/error.hpp"
#include "bee/sub_process.hpp"

namespace aspawn {

enum class StdioMode {
  Pipe,
  Ignore,
  Inherit,
};

enum class ChildEvent {
  Spawn,
  Exit,
  Close,
  Error,
};

struct ChildProcessOptions {
  std::optional<std::string> cwd;

  // Replaces the whole environment when set.
  std::optional<std::map<std::string, std::string>> env;

  // stdin, stdout, stderr
  std::array<StdioMode, 3> stdio = {
    StdioMode::Pipe, StdioMode::Pipe, StdioMode::Pipe};
};

// The process could not be started.
struct LaunchError {
 public:
  // 0 when the failure did not come with an errno.
  int error_number = 0;

  // "ENOENT", or "UNKNOWN" when error_number is 0.
  std::string code;

  std::string syscall;

  std::string message;

  static LaunchError of_errno(
    const std::string& syscall, const std::string& command, int error_number);

  static LaunchError of_error(
    const std::string& syscall,
    const std::string& command,
    const bee::Error& error);

  bee::Error to_error() const;
};

// Handle of a child process. The process manager keeps it alive until the
// child is reaped; events are always delivered from the scheduler.
//
// Events:
//   spawn: the process started.
//   exit:  the process was reaped; exactly one of status and signal is set.
//   close: after exit, once every piped output stream has closed. Outputs
//          without a data listener are drained on exit.
//   error: the process could not be started. Nothing else follows.
struct ChildProcess : public std::enable_shared_from_this<ChildProcess> {
 public:
  using ptr = std::shared_ptr<ChildProcess>;

  using spawn_listener = std::function<void()>;
  using exit_listener = std::function<void(
    const std::optional<int>& status, const std::optional<std::string>& signal)>;
  using error_listener = std::function<void(const LaunchError& error)>;

  // Never fails synchronously; launch failures arrive as an error event.
  static ptr spawn(
    const std::string& command,
    const std::vector<std::string>& args,
    const ChildProcessOptions& options = {});

  ChildProcess(const ChildProcess& other) = delete;
  ChildProcess(ChildProcess&& other) = delete;

  ~ChildProcess();

  const std::string& command() const { return _command; }

  // Unset when the process failed to start.
  const std::optional<pid_t>& pid() const { return _pid; }

  // Null unless the stream is in Pipe mode and the process started.
  const WritableStream::ptr& stdin_stream() const { return _stdin; }
  const ReadableStream::ptr& stdout_stream() const { return _stdout; }
  const ReadableStream::ptr& stderr_stream() const { return _stderr; }

  ListenerId on_spawn(spawn_listener&& listener);

  ListenerId on_exit(exit_listener&& listener);
  ListenerId once_exit(exit_listener&& listener);

  ListenerId on_close(exit_listener&& listener);
  ListenerId once_close(exit_listener&& listener);

  ListenerId on_error(error_listener&& listener);
  ListenerId once_error(error_listener&& listener);

  bool remove_listener(ChildEvent event, ListenerId id);

  size_t listener_count(ChildEvent event) const;

  // Returns false when there is no running process to signal.
  bool kill(int signo = SIGTERM);
  bool kill(const std::string& signal);

  bool killed() const { return _killed; }
  bool has_exited() const { return _exited; }

  const std::optional<int>& exit_code() const { return _exit_code; }
  const std::optional<std::string>& signal_code() const { return _signal_code; }

 private:
  explicit ChildProcess(const std::string& command);

  std::optional<LaunchError> _launch(
    const std::vector<std::string>& args, const ChildProcessOptions& options);

  std::optional<LaunchError> _open_stream(
    int stdio_index, bee::FileDescriptor::shared_ptr&& parent_end);

  void _destroy_streams();

  void _handle_exit(const ExitStatus& status);
  void _maybe_emit_close();

  std::string _command;
  bee::SubProcess::ptr _process;
  std::optional<pid_t> _pid;

  WritableStream::ptr _stdin;
  ReadableStream::ptr _stdout;
  ReadableStream::ptr _stderr;

  Listeners<> _spawn_listeners;
  Listeners<std::optional<int>, std::optional<std::string>> _exit_listeners;
  Listeners<std::optional<int>, std::optional<std::string>> _close_listeners;
  Listeners<LaunchError> _error_listeners;

  std::optional<int> _exit_code;
  std::optional<std::string> _signal_code;

  bool _exited = false;
  bool _close_emitted = false;
  bool _killed = false;
};

} // namespace aspawn
