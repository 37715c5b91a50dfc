#include "child_process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

#include "scheduler_context.hpp"
#include "signal_names.hpp"

#include "bee/fd.hpp"
#include "bee/file_path.hpp"
#include "bee/format.hpp"

using bee::FileDescriptor;
using bee::SubProcess;
using std::nullopt;
using std::optional;
using std::string;
using std::vector;
using std::weak_ptr;

namespace aspawn {
namespace {

bool is_executable_file(const string& path)
{
  struct stat st;
  if (stat(path.c_str(), &st) == -1) { return false; }
  return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

// SubProcess only learns that exec failed from the child's exit status, so
// the errno a launch would hit is worked out before spawning.
optional<int> launch_errno(
  const string& command, const ChildProcessOptions& options)
{
  if (options.cwd.has_value()) {
    struct stat st;
    if (stat(options.cwd->c_str(), &st) == -1) { return errno; }
    if (!S_ISDIR(st.st_mode)) { return ENOTDIR; }
  }

  if (command.find('/') != string::npos) {
    auto path = command;
    if (command[0] != '/' && options.cwd.has_value()) {
      path = F("$/$", *options.cwd, command);
    }
    if (is_executable_file(path)) { return nullopt; }
    return access(path.c_str(), F_OK) == 0 ? EACCES : ENOENT;
  }

  string search_path = "/usr/local/bin:/usr/bin:/bin";
  if (options.env.has_value()) {
    auto it = options.env->find("PATH");
    if (it != options.env->end()) { search_path = it->second; }
  } else if (const char* path_env = getenv("PATH")) {
    search_path = path_env;
  }

  bool found_unexecutable = false;
  size_t begin = 0;
  while (begin <= search_path.size()) {
    size_t end = search_path.find(':', begin);
    if (end == string::npos) { end = search_path.size(); }
    auto dir = search_path.substr(begin, end - begin);
    begin = end + 1;
    if (dir.empty()) { continue; }

    auto candidate = F("$/$", dir, command);
    if (is_executable_file(candidate)) { return nullopt; }
    if (access(candidate.c_str(), F_OK) == 0) { found_unexecutable = true; }
  }
  return found_unexecutable ? EACCES : ENOENT;
}

// Children only get the ends handed to them through the stdio specs.
bee::OrError<> set_cloexec(const FileDescriptor::shared_ptr& fd)
{
  if (fcntl(fd->int_fd(), F_SETFD, FD_CLOEXEC) == -1) {
    shot("Failed to set FD_CLOEXEC: $", strerror(errno));
  }
  return bee::ok();
}

} // namespace

////////////////////////////////////////////////////////////////////////////////
// LaunchError
//

LaunchError LaunchError::of_errno(
  const string& syscall, const string& command, int error_number)
{
  auto code = errno_code(error_number);
  return LaunchError{
    .error_number = error_number,
    .code = code,
    .syscall = syscall,
    .message = F("$ $ $", syscall, command, code),
  };
}

LaunchError LaunchError::of_error(
  const string& syscall, const string& command, const bee::Error& error)
{
  return LaunchError{
    .error_number = 0,
    .code = "UNKNOWN",
    .syscall = syscall,
    .message = F("$ $: $", syscall, command, error),
  };
}

bee::Error LaunchError::to_error() const { return bee::Error(message); }

////////////////////////////////////////////////////////////////////////////////
// ChildProcess
//

ChildProcess::ChildProcess(const string& command) : _command(command) {}

ChildProcess::~ChildProcess() {}

ChildProcess::ptr ChildProcess::spawn(
  const string& command,
  const vector<string>& args,
  const ChildProcessOptions& options)
{
  auto child = ptr(new ChildProcess(command));
  auto error = child->_launch(args, options);
  if (error.has_value()) {
    child->_destroy_streams();
    schedule([child, error = std::move(*error)]() {
      child->_error_listeners.emit(error);
    });
  } else {
    schedule([child]() { child->_spawn_listeners.emit(); });
  }
  return child;
}

optional<LaunchError> ChildProcess::_launch(
  const vector<string>& args, const ChildProcessOptions& options)
{
  auto manager = ProcessManager::current();
  if (manager.is_error()) {
    return LaunchError::of_error("spawn", _command, manager.error());
  }

  if (auto error_number = launch_errno(_command, options)) {
    return LaunchError::of_errno("spawn", _command, *error_number);
  }

  SubProcess::CreateProcessArgs spawn_args{
    .cmd = bee::FilePath::of_string(_command),
    .args = args,
  };
  if (options.cwd.has_value()) {
    spawn_args.cwd = bee::FilePath::of_string(*options.cwd);
  }
  if (options.env.has_value()) { spawn_args.env = *options.env; }

  // Ends handed to the child. The parent closes them once it is running.
  vector<FileDescriptor::shared_ptr> child_ends;

  for (int i = 0; i < 3; i++) {
    FileDescriptor::shared_ptr child_end;
    switch (options.stdio[i]) {
    case StdioMode::Inherit:
      continue;
    case StdioMode::Ignore: {
      int fd = open("/dev/null", O_RDWR | O_CLOEXEC);
      if (fd == -1) { return LaunchError::of_errno("open", _command, errno); }
      child_end = FileDescriptor(fd).to_shared();
    } break;
    case StdioMode::Pipe: {
      auto pipe = bee::Pipe::create();
      if (pipe.is_error()) {
        return LaunchError::of_error("pipe", _command, pipe.error());
      }
      for (const auto& fd : {pipe.value().read_fd, pipe.value().write_fd}) {
        auto cloexec = set_cloexec(fd);
        if (cloexec.is_error()) {
          return LaunchError::of_error("pipe", _command, cloexec.error());
        }
      }
      // stdin is written by the parent, stdout and stderr are read by it.
      auto& parent_end = i == 0 ? pipe.value().write_fd : pipe.value().read_fd;
      child_end = i == 0 ? pipe.value().read_fd : pipe.value().write_fd;
      auto error = _open_stream(i, std::move(parent_end));
      if (error.has_value()) { return error; }
    } break;
    }

    child_ends.push_back(child_end);
    switch (i) {
    case 0:
      spawn_args.stdin_spec = child_end;
      break;
    case 1:
      spawn_args.stdout_spec = child_end;
      break;
    default:
      spawn_args.stderr_spec = child_end;
      break;
    }
  }

  auto process = SubProcess::spawn(spawn_args);
  for (auto& fd : child_ends) { fd->close(); }
  if (process.is_error()) {
    return LaunchError::of_error("spawn", _command, process.error());
  }

  _process = std::move(process.value());
  _pid = _process->pid().to_int();
  manager.value()->watch(
    *_pid, [self = shared_from_this()](const ExitStatus& status) {
      self->_handle_exit(status);
    });

  return nullopt;
}

optional<LaunchError> ChildProcess::_open_stream(
  int stdio_index, FileDescriptor::shared_ptr&& parent_end)
{
  if (stdio_index == 0) {
    auto stream = WritableStream::of_fd(std::move(parent_end));
    if (stream.is_error()) {
      return LaunchError::of_error("pipe", _command, stream.error());
    }
    _stdin = std::move(stream.value());
    return nullopt;
  }

  auto stream = ReadableStream::of_fd(std::move(parent_end));
  if (stream.is_error()) {
    return LaunchError::of_error("pipe", _command, stream.error());
  }
  auto& slot = stdio_index == 1 ? _stdout : _stderr;
  slot = std::move(stream.value());
  slot->on_close([weak = weak_ptr(shared_from_this())]() {
    if (auto self = weak.lock()) { self->_maybe_emit_close(); }
  });
  return nullopt;
}

void ChildProcess::_destroy_streams()
{
  for (auto* output : {&_stdout, &_stderr}) {
    if (*output == nullptr) { continue; }
    (*output)->destroy();
    *output = nullptr;
  }
  if (_stdin != nullptr) {
    _stdin->destroy();
    _stdin = nullptr;
  }
}

void ChildProcess::_handle_exit(const ExitStatus& status)
{
  _exited = true;
  _exit_code = status.code;
  if (status.signal.has_value()) { _signal_code = signal_name(*status.signal); }

  _exit_listeners.emit(_exit_code, _signal_code);

  // Outputs nobody reads are drained so that close can still follow. Streams
  // paused by a consumer are left alone.
  for (const auto* output : {&_stdout, &_stderr}) {
    if (*output == nullptr || (*output)->has_consumer()) { continue; }
    (*output)->resume();
  }
  _maybe_emit_close();
}

// Called on exit and whenever a piped output stream closes.
void ChildProcess::_maybe_emit_close()
{
  if (!_exited || _close_emitted) { return; }
  int still_open = 0;
  for (const auto* output : {&_stdout, &_stderr}) {
    if (*output != nullptr && !(*output)->is_closed()) { still_open++; }
  }
  if (still_open > 0) { return; }
  _close_emitted = true;
  _close_listeners.emit(_exit_code, _signal_code);
}

ListenerId ChildProcess::on_spawn(spawn_listener&& listener)
{
  return _spawn_listeners.add(std::move(listener));
}

ListenerId ChildProcess::on_exit(exit_listener&& listener)
{
  return _exit_listeners.add(std::move(listener));
}

ListenerId ChildProcess::once_exit(exit_listener&& listener)
{
  return _exit_listeners.once(std::move(listener));
}

ListenerId ChildProcess::on_close(exit_listener&& listener)
{
  return _close_listeners.add(std::move(listener));
}

ListenerId ChildProcess::once_close(exit_listener&& listener)
{
  return _close_listeners.once(std::move(listener));
}

ListenerId ChildProcess::on_error(error_listener&& listener)
{
  return _error_listeners.add(std::move(listener));
}

ListenerId ChildProcess::once_error(error_listener&& listener)
{
  return _error_listeners.once(std::move(listener));
}

bool ChildProcess::remove_listener(ChildEvent event, ListenerId id)
{
  switch (event) {
  case ChildEvent::Spawn:
    return _spawn_listeners.remove(id);
  case ChildEvent::Exit:
    return _exit_listeners.remove(id);
  case ChildEvent::Close:
    return _close_listeners.remove(id);
  case ChildEvent::Error:
    return _error_listeners.remove(id);
  }
  return false;
}

size_t ChildProcess::listener_count(ChildEvent event) const
{
  switch (event) {
  case ChildEvent::Spawn:
    return _spawn_listeners.size();
  case ChildEvent::Exit:
    return _exit_listeners.size();
  case ChildEvent::Close:
    return _close_listeners.size();
  case ChildEvent::Error:
    return _error_listeners.size();
  }
  return 0;
}

bool ChildProcess::kill(int signo)
{
  if (!_pid.has_value() || _exited) { return false; }
  if (::kill(*_pid, signo) == -1) { return false; }
  _killed = true;
  return true;
}

bool ChildProcess::kill(const string& signal)
{
  auto signo = signal_number(signal);
  if (!signo.has_value()) { return false; }
  return kill(*signo);
}

} // namespace aspawn
