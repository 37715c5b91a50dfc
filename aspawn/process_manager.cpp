#include "process_manager.hpp"

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <vector>

#include <sys/wait.h>

#include "scheduler_context.hpp"

#include "bee/signal.hpp"

using bee::FileDescriptor;
using std::make_shared;
using std::weak_ptr;

namespace aspawn {

////////////////////////////////////////////////////////////////////////////////
// ExitStatus
//

ExitStatus ExitStatus::of_wait_status(int wait_status)
{
  if (WIFSIGNALED(wait_status)) {
    return ExitStatus{.code = std::nullopt, .signal = WTERMSIG(wait_status)};
  }
  return ExitStatus{.code = WEXITSTATUS(wait_status), .signal = std::nullopt};
}

////////////////////////////////////////////////////////////////////////////////
// ProcessManager
//

ProcessManager::ProcessManager(FileDescriptor::shared_ptr&& signal_fd)
    : _signal_fd(std::move(signal_fd))
{}

ProcessManager::~ProcessManager() { _close(); }

bee::OrError<ProcessManager::ptr> ProcessManager::current()
{
  static ptr manager;
  if (manager == nullptr) {
    bail(created, _create());
    manager = std::move(created);
    // A new scheduler context gets a new manager.
    SchedulerContext::scheduler().on_exit([]() {
      if (manager == nullptr) { return; }
      auto closing = std::move(manager);
      manager = nullptr;
      closing->_close();
    });
  }
  return manager;
}

bee::OrError<ProcessManager::ptr> ProcessManager::_create()
{
  // The signal has to stay blocked for signalfd to see it.
  bail_unit(bee::Signal::block_signal(bee::SignalCode::SigChld));
  bail(fd, bee::Signal::create_signal_fd(bee::SignalCode::SigChld));

  auto manager = make_shared<ProcessManager>(std::move(fd).to_shared());

  bail_unit(add_fd(manager->_signal_fd, [weak = weak_ptr(manager)]() {
    if (auto manager = weak.lock()) { must_unit(manager->_check_children()); }
  }));

  return manager;
}

void ProcessManager::watch(pid_t pid, on_exit_callback&& on_exit)
{
  _watched.emplace(pid, std::move(on_exit));
}

bee::OrError<> ProcessManager::_check_children()
{
  while (true) {
    std::byte buffer[1024];
    bail(ret, _signal_fd->read(buffer, sizeof(buffer)));
    if (ret.bytes_read() == 0) { break; }
  }

  // SIGCHLD deliveries coalesce, so every watched child is polled.
  std::vector<std::pair<on_exit_callback, ExitStatus>> exited;
  for (auto it = _watched.begin(); it != _watched.end();) {
    int wait_status = 0;
    pid_t ret = waitpid(it->first, &wait_status, WNOHANG);
    if (ret == 0 || (ret == -1 && errno == EINTR)) {
      ++it;
      continue;
    }
    if (ret == -1) {
      shot("Failed to wait for pid $: $", it->first, strerror(errno));
    }
    exited.emplace_back(
      std::move(it->second), ExitStatus::of_wait_status(wait_status));
    it = _watched.erase(it);
  }

  for (auto& [on_exit, status] : exited) { on_exit(status); }

  return bee::ok();
}

void ProcessManager::_close()
{
  if (_signal_fd == nullptr) { return; }
  remove_fd(_signal_fd);
  _signal_fd->close();
  _signal_fd = nullptr;
  auto watched = std::move(_watched);
  _watched.clear();
}

} // namespace aspawn
