#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>

#include <sys/types.h>

#include "bee/error.hpp"
#include "bee/file_descriptor.hpp"

namespace aspawn {

struct ExitStatus {
 public:
  // Exactly one of the two is set.
  std::optional<int> code;
  std::optional<int> signal;

  static ExitStatus of_wait_status(int wait_status);
};

// Reaps the children it watches. There is one manager per scheduler context,
// fed by a SIGCHLD signalfd registered with that scheduler.
struct ProcessManager {
 public:
  using ptr = std::shared_ptr<ProcessManager>;
  using on_exit_callback = std::function<void(const ExitStatus& status)>;

  explicit ProcessManager(bee::FileDescriptor::shared_ptr&& signal_fd);

  ProcessManager(const ProcessManager& other) = delete;
  ProcessManager(ProcessManager&& other) = delete;

  ~ProcessManager();

  // Creates the manager of the current scheduler context on first use.
  static bee::OrError<ptr> current();

  // Must be called right after fork, before control returns to the scheduler.
  void watch(pid_t pid, on_exit_callback&& on_exit);

  size_t num_watched() const { return _watched.size(); }

 private:
  static bee::OrError<ptr> _create();

  bee::OrError<> _check_children();

  void _close();

  bee::FileDescriptor::shared_ptr _signal_fd;

  std::map<pid_t, on_exit_callback> _watched;
};

} // namespace aspawn
