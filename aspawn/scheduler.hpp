#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <memory>

#include "bee/error.hpp"
#include "bee/file_descriptor.hpp"
#include "bee/span.hpp"

namespace aspawn {

struct TimedTaskId {
 public:
  explicit TimedTaskId(uint64_t id) : _id(id) {}

  TimedTaskId(const TimedTaskId& other) = default;

  uint64_t to_int() const { return _id; }

  std::strong_ordering operator<=>(const TimedTaskId& other) const = default;

 private:
  uint64_t _id;
};

// Single threaded event loop. Callbacks registered here always run from
// wait_until, never from inside the call that registered them.
struct Scheduler {
 public:
  using ptr = std::unique_ptr<Scheduler>;

  virtual ~Scheduler();

  // The callback fires every time the fd becomes readable, writable or hung
  // up. Readiness is edge triggered, so the callback must drain the fd.
  virtual bee::OrError<> add_fd(
    const bee::FileDescriptor::shared_ptr& fd,
    std::function<void()>&& on_ready) = 0;

  // Unknown fds are ignored.
  virtual void remove_fd(const bee::FileDescriptor::shared_ptr& fd) = 0;

  virtual void schedule(std::function<void()>&& f) = 0;

  virtual TimedTaskId after(
    const bee::Span& span, std::function<void()>&& callback) = 0;

  virtual void cancel(TimedTaskId task_id) = 0;

  virtual void on_exit(std::function<void()>&& on_exit) = 0;

  virtual bee::OrError<> wait_until(const std::function<bool()>& stop) = 0;

  virtual void close() = 0;
};

} // namespace aspawn
