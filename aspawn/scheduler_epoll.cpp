#include "scheduler_epoll.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <map>
#include <unordered_map>
#include <vector>

#include <sys/epoll.h>

#include "bee/time.hpp"

using bee::FileDescriptor;
using bee::Span;
using bee::Time;
using std::function;

namespace aspawn {
namespace {

const Span max_timeout = Span::of_seconds(60);

struct SchedulerEpollImpl final : public Scheduler {
 public:
  explicit SchedulerEpollImpl(FileDescriptor&& epoll_fd)
      : _epoll_fd(std::move(epoll_fd))
  {}

  SchedulerEpollImpl(const SchedulerEpollImpl&) = delete;
  SchedulerEpollImpl(SchedulerEpollImpl&&) = delete;

  virtual ~SchedulerEpollImpl() {}

  virtual bee::OrError<> add_fd(
    const FileDescriptor::shared_ptr& fd,
    function<void()>&& on_ready) override
  {
    if (_ids_by_fd.find(fd.get()) != _ids_by_fd.end()) {
      return bee::Error::format("Fd $ is already watched", fd->int_fd());
    }

    uint64_t id = _next_watch_id++;

    epoll_event event;
    memset(&event, 0, sizeof(event));
    event.events = EPOLLIN | EPOLLOUT | EPOLLRDHUP | EPOLLET;
    event.data.u64 = id;

    if (epoll_ctl(_epoll_fd.int_fd(), EPOLL_CTL_ADD, fd->int_fd(), &event)) {
      return bee::Error::format(
        "Failed to add fd $ to epoll: $", fd->int_fd(), strerror(errno));
    }

    _watches.emplace(id, Watch{.fd = fd, .on_ready = std::move(on_ready)});
    _ids_by_fd.emplace(fd.get(), id);

    return bee::ok();
  }

  // The fd is not removed from the epoll set: the owner closes it right after
  // and events for an unknown id are dropped.
  virtual void remove_fd(const FileDescriptor::shared_ptr& fd) override
  {
    auto it = _ids_by_fd.find(fd.get());
    if (it == _ids_by_fd.end()) { return; }
    // Destroyed on return, after both maps are consistent again.
    auto removed = _watches.extract(it->second);
    _ids_by_fd.erase(it);
  }

  virtual void schedule(function<void()>&& f) override
  {
    _ready.push_back(std::move(f));
  }

  virtual TimedTaskId after(
    const Span& span, function<void()>&& callback) override
  {
    auto id = TimedTaskId(_next_timer_id++);
    auto when = Time::monotonic() + span;
    auto it = _timers.emplace(when, Timer{.id = id, .fn = std::move(callback)});
    _timer_index.emplace(id, it);
    return id;
  }

  virtual void cancel(TimedTaskId task_id) override
  {
    auto it = _timer_index.find(task_id);
    if (it == _timer_index.end()) { return; }
    _timers.erase(it->second);
    _timer_index.erase(it);
  }

  virtual void on_exit(function<void()>&& on_exit) override
  {
    _on_exit.push_back(std::move(on_exit));
  }

  virtual bee::OrError<> wait_until(const function<bool()>& stop) override
  {
    while (true) {
      _fire_due_timers();
      _run_ready();
      if (_ready.empty() && stop()) { break; }
      bail_unit(_wait_events(_ready.empty() ? _next_timeout() : Span::zero()));
    }
    return bee::ok();
  }

  virtual void close() override
  {
    auto on_exit = std::move(_on_exit);
    _on_exit.clear();
    for (auto& f : on_exit) { f(); }

    // Destroying callbacks can release objects that call back into
    // remove_fd, so the containers are emptied before anything is destroyed.
    auto watches = std::move(_watches);
    _watches.clear();
    _ids_by_fd.clear();
    auto ready = std::move(_ready);
    _ready.clear();
    auto timers = std::move(_timers);
    _timers.clear();
    _timer_index.clear();

    watches.clear();
    ready.clear();
    timers.clear();

    _epoll_fd.close();
  }

 private:
  struct Watch {
    FileDescriptor::shared_ptr fd;
    function<void()> on_ready;
  };

  struct Timer {
    TimedTaskId id;
    function<void()> fn;
  };

  using timer_queue = std::multimap<Time, Timer>;

  void _fire_due_timers()
  {
    auto now = Time::monotonic();
    while (!_timers.empty()) {
      auto it = _timers.begin();
      if (it->first > now) { break; }
      _timer_index.erase(it->second.id);
      schedule(std::move(it->second.fn));
      _timers.erase(it);
    }
  }

  void _run_ready()
  {
    std::swap(_ready, _running);
    for (auto& task : _running) { task(); }
    _running.clear();
  }

  Span _next_timeout() const
  {
    if (_timers.empty()) { return max_timeout; }
    auto remaining = _timers.begin()->first.diff(Time::monotonic());
    return std::clamp(remaining, Span::zero(), max_timeout);
  }

  bee::OrError<> _wait_events(Span timeout)
  {
    constexpr int max_events = 64;
    epoll_event events[max_events];

    int ret = epoll_wait(
      _epoll_fd.int_fd(), events, max_events, timeout.to_millis());
    if (ret == -1) {
      if (errno == EINTR) { return bee::ok(); }
      return bee::Error::format("Failed to wait on epoll: $", strerror(errno));
    }

    for (int i = 0; i < ret; i++) {
      uint64_t id = events[i].data.u64;
      schedule([this, id]() {
        auto it = _watches.find(id);
        if (it == _watches.end()) { return; }
        // Copy so the callback may remove its own watch.
        auto on_ready = it->second.on_ready;
        on_ready();
      });
    }
    return bee::ok();
  }

  FileDescriptor _epoll_fd;

  std::unordered_map<uint64_t, Watch> _watches;
  std::unordered_map<const FileDescriptor*, uint64_t> _ids_by_fd;
  uint64_t _next_watch_id = 1;

  timer_queue _timers;
  std::map<TimedTaskId, timer_queue::iterator> _timer_index;
  uint64_t _next_timer_id = 1;

  std::vector<function<void()>> _ready;
  std::vector<function<void()>> _running;

  std::vector<function<void()>> _on_exit;
};

} // namespace

bee::OrError<Scheduler::ptr> SchedulerEpoll::create_direct()
{
  int fd = epoll_create1(EPOLL_CLOEXEC);
  if (fd == -1) { shot("Failed to create epoll: $", strerror(errno)); }
  return std::make_unique<SchedulerEpollImpl>(FileDescriptor(fd));
}

bee::OrError<SchedulerContext> SchedulerEpoll::create_context()
{
  bail(scheduler, create_direct());
  return SchedulerContext::create(std::move(scheduler));
}

} // namespace aspawn
