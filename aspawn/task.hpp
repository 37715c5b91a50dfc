#pragma once

#include <cassert>
#include <concepts>
#include <coroutine>
#include <memory>
#include <optional>
#include <type_traits>

#include "scheduler_context.hpp"

#include "bee/span.hpp"
#include "bee/unit.hpp"

namespace aspawn {

template <class T = void> struct Task;

namespace detail {

template <class T> struct TaskState {
 public:
  using ptr = std::shared_ptr<TaskState>;

  std::optional<bee::unit_if_void_t<T>> value;
  std::coroutine_handle<> continuation;
};

template <class T> struct TaskPromiseBase {
 public:
  using state_t = TaskState<T>;

  TaskPromiseBase() : _state(std::make_shared<state_t>()) {}

  TaskPromiseBase(const TaskPromiseBase& other) = delete;
  TaskPromiseBase(TaskPromiseBase&& other) = delete;

  Task<T> get_return_object() { return Task<T>(_state); }

  // Tasks run eagerly up to their first suspension point.
  std::suspend_never initial_suspend() { return {}; }
  std::suspend_never final_suspend() noexcept { return {}; }

  void unhandled_exception() { throw; }

 protected:
  template <class... Args> void _set_value(Args&&... args)
  {
    _state->value.emplace(std::forward<Args>(args)...);
    if (_state->continuation) {
      schedule([h = _state->continuation]() { h.resume(); });
    }
  }

 private:
  typename state_t::ptr _state;
};

template <class T> struct TaskPromise : public TaskPromiseBase<T> {
 public:
  template <std::convertible_to<T> U> void return_value(U&& value)
  {
    this->_set_value(std::forward<U>(value));
  }
};

template <> struct TaskPromise<void> : public TaskPromiseBase<void> {
 public:
  void return_void() { _set_value(); }
};

} // namespace detail

////////////////////////////////////////////////////////////////////////////////
// Task
//
// Result of a coroutine. Can be awaited by at most one coroutine.
//

template <class T> struct Task {
 public:
  using value_type = T;
  using promise_type = detail::TaskPromise<T>;
  using state_t = detail::TaskState<T>;

  explicit Task(const typename state_t::ptr& state) : _state(state) {}

  Task(const Task& other) = default;
  Task(Task&& other) = default;

  Task& operator=(const Task& other) = default;
  Task& operator=(Task&& other) = default;

  bool done() const { return _state->value.has_value(); }

  T value()
  {
    assert(done());
    if constexpr (!std::is_void_v<T>) { return std::move(*_state->value); }
  }

  bool await_ready() const { return done(); }

  void await_suspend(std::coroutine_handle<> h)
  {
    assert(!_state->continuation && "Task already awaited");
    _state->continuation = h;
  }

  T await_resume() { return value(); }

 private:
  typename state_t::ptr _state;
};

// Completes once the span has elapsed.
Task<> after(const bee::Span& span);

} // namespace aspawn
