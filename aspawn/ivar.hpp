#pragma once

#include <cassert>
#include <concepts>
#include <coroutine>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <vector>

#include "scheduler_context.hpp"

#include "bee/copy.hpp"
#include "bee/unit.hpp"

namespace aspawn {

template <class T>
concept ivar_value = std::is_void_v<T> || std::copy_constructible<T>;

////////////////////////////////////////////////////////////////////////////////
// Ivar
//
// A write-once cell. Any number of listeners and coroutines can wait on it,
// and all of them are resumed from the scheduler after the fill.
//

template <ivar_value T = void>
struct Ivar : public std::enable_shared_from_this<Ivar<T>> {
 public:
  using ptr = std::shared_ptr<Ivar>;
  using value_type = T;

  Ivar() {}

  Ivar(const Ivar& other) = delete;
  Ivar(Ivar&& other) = delete;

  static ptr create() { return std::make_shared<Ivar>(); }

  template <class... Args> static ptr create_with_value(Args&&... args)
  {
    auto ivar = create();
    ivar->fill(std::forward<Args>(args)...);
    return ivar;
  }

  template <class... Args> void fill(Args&&... args)
  {
    if (_value.has_value()) { assert(false && "Ivar already determined"); }
    _value.emplace(std::forward<Args>(args)...);

    auto waiting = std::move(_waiting);
    _waiting.clear();
    for (auto& fn : waiting) { schedule(std::move(fn)); }
  }

  void on_determined(std::function<void()>&& callback)
  {
    if (_value.has_value()) {
      schedule(std::move(callback));
    } else {
      _waiting.push_back(std::move(callback));
    }
  }

  bool is_determined() const { return _value.has_value(); }

  decltype(auto) value() const
  {
    assert(_value.has_value() && "Ivar is not determined");
    if constexpr (!std::is_void_v<T>) { return static_cast<const T&>(*_value); }
  }

  struct Awaiter {
   public:
    bool await_ready() const { return ivar->is_determined(); }

    void await_suspend(std::coroutine_handle<> h)
    {
      ivar->on_determined([h]() { h.resume(); });
    }

    T await_resume() const
    {
      if constexpr (!std::is_void_v<T>) { return bee::copy(ivar->value()); }
    }

    ptr ivar;
  };

 private:
  std::optional<bee::unit_if_void_t<T>> _value;
  std::vector<std::function<void()>> _waiting;
};

template <ivar_value T>
typename Ivar<T>::Awaiter operator co_await(const std::shared_ptr<Ivar<T>>& ivar)
{
  return typename Ivar<T>::Awaiter{.ivar = ivar};
}

} // namespace aspawn
