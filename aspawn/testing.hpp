#pragma once

#include <functional>

#include "task.hpp"

#include "bee/testing.hpp"

// Declares a coroutine test. The body runs inside its own epoll scheduler
// context, and the test fails if the loop itself reports an error.
#define ASPAWN_TEST(name)                                                      \
  aspawn::Task<> aspawn_test_##name();                                         \
  TEST(name) { aspawn::run_async_test(aspawn_test_##name); }                   \
  aspawn::Task<> aspawn_test_##name()

namespace aspawn {

// Runs the coroutine inside a fresh scheduler context.
void run_async_test(std::function<Task<>()>&& test);

} // namespace aspawn
