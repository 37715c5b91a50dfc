#include "task.hpp"

#include "ivar.hpp"

using bee::Span;

namespace aspawn {

Task<> after(const Span& span)
{
  auto ivar = Ivar<>::create();
  after(span, [ivar]() { ivar->fill(); });
  co_await ivar;
}

} // namespace aspawn
