#pragma once

#include <utility>

namespace utils
{

/**
 * Calls the function when it goes out of scope, whether the scope is left
 * normally or by an exception.
 *
 * {
 *   const auto guard = utils::make_scope_guard([&path]() { ::unlink(path.data()); });
 *   // Use the file, and maybe throw
 * }
 */
template <typename F>
struct ScopeExit
{
  explicit ScopeExit(F&& f):
      func(std::forward<F>(f))
  {}
  ~ScopeExit()
  {
    this->func();
  }
  ScopeExit(ScopeExit&&) = default;
  ScopeExit(const ScopeExit&) = delete;
  ScopeExit& operator=(const ScopeExit&) = delete;
  ScopeExit& operator=(ScopeExit&&) = delete;

  F func;
};

template <typename F>
auto make_scope_guard(F&& f)
{
  return ScopeExit<F>{std::forward<F>(f)};
}

}
