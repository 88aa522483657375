// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <type_traits>
#include <utility>

namespace beeprof {

// Runs the stored callable when leaving the enclosing scope, unless released
template <typename EF> class scope_exit {
public:
  template <typename Fn>
  explicit scope_exit(Fn &&fn) noexcept(
      std::is_nothrow_constructible_v<EF, Fn>)
      : _exit_function(std::forward<Fn>(fn)) {}

  scope_exit(scope_exit &&other) noexcept(
      std::is_nothrow_move_constructible_v<EF>)
      : _exit_function(std::move(other._exit_function)),
        _execute_on_destruction(other._execute_on_destruction) {
    other.release();
  }

  scope_exit(const scope_exit &) = delete;
  scope_exit &operator=(const scope_exit &) = delete;
  scope_exit &operator=(scope_exit &&) = delete;

  ~scope_exit() noexcept {
    if (_execute_on_destruction) {
      _exit_function();
    }
  }

  void release() noexcept { _execute_on_destruction = false; }

private:
  EF _exit_function;
  bool _execute_on_destruction{true};
};

template <typename EF> scope_exit(EF) -> scope_exit<EF>;

} // namespace beeprof
