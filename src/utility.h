#pragma once

#include <spdlog/spdlog.h>

#include <chrono>
#include <type_traits>

namespace splittab {

// Run func and trace how long it took. Returns whatever func returns.
template <typename F>
decltype(auto) timed(const char* label, F&& func) {
  auto start = std::chrono::steady_clock::now();
  auto elapsed_us = [start] {
    return std::chrono::duration_cast<std::chrono::microseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
  };

  if constexpr (std::is_void_v<std::invoke_result_t<F>>) {
    func();
    spdlog::trace("[timed] {} took {}us", label, elapsed_us());
  } else {
    auto result = func();
    spdlog::trace("[timed] {} took {}us", label, elapsed_us());
    return result;
  }
}

} // namespace splittab
