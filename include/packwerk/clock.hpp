#pragma once
#include <chrono>
#include <functional>

namespace packwerk {

// Источник монотонного времени; тесты подставляют свой, чтобы сдвигать возраст.
using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

inline SteadyClock default_clock() {
  return [] { return std::chrono::steady_clock::now(); };
}

} // namespace packwerk
