#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace pkgdriver::utils {

// Logs the duration of a registry phase when it goes out of scope
class ScopedTimer {
 public:
  ScopedTimer(const ScopedTimer &) = delete;
  ScopedTimer(ScopedTimer &&) = delete;
  auto operator=(const ScopedTimer &) -> ScopedTimer & = delete;
  auto operator=(ScopedTimer &&) -> ScopedTimer & = delete;
  ScopedTimer(
      std::string operation_name, std::shared_ptr<spdlog::logger> logger,
      spdlog::level::level_enum level = spdlog::level::debug);
  ~ScopedTimer();

  [[nodiscard]] auto GetElapsed() const -> std::chrono::microseconds;

  // "850us", "12ms" or "1.2s"
  static auto FormatDuration(std::chrono::microseconds duration)
      -> std::string;

 private:
  std::chrono::steady_clock::time_point start_;
  std::string operation_name_;
  std::shared_ptr<spdlog::logger> logger_;
  spdlog::level::level_enum level_;
};

}  // namespace pkgdriver::utils
