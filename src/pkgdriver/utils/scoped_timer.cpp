#include "pkgdriver/utils/scoped_timer.hpp"

#include <fmt/format.h>

namespace pkgdriver::utils {

ScopedTimer::ScopedTimer(
    std::string operation_name, std::shared_ptr<spdlog::logger> logger,
    spdlog::level::level_enum level)
    : start_(std::chrono::steady_clock::now()),
      operation_name_(std::move(operation_name)),
      logger_(logger ? logger : spdlog::default_logger()),
      level_(level) {
}

ScopedTimer::~ScopedTimer() {
  logger_->log(
      level_, "{} completed ({})", operation_name_,
      FormatDuration(GetElapsed()));
}

auto ScopedTimer::GetElapsed() const -> std::chrono::microseconds {
  return std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start_);
}

auto ScopedTimer::FormatDuration(std::chrono::microseconds duration)
    -> std::string {
  auto count = duration.count();

  if (count >= 1'000'000) {
    return fmt::format("{:.1f}s", static_cast<double>(count) / 1'000'000.0);
  }
  if (count >= 1000) {
    return fmt::format("{}ms", count / 1000);
  }
  // Registry phases over small graphs finish well under a millisecond
  return fmt::format("{}us", count);
}

}  // namespace pkgdriver::utils
