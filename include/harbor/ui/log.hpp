#pragma once

#include <harbor/ui/geometry.hpp>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <string>

namespace harbor::ui {

inline std::shared_ptr<spdlog::logger> ensure_named_logger(const char *name) {
  if (auto logger = spdlog::get(name); logger != nullptr) {
    return logger;
  }
  try {
    return spdlog::stdout_color_mt(name);
  } catch (const spdlog::spdlog_ex &) {
    // Lost a registration race with another caller; use theirs.
    if (auto logger = spdlog::get(name); logger != nullptr) {
      return logger;
    }
    return spdlog::default_logger();
  }
}

inline spdlog::logger &portal_log() {
  static const auto logger = ensure_named_logger("harbor.portal");
  return *logger;
}

inline std::string format_rect(const RectF &r) {
  return fmt::format("{:.1f},{:.1f} {:.1f}x{:.1f}", r.x, r.y, r.w, r.h);
}

inline std::string format_token(std::uint64_t id) {
  if (id == 0) {
    return "nil";
  }
  return fmt::format("#{}", id);
}

} // namespace harbor::ui
