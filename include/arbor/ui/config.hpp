#pragma once

#include <arbor/ui/log.hpp>

#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>

namespace arbor::ui {

struct RootOptions {
  spdlog::level::level_enum log_level{spdlog::level::warn};
  bool warn_on_duplicate_keys{true};
  std::size_t max_flush_passes{16};
  bool record_patches{true};

  // Defaults overlaid with ARBOR_LOG_LEVEL and ARBOR_MAX_FLUSH_PASSES.
  static RootOptions from_env() {
    RootOptions opts;
    if (const char *lvl = std::getenv("ARBOR_LOG_LEVEL")) {
      const std::string name{lvl};
      const auto parsed = spdlog::level::from_str(name);
      // from_str maps unknown names to off; only accept an explicit "off".
      if (parsed != spdlog::level::off || name == "off") {
        opts.log_level = parsed;
      } else {
        logger()->warn("ignoring unknown ARBOR_LOG_LEVEL '{}'", name);
      }
    }
    if (const char *passes = std::getenv("ARBOR_MAX_FLUSH_PASSES")) {
      const std::string_view sv{passes};
      std::size_t value = 0;
      const auto r = std::from_chars(sv.data(), sv.data() + sv.size(), value);
      if (r.ec == std::errc{} && r.ptr == sv.data() + sv.size() && value > 0) {
        opts.max_flush_passes = value;
      } else {
        logger()->warn("ignoring invalid ARBOR_MAX_FLUSH_PASSES '{}'", sv);
      }
    }
    return opts;
  }
};

inline void apply_log_level(const RootOptions &opts) {
  logger()->set_level(opts.log_level);
}

} // namespace arbor::ui
