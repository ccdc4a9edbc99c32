#include <tandem/common/cli.hpp>

#include <array>
#include <utility>

namespace tandem::common {

namespace {

constexpr auto kLogLevels =
    std::array<std::pair<std::string_view, spdlog::level::level_enum>, 6>{{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
    }};

}  // namespace

std::optional<spdlog::level::level_enum> try_parse_log_level(
    const std::string_view name) {
  for (const auto& [level_name, level] : kLogLevels) {
    if (level_name == name) {
      return level;
    }
  }
  return std::nullopt;
}

}  // namespace tandem::common
