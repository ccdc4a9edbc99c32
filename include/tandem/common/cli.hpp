#pragma once

#include <spdlog/common.h>
#include <optional>
#include <string_view>

namespace tandem::common {

/// Exit status for malformed command lines (sysexits EX_USAGE). Sits above
/// every schema::error_code value, so scripts can tell usage mistakes from
/// protocol rejections.
inline constexpr int kUsageExitCode = 64;

/// Names accepted by `--log-level`, in increasing severity.
inline constexpr std::string_view kLogLevelNames =
    "trace, debug, info, warn, error or critical";

/// Level for one of the documented names, or std::nullopt for anything else.
std::optional<spdlog::level::level_enum> try_parse_log_level(
    std::string_view name);

}  // namespace tandem::common
