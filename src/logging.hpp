#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <spdlog/common.h>

namespace tickerboard {

inline constexpr const char* kLogFileName = "tickerboard.log";
inline constexpr const char* kLogLevelEnv = "TICKERBOARD_LOG";

// Accepts spdlog's level names plus "warning"/"none".
std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

// Installs the default logger: a file under the data directory, or a null
// sink when the file cannot be opened. The terminal is never written to.
// TICKERBOARD_LOG overrides `level` when it names a valid level.
bool init_logging(const std::string& level, std::string* err);

} // namespace tickerboard
