// include/utils/log.hpp
#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace utils {

// Install the process-wide spdlog logger: stdout, UTC timestamps,
// "[2024-01-01T00:00:00.000] [info] message {json fields}".
// `debug` lowers the level so debug lines are printed.
void init_logging(bool debug);

// Render structured fields the way every log line carries them: a single
// compact JSON object, null members dropped. Empty object -> "".
std::string fields(const nlohmann::json& meta);

} // namespace utils
