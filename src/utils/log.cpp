// src/utils/log.cpp
#include "utils/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace utils {

void init_logging(bool debug)
{
    auto logger = spdlog::stdout_color_mt("copytrade");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%dT%H:%M:%S.%e] [%l] %v", spdlog::pattern_time_type::utc);
    spdlog::set_level(debug ? spdlog::level::debug : spdlog::level::info);
    spdlog::flush_on(spdlog::level::warn);
}

std::string fields(const nlohmann::json& meta)
{
    if (!meta.is_object()) {
        return meta.dump();
    }

    nlohmann::json out = nlohmann::json::object();
    for (auto it = meta.begin(); it != meta.end(); ++it) {
        if (!it.value().is_null()) out[it.key()] = it.value();
    }
    return out.empty() ? std::string{} : out.dump();
}

} // namespace utils
