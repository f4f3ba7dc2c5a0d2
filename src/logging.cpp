#include "logging.hpp"
#include "paths.hpp"
#include "text.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <map>
#include <memory>

namespace tickerboard {

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name)
{
    static const std::map<std::string, spdlog::level::level_enum> levels{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"err", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
        {"none", spdlog::level::off},
    };

    auto it = levels.find(lower_copy(trim_copy(name)));
    if (it == levels.end()) return std::nullopt;
    return it->second;
}

bool init_logging(const std::string& level, std::string* err)
{
    auto lvl = parse_log_level(level).value_or(spdlog::level::info);
    if (const char* env = std::getenv(kLogLevelEnv); env && *env) {
        if (auto from_env = parse_log_level(env)) lvl = *from_env;
    }

    std::shared_ptr<spdlog::logger> logger;
    bool ok = true;
    try {
        std::filesystem::path file = platform::data_file(kLogFileName, err);
        if (file.empty()) {
            ok = false;
        }
        else {
            std::filesystem::create_directories(file.parent_path());
            logger = std::make_shared<spdlog::logger>(
                "tickerboard",
                std::make_shared<spdlog::sinks::basic_file_sink_mt>(file.string()));
        }
    }
    catch (const std::exception& e) {
        if (err) *err = e.what();
        ok = false;
    }

    if (!logger) {
        logger = std::make_shared<spdlog::logger>(
            "tickerboard", std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    logger->set_level(lvl);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    return ok;
}

} // namespace tickerboard
