#pragma once
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "logging.hpp"
#include "paths.hpp"
#include "state.hpp"
#include "text.hpp"

inline constexpr int kMinLookbackDays = 5;
inline constexpr int kMaxLookbackDays = 365;

inline std::filesystem::path tickerboard_settings_path(std::string* err)
{
    try {
        return tickerboard::platform::config_file("settings.ini", err);
    }
    catch (const std::exception& e) {
        if (err) *err = e.what();
        return {};
    }
}

inline bool parse_flag(const std::string& val, bool* out)
{
    if (val == "1" || val == "true" || val == "yes" || val == "on") {
        *out = true;
        return true;
    }
    if (val == "0" || val == "false" || val == "no" || val == "off") {
        *out = false;
        return true;
    }
    return false;
}

// Applies one key=value line. Unknown keys are ignored; bad values keep the
// default and add a warning.
inline void apply_setting(AppState::Settings& s,
                          const std::string& key,
                          const std::string& val,
                          std::vector<std::string>* warnings)
{
    auto warn = [&](const char* what) {
        if (warnings) {
            warnings->push_back(std::string("settings: bad ") + what +
                                " '" + val + "', keeping default");
        }
    };

    if (key == "source" || key == "backend") {
        if (auto kind = market::parse_source_kind(val)) {
            s.source = *kind;
        }
        else {
            warn("source");
        }
    }
    else if (key == "lookback_days" || key == "lookback") {
        std::int64_t days = 0;
        if (parse_int64(val, &days)) {
            s.lookback_days = static_cast<int>(
                std::clamp<std::int64_t>(days, kMinLookbackDays, kMaxLookbackDays));
        }
        else {
            warn("lookback_days");
        }
    }
    else if (key == "log_level") {
        if (tickerboard::parse_log_level(val)) {
            s.log_level = val;
        }
        else {
            warn("log_level");
        }
    }
    else if (key == "show_help" || key == "help" || key == "hints") {
        if (!parse_flag(val, &s.show_help)) warn("show_help");
    }
    else if (key == "history_timeout" || key == "timeout") {
        std::int64_t secs = 0;
        if (parse_int64(val, &secs) && secs > 0) {
            s.history_timeout = static_cast<long>(std::min<std::int64_t>(secs, 300));
        }
        else {
            warn("history_timeout");
        }
    }
}

inline bool load_settings(AppState::Settings& s,
                          std::string* err,
                          std::vector<std::string>* warnings = nullptr)
{
    try {
        namespace fs = std::filesystem;

        std::string path_err;
        fs::path cfg = tickerboard_settings_path(&path_err);
        if (cfg.empty()) {
            if (err) *err = path_err;
            return false;
        }

        std::ifstream in(cfg, std::ios::binary);
        if (!in) {
            // no file yet -> defaults remain
            return true;
        }

        std::string line;
        while (std::getline(in, line)) {
            line = trim_copy(line);
            if (line.empty()) continue;
            if (line[0] == '#' || line[0] == ';') continue;

            const auto eq = line.find('=');
            if (eq == std::string::npos) continue;

            std::string key = lower_copy(trim_copy(line.substr(0, eq)));
            std::string val = lower_copy(trim_copy(line.substr(eq + 1)));
            apply_setting(s, key, val, warnings);
        }

        return true;
    }
    catch (const std::exception& e) {
        if (err) *err = e.what();
        return false;
    }
}
