#pragma once

#include <cstdlib>
#include <filesystem>
#include <string>

namespace tickerboard::platform {

inline constexpr const char* kAppDirName = "tickerboard";

inline bool env_path(const char* name, std::filesystem::path* out)
{
    if (!name || !out) return false;
    const char* value = std::getenv(name);
    if (!value || !*value) return false;
    *out = std::filesystem::path(value);
    return true;
}

// $XDG_CONFIG_HOME or ~/.config
inline std::filesystem::path config_home(std::string* err)
{
    std::filesystem::path base;
    if (env_path("XDG_CONFIG_HOME", &base)) return base;
    if (env_path("HOME", &base)) return base / ".config";

    if (err) {
        *err = "Neither XDG_CONFIG_HOME nor HOME is set; cannot resolve "
               "config path";
    }
    return {};
}

// $XDG_DATA_HOME or ~/.local/share
inline std::filesystem::path data_home(std::string* err)
{
    std::filesystem::path base;
    if (env_path("XDG_DATA_HOME", &base)) return base;
    if (env_path("HOME", &base)) return base / ".local" / "share";

    if (err) {
        *err = "Neither XDG_DATA_HOME nor HOME is set; cannot resolve "
               "data path";
    }
    return {};
}

inline std::filesystem::path config_file(const char* file_name,
                                         std::string* err)
{
    const auto base = config_home(err);
    if (base.empty()) return {};
    return base / kAppDirName / file_name;
}

inline std::filesystem::path data_file(const char* file_name,
                                       std::string* err)
{
    const auto base = data_home(err);
    if (base.empty()) return {};
    return base / kAppDirName / file_name;
}

} // namespace tickerboard::platform
