#pragma once

#include <filesystem>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace board {

class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Ordered symbol list persisted as { "Stocks": [ { "Symbol": "..." } ] }.
// Guarded by its own lock, independent of BoardState's.
class ConfigStore {
public:
    static constexpr const char* kFileName = "config.json";

    explicit ConfigStore(std::filesystem::path path);

    // $XDG_CONFIG_HOME/tickerboard/config.json; throws PersistenceError when
    // no home directory can be resolved
    static std::filesystem::path default_path();

    const std::filesystem::path& path() const { return path_; }

    // Missing file yields an empty list. Throws PersistenceError when the
    // file cannot be read or is malformed.
    std::vector<std::string> load() const;

    bool load(std::vector<std::string>* symbols, std::string* err) const;
    bool save(const std::vector<std::string>& symbols,
              std::string* err = nullptr);

private:
    void write_atomically_(const std::string& text);

    mutable std::shared_mutex mu_;
    std::filesystem::path path_;
};

std::string encode_config(const std::vector<std::string>& symbols);
std::vector<std::string> decode_config(std::string_view text);

} // namespace board
