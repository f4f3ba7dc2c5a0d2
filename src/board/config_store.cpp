#include "board/config_store.hpp"
#include "paths.hpp"
#include "text.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <mutex>
#include <sstream>
#include <system_error>
#include <utility>

namespace board {

using json = nlohmann::json;

std::string encode_config(const std::vector<std::string>& symbols)
{
    json stocks = json::array();
    for (const auto& s : symbols) {
        stocks.push_back(json{{"Symbol", s}});
    }
    return json{{"Stocks", stocks}}.dump(2) + "\n";
}

std::vector<std::string> decode_config(std::string_view text)
{
    // an empty file is an empty config
    if (trim_copy(text).empty()) return {};

    json doc;
    try {
        doc = json::parse(text);
    }
    catch (const json::parse_error& e) {
        throw PersistenceError(std::string("malformed config: ") + e.what());
    }

    if (!doc.is_object()) {
        throw PersistenceError("malformed config: expected a JSON object");
    }

    std::vector<std::string> symbols;
    const auto stocks = doc.find("Stocks");
    if (stocks == doc.end() || stocks->is_null()) return symbols;
    if (!stocks->is_array()) {
        throw PersistenceError("malformed config: Stocks is not an array");
    }

    for (const auto& entry : *stocks) {
        const auto symbol =
            entry.is_object() ? entry.find("Symbol") : entry.end();
        if (!entry.is_object() || symbol == entry.end() ||
            !symbol->is_string()) {
            throw PersistenceError(
                "malformed config: stock entry without a Symbol string");
        }
        // stored verbatim: the exact string is the symbol's identity
        std::string s = symbol->get<std::string>();
        if (s.empty()) {
            throw PersistenceError("malformed config: empty Symbol");
        }
        symbols.push_back(std::move(s));
    }
    return symbols;
}

ConfigStore::ConfigStore(std::filesystem::path path) : path_(std::move(path))
{
}

std::filesystem::path ConfigStore::default_path()
{
    std::string err;
    auto path = tickerboard::platform::config_file(kFileName, &err);
    if (path.empty()) throw PersistenceError(err);
    return path;
}

std::vector<std::string> ConfigStore::load() const
{
    std::shared_lock<std::shared_mutex> lock(mu_);

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        if (ec) {
            throw PersistenceError("cannot stat config " + path_.string() +
                                   ": " + ec.message());
        }
        return {};
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        throw PersistenceError("failed to open config for reading: " +
                               path_.string());
    }

    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        throw PersistenceError("failed to read config: " + path_.string());
    }

    return decode_config(buf.str());
}

bool ConfigStore::load(std::vector<std::string>* symbols,
                       std::string* err) const
{
    try {
        auto loaded = load();
        if (symbols) *symbols = std::move(loaded);
        return true;
    }
    catch (const std::exception& e) {
        if (err) *err = e.what();
        return false;
    }
}

bool ConfigStore::save(const std::vector<std::string>& symbols,
                       std::string* err)
{
    try {
        const std::string text = encode_config(symbols);

        std::unique_lock<std::shared_mutex> lock(mu_);
        write_atomically_(text);
        return true;
    }
    catch (const std::exception& e) {
        if (err) *err = e.what();
        return false;
    }
}

void ConfigStore::write_atomically_(const std::string& text)
{
    namespace fs = std::filesystem;

    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw PersistenceError("failed to create config directory '" +
                                   path_.parent_path().string() +
                                   "': " + ec.message());
        }
    }

    const fs::path tmp = path_.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw PersistenceError("failed to open config for writing: " +
                                   tmp.string());
        }
        out << text;
        out.flush();
        if (!out) {
            throw PersistenceError("failed to write config: " + tmp.string());
        }
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw PersistenceError("failed to replace config: " + ec.message());
    }
}

} // namespace board
