#pragma once

#include "board/board_state.hpp"
#include "board/config_store.hpp"
#include "board/scheduler.hpp"
#include "market/errors.hpp"
#include "market/live_quote_source.hpp"
#include "market/session_source.hpp"
#include "state.hpp"
#include "test_utils.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace test {

inline market::Date ymd(int y, int m, int d)
{
    return market::Date::from_ymd(y, m, d);
}

inline market::TimePoint
utc(int y, int m, int d, int hour = 0, int minute = 0, int second = 0)
{
    const long long days = market::Date::from_ymd(y, m, d).days;
    return market::TimePoint{std::chrono::seconds{
        days * 86400 + hour * 3600 + minute * 60 + second}};
}

inline market::TradingSession
session(market::Date date, double close, std::int64_t volume = 1000)
{
    market::TradingSession s;
    s.date = date;
    s.open = close;
    s.high = close;
    s.low = close;
    s.close = close;
    s.volume = volume;
    return s;
}

// Canned history per symbol; symbols listed in fail_ throw a TransportError.
class FakeSessionSource : public market::SessionSource {
public:
    void set(const std::string& symbol, std::vector<market::TradingSession> rows)
    {
        std::lock_guard<std::mutex> lock(mu_);
        rows_[symbol] = std::move(rows);
        fail_.erase(symbol);
    }

    void fail(const std::string& symbol)
    {
        std::lock_guard<std::mutex> lock(mu_);
        fail_.insert(symbol);
    }

    std::vector<market::TradingSession>
    fetch(const std::string& symbol, market::Date start, market::Date end) override
    {
        std::lock_guard<std::mutex> lock(mu_);
        requested_.push_back(symbol);
        last_start_ = start;
        last_end_ = end;
        if (fail_.count(symbol)) {
            throw market::TransportError("fake outage for " + symbol);
        }
        auto it = rows_.find(symbol);
        if (it == rows_.end()) return {};
        return it->second;
    }

    const char* name() const override { return "fake"; }

    std::vector<std::string> requested() const
    {
        std::lock_guard<std::mutex> lock(mu_);
        return requested_;
    }

    market::Date last_start() const
    {
        std::lock_guard<std::mutex> lock(mu_);
        return last_start_;
    }

    market::Date last_end() const
    {
        std::lock_guard<std::mutex> lock(mu_);
        return last_end_;
    }

private:
    mutable std::mutex mu_;
    std::map<std::string, std::vector<market::TradingSession>> rows_;
    std::set<std::string> fail_;
    std::vector<std::string> requested_;
    market::Date last_start_;
    market::Date last_end_;
};

// Answers with every canned quote whose symbol was asked for.
class FakeLiveQuoteSource : public market::LiveQuoteSource {
public:
    void set(market::LiveQuote q)
    {
        std::lock_guard<std::mutex> lock(mu_);
        quotes_[q.symbol] = std::move(q);
    }

    void fail_all(bool fail)
    {
        std::lock_guard<std::mutex> lock(mu_);
        fail_ = fail;
    }

    std::vector<market::LiveQuote>
    fetch(const std::vector<std::string>& symbols) override
    {
        std::lock_guard<std::mutex> lock(mu_);
        batches_.push_back(symbols);
        if (fail_) throw market::SchemaError("fake batch failure");

        std::vector<market::LiveQuote> out;
        for (const auto& s : symbols) {
            auto it = quotes_.find(s);
            if (it != quotes_.end()) out.push_back(it->second);
        }
        return out;
    }

    std::vector<std::vector<std::string>> batches() const
    {
        std::lock_guard<std::mutex> lock(mu_);
        return batches_;
    }

private:
    mutable std::mutex mu_;
    std::map<std::string, market::LiveQuote> quotes_;
    std::vector<std::vector<std::string>> batches_;
    bool fail_ = false;
};

class FakeTrigger : public board::RefreshTrigger {
public:
    void request_full() override { ++full; }
    void request_symbol(const std::string& symbol) override
    {
        symbols.push_back(symbol);
    }

    int full = 0;
    std::vector<std::string> symbols;
};

// AppState wired to a sandboxed config directory and a fake trigger.
struct AppSandbox {
    TempDir temp;
    ScopedEnvVar xdg_data;
    ScopedEnvVar xdg_config;
    ScopedEnvVar home;
    board::ConfigStore config;
    board::BoardState board;
    FakeTrigger trigger;
    AppState app;

    explicit AppSandbox(std::vector<std::string> symbols = {})
        : xdg_data("XDG_DATA_HOME", (temp.path() / "xdg-data").string()),
          xdg_config("XDG_CONFIG_HOME", (temp.path() / "xdg-config").string()),
          home("HOME", (temp.path() / "home").string()),
          config(board::ConfigStore::default_path()),
          board(std::move(symbols))
    {
        app.board = &board;
        app.config = &config;
        app.refresh = &trigger;
    }

    std::filesystem::path config_file_path() const
    {
        return temp.path() / "xdg-config" / "tickerboard" / "config.json";
    }

    std::vector<std::string> reload() const
    {
        board::ConfigStore fresh(config_file_path());
        return fresh.load();
    }
};

} // namespace test
