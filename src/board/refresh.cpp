#include "board/refresh.hpp"
#include "market/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <future>
#include <set>
#include <utility>

namespace board {

void derive_changes(std::vector<market::TradingSession>& sessions)
{
    std::stable_sort(sessions.begin(),
                     sessions.end(),
                     [](const auto& a, const auto& b) { return a.date > b.date; });

    for (std::size_t i = 0; i < sessions.size(); ++i) {
        auto& s = sessions[i];
        if (i + 1 >= sessions.size()) {
            s.change = 0.0;
            s.percent_change = 0.0;
            continue;
        }

        const double prev_close = sessions[i + 1].close;
        s.change = s.close - prev_close;
        s.percent_change = prev_close != 0.0 ? s.change / prev_close : 0.0;
    }
}

// Logs and swallows the failure of one leg; the cycle carries on.
template <class T>
static bool collect(std::future<T>& f, T* out, const std::string& what)
{
    try {
        *out = f.get();
        return true;
    }
    catch (const market::FetchError& e) {
        spdlog::warn("{}: {} error: {}",
                     what,
                     market::error_kind_label(e.kind()),
                     e.what());
    }
    catch (const std::exception& e) {
        spdlog::warn("{}: {}", what, e.what());
    }
    return false;
}

RefreshCoordinator::RefreshCoordinator(BoardState& board,
                                       market::SessionSource& history,
                                       market::LiveQuoteSource& quotes,
                                       int lookback_days,
                                       NowFn now)
    : board_(board),
      history_(history),
      quotes_(quotes),
      lookback_days_(lookback_days),
      now_(std::move(now))
{
}

CycleReport RefreshCoordinator::run_cycle()
{
    return run_(board_.symbols(), true);
}

CycleReport RefreshCoordinator::run_incremental(const std::string& symbol)
{
    return run_({symbol}, false);
}

CycleReport RefreshCoordinator::run_(const std::vector<std::string>& symbols,
                                     bool include_indexes)
{
    // distinct symbols, first occurrence order
    std::vector<std::string> distinct;
    {
        std::set<std::string> seen;
        for (const auto& s : symbols) {
            if (!s.empty() && seen.insert(s).second) distinct.push_back(s);
        }
    }

    const market::TimePoint now = now_();
    const market::Date end = market::exchange_date(now);
    const market::Date start = end - lookback_days_;

    CycleReport report;
    report.symbols_requested = distinct.size();
    report.quotes_requested = !distinct.empty();
    report.indexes_requested = include_indexes;

    spdlog::info("refresh: {} symbols, window {} - {}{}",
                 distinct.size(),
                 market::format_short_date(start),
                 market::format_short_date(end),
                 include_indexes ? "" : " (incremental)");

    // *
    // **
    // ***
    // ****
    // ***** FAN OUT

    using History = std::vector<market::TradingSession>;
    using Quotes = std::vector<market::LiveQuote>;

    std::vector<std::pair<std::string, std::future<History>>> history_tasks;
    history_tasks.reserve(distinct.size());
    for (const auto& symbol : distinct) {
        history_tasks.emplace_back(
            symbol,
            std::async(std::launch::async, [this, symbol, start, end] {
                return history_.fetch(symbol, start, end);
            }));
    }

    std::future<Quotes> quote_task;
    if (report.quotes_requested) {
        quote_task = std::async(std::launch::async, [this, &distinct] {
            return quotes_.fetch(distinct);
        });
    }

    std::future<Quotes> index_task;
    if (include_indexes) {
        index_task = std::async(std::launch::async, [this] {
            std::vector<std::string> indexes;
            for (const auto& idx : kIndexSymbols) indexes.push_back(idx.symbol);
            return quotes_.fetch(indexes);
        });
    }

    // *
    // **
    // ***
    // ****
    // ***** FAN IN

    CycleResult result;
    result.refresh_time = now;

    for (auto& [symbol, task] : history_tasks) {
        History sessions;
        if (!collect(task, &sessions, "history " + symbol)) {
            ++report.history_failed;
            continue;
        }
        ++report.history_ok;

        derive_changes(sessions);
        SessionMap& by_date = result.sessions[symbol];
        for (const auto& s : sessions) merge_session(by_date, s);
    }

    if (quote_task.valid()) {
        Quotes quotes;
        report.quotes_ok = collect(quote_task, &quotes, "live quotes");

        const std::set<std::string> wanted(distinct.begin(), distinct.end());
        for (const auto& q : quotes) {
            if (wanted.count(q.symbol) == 0) {
                spdlog::debug("live quote for unrequested symbol {}", q.symbol);
                continue;
            }
            merge_session(result.sessions[q.symbol],
                          market::session_from_quote(q));
        }
    }

    if (index_task.valid()) {
        Quotes quotes;
        report.indexes_ok = collect(index_task, &quotes, "index quotes");
        for (auto& q : quotes) {
            result.index_quotes[q.symbol] = std::move(q);
        }
    }

    board_.commit(std::move(result));

    report.dates_known =
        board_.read([](const BoardView& v) { return v.snapshot.dates.size(); });

    spdlog::info("refresh committed: {} ok, {} failed, quotes {}, {} dates",
                 report.history_ok,
                 report.history_failed,
                 report.quotes_requested ? (report.quotes_ok ? "ok" : "failed")
                                         : "skipped",
                 report.dates_known);
    return report;
}

} // namespace board
