#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "board/board_state.hpp"
#include "market/live_quote_source.hpp"
#include "market/session_source.hpp"

namespace board {

struct IndexSymbol {
    const char* symbol;
    const char* label;
};

inline constexpr std::array<IndexSymbol, 3> kIndexSymbols = {{
    {".DJI", "DOW"},
    {".INX", "S&P"},
    {".IXIC", "NASDAQ"},
}};

inline constexpr int kDefaultLookbackDays = 30;

// What a cycle managed to gather; failures were logged and skipped.
struct CycleReport {
    std::size_t symbols_requested = 0;
    std::size_t history_ok = 0;
    std::size_t history_failed = 0;
    bool quotes_requested = false;
    bool quotes_ok = false;
    bool indexes_requested = false;
    bool indexes_ok = false;
    std::size_t dates_known = 0;
};

// Orders sessions newest first and fills change / percent_change from the
// next older session. The oldest session has no reference and stays at 0.
void derive_changes(std::vector<market::TradingSession>& sessions);

class RefreshCoordinator {
public:
    using NowFn = std::function<market::TimePoint()>;

    RefreshCoordinator(BoardState& board,
                       market::SessionSource& history,
                       market::LiveQuoteSource& quotes,
                       int lookback_days = kDefaultLookbackDays,
                       NowFn now = &market::Clock::now);

    // Every symbol on the board plus the index quotes.
    CycleReport run_cycle();

    // One just-added symbol: its history and live quote only.
    CycleReport run_incremental(const std::string& symbol);

private:
    CycleReport run_(const std::vector<std::string>& symbols,
                     bool include_indexes);

    BoardState& board_;
    market::SessionSource& history_;
    market::LiveQuoteSource& quotes_;
    int lookback_days_;
    NowFn now_;
};

} // namespace board
