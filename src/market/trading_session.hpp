#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "market/market_time.hpp"

namespace market {

// One exchange day. change and percent_change are derived at ingestion from
// the previous session in the same fetch; percent_change is a fraction.
struct TradingSession {
    Date date;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    std::int64_t volume = 0;
    double change = 0.0;
    double percent_change = 0.0;
    // synthetic session built from a live quote
    bool live = false;
};

// Near-real-time read, never persisted. percent_change is a fraction.
struct LiveQuote {
    std::string symbol;
    TimePoint timestamp;
    double price = 0.0;
    double change = 0.0;
    double percent_change = 0.0;
};

// Synthetic same-day session keyed by the quote's exchange date.
inline TradingSession session_from_quote(const LiveQuote& q)
{
    TradingSession s;
    s.date = exchange_date(q.timestamp);
    s.open = q.price;
    s.high = q.price;
    s.low = q.price;
    s.close = q.price;
    s.change = q.change;
    s.percent_change = q.percent_change;
    s.live = true;
    return s;
}

} // namespace market
