#include "board/board_state.hpp"

#include <algorithm>
#include <iterator>
#include <mutex>
#include <set>
#include <utility>

namespace board {

void merge_session(SessionMap& into, const market::TradingSession& session)
{
    const auto it = into.find(session.date);
    if (it == into.end()) {
        into.emplace(session.date, session);
        return;
    }

    // history wins over a still-forming live session
    if (session.live && !it->second.live) return;
    it->second = session;
}

BoardState::BoardState(std::vector<std::string> symbols)
    : symbols_(std::move(symbols))
{
}

std::vector<std::string> BoardState::symbols() const
{
    std::shared_lock<std::shared_mutex> lock(mu_);
    return symbols_;
}

Snapshot BoardState::snapshot() const
{
    std::shared_lock<std::shared_mutex> lock(mu_);
    return snapshot_;
}

void BoardState::insert_symbol(std::size_t index,
                               std::string symbol,
                               std::vector<std::string>* after)
{
    std::unique_lock<std::shared_mutex> lock(mu_);
    index = std::min(index, symbols_.size());
    symbols_.insert(symbols_.begin() + static_cast<std::ptrdiff_t>(index),
                    std::move(symbol));
    if (after) *after = symbols_;
}

bool BoardState::remove_symbol(std::size_t index,
                               std::vector<std::string>* after)
{
    std::unique_lock<std::shared_mutex> lock(mu_);
    if (index >= symbols_.size()) return false;
    const std::string symbol = symbols_[index];
    symbols_.erase(symbols_.begin() + static_cast<std::ptrdiff_t>(index));

    // a re-added symbol starts blank; the date set keeps its dates
    if (std::find(symbols_.begin(), symbols_.end(), symbol) == symbols_.end()) {
        snapshot_.sessions.erase(symbol);
    }
    if (after) *after = symbols_;
    return true;
}

bool BoardState::swap_symbols(std::size_t a,
                              std::size_t b,
                              std::vector<std::string>* after)
{
    std::unique_lock<std::shared_mutex> lock(mu_);
    if (a >= symbols_.size() || b >= symbols_.size()) return false;
    std::swap(symbols_[a], symbols_[b]);
    if (after) *after = symbols_;
    return true;
}

void BoardState::commit(CycleResult result)
{
    // collect the cycle's dates before taking the lock
    std::set<market::Date> observed;
    for (const auto& [symbol, by_date] : result.sessions) {
        for (const auto& [date, session] : by_date) observed.insert(date);
    }

    std::unique_lock<std::shared_mutex> lock(mu_);

    // overlapping cycles may commit out of order
    if (!snapshot_.refresh_time || *snapshot_.refresh_time < result.refresh_time) {
        snapshot_.refresh_time = result.refresh_time;
    }

    std::vector<market::Date> dates;
    dates.reserve(snapshot_.dates.size() + observed.size());
    std::set_union(snapshot_.dates.begin(),
                   snapshot_.dates.end(),
                   observed.begin(),
                   observed.end(),
                   std::back_inserter(dates));
    snapshot_.dates = std::move(dates);

    for (auto& [symbol, by_date] : result.sessions) {
        SessionMap& existing = snapshot_.sessions[symbol];
        for (const auto& [date, session] : by_date) {
            merge_session(existing, session);
        }
    }

    for (auto& [symbol, quote] : result.index_quotes) {
        snapshot_.index_quotes[symbol] = std::move(quote);
    }
}

} // namespace board
