#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "market/market_time.hpp"
#include "market/trading_session.hpp"

namespace board {

using SessionMap = std::map<market::Date, market::TradingSession>;

struct Snapshot {
    std::optional<market::TimePoint> refresh_time;
    // ascending, unique, never shrinks across commits
    std::vector<market::Date> dates;
    std::map<std::string, SessionMap> sessions;
    std::map<std::string, market::LiveQuote> index_quotes;
};

// Everything one refresh cycle gathered, merged single-threaded before commit.
struct CycleResult {
    market::TimePoint refresh_time;
    std::map<std::string, SessionMap> sessions;
    std::map<std::string, market::LiveQuote> index_quotes;
};

// Read-only view handed to readers while the shared lock is held.
struct BoardView {
    const std::vector<std::string>& symbols;
    const Snapshot& snapshot;
};

class BoardState {
public:
    explicit BoardState(std::vector<std::string> symbols = {});

    BoardState(const BoardState&) = delete;
    BoardState& operator=(const BoardState&) = delete;

    // fn runs under the shared lock; keep it to in-memory work
    template <class Fn>
    auto read(Fn&& fn) const
    {
        std::shared_lock<std::shared_mutex> lock(mu_);
        return fn(BoardView{symbols_, snapshot_});
    }

    std::vector<std::string> symbols() const;
    Snapshot snapshot() const;

    // *
    // **
    // ***
    // ****
    // ***** STRUCTURAL EDITS

    // index is clamped to [0, size]; after receives the list post-edit
    void insert_symbol(std::size_t index,
                       std::string symbol,
                       std::vector<std::string>* after = nullptr);

    // Drops the symbol's sessions once no other row lists it.
    bool remove_symbol(std::size_t index,
                       std::vector<std::string>* after = nullptr);

    bool swap_symbols(std::size_t a,
                      std::size_t b,
                      std::vector<std::string>* after = nullptr);

    // *
    // **
    // ***
    // ****
    // ***** COMMIT

    // Merges, never replaces: dates are unioned with the current set and
    // per-symbol sessions not refetched keep their prior values. A live
    // session never overwrites a historical one for the same date.
    void commit(CycleResult result);

private:
    mutable std::shared_mutex mu_;
    std::vector<std::string> symbols_;
    Snapshot snapshot_;
};

// Merge rule shared by the coordinator and commit.
void merge_session(SessionMap& into, const market::TradingSession& session);

} // namespace board
