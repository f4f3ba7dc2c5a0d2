#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "market/market_time.hpp"
#include "market/trading_session.hpp"

namespace market {

enum class SourceKind { Google, Yahoo, Random };

const char* source_kind_label(SourceKind kind);
std::optional<SourceKind> parse_source_kind(std::string_view text);

// Historical daily bars for one symbol. Implementations may return sessions
// in any order; change fields are left at zero for the caller to derive.
// Throws TransportError, SchemaError or ParseError. A valid symbol with no
// rows yields an empty vector.
class SessionSource {
public:
    virtual ~SessionSource() = default;

    virtual std::vector<TradingSession>
    fetch(const std::string& symbol, Date start, Date end) = 0;

    virtual const char* name() const = 0;
};

class GoogleSessionSource : public SessionSource {
public:
    static constexpr const char* kDefaultUrl =
        "http://www.google.com/finance/historical";

    explicit GoogleSessionSource(long timeout_sec,
                                 std::string base_url = kDefaultUrl);

    std::vector<TradingSession>
    fetch(const std::string& symbol, Date start, Date end) override;

    const char* name() const override { return "google"; }

private:
    long timeout_sec_;
    std::string base_url_;
};

class YahooSessionSource : public SessionSource {
public:
    static constexpr const char* kDefaultUrl =
        "http://ichart.yahoo.com/table.csv";

    explicit YahooSessionSource(long timeout_sec,
                                std::string base_url = kDefaultUrl);

    std::vector<TradingSession>
    fetch(const std::string& symbol, Date start, Date end) override;

    const char* name() const override { return "yahoo"; }

private:
    long timeout_sec_;
    std::string base_url_;
};

// Tries each backend in a fresh random order and returns the first success.
class FallbackSessionSource : public SessionSource {
public:
    FallbackSessionSource(std::vector<std::unique_ptr<SessionSource>> backends,
                          unsigned seed);

    std::vector<TradingSession>
    fetch(const std::string& symbol, Date start, Date end) override;

    const char* name() const override { return "random"; }

private:
    std::vector<std::size_t> shuffled_order_();

    std::vector<std::unique_ptr<SessionSource>> backends_;
    std::mutex rng_mu_;
    std::mt19937 rng_;
};

std::unique_ptr<SessionSource> make_session_source(SourceKind kind,
                                                   long timeout_sec);

// *
// **
// ***
// ****
// ***** CSV PARSING

// Date,Open,High,Low,Close,Volume with dates like 2-Jan-06
std::vector<TradingSession> parse_google_csv(std::string_view body);

// Date,Open,High,Low,Close,Volume,Adj Close with dates like 2006-01-02
std::vector<TradingSession> parse_yahoo_csv(std::string_view body);

} // namespace market
