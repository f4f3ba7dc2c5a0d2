#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "market/trading_session.hpp"

namespace market {

// Batched near-real-time quotes: one request regardless of symbol count.
// Throws TransportError, SchemaError or ParseError.
class LiveQuoteSource {
public:
    virtual ~LiveQuoteSource() = default;

    virtual std::vector<LiveQuote>
    fetch(const std::vector<std::string>& symbols) = 0;
};

class GoogleLiveQuoteSource : public LiveQuoteSource {
public:
    static constexpr const char* kDefaultUrl =
        "http://www.google.com/finance/info";

    explicit GoogleLiveQuoteSource(long timeout_sec,
                                   std::string base_url = kDefaultUrl);

    std::vector<LiveQuote>
    fetch(const std::vector<std::string>& symbols) override;

private:
    long timeout_sec_;
    std::string base_url_;
};

// Strips the "// " envelope prefix and decodes the JSON array. Empty change
// fields (after market close) read as 0; percent change is scaled to a
// fraction. An empty array is a SchemaError.
std::vector<LiveQuote> parse_live_quotes(std::string_view body);

} // namespace market
