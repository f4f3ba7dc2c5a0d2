#include "market/live_quote_source.hpp"
#include "market/errors.hpp"
#include "market/http.hpp"
#include "text.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace market {

using json = nlohmann::json;

static constexpr std::size_t kEnvelopePrefixLen = 3; // "// "

static std::string string_field(const json& entry, const char* key)
{
    const auto it = entry.find(key);
    if (it == entry.end() || it->is_null()) return {};
    if (!it->is_string()) {
        throw SchemaError(std::string("field '") + key + "' is not a string");
    }
    return it->get<std::string>();
}

static double number_field(const json& entry,
                           const char* key,
                           const std::string& ticker,
                           bool empty_is_zero)
{
    const std::string raw = trim_copy(string_field(entry, key));
    if (raw.empty() && empty_is_zero) return 0.0;

    // values such as "1,234.50" carry thousands separators
    std::string cleaned;
    cleaned.reserve(raw.size());
    for (char c : raw) {
        if (c != ',') cleaned.push_back(c);
    }

    double v = 0.0;
    if (!parse_double(cleaned, &v)) {
        throw ParseError(ticker + ": bad " + key + " '" + raw + "'");
    }
    return v;
}

std::vector<LiveQuote> parse_live_quotes(std::string_view body)
{
    if (body.size() < kEnvelopePrefixLen) {
        throw SchemaError("live quote response shorter than its envelope");
    }

    json parsed;
    try {
        parsed = json::parse(body.substr(kEnvelopePrefixLen));
    }
    catch (const json::parse_error& e) {
        throw SchemaError(std::string("live quote json: ") + e.what());
    }

    if (!parsed.is_array()) {
        throw SchemaError("live quote response is not an array");
    }
    if (parsed.empty()) {
        throw SchemaError("expected at least one live quote entry");
    }

    std::vector<LiveQuote> out;
    out.reserve(parsed.size());

    for (const auto& entry : parsed) {
        if (!entry.is_object()) {
            throw SchemaError("live quote entry is not an object");
        }

        LiveQuote q;
        q.symbol = string_field(entry, "t");

        const std::string ts = string_field(entry, "lt_dts");
        const auto timestamp = parse_utc_timestamp(ts);
        if (!timestamp) {
            throw ParseError(q.symbol + ": bad timestamp '" + ts + "'");
        }
        q.timestamp = *timestamp;

        q.price = number_field(entry, "l", q.symbol, false);
        q.change = number_field(entry, "c", q.symbol, true);
        q.percent_change = number_field(entry, "cp", q.symbol, true) / 100.0;

        out.push_back(std::move(q));
    }

    return out;
}

GoogleLiveQuoteSource::GoogleLiveQuoteSource(long timeout_sec,
                                             std::string base_url)
    : timeout_sec_(timeout_sec), base_url_(std::move(base_url))
{
}

std::vector<LiveQuote>
GoogleLiveQuoteSource::fetch(const std::vector<std::string>& symbols)
{
    std::string joined;
    for (const auto& s : symbols) {
        if (!joined.empty()) joined.push_back(',');
        joined += s;
    }

    const std::string url = http::build_url(base_url_,
                                            {
                                                {"client", "ig"},
                                                {"q", joined},
                                            });
    return parse_live_quotes(http::get(url, timeout_sec_));
}

} // namespace market
