#include "market/session_source.hpp"
#include "market/errors.hpp"
#include "market/http.hpp"
#include "text.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>
#include <sstream>
#include <utility>

namespace market {

const char* source_kind_label(SourceKind kind)
{
    switch (kind) {
    case SourceKind::Google:
        return "google";
    case SourceKind::Yahoo:
        return "yahoo";
    case SourceKind::Random:
        return "random";
    }
    return "random";
}

std::optional<SourceKind> parse_source_kind(std::string_view text)
{
    const std::string v = lower_copy(trim_copy(text));
    if (v == "google") return SourceKind::Google;
    if (v == "yahoo") return SourceKind::Yahoo;
    if (v == "random") return SourceKind::Random;
    return std::nullopt;
}

// *
// **
// ***
// ****
// ***** CSV PARSING

using DateParser = std::optional<Date> (*)(std::string_view);

static std::vector<std::string_view> split_lines(std::string_view body)
{
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < body.size()) {
        std::size_t end = body.find('\n', start);
        if (end == std::string_view::npos) end = body.size();
        std::string_view line = body.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (!line.empty()) lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

static double field_f64(const std::vector<std::string>& record,
                        std::size_t i,
                        const char* what)
{
    double v = 0.0;
    if (!parse_double(record[i], &v)) {
        throw ParseError(std::string("bad ") + what + " '" + record[i] + "'");
    }
    return v;
}

static std::vector<TradingSession> parse_history_csv(std::string_view body,
                                                     std::size_t field_count,
                                                     DateParser parse_date)
{
    std::vector<TradingSession> out;

    const auto lines = split_lines(body);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto record = split_copy(lines[i], ',');

        if (record.size() != field_count) {
            std::ostringstream oss;
            oss << "record length should be " << field_count << ", got "
                << record.size();
            throw SchemaError(oss.str());
        }

        // header row
        if (i == 0) continue;

        const auto date = parse_date(trim_copy(record[0]));
        if (!date) {
            throw ParseError("bad date '" + record[0] + "'");
        }

        TradingSession s;
        s.date = *date;
        s.open = field_f64(record, 1, "open");
        s.high = field_f64(record, 2, "high");
        s.low = field_f64(record, 3, "low");
        s.close = field_f64(record, 4, "close");
        if (!parse_int64(record[5], &s.volume)) {
            throw ParseError("bad volume '" + record[5] + "'");
        }
        // adjusted close (Yahoo) is ignored to keep backends uniform

        out.push_back(s);
    }

    return out;
}

std::vector<TradingSession> parse_google_csv(std::string_view body)
{
    // Google prefixes its CSV with a UTF-8 BOM
    if (body.size() >= 3 && body.substr(0, 3) == "\xEF\xBB\xBF") {
        body.remove_prefix(3);
    }
    return parse_history_csv(body, 6, &parse_short_month_date);
}

std::vector<TradingSession> parse_yahoo_csv(std::string_view body)
{
    return parse_history_csv(body, 7, &parse_iso_date);
}

// *
// **
// ***
// ****
// ***** BACKENDS

GoogleSessionSource::GoogleSessionSource(long timeout_sec, std::string base_url)
    : timeout_sec_(timeout_sec), base_url_(std::move(base_url))
{
}

std::vector<TradingSession>
GoogleSessionSource::fetch(const std::string& symbol, Date start, Date end)
{
    const std::string url = http::build_url(base_url_,
                                            {
                                                {"q", symbol},
                                                {"startdate", format_long_date(start)},
                                                {"enddate", format_long_date(end)},
                                                {"output", "csv"},
                                            });
    return parse_google_csv(http::get(url, timeout_sec_));
}

YahooSessionSource::YahooSessionSource(long timeout_sec, std::string base_url)
    : timeout_sec_(timeout_sec), base_url_(std::move(base_url))
{
}

std::vector<TradingSession>
YahooSessionSource::fetch(const std::string& symbol, Date start, Date end)
{
    // months are zero-based in this API
    const std::string url =
        http::build_url(base_url_,
                        {
                            {"s", symbol},
                            {"a", std::to_string(start.month() - 1)},
                            {"b", std::to_string(start.day())},
                            {"c", std::to_string(start.year())},
                            {"d", std::to_string(end.month() - 1)},
                            {"e", std::to_string(end.day())},
                            {"f", std::to_string(end.year())},
                            {"g", "d"},
                            {"ignore", ".csv"},
                        });
    return parse_yahoo_csv(http::get(url, timeout_sec_));
}

FallbackSessionSource::FallbackSessionSource(
    std::vector<std::unique_ptr<SessionSource>> backends, unsigned seed)
    : backends_(std::move(backends)), rng_(seed)
{
}

std::vector<std::size_t> FallbackSessionSource::shuffled_order_()
{
    std::vector<std::size_t> order(backends_.size());
    std::iota(order.begin(), order.end(), std::size_t{0});

    std::lock_guard<std::mutex> lock(rng_mu_);
    std::shuffle(order.begin(), order.end(), rng_);
    return order;
}

std::vector<TradingSession>
FallbackSessionSource::fetch(const std::string& symbol, Date start, Date end)
{
    std::string last_error;
    ErrorKind last_kind = ErrorKind::Transport;

    for (std::size_t idx : shuffled_order_()) {
        SessionSource& backend = *backends_[idx];
        try {
            return backend.fetch(symbol, start, end);
        }
        catch (const FetchError& e) {
            spdlog::warn("{} history for {} failed ({}): {}",
                         backend.name(),
                         symbol,
                         error_kind_label(e.kind()),
                         e.what());
            last_error = e.what();
            last_kind = e.kind();
        }
    }

    std::ostringstream oss;
    oss << "all " << backends_.size() << " history backends failed";
    if (!last_error.empty()) oss << "; last: " << last_error;
    throw FetchError(last_kind, oss.str());
}

std::unique_ptr<SessionSource> make_session_source(SourceKind kind,
                                                   long timeout_sec)
{
    switch (kind) {
    case SourceKind::Google:
        return std::make_unique<GoogleSessionSource>(timeout_sec);
    case SourceKind::Yahoo:
        return std::make_unique<YahooSessionSource>(timeout_sec);
    case SourceKind::Random:
        break;
    }

    std::vector<std::unique_ptr<SessionSource>> backends;
    backends.push_back(std::make_unique<GoogleSessionSource>(timeout_sec));
    backends.push_back(std::make_unique<YahooSessionSource>(timeout_sec));
    return std::make_unique<FallbackSessionSource>(std::move(backends),
                                                   std::random_device{}());
}

} // namespace market
