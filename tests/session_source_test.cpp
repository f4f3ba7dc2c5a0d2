#include "market/errors.hpp"
#include "market/session_source.hpp"
#include "test_fixture.hpp"
#include "test_harness.hpp"

#include <memory>
#include <string>
#include <vector>

using test::ymd;

TEST_CASE("google csv parses six column rows with short month dates")
{
    const std::string body =
        "\xEF\xBB\xBF"
        "Date,Open,High,Low,Close,Volume\n"
        "15-Sep-15,116.58,116.89,114.86,116.28,37173492\n"
        "14-Sep-15,116.58,116.89,114.86,115.31,58363359\n";

    const auto rows = market::parse_google_csv(body);
    REQUIRE_EQ(rows.size(), std::size_t{2});
    REQUIRE_EQ(rows[0].date, ymd(2015, 9, 15));
    REQUIRE_EQ(rows[0].close, 116.28);
    REQUIRE_EQ(rows[0].volume, std::int64_t{37173492});
    REQUIRE_EQ(rows[1].date, ymd(2015, 9, 14));
    REQUIRE_EQ(rows[1].open, 116.58);
    REQUIRE(!rows[0].live);
}

TEST_CASE("yahoo csv parses seven column rows and ignores adjusted close")
{
    const std::string body =
        "Date,Open,High,Low,Close,Volume,Adj Close\r\n"
        "2015-09-15,116.58,116.89,114.86,116.28,37173492,115.10\r\n";

    const auto rows = market::parse_yahoo_csv(body);
    REQUIRE_EQ(rows.size(), std::size_t{1});
    REQUIRE_EQ(rows[0].date, ymd(2015, 9, 15));
    REQUIRE_EQ(rows[0].high, 116.89);
    REQUIRE_EQ(rows[0].low, 114.86);
    REQUIRE_EQ(rows[0].close, 116.28);
}

TEST_CASE("history csv with only a header yields no sessions")
{
    REQUIRE(market::parse_google_csv("Date,Open,High,Low,Close,Volume\n").empty());
    REQUIRE(market::parse_yahoo_csv("").empty());
}

TEST_CASE("history csv with a wrong field count is a schema error")
{
    const std::string body =
        "Date,Open,High,Low,Close,Volume\n"
        "15-Sep-15,116.58,116.89,114.86,116.28,37173492\n"
        "14-Sep-15,116.58,116.89,114.86,115.31\n";

    bool caught = false;
    try {
        (void)market::parse_google_csv(body);
    }
    catch (const market::SchemaError& e) {
        caught = true;
        REQUIRE_CONTAINS(std::string(e.what()), "record length should be 6, got 5");
    }
    REQUIRE(caught);

    // six columns where seven are expected
    REQUIRE_THROWS(market::parse_yahoo_csv(
        "Date,Open,High,Low,Close,Volume\n2015-09-15,1,2,3,4,5\n"));
}

TEST_CASE("history csv with an unparsable date or number is a parse error")
{
    bool date_error = false;
    try {
        (void)market::parse_google_csv(
            "Date,Open,High,Low,Close,Volume\n2015-09-15,1,2,3,4,5\n");
    }
    catch (const market::ParseError&) {
        date_error = true;
    }
    REQUIRE(date_error);

    bool number_error = false;
    try {
        (void)market::parse_yahoo_csv(
            "Date,Open,High,Low,Close,Volume,Adj Close\n"
            "2015-09-15,1,2,x,4,5,6\n");
    }
    catch (const market::ParseError& e) {
        number_error = true;
        REQUIRE_EQ(e.kind(), market::ErrorKind::Parse);
    }
    REQUIRE(number_error);
}

TEST_CASE("source kind names parse case insensitively")
{
    REQUIRE(market::parse_source_kind("Google") == market::SourceKind::Google);
    REQUIRE(market::parse_source_kind(" yahoo ") == market::SourceKind::Yahoo);
    REQUIRE(market::parse_source_kind("random") == market::SourceKind::Random);
    REQUIRE(!market::parse_source_kind("bloomberg"));
    REQUIRE_EQ(std::string(market::source_kind_label(market::SourceKind::Yahoo)),
               std::string("yahoo"));
}

TEST_CASE("fallback source returns the first backend that succeeds")
{
    auto failing = std::make_unique<test::FakeSessionSource>();
    auto working = std::make_unique<test::FakeSessionSource>();
    failing->fail("AAPL");
    working->set("AAPL", {test::session(ymd(2015, 9, 14), 115.31)});

    std::vector<std::unique_ptr<market::SessionSource>> backends;
    backends.push_back(std::move(failing));
    backends.push_back(std::move(working));

    market::FallbackSessionSource source(std::move(backends), 7);
    for (int i = 0; i < 8; ++i) {
        const auto rows = source.fetch("AAPL", ymd(2015, 9, 1), ymd(2015, 9, 15));
        REQUIRE_EQ(rows.size(), std::size_t{1});
        REQUIRE_EQ(rows[0].close, 115.31);
    }
}

TEST_CASE("fallback source reports when every backend failed")
{
    auto a = std::make_unique<test::FakeSessionSource>();
    auto b = std::make_unique<test::FakeSessionSource>();
    a->fail("MSFT");
    b->fail("MSFT");

    std::vector<std::unique_ptr<market::SessionSource>> backends;
    backends.push_back(std::move(a));
    backends.push_back(std::move(b));
    market::FallbackSessionSource source(std::move(backends), 1);

    bool caught = false;
    try {
        (void)source.fetch("MSFT", ymd(2015, 9, 1), ymd(2015, 9, 15));
    }
    catch (const market::FetchError& e) {
        caught = true;
        REQUIRE_EQ(e.kind(), market::ErrorKind::Transport);
        REQUIRE_CONTAINS(std::string(e.what()), "all 2 history backends failed");
    }
    REQUIRE(caught);
}
