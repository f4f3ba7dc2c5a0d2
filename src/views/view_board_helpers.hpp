#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <string>

#include "board/board_state.hpp"

namespace views {

inline constexpr const char* kNaValue = "--";

inline constexpr int kSymbolColWidth = 9; // marker + space + symbol
inline constexpr int kCellWidth = 10;
inline constexpr int kCellPadding = 2;
inline constexpr int kCellHeight = 4; // price, change, %change, volume
inline constexpr int kRowPadding = 1;
inline constexpr int kHeaderLines = 3; // status, index quotes, dates
inline constexpr std::size_t kSymbolMaxLen = 12;

// Ascending |percent change| thresholds, one severity level per entry.
inline constexpr std::array<double, 5> kChangeThresholds = {
    0.0, 0.05, 0.10, 0.25, 0.50};
inline constexpr int kChangeLevels = static_cast<int>(kChangeThresholds.size());

inline constexpr short kColorPairHeader = 1;
inline constexpr short kColorPairOverlay = 2;
inline constexpr short kColorPairUpBase = 10;   // 10..14
inline constexpr short kColorPairDownBase = 20; // 20..24

// *
// **
// ***
// ****
// ***** LAYOUT

struct BoardLayout {
    int date_cols = 0;  // date columns on screen
    int first_date = 0; // index into the date set of the leftmost column
    int rows = 0;       // symbol rows that fit
    int grid_y = kHeaderLines;
    int help_lines = 0;
};

inline int available_date_columns(int term_cols)
{
    if (term_cols <= kSymbolColWidth) return 0;
    return (term_cols - kSymbolColWidth + kCellPadding) /
           (kCellWidth + kCellPadding);
}

inline int visible_symbol_rows(int lines_available)
{
    if (lines_available < kCellHeight) return 0;
    return (lines_available + kRowPadding) / (kCellHeight + kRowPadding);
}

inline int help_line_count(int term_lines, bool show_help)
{
    if (!show_help) return 0;
    if (term_lines >= 12) return 2;
    if (term_lines >= 8) return 1;
    return 0;
}

inline BoardLayout
compute_layout(int term_lines, int term_cols, int total_dates, bool show_help)
{
    BoardLayout l;
    l.help_lines = help_line_count(term_lines, show_help);
    l.date_cols = std::max(
        0, std::min(available_date_columns(term_cols), total_dates));
    // most recent dates, right-aligned to now
    l.first_date = std::max(0, total_dates - l.date_cols);
    l.rows = visible_symbol_rows(term_lines - l.grid_y - l.help_lines);
    return l;
}

inline int cell_x(int col)
{
    return kSymbolColWidth + col * (kCellWidth + kCellPadding);
}

inline int row_y(const BoardLayout& l, int visible_row)
{
    return l.grid_y + visible_row * (kCellHeight + kRowPadding);
}

// Moves scroll one row at a time until the selected row's band is inside the
// window. The last violated edge wins; nothing is recomputed from the top.
inline int adjust_scroll(int scroll, int selected, int count, int visible_rows)
{
    if (count <= 0) return 0;

    scroll = std::clamp(scroll, 0, count - 1);
    // too short for a row: keep the offset for when the terminal grows
    if (visible_rows <= 0) return scroll;

    selected = std::clamp(selected, 0, count - 1);

    while (selected < scroll) --scroll;
    while (selected > scroll + visible_rows - 1) ++scroll;

    // list shrank under the window
    while (scroll > 0 && scroll + visible_rows > count) --scroll;
    return scroll;
}

// *
// **
// ***
// ****
// ***** COLORS

inline int change_level(double percent_change)
{
    const double mag = std::fabs(percent_change);
    int level = 0;
    for (int i = 0; i < kChangeLevels; ++i) {
        if (mag >= kChangeThresholds[static_cast<std::size_t>(i)]) level = i;
    }
    return level;
}

// 0 for an unchanged session
inline short change_color_pair(double change, double percent_change)
{
    const short level = static_cast<short>(change_level(percent_change));
    if (change > 0.0) return static_cast<short>(kColorPairUpBase + level);
    if (change < 0.0) return static_cast<short>(kColorPairDownBase + level);
    return 0;
}

// *
// **
// ***
// ****
// ***** FORMATTING

inline std::string group_thousands(const std::string& int_text)
{
    if (int_text.empty()) return int_text;

    const bool neg = int_text[0] == '-' || int_text[0] == '+';
    const std::size_t start = neg ? 1U : 0U;
    const std::size_t digits = int_text.size() - start;
    if (digits <= 3) return int_text;

    std::string out;
    out.reserve(int_text.size() + ((digits - 1) / 3));
    if (neg) out.push_back(int_text[0]);

    std::size_t pos = start;
    std::size_t head = digits % 3;
    if (head == 0) head = 3;
    out.append(int_text, pos, head);
    pos += head;

    while (pos < int_text.size()) {
        out.push_back(',');
        out.append(int_text, pos, 3);
        pos += 3;
    }
    return out;
}

inline std::string format_price(double v, bool show_sign = false)
{
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    if (show_sign) oss.setf(std::ios::showpos);
    oss << std::setprecision(2) << v;
    const std::string raw = oss.str();
    const std::size_t dot = raw.find('.');
    if (dot == std::string::npos) return raw;
    return group_thousands(raw.substr(0, dot)) + raw.substr(dot);
}

inline std::string format_change(double v)
{
    return format_price(v, true);
}

// fraction in, percentage out
inline std::string format_percent(double fraction)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%+.2f%%", fraction * 100.0);
    return buf;
}

inline std::string format_volume(std::int64_t v)
{
    if (v <= 0) return kNaValue;

    struct Unit {
        double scale;
        const char* suffix;
    };
    static constexpr std::array<Unit, 3> units = {{
        {1e9, "B"},
        {1e6, "M"},
        {1e3, "K"},
    }};

    const double d = static_cast<double>(v);
    for (const auto& u : units) {
        if (d >= u.scale) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.1f%s", d / u.scale, u.suffix);
            return buf;
        }
    }
    return std::to_string(v);
}

// *
// **
// ***
// ****
// ***** CELLS

// Text of one grid cell, top line first.
struct CellText {
    bool placeholder = false;
    std::array<std::string, kCellHeight> lines;
};

// Session stored for exactly (symbol, date); nullptr when either is missing.
inline const market::TradingSession*
find_cell(const board::Snapshot& snap, const std::string& symbol, market::Date date)
{
    const auto sessions = snap.sessions.find(symbol);
    if (sessions == snap.sessions.end()) return nullptr;
    const auto it = sessions->second.find(date);
    if (it == sessions->second.end()) return nullptr;
    return &it->second;
}

inline CellText cell_text(const market::TradingSession* s)
{
    CellText c;
    if (!s) {
        c.placeholder = true;
        c.lines[0] = kNaValue;
        return c;
    }
    c.lines[0] = format_price(s->close);
    c.lines[1] = format_change(s->change);
    c.lines[2] = format_percent(s->percent_change);
    c.lines[3] = s->live ? "live" : format_volume(s->volume);
    return c;
}

} // namespace views
