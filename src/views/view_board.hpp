#pragma once
#include <curses.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

#include "market/market_time.hpp"
#include "state.hpp"
#include "views/view.hpp"
#include "views/view_board_helpers.hpp"

namespace views {

// *
// **
// ***
// ****
// ***** DRAWING

inline void put_clipped(int y, int x, int width, const std::string& text)
{
    if (y < 0 || y >= LINES || x < 0 || x >= COLS || width <= 0) return;
    const int w = std::min(width, COLS - x);
    const int n = std::min(static_cast<int>(text.size()), w);
    if (n > 0) mvprintw(y, x, "%.*s", n, text.c_str());
}

inline void put_right(int y, int x, int width, const std::string& text)
{
    const int pad = std::max(0, width - static_cast<int>(text.size()));
    put_clipped(y, x + pad, width - pad, text);
}

inline void color_on(short pair)
{
    if (pair > 0 && has_colors()) attron(COLOR_PAIR(pair));
}

inline void color_off(short pair)
{
    if (pair > 0 && has_colors()) attroff(COLOR_PAIR(pair));
}

inline void render_status_line(const board::Snapshot& snap)
{
    if (LINES <= 0) return;

    color_on(kColorPairHeader);
    attron(A_BOLD);
    put_clipped(0, 0, COLS, "tickerboard ~");
    attroff(A_BOLD);
    color_off(kColorPairHeader);

    std::string status;
    if (snap.refresh_time) {
        status = " " + market::format_refresh_time(*snap.refresh_time);
    }
    else {
        status = " refreshing...";
    }
    status += market::is_market_hours(market::Clock::now()) ? "   open"
                                                            : "   closed";
    put_clipped(0, 13, COLS - 13, status);
}

inline void render_index_line(const board::Snapshot& snap)
{
    if (LINES <= 1) return;

    int x = 0;
    for (const auto& idx : board::kIndexSymbols) {
        auto it = snap.index_quotes.find(idx.symbol);
        if (it == snap.index_quotes.end()) continue;

        const auto& q = it->second;
        const std::string text = std::string(idx.label) + " " +
                                 format_price(q.price) + " " +
                                 format_change(q.change) + " (" +
                                 format_percent(q.percent_change) + ")";

        const short pair = change_color_pair(q.change, q.percent_change);
        color_on(pair);
        put_clipped(1, x, COLS - x, text);
        color_off(pair);

        x += static_cast<int>(text.size()) + 3;
        if (x >= COLS) break;
    }
}

inline void render_cell(int y, int x, const market::TradingSession* s)
{
    const CellText c = cell_text(s);
    if (c.placeholder) {
        attron(A_DIM);
        put_right(y, x, kCellWidth, c.lines[0]);
        attroff(A_DIM);
        return;
    }

    const short pair = change_color_pair(s->change, s->percent_change);
    color_on(pair);
    for (int i = 0; i < 3; ++i) {
        put_right(y + i, x, kCellWidth, c.lines[static_cast<std::size_t>(i)]);
    }
    color_off(pair);

    attron(A_DIM);
    put_right(y + 3, x, kCellWidth, c.lines[3]);
    attroff(A_DIM);
}

inline void render_compose_overlay(const AppState& app)
{
    const std::string prompt = "add: ";
    const std::string& buf = app.selection.buffer;
    const int inner = static_cast<int>(
        prompt.size() + std::max(kSymbolMaxLen, buf.size()));
    const int w = std::min(COLS, inner + 4);
    const int h = 3;
    if (w <= 0 || LINES < h) return;

    const int x = std::max(0, (COLS - w) / 2);
    const int y = std::max(0, (LINES - h) / 2);

    color_on(kColorPairOverlay);
    for (int i = 0; i < h; ++i) mvprintw(y + i, x, "%*s", w, "");
    put_clipped(y + 1, x + 2, w - 4, prompt + buf);
    color_off(kColorPairOverlay);

    const int cursor_x = x + 2 + static_cast<int>(prompt.size() + buf.size());
    move(y + 1, std::min(cursor_x, std::max(0, COLS - 1)));
}

inline void render_footer(const AppState& app, const BoardLayout& l)
{
    if (l.help_lines >= 2) {
        attron(A_DIM);
        put_clipped(LINES - 2,
                    0,
                    COLS,
                    "type: add   del: remove   shift+up/down: move");
        put_clipped(LINES - 1, 0, COLS, "^R: refresh   ^Q: quit");
        attroff(A_DIM);
    }
    else if (l.help_lines == 1) {
        attron(A_DIM);
        put_clipped(LINES - 1, 0, COLS, "type: add   del: remove   ^R: refresh   ^Q: quit");
        attroff(A_DIM);
    }

    if (!app.last_error.empty() && LINES > 0) {
        attron(A_BOLD);
        mvprintw(LINES - 1, 0, "%*s", std::max(0, COLS - 1), "");
        put_clipped(LINES - 1, 0, COLS, app.last_error);
        attroff(A_BOLD);
    }
}

inline void render_board(AppState& app)
{
    curs_set(app.mode == InputMode::Composing ? 1 : 0);
    erase();

    app.board->read([&](const board::BoardView& v) {
        const auto& snap = v.snapshot;
        const int count = static_cast<int>(v.symbols.size());
        const BoardLayout l = compute_layout(
            LINES, COLS, static_cast<int>(snap.dates.size()), app.settings.show_help);

        auto& sel = app.selection;
        sel.selected = count > 0 ? std::clamp(sel.selected, 0, count - 1) : 0;
        sel.scroll = adjust_scroll(sel.scroll, sel.selected, count, l.rows);

        render_status_line(snap);
        render_index_line(snap);

        if (LINES > 2) {
            attron(A_DIM);
            for (int c = 0; c < l.date_cols; ++c) {
                const auto& date = snap.dates[static_cast<std::size_t>(l.first_date + c)];
                put_right(2, cell_x(c), kCellWidth, market::format_short_date(date));
            }
            attroff(A_DIM);
        }

        if (count == 0 && LINES > l.grid_y) {
            put_clipped(l.grid_y, 0, COLS, "Type a symbol and press Enter to add it");
        }

        for (int r = 0; r < l.rows; ++r) {
            const int idx = sel.scroll + r;
            if (idx >= count) break;

            const int y = row_y(l, r);
            const bool selected = idx == sel.selected;
            const auto& symbol = v.symbols[static_cast<std::size_t>(idx)];

            if (selected) attron(A_BOLD);
            mvaddch(y, 0, selected ? '>' : ' ');
            put_clipped(y, 2, kSymbolColWidth - 2, symbol);
            if (selected) attroff(A_BOLD);

            for (int c = 0; c < l.date_cols; ++c) {
                const auto& date = snap.dates[static_cast<std::size_t>(l.first_date + c)];
                render_cell(y, cell_x(c), find_cell(snap, symbol, date));
            }
        }

        render_footer(app, l);
    });

    if (app.mode == InputMode::Composing) render_compose_overlay(app);

    wnoutrefresh(stdscr);
    doupdate();
}

// *
// **
// ***
// ****
// ***** INPUT

inline int symbol_count(const AppState& app)
{
    return static_cast<int>(app.board->symbols().size());
}

inline void persist_symbols(AppState& app, const std::vector<std::string>& symbols)
{
    if (!app.config) return;

    std::string err;
    if (app.config->save(symbols, &err)) {
        app.last_error.clear();
        return;
    }
    spdlog::error("saving symbols to {}: {}", app.config->path().string(), err);
    app.last_error = "save failed: " + err;
}

inline bool is_symbol_char(int ch)
{
    return ch > 0 && ch < 256 && std::isgraph(static_cast<unsigned char>(ch));
}

inline bool is_backspace(int ch)
{
    return ch == KEY_BACKSPACE || ch == 127 || ch == 8;
}

inline bool is_enter(int ch)
{
    return ch == '\n' || ch == '\r' || ch == KEY_ENTER;
}

inline void append_symbol_char(AppState& app, int ch)
{
    auto& buf = app.selection.buffer;
    if (buf.size() >= kSymbolMaxLen) return;
    buf.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
}

inline void move_selection(AppState& app, int delta)
{
    const int count = symbol_count(app);
    if (count <= 0) {
        app.selection.selected = 0;
        return;
    }
    const int cur = std::clamp(app.selection.selected, 0, count - 1);
    app.selection.selected = ((cur + delta) % count + count) % count;
}

// Swaps with the neighbour in direction delta; no wrap at the ends.
inline void reorder_selected(AppState& app, int delta)
{
    const int count = symbol_count(app);
    if (count <= 0) return;

    const int cur = std::clamp(app.selection.selected, 0, count - 1);
    const int other = cur + delta;
    if (other < 0 || other >= count) return;

    std::vector<std::string> after;
    if (!app.board->swap_symbols(static_cast<std::size_t>(cur),
                                 static_cast<std::size_t>(other),
                                 &after)) {
        return;
    }
    app.selection.selected = other;
    persist_symbols(app, after);
}

inline void delete_selected(AppState& app)
{
    const int count = symbol_count(app);
    if (count <= 0) return;

    const int cur = std::clamp(app.selection.selected, 0, count - 1);
    std::vector<std::string> after;
    if (!app.board->remove_symbol(static_cast<std::size_t>(cur), &after)) return;

    const int remaining = static_cast<int>(after.size());
    app.selection.selected = remaining > 0 ? std::min(cur, remaining - 1) : 0;
    persist_symbols(app, after);
}

inline void leave_composing(AppState& app)
{
    app.mode = InputMode::Normal;
    app.selection.buffer.clear();
}

inline void commit_composed_symbol(AppState& app)
{
    const std::string symbol = app.selection.buffer;
    const int count = symbol_count(app);
    const int index = std::clamp(app.selection.selected, 0, count);

    std::vector<std::string> after;
    app.board->insert_symbol(static_cast<std::size_t>(index), symbol, &after);
    app.selection.selected = index;
    leave_composing(app);

    persist_symbols(app, after);
    if (app.refresh) app.refresh->request_symbol(symbol);
}

inline bool handle_key_board(AppState& app, int ch)
{
    if (ch == kKeyCtrlC || ch == kKeyCtrlQ) {
        app.quit_requested = true;
        return true;
    }
    if (ch == kKeyCtrlR) {
        if (app.refresh) app.refresh->request_full();
        return true;
    }
    if (ch == KEY_RESIZE) {
        return true;
    }

    if (app.mode == InputMode::Composing) {
        if (ch == kKeyEsc) {
            leave_composing(app);
            return true;
        }
        if (is_backspace(ch)) {
            if (!app.selection.buffer.empty()) app.selection.buffer.pop_back();
            return true;
        }
        if (is_enter(ch)) {
            if (app.selection.buffer.empty()) {
                leave_composing(app);
            }
            else {
                commit_composed_symbol(app);
            }
            return true;
        }
        if (is_symbol_char(ch)) {
            append_symbol_char(app, ch);
            return true;
        }
        return false;
    }

    switch (ch) {
    case KEY_UP:
        move_selection(app, -1);
        return true;
    case KEY_DOWN:
        move_selection(app, +1);
        return true;
    case KEY_SR:
        reorder_selected(app, -1);
        return true;
    case KEY_SF:
        reorder_selected(app, +1);
        return true;
    case KEY_DC:
        delete_selected(app);
        return true;
    default:
        break;
    }

    if (is_symbol_char(ch)) {
        app.mode = InputMode::Composing;
        app.selection.buffer.clear();
        append_symbol_char(app, ch);
        return true;
    }

    return false;
}

} // namespace views
