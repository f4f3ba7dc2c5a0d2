#include <curses.h>
#include <poll.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <system_error>

#include "board/board_state.hpp"
#include "board/config_store.hpp"
#include "board/refresh.hpp"
#include "board/scheduler.hpp"
#include "logging.hpp"
#include "market/live_quote_source.hpp"
#include "market/session_source.hpp"
#include "settings.hpp"
#include "state.hpp"
#include "views/repaint_signal.hpp"
#include "views/view.hpp"
#include "views/view_board.hpp"

struct Ncurses {
    Ncurses()
    {
        screen_ = newterm(nullptr, stdout, stdin);
        if (!screen_) {
            throw std::runtime_error("failed to initialize the terminal");
        }
        set_term(screen_);

        raw(); // ^C and ^Q arrive as keys
        noecho();
        keypad(stdscr, TRUE);
        nodelay(stdscr, TRUE);
#if defined(NCURSES_VERSION)
        set_escdelay(25);
#endif
        curs_set(0);
        if (has_colors()) init_colors_();
    }
    ~Ncurses()
    {
        endwin();
        delscreen(screen_);
    }

    Ncurses(const Ncurses&) = delete;
    Ncurses& operator=(const Ncurses&) = delete;

private:
    struct Shade {
        short fg;
        short bg;
    };
    using Shades = std::array<Shade, views::kChangeLevels>;

    static void init_colors_()
    {
        start_color();
        short none = COLOR_BLACK;
#if defined(NCURSES_VERSION)
        if (use_default_colors() == OK) none = -1;
#endif
        init_pair(views::kColorPairHeader, COLOR_BLUE, none);
        const short bright_cyan = (COLORS > 14) ? 14 : COLOR_CYAN;
        init_pair(views::kColorPairOverlay, COLOR_BLACK, bright_cyan);

        // severity grows left to right
        Shades up;
        Shades down;
        if (COLORS >= 256) {
            up = {{{71, none}, {46, none}, {16, 28}, {16, 34}, {16, 46}}};
            down = {{{167, none}, {196, none}, {16, 88}, {16, 124}, {16, 196}}};
        }
        else {
            up = {{{COLOR_GREEN, none},
                   {COLOR_GREEN, none},
                   {COLOR_BLACK, COLOR_GREEN},
                   {COLOR_BLACK, COLOR_GREEN},
                   {COLOR_WHITE, COLOR_GREEN}}};
            down = {{{COLOR_RED, none},
                     {COLOR_RED, none},
                     {COLOR_BLACK, COLOR_RED},
                     {COLOR_BLACK, COLOR_RED},
                     {COLOR_WHITE, COLOR_RED}}};
        }

        for (int i = 0; i < views::kChangeLevels; ++i) {
            const auto idx = static_cast<std::size_t>(i);
            init_pair(static_cast<short>(views::kColorPairUpBase + i), up[idx].fg, up[idx].bg);
            init_pair(static_cast<short>(views::kColorPairDownBase + i), down[idx].fg, down[idx].bg);
        }
    }

    SCREEN* screen_ = nullptr;
};

static constexpr std::chrono::milliseconds kShutdownGrace{200};

int main()
{
    try {
        AppState app;

        // settings come first: they pick the log level
        std::string settings_err;
        std::vector<std::string> settings_warnings;
        const bool settings_ok =
            load_settings(app.settings, &settings_err, &settings_warnings);

        std::string log_err;
        if (!tickerboard::init_logging(app.settings.log_level, &log_err)) {
            std::fprintf(stderr, "warning: logging disabled: %s\n", log_err.c_str());
        }

        spdlog::info("tickerboard starting: source={} lookback={}d timeout={}s",
                     market::source_kind_label(app.settings.source),
                     app.settings.lookback_days,
                     app.settings.history_timeout);
        if (!settings_ok) spdlog::warn("settings: {}", settings_err);
        for (const auto& w : settings_warnings) spdlog::warn("{}", w);

        board::ConfigStore config(board::ConfigStore::default_path());
        auto symbols = config.load();
        spdlog::info("loaded {} symbols from {}", symbols.size(), config.path().string());

        board::BoardState board(std::move(symbols));

        auto history =
            market::make_session_source(app.settings.source, app.settings.history_timeout);
        market::GoogleLiveQuoteSource quotes(app.settings.history_timeout);
        board::RefreshCoordinator coordinator(
            board, *history, quotes, app.settings.lookback_days);

        views::RepaintSignal repaint;
        board::Scheduler scheduler(coordinator, [&repaint] { repaint.notify(); });

        std::optional<Ncurses> ncurses;
        ncurses.emplace();

        app.board = &board;
        app.config = &config;
        app.refresh = &scheduler;

        scheduler.start();

        while (!app.quit_requested) {
            views::render_board(app);

            std::array<pollfd, 2> fds = {{
                {STDIN_FILENO, POLLIN, 0},
                {repaint.read_fd(), POLLIN, 0},
            }};
            if (::poll(fds.data(), fds.size(), -1) < 0 && errno != EINTR) {
                throw std::system_error(errno, std::generic_category(), "poll");
            }
            if (fds[1].revents & POLLIN) repaint.drain();

            // interrupted by SIGWINCH -> getch reports KEY_RESIZE
            int ch = ERR;
            while (!app.quit_requested && (ch = getch()) != ERR) {
                views::handle_key_board(app, ch);
            }
        }

        // terminal first, then the refresh threads
        ncurses.reset();
        spdlog::info("quit requested");

        scheduler.request_stop();
        if (!scheduler.wait_idle(kShutdownGrace)) {
            // no cancellation: a cycle blocked in fetches is abandoned
            spdlog::info("abandoning in-flight fetches");
            spdlog::shutdown();
            std::_Exit(0);
        }
        return 0;
    }
    catch (const std::exception& e) {
        spdlog::critical("fatal: {}", e.what());
        std::fprintf(stderr, "error: %s\n", e.what());
        return 1;
    }
}
