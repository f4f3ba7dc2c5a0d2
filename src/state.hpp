#pragma once

#include <string>

#include "board/board_state.hpp"
#include "board/config_store.hpp"
#include "board/refresh.hpp"
#include "board/scheduler.hpp"
#include "market/session_source.hpp"

enum class InputMode {
    Normal,
    Composing,
};

struct SelectionState {
    int selected = 0;   // row index into the symbol list
    int scroll = 0;     // first visible row
    std::string buffer; // symbol being typed while composing
};

struct AppState {
    board::BoardState* board = nullptr;        // non-owning dep-injection
    board::ConfigStore* config = nullptr;      // non-owning dep-injection
    board::RefreshTrigger* refresh = nullptr;  // non-owning dep-injection
    InputMode mode = InputMode::Normal;
    SelectionState selection;
    bool quit_requested = false; // request clean main-loop exit
    std::string last_error;      // shown in the footer until the next edit

    struct Settings {
        // defaults
        market::SourceKind source = market::SourceKind::Random;
        int lookback_days = board::kDefaultLookbackDays;
        std::string log_level = "info";
        bool show_help = true;
        long history_timeout = 20;
    } settings;
};
