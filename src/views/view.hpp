#pragma once

struct AppState;

namespace views {

inline constexpr int kKeyCtrlC = 3;
inline constexpr int kKeyCtrlQ = 17;
inline constexpr int kKeyCtrlR = 18;
inline constexpr int kKeyEsc = 27;

void render_board(AppState& app);
bool handle_key_board(AppState& app, int ch);

} // namespace views
