#include "test_fixture.hpp"
#include "test_harness.hpp"
#include "views/view_board.hpp"

#include <curses.h>

#include <string>
#include <vector>

using Symbols = std::vector<std::string>;

namespace {

void type(AppState& app, const std::string& text)
{
    for (char c : text) views::handle_key_board(app, static_cast<unsigned char>(c));
}

} // namespace

TEST_CASE("input starts in normal mode")
{
    test::AppSandbox sb({"A"});
    REQUIRE(sb.app.mode == InputMode::Normal);
    REQUIRE(sb.app.selection.buffer.empty());
}

TEST_CASE("input enter inserts the typed symbol at the selection")
{
    test::AppSandbox sb({"A", "B", "C"});
    sb.app.selection.selected = 1;

    type(sb.app, "X");
    REQUIRE(sb.app.mode == InputMode::Composing);
    REQUIRE(views::handle_key_board(sb.app, '\n'));

    REQUIRE(sb.board.symbols() == (Symbols{"A", "X", "B", "C"}));
    REQUIRE_EQ(sb.app.selection.selected, 1);
    REQUIRE_EQ(sb.board.symbols()[1], std::string("X"));
    REQUIRE(sb.app.mode == InputMode::Normal);
    REQUIRE(sb.app.selection.buffer.empty());

    REQUIRE(sb.reload() == (Symbols{"A", "X", "B", "C"}));
    REQUIRE(sb.trigger.symbols == (Symbols{"X"}));
    REQUIRE_EQ(sb.trigger.full, 0);
}

TEST_CASE("input typed symbols are upper cased and capped")
{
    test::AppSandbox sb;
    type(sb.app, "brk.b");
    REQUIRE_EQ(sb.app.selection.buffer, std::string("BRK.B"));

    type(sb.app, "abcdefghijklmnop");
    REQUIRE_EQ(sb.app.selection.buffer.size(), views::kSymbolMaxLen);

    views::handle_key_board(sb.app, KEY_ENTER);
    REQUIRE(sb.board.symbols() == (Symbols{"BRK.BABCDEFG"}));
    REQUIRE_EQ(sb.app.selection.selected, 0);
}

TEST_CASE("input backspace keeps composing with an empty buffer")
{
    test::AppSandbox sb({"A"});
    type(sb.app, "XY");
    views::handle_key_board(sb.app, KEY_BACKSPACE);
    REQUIRE_EQ(sb.app.selection.buffer, std::string("X"));
    views::handle_key_board(sb.app, 127);
    REQUIRE(sb.app.selection.buffer.empty());
    REQUIRE(sb.app.mode == InputMode::Composing);

    // and again on an empty buffer
    views::handle_key_board(sb.app, 8);
    REQUIRE(sb.app.mode == InputMode::Composing);

    views::handle_key_board(sb.app, '\r');
    REQUIRE(sb.app.mode == InputMode::Normal);
    REQUIRE(sb.board.symbols() == (Symbols{"A"}));
    REQUIRE(sb.trigger.symbols.empty());
}

TEST_CASE("input escape discards the buffer")
{
    test::AppSandbox sb({"A"});
    type(sb.app, "MSFT");
    views::handle_key_board(sb.app, views::kKeyEsc);
    REQUIRE(sb.app.mode == InputMode::Normal);
    REQUIRE(sb.app.selection.buffer.empty());
    REQUIRE(sb.board.symbols() == (Symbols{"A"}));
}

TEST_CASE("input space does not start composing")
{
    test::AppSandbox sb({"A"});
    REQUIRE(!views::handle_key_board(sb.app, ' '));
    REQUIRE(sb.app.mode == InputMode::Normal);
}

TEST_CASE("input up and down wrap around the list")
{
    test::AppSandbox sb({"A", "B", "C"});
    views::handle_key_board(sb.app, KEY_UP);
    REQUIRE_EQ(sb.app.selection.selected, 2);
    views::handle_key_board(sb.app, KEY_DOWN);
    REQUIRE_EQ(sb.app.selection.selected, 0);
    views::handle_key_board(sb.app, KEY_DOWN);
    REQUIRE_EQ(sb.app.selection.selected, 1);
    REQUIRE(sb.board.symbols() == (Symbols{"A", "B", "C"}));
}

TEST_CASE("input up and down on an empty list are harmless")
{
    test::AppSandbox sb;
    views::handle_key_board(sb.app, KEY_UP);
    views::handle_key_board(sb.app, KEY_DOWN);
    views::handle_key_board(sb.app, KEY_DC);
    views::handle_key_board(sb.app, KEY_SR);
    REQUIRE_EQ(sb.app.selection.selected, 0);
    REQUIRE(sb.board.symbols().empty());
}

TEST_CASE("input move up swaps with the neighbour and persists")
{
    test::AppSandbox sb({"A", "B", "C"});
    sb.app.selection.selected = 1;

    views::handle_key_board(sb.app, KEY_SR);
    REQUIRE(sb.board.symbols() == (Symbols{"B", "A", "C"}));
    REQUIRE_EQ(sb.app.selection.selected, 0);
    REQUIRE(sb.reload() == (Symbols{"B", "A", "C"}));
}

TEST_CASE("input move down swaps with the neighbour and persists")
{
    test::AppSandbox sb({"A", "B", "C"});
    sb.app.selection.selected = 1;

    views::handle_key_board(sb.app, KEY_SF);
    REQUIRE(sb.board.symbols() == (Symbols{"A", "C", "B"}));
    REQUIRE_EQ(sb.app.selection.selected, 2);
    REQUIRE(sb.reload() == (Symbols{"A", "C", "B"}));
}

TEST_CASE("input reorder does not wrap at the ends")
{
    test::AppSandbox sb({"A", "B", "C"});
    views::handle_key_board(sb.app, KEY_SR);
    REQUIRE(sb.board.symbols() == (Symbols{"A", "B", "C"}));
    REQUIRE_EQ(sb.app.selection.selected, 0);

    sb.app.selection.selected = 2;
    views::handle_key_board(sb.app, KEY_SF);
    REQUIRE(sb.board.symbols() == (Symbols{"A", "B", "C"}));
    REQUIRE_EQ(sb.app.selection.selected, 2);
}

TEST_CASE("input delete removes the selection and clamps it")
{
    test::AppSandbox sb({"A", "B", "C"});
    sb.app.selection.selected = 2;

    views::handle_key_board(sb.app, KEY_DC);
    REQUIRE(sb.board.symbols() == (Symbols{"A", "B"}));
    REQUIRE_EQ(sb.app.selection.selected, 1);
    REQUIRE(sb.reload() == (Symbols{"A", "B"}));

    views::handle_key_board(sb.app, KEY_DC);
    views::handle_key_board(sb.app, KEY_DC);
    REQUIRE(sb.board.symbols().empty());
    REQUIRE_EQ(sb.app.selection.selected, 0);
    REQUIRE(sb.reload().empty());
}

TEST_CASE("input refresh key requests a full cycle in either mode")
{
    test::AppSandbox sb({"A"});
    views::handle_key_board(sb.app, views::kKeyCtrlR);
    REQUIRE_EQ(sb.trigger.full, 1);
    REQUIRE(sb.app.mode == InputMode::Normal);

    type(sb.app, "GO");
    views::handle_key_board(sb.app, views::kKeyCtrlR);
    REQUIRE_EQ(sb.trigger.full, 2);
    REQUIRE(sb.app.mode == InputMode::Composing);
    REQUIRE_EQ(sb.app.selection.buffer, std::string("GO"));
}

TEST_CASE("input quit keys work in either mode")
{
    test::AppSandbox sb({"A"});
    views::handle_key_board(sb.app, views::kKeyCtrlQ);
    REQUIRE(sb.app.quit_requested);

    test::AppSandbox sb2({"A"});
    type(sb2.app, "Q");
    REQUIRE(!sb2.app.quit_requested);
    views::handle_key_board(sb2.app, views::kKeyCtrlC);
    REQUIRE(sb2.app.quit_requested);
}

TEST_CASE("input save failure keeps the edit and reports it")
{
    test::AppSandbox sb({"A", "B"});
    const auto blocker = sb.temp.path() / "blocker";
    test::write_text_file(blocker, "not a directory");
    board::ConfigStore broken(blocker / "config.json");
    sb.app.config = &broken;

    views::handle_key_board(sb.app, KEY_DC);
    REQUIRE(sb.board.symbols() == (Symbols{"B"}));
    REQUIRE_CONTAINS(sb.app.last_error, "save failed");

    // a successful save clears the message
    sb.app.config = &sb.config;
    type(sb.app, "C\n");
    REQUIRE(sb.app.last_error.empty());
    REQUIRE(sb.reload() == (Symbols{"C", "B"}));
}
