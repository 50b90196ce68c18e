#include <iostream>
#include <string>
#include "sweeper/errors.hpp"
#include "sweeper/game_state.hpp"
#include "sweeper/random_source.hpp"

using namespace sweeper;

namespace {

int g_failures = 0;

void expect(bool ok, const std::string& what) {
    if (ok) {
        std::cout << "[SUCCESS] " << what << std::endl;
    } else {
        std::cout << "[FAILED] " << what << std::endl;
        ++g_failures;
    }
}

// 5x5 board with mines at (0,0) and (4,4); remaining == 3 from generation.
GameState two_mine_board() {
    GameState game(5, 5, make_random_source(5));
    game.clear();
    game.board().at(0, 0) = CellState::unknown(true);
    game.board().at(4, 4) = CellState::unknown(true);
    return game;
}

template <typename Fn>
bool throws_out_of_bounds(Fn fn) {
    try {
        fn();
    } catch (const OutOfBounds&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "=== Flag ===" << std::endl;
    {
        GameState game = two_mine_board();
        const int start = game.remaining();
        game.flag(0, 0);
        expect(game.cell_state(0, 0) == CellState::flagged(true), "covered mine becomes Flagged(true)");
        expect(game.remaining() == start - 1, "flag decrements remaining");
        game.flag(0, 0);
        expect(game.remaining() == start - 1, "flagging twice is a no-op");
        game.flag(2, 2);
        expect(game.cell_state(2, 2) == CellState::flagged(false), "mis-flag keeps ground truth");
        expect(game.remaining() == start - 2, "mis-flag still decrements remaining");
        game.question(3, 3);
        game.flag(3, 3);
        expect(game.cell_state(3, 3) == CellState::flagged(false), "questioned cell can be flagged");
        expect(game.remaining() == start - 3, "flagging a questioned cell decrements remaining");
        game.flag(1, 3);
        game.flag(3, 1);
        expect(game.remaining() == 0, "remaining floors at zero");
        game.flag(1, 1);
        expect(game.remaining() == 0, "remaining never goes negative");
    }
    {
        GameState game = two_mine_board();
        game.uncover(1, 0);
        const int start = game.remaining();
        game.flag(1, 0);
        expect(game.cell_state(1, 0) == CellState::counted(1), "revealed cell cannot be flagged");
        expect(game.remaining() == start, "flag on a revealed cell leaves remaining");
    }

    std::cout << "\n=== Question ===" << std::endl;
    {
        GameState game = two_mine_board();
        const int start = game.remaining();
        game.question(0, 0);
        expect(game.cell_state(0, 0) == CellState::questioned(true), "covered mine becomes Questioned(true)");
        expect(game.remaining() == start, "questioning a covered cell leaves remaining");
        game.flag(0, 0);
        game.question(0, 0);
        expect(game.cell_state(0, 0) == CellState::questioned(true), "flagged cell becomes questioned");
        expect(game.remaining() == start, "questioning a flagged cell gives the flag back");
        game.question(0, 0);
        expect(game.cell_state(0, 0) == CellState::questioned(true), "questioning twice is a no-op");
    }

    std::cout << "\n=== Set unknown ===" << std::endl;
    {
        GameState game = two_mine_board();
        const int start = game.remaining();
        game.flag(4, 4);
        game.set_unknown(4, 4);
        expect(game.cell_state(4, 4) == CellState::unknown(true), "flag cleared back to Unknown(true)");
        expect(game.remaining() == start, "clearing a flag restores remaining");
        game.question(2, 2);
        game.set_unknown(2, 2);
        expect(game.cell_state(2, 2) == CellState::unknown(false), "question cleared");
        expect(game.remaining() == start, "clearing a question leaves remaining");
        game.set_unknown(2, 2);
        expect(game.cell_state(2, 2) == CellState::unknown(false), "clearing an unknown cell is a no-op");
    }
    {
        GameState game = two_mine_board();
        game.uncover(1, 0);
        game.set_unknown(1, 0);
        expect(game.cell_state(1, 0) == CellState::unknown(false), "counted cell covered again");
        game.uncover(2, 2);
        expect(game.cell_state(2, 2) == CellState::known(false), "zero cell revealed");
        game.set_unknown(2, 2);
        expect(game.cell_state(2, 2) == CellState::unknown(false), "known cell covered again");
    }
    {
        GameState game = two_mine_board();
        const int start = game.remaining();
        game.flag(0, 0);
        game.question(0, 0);
        game.set_unknown(0, 0);
        expect(game.remaining() == start, "flag, question, set_unknown restores remaining");
        expect(game.cell_state(0, 0) == CellState::unknown(true), "cell back to Unknown(true)");
    }

    std::cout << "\n=== Mine predicates ===" << std::endl;
    {
        GameState game = two_mine_board();
        expect(game.is_mined(0, 0) && game.has_mine(0, 0), "covered mine is mined");
        expect(!game.is_mined(1, 1) && !game.has_mine(1, 1), "safe cell is not mined");
        game.flag(0, 0);
        expect(!game.is_mined(0, 0), "flagged mine is not reported by is_mined");
        expect(game.has_mine(0, 0), "flagged mine is still a mine in ground truth");
        game.question(4, 4);
        expect(!game.is_mined(4, 4) && game.has_mine(4, 4), "questioned mine only shows in ground truth");
        game.uncover(4, 4);
        expect(game.is_mined(4, 4), "detonated mine is mined");
    }

    std::cout << "\n=== Show mined ===" << std::endl;
    {
        GameState game = two_mine_board();
        game.board().at(2, 0) = CellState::unknown(true);
        game.flag(2, 0);
        game.uncover(2, 2);
        game.show_mined();
        expect(game.cell_state(0, 0) == CellState::known(true), "covered mine revealed");
        expect(game.cell_state(4, 4) == CellState::known(true), "second covered mine revealed");
        expect(game.cell_state(2, 0) == CellState::flagged(true), "flagged mine left flagged");
        expect(game.cell_state(1, 1).kind == CellKind::Counted, "revealed cells untouched");
        expect(game.state() == Phase::Playing, "show_mined does not change the phase");
    }

    std::cout << "\n=== Out of bounds ===" << std::endl;
    {
        GameState game = two_mine_board();
        expect(throws_out_of_bounds([&] { game.uncover(-1, 0); }), "uncover left of the board throws");
        expect(throws_out_of_bounds([&] { game.uncover(0, 5); }), "uncover below the board throws");
        expect(throws_out_of_bounds([&] { game.flag(5, 0); }), "flag right of the board throws");
        expect(throws_out_of_bounds([&] { game.question(0, -1); }), "question above the board throws");
        expect(throws_out_of_bounds([&] { game.set_unknown(7, 7); }), "set_unknown off the board throws");
        expect(throws_out_of_bounds([&] { game.cell_state(5, 5); }), "cell_state off the board throws");
        expect(throws_out_of_bounds([&] { game.is_mined(-1, -1); }), "is_mined off the board throws");
        expect(throws_out_of_bounds([&] { game.neighbor_count(0, 9); }), "neighbor_count off the board throws");
        expect(game.state() == Phase::Initial, "rejected commands leave the phase");
        expect(game.remaining() == game.total_mines(), "rejected commands leave remaining");
    }

    if (g_failures > 0) {
        std::cout << "\n=== " << g_failures << " check(s) failed ===" << std::endl;
        return 1;
    }
    std::cout << "\n=== All tests passed ===" << std::endl;
    return 0;
}
