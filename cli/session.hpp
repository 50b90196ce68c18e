#pragma once

#include <exception>
#include <ostream>
#include <string>

#include "command.hpp"
#include "sweeper/game_state.hpp"
#include "sweeper/rules.hpp"
#include "sweeper/types.hpp"

namespace sweeper_cli {

// Drives one engine from text commands. Errors on a line are reported and the
// session carries on.
class Session {
public:
    Session(sweeper::GameState& game, std::ostream& out, std::ostream& err, std::ostream* log = nullptr)
        : game_(game), out_(out), err_(err), log_(log) {}

    bool game_over() const { return game_over_; }

    // Returns false when the session should end.
    bool handle_line(const std::string& line) {
        try {
            const auto cmd = parse_command(line);
            if (!cmd) return true;
            return run(*cmd);
        } catch (const std::exception& ex) {
            error_line(ex.what());
        }
        return true;
    }

    bool run(const Command& cmd) {
        switch (cmd.action) {
            case Action::Exit:
                return false;
            case Action::Restart:
                game_.reset();
                game_over_ = false;
                out_ << "[INFO] New game: " << game_.total_mines() << " mines\n";
                log_line("restart mines=" + std::to_string(game_.total_mines()));
                break;
            case Action::ShowMines:
                game_.show_mined();
                break;
            case Action::Uncover:
                uncover(cmd.x, cmd.y);
                break;
            case Action::Flag:
                game_.flag(cmd.x, cmd.y);
                break;
            case Action::Question:
                game_.question(cmd.x, cmd.y);
                break;
            case Action::Clear:
                game_.set_unknown(cmd.x, cmd.y);
                break;
        }
        return true;
    }

private:
    // Marks after a loss put the engine back in Playing, so the session keeps
    // its own record of the loss until the next restart.
    void uncover(int x, int y) {
        if (game_over_) {
            out_ << "[INFO] Game over. Press r to restart.\n";
            return;
        }
        const sweeper::Phase phase = game_.uncover(x, y);
        if (phase == sweeper::Phase::Lost) {
            game_over_ = true;
            game_.show_mined();
            out_ << "[RESULT] Boom! You hit a mine. Press r to restart.\n";
            log_line("lost");
        } else if (sweeper::Rules::is_cleared(game_)) {
            game_over_ = true;
            out_ << "[RESULT] All safe cells uncovered.\n";
            log_line("cleared");
        }
    }

    void log_line(const std::string& s) {
        if (log_ != nullptr) {
            *log_ << s << std::endl;
            log_->flush();
        }
    }

    void error_line(const std::string& s) {
        err_ << "[ERROR] " << s << std::endl;
        log_line("[ERROR] " + s);
    }

    sweeper::GameState& game_;
    std::ostream& out_;
    std::ostream& err_;
    std::ostream* log_;
    bool game_over_ = false;
};

} // namespace sweeper_cli
