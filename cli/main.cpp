#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>

#include "session.hpp"
#include "settings.hpp"
#include "sweeper/game_state.hpp"
#include "sweeper/random_source.hpp"
#include "sweeper/text_view.hpp"

namespace {

std::ofstream g_log_file;

inline bool debug_mode() { return std::getenv("SWEEPER_DEBUG") != nullptr; }

void log_line(const std::string& s) {
  if (g_log_file.is_open()) {
    g_log_file << s << std::endl;
    g_log_file.flush();
  }
}

void debug_line(const std::string& s) {
  if (!debug_mode()) return;
  std::cerr << "[DEBUG] " << s << std::endl;
  log_line("[DEBUG] " + s);
}

void print_banner() {
  std::cout << R"(
Minesweeper CLI
----------------------------------------
A simple text harness for the board engine.

Commands:
----------------------------------------
x       Exit
r       Restart
s       Show all mines
u(x,y)  Uncover the cell at the coordinates
f(x,y)  Flag a mine at the coordinates
?(x,y)  Mark the cell as questioned
c(x,y)  Clear the mark at the coordinates
)" << std::endl;
}

void print_game(const sweeper::GameState& game) {
  std::cout << "\n" << sweeper::render(game);
  std::cout << "Mines: " << game.total_mines() << "  Remaining: " << game.remaining()
            << "  State: " << sweeper::phase_name(game.state()) << "\n";
}

} // namespace

int main(int argc, char** argv) {
  const sweeper_cli::Settings settings = sweeper_cli::resolve_settings(argc, argv);

  if (!settings.log_path.empty()) {
    g_log_file.open(settings.log_path, std::ios::app);
    if (!g_log_file.is_open()) {
      std::cerr << "Warning: Could not open " << settings.log_path << " for writing\n";
    }
  }

  try {
    sweeper::GameState game = settings.seed
        ? sweeper::GameState(settings.width, settings.height, sweeper::make_random_source(*settings.seed))
        : sweeper::GameState(settings.width, settings.height);
    log_line("=== New session " + std::to_string(settings.width) + "x" + std::to_string(settings.height) +
             " mines=" + std::to_string(game.total_mines()) + " ===");

    sweeper_cli::Session session(game, std::cout, std::cerr,
                                 g_log_file.is_open() ? &g_log_file : nullptr);
    print_banner();
    std::string line;
    for (;;) {
      print_game(game);
      std::cout << "> " << std::flush;
      if (!std::getline(std::cin, line)) break;
      debug_line("input: " + line);
      log_line("> " + line);
      if (!session.handle_line(line)) break;
    }
  } catch (const std::exception& ex) {
    std::cerr << "Fatal error: " << ex.what() << std::endl;
    if (g_log_file.is_open()) g_log_file.close();
    return 1;
  }

  if (g_log_file.is_open()) g_log_file.close();
  return 0;
}
