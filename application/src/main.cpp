#include <string>

#define SDL_MAIN_HANDLED
#include <SDL.h>

#include <cxxopts.hpp>

#include <corona/common/clock.hpp>
#include <corona/common/errors.hpp>
#include <corona/common/logging.hpp>
#include <corona/game/game.hpp>

namespace
{
auto logger = corona::_get_logger(__FILE__);
};

int main(int argc, char** argv)
{
  spdlog::set_level(spdlog::level::debug);
  const auto time_start_ms = corona::clock::ticks_ms();

  cxxopts::Options options("corona", "Run right, jump the gaps and stay clear of the slimes.");

  options.add_options()
      ("q,quiet", "Quiet the logger")
      ("g,game", "Game root path", cxxopts::value<std::string>()->default_value("../game"))
      ("headless", "Run without a window or sound")
      ("ticks", "Stop after this many ticks, 0 runs until quit", cxxopts::value<uint64_t>()->default_value("0"))
      ("h,help", "Print usage");

  uint64_t max_ticks = 0;
  bool is_headless = false;
  std::string game_root;

  try {
    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      logger->info("{}", options.help());
      return 0;
    }

    if (result.count("quiet")) {
      spdlog::set_level(spdlog::level::info);
    }

    game_root = result["game"].as<std::string>();
    max_ticks = result["ticks"].as<uint64_t>();
    is_headless = result.count("headless") > 0;
  } catch (const cxxopts::OptionException& e) {
    logger->error("{}", e.what());
    return 1;
  }

  if (is_headless && max_ticks == 0) {
    logger->error("--headless needs --ticks, there is no window to close");
    return 1;
  }

  logger->info("Hello from corona!");

  try {
    auto game = corona::Game::create(game_root, is_headless);
    if (!game->init()) {
      logger->error("Failed to initialize the game from {}", game_root);
      return 1;
    }

    if (!game->run(max_ticks)) {
      return 1;
    }
  } catch (const corona::AssetLoadError& e) {
    logger->error("Could not load the artwork: {}", e.what());
    return 1;
  } catch (const corona::ConfigurationError& e) {
    logger->error("The settings can not be used: {}", e.what());
    return 1;
  }

  const auto time_played = (corona::clock::ticks_ms() - time_start_ms) / 1000.0;

  logger->info("Okay, quitting. You played for {:.1f}s. Bye Bye.", time_played);
  return 0;
}
