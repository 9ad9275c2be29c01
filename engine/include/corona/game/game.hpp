/*!
  \file game.hpp
  The driver that glues the pieces together: it owns the window, sound and
  artwork, feeds input and time into a session each frame, and starts a new
  session whenever the current one ends.
*/
#pragma once

#include <cstdint>
#include <memory>

#include <corona/common/filesystem.hpp>
#include <corona/game/artwork.hpp>
#include <corona/game/session.hpp>
#include <corona/game/settings.hpp>
#include <corona/game/spawner.hpp>
#include <corona/input/keyboard.hpp>
#include <corona/renderer/renderer.hpp>
#include <corona/sound/sound.hpp>

namespace corona
{
class Game
{
private:
  //! The class should be created using Game::create
  Game(const FileInfo& game_path_, bool is_headless_);

public:
  ~Game();
  Game(const Game&) = delete;
  Game& operator=(const Game&) = delete;

  /*!
    This should be used when creating a Game
    \param game_root - The game directory holding settings.toml and the assets
    \param is_headless - Run without a window or sound, time advances one frame per tick
  */
  static std::shared_ptr<Game> create(const fs::path& game_root, bool is_headless);

  /*!
    Initialize SDL, read the settings, load the artwork and open the window and sound
    \return Whether the game can run
    \throws AssetLoadError or ConfigurationError if the assets or settings are unusable
  */
  bool init();

  /*!
    Run the game until the window is closed or Escape is pressed
    \param max_ticks - Stop after this many ticks, 0 runs forever
    \return Whether the game ran
  */
  bool run(uint64_t max_ticks = 0);

  //! Throw away the current session and start a fresh one
  void new_session(int64_t now_ms);

  /*!
    Advance the current session by one frame
    \return false if the session ended this frame
  */
  bool tick(const InputState& input, int64_t now_ms);

  /*!
    A session ends when the player touches a slime or falls below the screen
  */
  bool session_over() const;

  /*!
    Pump SDL events into the keyboard
    \return false when the game should quit
  */
  bool poll_events();

public:
  FileInfo game_path;
  bool is_headless;
  bool is_init;
  bool shutdown;

  std::shared_ptr<Settings> settings;
  std::shared_ptr<Artwork> artwork;
  std::unique_ptr<Renderer> renderer;
  std::shared_ptr<Sound> sound;
  std::unique_ptr<Session> session;
  std::unique_ptr<Spawner> spawner;
  Keyboard keyboard;

  uint64_t sessions_played;
  uint64_t total_ticks;
};
} // namespace corona
