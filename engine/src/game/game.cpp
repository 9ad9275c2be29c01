#include <SDL.h>
#include <SDL_image.h>

#include <corona/common/clock.hpp>
#include <corona/common/logging.hpp>
#include <corona/game/game.hpp>

namespace {
auto logger = corona::_get_logger(__FILE__);
}

namespace corona
{
Game::Game(const FileInfo& game_path_, bool is_headless_)
  : game_path(game_path_),
    is_headless(is_headless_),
    is_init(false),
    shutdown(false),
    sessions_played(0),
    total_ticks(0)
{
}

Game::~Game()
{
  session.reset();
  sound.reset();
  renderer.reset();
  if (is_init) {
    IMG_Quit();
    SDL_Quit();
  }
}

std::shared_ptr<Game> Game::create(const fs::path& game_root, bool is_headless)
{
  return std::shared_ptr<Game>(new Game(FileInfo::root(game_root), is_headless));
}

bool Game::init()
{
  const Uint32 subsystems = is_headless ? 0 : SDL_INIT_VIDEO | SDL_INIT_AUDIO;
  if (SDL_Init(subsystems) < 0) {
    logger->error("SDL could not be initialized: {}", SDL_GetError());
    return false;
  }
  is_init = true;

  if (!(IMG_Init(IMG_INIT_PNG) & IMG_INIT_PNG)) {
    logger->error("SDL_image could not be initialized: {}", IMG_GetError());
    return false;
  }

  if (!game_path.exists()) {
    logger->error("{} does not exist. Are you sure it is the game path?", game_path.file_path.string());
    return false;
  }

  settings = Settings::from_toml(game_path.from_root("settings.toml"));
  if (!settings) {
    logger->error("Failed to read the settings");
    return false;
  }
  settings->validate();

  artwork = Artwork::load(game_path, *settings);

  renderer = std::make_unique<Renderer>(is_headless);
  if (!renderer->init(settings->screen)) {
    return false;
  }

  if (!is_headless) {
    sound = Sound::open();
    if (sound) {
      sound->load("jump", game_path.from_root(settings->assets.jump_sound));
    } else {
      logger->warn("Continuing without sound");
    }
  }

  return true;
}

void Game::new_session(int64_t now_ms)
{
  session = std::make_unique<Session>(artwork, *settings);
  if (sound) {
    auto engine = sound;
    session->on_sound = [engine](const std::string& cue) { engine->play(cue); };
  }
  session->start();

  spawner = std::make_unique<Spawner>(*settings);
  spawner->reset(*session, now_ms);
  ++sessions_played;
  logger->info("Session {} started", sessions_played);
}

bool Game::tick(const InputState& input, int64_t now_ms)
{
  spawner->tick(*session, now_ms);
  session->update(input, now_ms);
  ++total_ticks;
  return !this->session_over();
}

bool Game::session_over() const
{
  const auto player = session->player();
  if (!player) {
    return true;
  }

  if (player->visual.rect.top() > settings->screen.height) {
    logger->info("The player fell out of the world");
    return true;
  }

  if (!session->collide_precise(session->player_handle, Group::enemies).empty()) {
    logger->info("The player was caught by a slime after scrolling {}px", session->scrolled);
    return true;
  }

  return false;
}

bool Game::poll_events()
{
  SDL_Event e;
  while (SDL_PollEvent(&e)) {
    if (e.type == SDL_QUIT) {
      return false;
    }
    if (e.type == SDL_KEYDOWN && e.key.keysym.scancode == SDL_SCANCODE_ESCAPE) {
      return false;
    }
    keyboard.handle(e);
  }
  return true;
}

bool Game::run(uint64_t max_ticks)
{
  if (!is_init || !settings || !artwork) {
    logger->error("The game must be initialized before it runs");
    return false;
  }

  const int64_t frame_ms = 1000 / settings->screen.fps;
  int64_t now_ms = is_headless ? 0 : clock::ticks_ms();
  this->new_session(now_ms);

  while (!shutdown) {
    const auto frame_start_ms = is_headless ? now_ms : clock::ticks_ms();

    InputState input;
    if (!is_headless) {
      if (!this->poll_events()) {
        shutdown = true;
        break;
      }
      input = keyboard.snapshot();
    }

    now_ms = is_headless ? now_ms + frame_ms : clock::ticks_ms();
    if (!this->tick(input, now_ms)) {
      this->new_session(now_ms);
    }

    renderer->run_frame(session->render_list());

    if (max_ticks && total_ticks >= max_ticks) {
      break;
    }

    if (!is_headless) {
      const auto elapsed_ms = clock::ticks_ms() - frame_start_ms;
      if (elapsed_ms < frame_ms) {
        SDL_Delay(static_cast<Uint32>(frame_ms - elapsed_ms));
      }
    }
  }

  logger->info("Ran {} ticks over {} sessions", total_ticks, sessions_played);
  return true;
}
} // namespace corona
