/*!
  \file settings.hpp
  Everything about a play session that is not code: screen size, physics
  constants, animation pacing, spawn rates, draw layers and asset paths.
  A session copies these once and never changes them.
*/
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <corona/common/filesystem.hpp>

namespace corona
{
struct ScreenSettings
{
  int32_t width = 1280;
  int32_t height = 720;
  int32_t fps = 60;
  std::string title = "Corona Breakout";
};

struct PhysicsSettings
{
  //! Downward acceleration in pixels per tick squared
  double gravity = 0.8;
};

struct PlayerSettings
{
  //! Horizontal acceleration while a direction is held, pixels per tick squared
  double acceleration = 0.5;

  //! Fraction of the horizontal velocity removed each tick
  double friction = 0.12;

  //! Upward velocity at the start of a jump
  double jump_velocity = 20.0;

  //! Releasing jump clamps the upward velocity to this magnitude
  double jump_cut_threshold = 3.0;

  int64_t run_frame_ms = 60;
  int64_t idle_frame_ms = 120;
  int64_t jump_frame_ms = 100;

  //! Spawn point, start_height is measured up from the bottom of the screen
  double start_x = 40.0;
  double start_height = 50.0;

  //! Scale applied to the player frames when they are loaded
  double frame_scale = 0.2;

  //! Where the left edge is put back to after crossing the left of the world
  double wall_offset = 50.0;

  //! How far to the right the jump probe looks for terrain
  double jump_probe_px = 2.0;

  //! Horizontal speeds below this snap to 0
  double velocity_deadzone = 0.1;
};

struct PlatformPlacement
{
  double x;
  double y;
};

struct TerrainSettings
{
  double base_height = 60.0;
  double platform_scale = 0.5;

  //! How far to the right the row of bases is laid out
  double level_width = 6000.0;
  std::vector<PlatformPlacement> platforms;
};

struct SlimeSettings
{
  int64_t frame_ms = 180;
  int32_t min_speed = 1;
  int32_t max_speed = 3;
  int64_t spawn_ms = 5000;
  int64_t spawn_jitter_ms = 1000;

  //! How far below the top of the base the slime's bottom sits
  double ground_offset = 5.0;
  double scale = 1.5;
};

struct CloudSettings
{
  double min_scale = 0.5;
  double max_scale = 1.0;
  int64_t spawn_ms = 3000;
  int32_t initial_count = 3;

  //! How much of the world scroll the clouds follow
  double parallax = 0.5;
};

struct WorldSettings
{
  //! Fraction of the screen width the player may reach before the world scrolls, 0 disables
  double scroll_threshold = 0.75;

  //! The least the world scrolls by when it scrolls at all
  double min_scroll = 2.0;
};

//! Draw order only, lower is further back
struct LayerSettings
{
  int32_t cloud = 0;
  int32_t platform = 1;
  int32_t enemy = 2;
  int32_t player = 3;
};

//! Paths relative to the game root
struct AssetSettings
{
  std::string player_idle = "textures/player/idle";
  std::string player_run = "textures/player/run";
  std::string player_jump = "textures/player/jump";
  std::string player_hurt = "textures/player/hurt";
  std::string player_shoot = "textures/player/shoot";
  std::string platforms = "textures/platforms.json";
  std::string enemies = "textures/enemies.json";
  std::string base = "textures/base.png";
  std::string clouds = "textures/clouds";
  std::string jump_sound = "sounds/jump.wav";
};

class Settings
{
public:
  /*!
    Load settings from a TOML file. Missing keys keep their defaults.
    \param path - The TOML file
    \return The settings or null if the file could not be read or parsed
  */
  static std::shared_ptr<Settings> from_toml(const FileInfo& path);

  /*!
    Checks for values that can not run a session
    \throws ConfigurationError describing the first bad value
  */
  void validate() const;

public:
  ScreenSettings screen;
  PhysicsSettings physics;
  PlayerSettings player;
  TerrainSettings terrain;
  SlimeSettings slime;
  CloudSettings cloud;
  WorldSettings world;
  LayerSettings layers;
  AssetSettings assets;
};
} // namespace corona
