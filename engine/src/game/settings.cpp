#include <map>
#include <string>
#include <type_traits>

#pragma warning(disable : 4996)
#include <toml/toml.h>
#pragma warning(default : 4996)

#include <fmt/format.h>

#include <corona/common/errors.hpp>
#include <corona/common/logging.hpp>
#include <corona/game/settings.hpp>

namespace
{
auto logger = corona::_get_logger(__FILE__);
};

namespace corona
{
std::shared_ptr<Settings> Settings::from_toml(const FileInfo& toml_path)
{
  const auto toml_relative = toml_path.file_relative.string();
  auto ifs = toml_path.open();
  if (!ifs) {
    return nullptr;
  }

  toml::ParseResult pr = toml::parse(*ifs);

  if (!pr.valid()) {
    logger->error("Failed to parse {} with reason {}", toml_relative, pr.errorReason);
    return nullptr;
  }

  const toml::Value& v = pr.value;

  auto V = [&](const std::string& key, auto& field)
  {
    using T = std::decay_t<decltype(field)>;
    const toml::Value* value = v.find(key);
    if (!value) {
      logger->warn("Defaulting {} to {}", key, field);
      return;
    }

    if constexpr (std::is_same_v<T, std::string>) {
      if (value->is<std::string>()) {
        field = value->as<std::string>();
        return;
      }
    } else if constexpr (std::is_floating_point_v<T>) {
      if (value->is<double>()) {
        field = value->as<double>();
        return;
      }
      if (value->is<int64_t>()) {
        field = static_cast<T>(value->as<int64_t>());
        return;
      }
    } else {
      if (value->is<int64_t>()) {
        field = static_cast<T>(value->as<int64_t>());
        return;
      }
    }

    logger->warn("{} in {} has the wrong type, defaulting to {}", key, toml_relative, field);
  };

  std::shared_ptr<Settings> settings(new Settings());
  auto& s = *settings;

  V("screen.width", s.screen.width);
  V("screen.height", s.screen.height);
  V("screen.fps", s.screen.fps);
  V("screen.title", s.screen.title);

  V("physics.gravity", s.physics.gravity);

  V("player.acceleration", s.player.acceleration);
  V("player.friction", s.player.friction);
  V("player.jump_velocity", s.player.jump_velocity);
  V("player.jump_cut_threshold", s.player.jump_cut_threshold);
  V("player.run_frame_ms", s.player.run_frame_ms);
  V("player.idle_frame_ms", s.player.idle_frame_ms);
  V("player.jump_frame_ms", s.player.jump_frame_ms);
  V("player.start_x", s.player.start_x);
  V("player.start_height", s.player.start_height);
  V("player.frame_scale", s.player.frame_scale);
  V("player.wall_offset", s.player.wall_offset);
  V("player.jump_probe_px", s.player.jump_probe_px);
  V("player.velocity_deadzone", s.player.velocity_deadzone);

  V("terrain.base_height", s.terrain.base_height);
  V("terrain.platform_scale", s.terrain.platform_scale);
  V("terrain.level_width", s.terrain.level_width);

  V("slime.frame_ms", s.slime.frame_ms);
  V("slime.min_speed", s.slime.min_speed);
  V("slime.max_speed", s.slime.max_speed);
  V("slime.spawn_ms", s.slime.spawn_ms);
  V("slime.spawn_jitter_ms", s.slime.spawn_jitter_ms);
  V("slime.ground_offset", s.slime.ground_offset);
  V("slime.scale", s.slime.scale);

  V("cloud.min_scale", s.cloud.min_scale);
  V("cloud.max_scale", s.cloud.max_scale);
  V("cloud.spawn_ms", s.cloud.spawn_ms);
  V("cloud.initial_count", s.cloud.initial_count);
  V("cloud.parallax", s.cloud.parallax);

  V("world.scroll_threshold", s.world.scroll_threshold);
  V("world.min_scroll", s.world.min_scroll);

  V("layers.cloud", s.layers.cloud);
  V("layers.platform", s.layers.platform);
  V("layers.enemy", s.layers.enemy);
  V("layers.player", s.layers.player);

  V("assets.player_idle", s.assets.player_idle);
  V("assets.player_run", s.assets.player_run);
  V("assets.player_jump", s.assets.player_jump);
  V("assets.player_hurt", s.assets.player_hurt);
  V("assets.player_shoot", s.assets.player_shoot);
  V("assets.platforms", s.assets.platforms);
  V("assets.enemies", s.assets.enemies);
  V("assets.base", s.assets.base);
  V("assets.clouds", s.assets.clouds);
  V("assets.jump_sound", s.assets.jump_sound);

  const toml::Value* platforms = v.find("terrain.platform");
  if (platforms && platforms->is<toml::Array>()) {
    size_t k = 0;
    for (const toml::Value& p : platforms->as<toml::Array>()) {
      const toml::Value* x = p.find("x");
      const toml::Value* y = p.find("y");
      if (!x || !y || !x->isNumber() || !y->isNumber()) {
        logger->warn("Skipping [[terrain.platform]] index at {} because it is missing x or y", k);
        ++k;
        continue;
      }
      s.terrain.platforms.push_back({x->asNumber(), y->asNumber()});
      ++k;
    }
  }

  logger->info("Loaded settings from {} with {} platforms", toml_relative, s.terrain.platforms.size());
  return settings;
}

void Settings::validate() const
{
  auto require = [](bool ok, const std::string& what)
  {
    if (!ok) {
      throw ConfigurationError(what);
    }
  };

  require(screen.width > 0 && screen.height > 0,
          fmt::format("Screen size must be positive, got {}x{}", screen.width, screen.height));
  require(screen.fps > 0, fmt::format("screen.fps must be positive, got {}", screen.fps));
  require(physics.gravity > 0, fmt::format("physics.gravity must be positive, got {}", physics.gravity));
  require(player.acceleration >= 0,
          fmt::format("player.acceleration can not be negative, got {}", player.acceleration));
  require(player.jump_velocity > 0,
          fmt::format("player.jump_velocity must be positive, got {}", player.jump_velocity));
  require(player.friction >= 0, fmt::format("player.friction can not be negative, got {}", player.friction));
  require(player.jump_cut_threshold >= 0,
          fmt::format("player.jump_cut_threshold can not be negative, got {}", player.jump_cut_threshold));
  require(player.run_frame_ms >= 0 && player.idle_frame_ms >= 0 && player.jump_frame_ms >= 0,
          "Player frame intervals can not be negative");
  require(player.frame_scale > 0, fmt::format("player.frame_scale must be positive, got {}", player.frame_scale));
  require(player.velocity_deadzone >= 0, "player.velocity_deadzone can not be negative");
  require(terrain.platform_scale > 0, "terrain.platform_scale must be positive");
  require(terrain.base_height >= 0 && terrain.base_height <= screen.height,
          fmt::format("terrain.base_height must be within the screen, got {}", terrain.base_height));
  require(slime.min_speed >= 1 && slime.max_speed >= slime.min_speed,
          fmt::format("Slime speeds must satisfy 1 <= min <= max, got {}..{}", slime.min_speed, slime.max_speed));
  require(slime.frame_ms >= 0 && slime.spawn_ms >= 0 && slime.spawn_jitter_ms >= 0,
          "Slime intervals can not be negative");
  require(slime.spawn_ms == 0 || slime.spawn_jitter_ms < slime.spawn_ms,
          "slime.spawn_jitter_ms must be less than slime.spawn_ms");
  require(slime.scale > 0, "slime.scale must be positive");
  require(cloud.min_scale > 0 && cloud.max_scale >= cloud.min_scale,
          fmt::format("Cloud scales must satisfy 0 < min <= max, got {}..{}", cloud.min_scale, cloud.max_scale));
  require(cloud.spawn_ms >= 0 && cloud.initial_count >= 0, "Cloud spawn settings can not be negative");
  require(world.scroll_threshold >= 0 && world.scroll_threshold <= 1,
          fmt::format("world.scroll_threshold must be within [0, 1], got {}", world.scroll_threshold));
}

} // namespace corona
