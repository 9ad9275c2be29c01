#include <fmt/format.h>

#include <corona/common/errors.hpp>
#include <corona/common/logging.hpp>
#include <corona/game/artwork.hpp>
#include <corona/renderer/spritesheet.hpp>

namespace
{
auto logger = corona::_get_logger(__FILE__);
};

namespace corona
{
namespace
{
const char* platform_regions[] = {"stone", "stone_broken", "stone_small", "stone_small_broken"};
} // namespace

std::shared_ptr<Artwork> Artwork::load(const FileInfo& game_root, const Settings& settings)
{
  const auto& assets = settings.assets;
  const auto scale = settings.player.frame_scale;
  std::shared_ptr<Artwork> artwork(new Artwork());

  auto player = std::make_shared<PlayerFrames>();
  player->idle = FrameSet::mirrored(load_frames(game_root.from_root(assets.player_idle), scale));
  player->run = FrameSet::mirrored(load_frames(game_root.from_root(assets.player_run), scale));
  player->jump = FrameSet::mirrored(load_frames(game_root.from_root(assets.player_jump), scale));
  player->hurt = FrameSet::mirrored(load_frames(game_root.from_root(assets.player_hurt), scale));
  player->shoot = FrameSet::mirrored(load_frames(game_root.from_root(assets.player_shoot), scale));
  if (player->idle.size() == 0) {
    throw AssetLoadError(fmt::format("{} has no idle frames", assets.player_idle));
  }
  if (player->run.size() == 0) {
    throw AssetLoadError(fmt::format("{} has no run frames", assets.player_run));
  }
  if (player->jump.size() == 0) {
    throw AssetLoadError(fmt::format("{} has no jump frames", assets.player_jump));
  }
  artwork->player = player;

  auto enemies = SpriteSheet::from_json(game_root.from_root(assets.enemies));
  auto slime = std::make_shared<SlimeFrames>();
  slime->walk.push_back(enemies->get_image("walk_1", settings.slime.scale));
  slime->walk.push_back(enemies->get_image("walk_2", settings.slime.scale));
  slime->die = enemies->get_image("die");
  artwork->slime = slime;

  auto platforms = SpriteSheet::from_json(game_root.from_root(assets.platforms));
  for (const auto* region : platform_regions) {
    artwork->platforms.push_back(platforms->get_image(region, settings.terrain.platform_scale));
  }

  artwork->base = load_image(game_root.from_root(assets.base));
  artwork->clouds = load_frames(game_root.from_root(assets.clouds), 1.0);
  if (artwork->clouds.empty()) {
    throw AssetLoadError(fmt::format("{} has no cloud images", assets.clouds));
  }

  logger->info("Loaded artwork: {} idle, {} run, {} jump frames, {} platforms, {} clouds",
               player->idle.size(), player->run.size(), player->jump.size(),
               artwork->platforms.size(), artwork->clouds.size());
  return artwork;
}
} // namespace corona
