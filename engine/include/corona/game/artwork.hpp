/*!
  \file artwork.hpp
  Every image a session draws, loaded once and shared by every session
*/
#pragma once

#include <memory>
#include <vector>

#include <corona/common/filesystem.hpp>
#include <corona/game/player.hpp>
#include <corona/game/settings.hpp>
#include <corona/game/slime.hpp>
#include <corona/renderer/image.hpp>

namespace corona
{
class Artwork
{
public:
  /*!
    Load everything named in the [assets] settings
    \param game_root - The game directory the asset paths are relative to
    \param settings - Asset paths and load scales
    \return The loaded artwork
    \throws AssetLoadError if any image, manifest, region or frame directory can not be loaded
  */
  static std::shared_ptr<Artwork> load(const FileInfo& game_root, const Settings& settings);

public:
  std::shared_ptr<const PlayerFrames> player;
  std::shared_ptr<const SlimeFrames> slime;
  std::vector<Image> platforms;
  Image base;
  std::vector<Image> clouds;
};
} // namespace corona
