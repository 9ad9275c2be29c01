/*!
  \file slime.hpp
  A slime walks in from the right edge of the screen at a constant speed and
  is gone once it has fully left on the left.
*/
#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <vector>

#include <corona/game/entity.hpp>
#include <corona/game/settings.hpp>
#include <corona/renderer/image.hpp>

namespace corona
{
struct SlimeFrames
{
  std::vector<Image> walk;

  //! Not shown yet, slimes do not die
  Image die;
};

class Slime
{
public:
  /*!
    Create a slime just off the right edge of the screen with its feet
    slightly sunk into the base
    \param frames_ - The walk cycle, shared between all slimes
    \param settings - Screen size, terrain height and slime pacing
    \param speed_ - How many pixels the slime moves left per tick
    \throws ConfigurationError if there are no walk frames
  */
  Slime(std::shared_ptr<const SlimeFrames> frames_, const Settings& settings, int32_t speed_);

  //! Create a slime with a speed drawn from [min_speed, max_speed]
  static Slime spawn(std::shared_ptr<const SlimeFrames> frames_, const Settings& settings, std::mt19937& rng);

  /*!
    Animate, then walk left
    \param now_ms - The monotonic frame time in milliseconds
    \return false once the slime is entirely left of the screen
  */
  bool update(int64_t now_ms);

  //! The walk cycle advances on its own timer whether the slime moves or not
  void animate(int64_t now_ms);

  bool off_screen() const
  {
    return visual.rect.right() < 0;
  }

public:
  Visual visual;
  int32_t speed;
  size_t current_frame;
  int64_t last_update_ms;
  int64_t frame_ms;
  std::shared_ptr<const SlimeFrames> frames;
};
} // namespace corona
